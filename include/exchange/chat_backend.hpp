#ifndef CHAT_BACKEND_HPP
#define CHAT_BACKEND_HPP

#include "core/cancellation_token.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

// One chat turn: the user's words in, the assistant's reply out.
class ChatBackend {
public:
    virtual ~ChatBackend() = default;

    // Empty on cancellation. Throws std::runtime_error on failure.
    virtual std::string reply(const std::string& prompt, const CancellationToken& token) = 0;
};

// Delegates the turn to an external command: the conversation so far goes to
// its stdin as "role: text" lines and stdout is the reply. History is kept
// across turns of the same backend.
class CommandChatBackend : public ChatBackend {
public:
    struct Config {
        std::string command;
        std::string systemPrompt = "You are a helpful voice assistant. Answer briefly.";
        std::size_t maxHistoryTurns = 10;
        // Shorter than the turn's response timeout, which covers the whole exchange.
        int timeoutMs = 10000;
    };

    struct Message {
        std::string role;
        std::string text;
    };

    explicit CommandChatBackend(Config config);

    std::string reply(const std::string& prompt, const CancellationToken& token) override;

    std::vector<Message> history() const;

    // Transcript handed to the command for the next prompt.
    std::string transcript(const std::string& prompt) const;

private:
    Config config_;
    mutable std::mutex mutex_;
    std::vector<Message> history_;
};

#endif
