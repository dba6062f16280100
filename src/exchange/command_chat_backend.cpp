#include "exchange/chat_backend.hpp"

#include "exchange/process_runner.hpp"

#include <stdexcept>
#include <utility>

static std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Constructor
CommandChatBackend::CommandChatBackend(Config config) : config_(std::move(config)) {
    if (config_.command.empty()) throw std::invalid_argument("chat backend command is empty");
}

std::string CommandChatBackend::transcript(const std::string& prompt) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    if (!config_.systemPrompt.empty()) out += "system: " + config_.systemPrompt + "\n";
    for (const auto& m : history_) out += m.role + ": " + m.text + "\n";
    out += "user: " + prompt + "\n";
    return out;
}

std::string CommandChatBackend::reply(const std::string& prompt, const CancellationToken& token) {
    const ProcessResult r = runProcess(config_.command, transcript(prompt), token, config_.timeoutMs);
    if (r.cancelled) return {};
    if (r.timedOut) throw std::runtime_error("chat command timed out after " + std::to_string(config_.timeoutMs) + " ms");
    if (r.exitCode != 0) throw std::runtime_error("chat command exited with status " + std::to_string(r.exitCode));

    const std::string answer = trim(r.output);
    if (answer.empty()) throw std::runtime_error("chat command returned no reply");

    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(Message{"user", prompt});
    history_.push_back(Message{"assistant", answer});
    while (history_.size() > config_.maxHistoryTurns * 2) {
        history_.erase(history_.begin(), history_.begin() + 2);
    }
    return answer;
}

std::vector<CommandChatBackend::Message> CommandChatBackend::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}
