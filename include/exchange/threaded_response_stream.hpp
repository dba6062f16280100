#ifndef THREADED_RESPONSE_STREAM_HPP
#define THREADED_RESPONSE_STREAM_HPP

#include "core/cancellation_token.hpp"
#include "exchange/response_stream.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

// Response stream whose chunks come from a producer running on a detached
// thread. The producer must only capture what it owns (shared pointers), since
// it may outlive the stream after cancel(); it polls the token and emit()
// returns false once the stream was cancelled.
class ThreadedResponseStream : public ResponseStream {
    struct Shared;

public:
    class Writer {
    public:
        explicit Writer(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}

        // Blocks while the queue is full.
        bool emit(PlaybackChunk chunk);
        const CancellationToken& token() const;
        uint64_t responseId() const;

    private:
        std::shared_ptr<Shared> shared_;
    };

    using Producer = std::function<void(Writer& writer)>;

    ThreadedResponseStream(uint64_t id, Producer producer, std::size_t maxQueued = 16);
    ~ThreadedResponseStream() override;

    ThreadedResponseStream(const ThreadedResponseStream&) = delete;
    ThreadedResponseStream& operator=(const ThreadedResponseStream&) = delete;

    Status poll(PlaybackChunk& out) override;
    void cancel() override;
    uint64_t id() const override { return id_; }

    bool cancelled() const;

private:
    struct Shared {
        uint64_t id = 0;
        std::size_t maxQueued = 16;
        CancellationToken token;

        std::mutex mutex;
        std::condition_variable spaceCv;
        std::deque<PlaybackChunk> queue;
        bool finished = false;
        std::string error;
    };

    static void run(std::shared_ptr<Shared> shared, Producer producer);

    uint64_t id_;
    std::shared_ptr<Shared> shared_;
};

#endif
