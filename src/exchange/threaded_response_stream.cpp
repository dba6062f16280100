#include "exchange/threaded_response_stream.hpp"

#include "core/errors.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

// Constructor
ThreadedResponseStream::ThreadedResponseStream(uint64_t id, Producer producer, std::size_t maxQueued)
    : id_(id), shared_(std::make_shared<Shared>()) {
    shared_->id = id;
    shared_->maxQueued = maxQueued ? maxQueued : 1;
    std::thread(&ThreadedResponseStream::run, shared_, std::move(producer)).detach();
}

// Destructor
ThreadedResponseStream::~ThreadedResponseStream() { cancel(); }

void ThreadedResponseStream::cancel() {
    shared_->token.cancel();
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->queue.clear();
    shared_->spaceCv.notify_all();
}

bool ThreadedResponseStream::cancelled() const { return shared_->token.cancelled(); }

const CancellationToken& ThreadedResponseStream::Writer::token() const { return shared_->token; }

uint64_t ThreadedResponseStream::Writer::responseId() const { return shared_->id; }

bool ThreadedResponseStream::Writer::emit(PlaybackChunk chunk) {
    Shared& s = *shared_;
    chunk.responseId = s.id;

    std::unique_lock<std::mutex> lock(s.mutex);
    while (s.queue.size() >= s.maxQueued && !s.token.cancelled()) {
        s.spaceCv.wait_for(lock, std::chrono::milliseconds(20));
    }
    if (s.token.cancelled()) return false;
    s.queue.push_back(std::move(chunk));
    return true;
}

ResponseStream::Status ThreadedResponseStream::poll(PlaybackChunk& out) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (!shared_->queue.empty()) {
        out = std::move(shared_->queue.front());
        shared_->queue.pop_front();
        shared_->spaceCv.notify_one();
        return Status::Chunk;
    }
    if (!shared_->error.empty()) throw ResponseFailed(shared_->error);
    return shared_->finished ? Status::Finished : Status::Pending;
}

// Producer thread body
void ThreadedResponseStream::run(std::shared_ptr<Shared> shared, Producer producer) {
    Writer writer(shared);
    std::string error;
    try {
        producer(writer);
    } catch (const std::exception& e) {
        error = e.what();
        if (error.empty()) error = "response producer failed";
    }

    std::lock_guard<std::mutex> lock(shared->mutex);
    shared->finished = true;
    if (!shared->token.cancelled()) shared->error = error;
}
