#include "turn/turn_state.hpp"

#include <stdexcept>
#include <string>
#include <utility>

const char* toString(Turn turn) {
    switch (turn) {
    case Turn::Idle: return "Idle";
    case Turn::ListeningUser: return "ListeningUser";
    case Turn::ProcessingResponse: return "ProcessingResponse";
    case Turn::PlayingResponse: return "PlayingResponse";
    }
    return "Unknown";
}

bool TurnState::allowed(Turn from, Turn to) {
    if (to == Turn::Idle) return true;
    switch (from) {
    case Turn::Idle:
        return to == Turn::ListeningUser;
    case Turn::ListeningUser:
        return to == Turn::ProcessingResponse;
    case Turn::ProcessingResponse:
        // ListeningUser on failure, timeout or an empty response
        return to == Turn::PlayingResponse || to == Turn::ListeningUser;
    case Turn::PlayingResponse:
        return to == Turn::ListeningUser;
    }
    return false;
}

Turn TurnState::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turn_;
}

void TurnState::enter(Turn next) {
    Turn previous;
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (turn_ == next) return;
        if (!allowed(turn_, next)) {
            throw std::logic_error(std::string("illegal turn transition ") + toString(turn_) + " -> " + toString(next));
        }
        previous = turn_;
        turn_ = next;
        ++transitions_;
        observer = observer_;
    }
    if (observer) observer(previous, next);
}

void TurnState::setObserver(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

uint64_t TurnState::transitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transitions_;
}
