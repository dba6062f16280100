#ifndef TURN_STATE_HPP
#define TURN_STATE_HPP

#include <cstdint>
#include <functional>
#include <mutex>

enum class Turn { Idle, ListeningUser, ProcessingResponse, PlayingResponse };

const char* toString(Turn turn);

// The one owner of "whose turn it is" in a session. Components get it by
// reference; holding a single value makes ListeningUser and PlayingResponse
// mutually exclusive.
class TurnState {
public:
    using Observer = std::function<void(Turn from, Turn to)>;

    Turn current() const;

    // Entering the current turn again is a no-op. Throws std::logic_error on
    // a transition the turn machine does not have.
    void enter(Turn next);

    static bool allowed(Turn from, Turn to);

    // Called with the state lock released, from the thread that transitions.
    void setObserver(Observer observer);

    uint64_t transitions() const;

private:
    mutable std::mutex mutex_;
    Turn turn_ = Turn::Idle;
    uint64_t transitions_ = 0;
    Observer observer_;
};

#endif
