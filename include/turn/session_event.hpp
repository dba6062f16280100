#ifndef SESSION_EVENT_HPP
#define SESSION_EVENT_HPP

#include "turn/turn_state.hpp"

#include <cstdint>
#include <functional>
#include <string>

// What the session reports to the presentation layer.
struct SessionEvent {
    enum class Type {
        TurnChanged,
        UtteranceSealed,
        BargeIn,
        ResponseFailed,
        DeviceUnavailable,
        SessionEnded
    };

    Type type = Type::TurnChanged;
    Turn from = Turn::Idle;
    Turn to = Turn::Idle;
    uint64_t utteranceId = 0;
    uint64_t responseId = 0;
    int durationMs = 0;
    std::string message;
};

const char* toString(SessionEvent::Type type);

using SessionEventSink = std::function<void(const SessionEvent& event)>;

#endif
