#ifndef SESSION_CONTROL_HPP
#define SESSION_CONTROL_HPP

#include "turn/session_event.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

using socket_t = int;
static constexpr socket_t kInvalidSocket = -1;

// UDP endpoint the presentation layer uses to start and stop sessions. JSON
// datagrams in ({"type":"session_start"}), session events out to whichever
// client spoke last.
class SessionControl {
public:
    enum class Command { Unknown, Start, Stop, Status };

    using CallBack = std::function<void(Command command,
                                        const std::string& senderIp,
                                        uint16_t senderPort)>;

    SessionControl(std::string bind_ip, int port, CallBack callback_function);
    ~SessionControl();

    // Throws std::runtime_error if the socket cannot be bound. Port 0 binds
    // a free port, reported by port() afterwards.
    void start();
    void stop();

    int port() const { return port_.load(); }

    bool sendTo(const std::string& ip, uint16_t port, const std::string& payload);
    bool sendToActive(const std::string& payload);

    bool sendEvent(const SessionEvent& event);
    bool sendStatus(bool sessionRunning, Turn turn);

    static Command parseCommand(const std::string& payload);
    static std::string formatEvent(const SessionEvent& event);

private:
    void run();

    void setActiveClient(const std::string& ip, uint16_t port);

    std::string bind_ip_;
    std::atomic<int> port_;
    CallBack callback_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<socket_t> sock_{kInvalidSocket};

    std::mutex client_mutex_;
    std::string active_ip_{"127.0.0.1"};
    uint16_t active_port_{0};
    bool has_active_client_{false};
};

#endif
