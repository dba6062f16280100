#include "control/session_control.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

// Constructor
SessionControl::SessionControl(std::string bind_ip, int port, CallBack callback_function)
    : bind_ip_(std::move(bind_ip)), port_(port), callback_(std::move(callback_function)) {}

// Destructor
SessionControl::~SessionControl() { stop(); }

// Binds the socket and starts the receive thread
void SessionControl::start() {
    if (running_.load()) return;

    const socket_t s = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (s == kInvalidSocket) {
        throw std::runtime_error(std::string("SessionControl socket() failed: ") + std::strerror(errno));
    }

    int reuse = 1;
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    // recvfrom wakes up regularly so stop() is noticed
    timeval tv{};
    tv.tv_usec = 200 * 1000;
    ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_.load()));

    if (::inet_pton(AF_INET, bind_ip_.c_str(), &addr.sin_addr) != 1) {
        ::close(s);
        throw std::runtime_error("SessionControl: invalid bind ip: " + bind_ip_);
    }
    if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        ::close(s);
        throw std::runtime_error(std::string("SessionControl bind() failed: ") + std::strerror(err));
    }
    socklen_t alen = sizeof(addr);
    if (::getsockname(s, reinterpret_cast<sockaddr*>(&addr), &alen) == 0) port_.store(ntohs(addr.sin_port));

    sock_.store(s);
    running_.store(true);
    thread_ = std::thread(&SessionControl::run, this);
}

// Stops the receive thread and closes the socket
void SessionControl::stop() {
    if (!running_.exchange(false)) return;

    const socket_t s = sock_.load();
    if (s != kInvalidSocket) ::shutdown(s, SHUT_RDWR);
    if (thread_.joinable()) thread_.join();

    sock_.store(kInvalidSocket);
    ::close(s);
}

// Sets current active client the endpoint is talking to
void SessionControl::setActiveClient(const std::string& ip, uint16_t port) {
    std::lock_guard<std::mutex> lock(client_mutex_);
    active_ip_ = ip;
    active_port_ = port;
    has_active_client_ = true;
}

// Sends a payload to an ip and port
bool SessionControl::sendTo(const std::string& ip, uint16_t port, const std::string& payload) {
    const socket_t s = sock_.load();
    if (s == kInvalidSocket) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

    ssize_t n = ::sendto(s, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return n == (ssize_t)payload.size();
}

// Sends a payload to the active client
bool SessionControl::sendToActive(const std::string& payload) {
    std::string ip;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (!has_active_client_) return false;
        ip = active_ip_;
        port = active_port_;
    }
    return sendTo(ip, port, payload);
}

bool SessionControl::sendEvent(const SessionEvent& event) {
    return sendToActive(formatEvent(event));
}

bool SessionControl::sendStatus(bool sessionRunning, Turn turn) {
    nlohmann::json j;
    j["type"] = "status";
    j["running"] = sessionRunning;
    j["turn"] = toString(turn);
    j["ts"] = (double)std::time(nullptr);
    return sendToActive(j.dump());
}

SessionControl::Command SessionControl::parseCommand(const std::string& payload) {
    const nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return Command::Unknown;

    auto it = j.find("type");
    if (it == j.end() || !it->is_string()) return Command::Unknown;

    const std::string type = it->get<std::string>();
    if (type == "session_start") return Command::Start;
    if (type == "session_stop") return Command::Stop;
    if (type == "status") return Command::Status;
    return Command::Unknown;
}

std::string SessionControl::formatEvent(const SessionEvent& event) {
    nlohmann::json j;
    j["type"] = toString(event.type);
    j["ts"] = (double)std::time(nullptr);

    switch (event.type) {
    case SessionEvent::Type::TurnChanged:
        j["from"] = toString(event.from);
        j["to"] = toString(event.to);
        break;
    case SessionEvent::Type::UtteranceSealed:
        j["utterance_id"] = event.utteranceId;
        j["duration_ms"] = event.durationMs;
        break;
    case SessionEvent::Type::BargeIn:
        j["response_id"] = event.responseId;
        break;
    case SessionEvent::Type::ResponseFailed:
        j["response_id"] = event.responseId;
        j["message"] = event.message;
        break;
    case SessionEvent::Type::DeviceUnavailable:
        j["message"] = event.message;
        break;
    case SessionEvent::Type::SessionEnded:
        break;
    }
    return j.dump();
}

// Thread function that waits for commands from the presentation layer
void SessionControl::run() {
    const socket_t s = sock_.load();

    while (running_.load()) {
        char buff[2048];
        sockaddr_in src{};
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(s, buff, sizeof(buff) - 1, 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);

        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        if (n <= 0) break;
        buff[n] = '\0';

        char ipstr[INET_ADDRSTRLEN]{};
        const char* ok = ::inet_ntop(AF_INET, &src.sin_addr, ipstr, sizeof(ipstr));
        std::string senderIp = ok ? std::string(ipstr) : std::string("127.0.0.1");
        uint16_t senderPort = ntohs(src.sin_port);

        setActiveClient(senderIp, senderPort);

        const Command command = parseCommand(std::string(buff, (std::size_t)n));
        if (command == Command::Unknown) {
            std::cerr << "[Session Control] [WARN] Ignoring datagram from " << senderIp << ":" << senderPort << "\n";
            continue;
        }

        try {
            if (callback_) callback_(command, senderIp, senderPort);
        } catch (const std::exception& e) {
            std::cerr << "[Session Control] [ERROR] callback threw: " << e.what() << "\n";
        }
    }
}
