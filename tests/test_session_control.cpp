#include "control/session_control.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using json = nlohmann::json;

TEST(SessionControl, ParsesCommands) {
    EXPECT_EQ(SessionControl::parseCommand(R"({"type":"session_start"})"), SessionControl::Command::Start);
    EXPECT_EQ(SessionControl::parseCommand(R"({"type":"session_stop"})"), SessionControl::Command::Stop);
    EXPECT_EQ(SessionControl::parseCommand(R"({"type":"status","extra":1})"), SessionControl::Command::Status);
}

TEST(SessionControl, UnknownOrBrokenDatagramsAreUnknown) {
    EXPECT_EQ(SessionControl::parseCommand("start"), SessionControl::Command::Unknown);
    EXPECT_EQ(SessionControl::parseCommand(R"({"type":"reboot"})"), SessionControl::Command::Unknown);
    EXPECT_EQ(SessionControl::parseCommand(R"({"type":5})"), SessionControl::Command::Unknown);
    EXPECT_EQ(SessionControl::parseCommand(R"(["session_start"])"), SessionControl::Command::Unknown);
    EXPECT_EQ(SessionControl::parseCommand(""), SessionControl::Command::Unknown);
}

TEST(SessionControl, FormatsTurnChanges) {
    SessionEvent e;
    e.type = SessionEvent::Type::TurnChanged;
    e.from = Turn::ListeningUser;
    e.to = Turn::ProcessingResponse;

    const json j = json::parse(SessionControl::formatEvent(e));
    EXPECT_EQ(j.at("type"), "turn_changed");
    EXPECT_EQ(j.at("from"), "ListeningUser");
    EXPECT_EQ(j.at("to"), "ProcessingResponse");
    EXPECT_TRUE(j.contains("ts"));
}

TEST(SessionControl, FormatsFailuresWithTheirMessage) {
    SessionEvent e;
    e.type = SessionEvent::Type::ResponseFailed;
    e.responseId = 4;
    e.message = "piper exited with status 1";

    const json j = json::parse(SessionControl::formatEvent(e));
    EXPECT_EQ(j.at("type"), "response_failed");
    EXPECT_EQ(j.at("response_id"), 4);
    EXPECT_EQ(j.at("message"), "piper exited with status 1");

    SessionEvent d;
    d.type = SessionEvent::Type::DeviceUnavailable;
    d.message = "unplugged";
    EXPECT_EQ(json::parse(SessionControl::formatEvent(d)).at("type"), "device_unavailable");

    SessionEvent end;
    end.type = SessionEvent::Type::SessionEnded;
    EXPECT_EQ(json::parse(SessionControl::formatEvent(end)).at("type"), "session_done");
}

TEST(SessionControl, FormatsUtterances) {
    SessionEvent e;
    e.type = SessionEvent::Type::UtteranceSealed;
    e.utteranceId = 12;
    e.durationMs = 840;

    const json j = json::parse(SessionControl::formatEvent(e));
    EXPECT_EQ(j.at("type"), "utterance_sealed");
    EXPECT_EQ(j.at("utterance_id"), 12);
    EXPECT_EQ(j.at("duration_ms"), 840);
}

TEST(SessionControl, NothingIsSentBeforeAClientSpoke) {
    SessionControl control("127.0.0.1", 3939, nullptr);
    SessionEvent e;
    EXPECT_FALSE(control.sendEvent(e));
    EXPECT_FALSE(control.sendStatus(false, Turn::Idle));
}

TEST(SessionControl, InvalidBindAddressThrows) {
    SessionControl control("not-an-ip", 3939, nullptr);
    EXPECT_THROW(control.start(), std::runtime_error);
}

namespace {

// Loopback UDP peer standing in for the presentation layer.
class ControlClient {
public:
    ControlClient() {
        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr = loopback(0);
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        timeval tv{};
        tv.tv_sec = 2;
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }
    ~ControlClient() { ::close(fd_); }

    void send(int port, const std::string& payload) {
        sockaddr_in to = loopback(port);
        ::sendto(fd_, payload.data(), payload.size(), 0, reinterpret_cast<sockaddr*>(&to), sizeof(to));
    }

    // Empty on timeout.
    std::string receive() {
        char buff[2048];
        const ssize_t n = ::recv(fd_, buff, sizeof(buff), 0);
        return n > 0 ? std::string(buff, (std::size_t)n) : std::string();
    }

    uint16_t port() const { return port_; }

private:
    static sockaddr_in loopback(int port) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        return addr;
    }

    int fd_ = -1;
    uint16_t port_ = 0;
};

struct Received {
    SessionControl::Command command;
    std::string ip;
    uint16_t port;
};

} // namespace

TEST(SessionControl, DispatchesCommandsAndAnswersTheSender) {
    std::mutex mutex;
    std::vector<Received> received;
    SessionControl control("127.0.0.1", 0, [&](SessionControl::Command c, const std::string& ip, uint16_t port) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(Received{c, ip, port});
    });
    control.start();
    ASSERT_GT(control.port(), 0);

    ControlClient client;
    client.send(control.port(), "not json");
    client.send(control.port(), R"({"type":"session_start"})");
    client.send(control.port(), R"({"type":"session_stop"})");

    ASSERT_TRUE(waitUntil([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return received.size() == 2;
    }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(received[0].command, SessionControl::Command::Start);
        EXPECT_EQ(received[0].ip, "127.0.0.1");
        EXPECT_EQ(received[0].port, client.port());
        EXPECT_EQ(received[1].command, SessionControl::Command::Stop);
    }

    SessionEvent e;
    e.type = SessionEvent::Type::TurnChanged;
    e.from = Turn::Idle;
    e.to = Turn::ListeningUser;
    ASSERT_TRUE(control.sendEvent(e));

    const json j = json::parse(client.receive());
    EXPECT_EQ(j.at("type"), "turn_changed");
    EXPECT_EQ(j.at("to"), "ListeningUser");

    control.stop();
    EXPECT_FALSE(control.sendEvent(e));
}
