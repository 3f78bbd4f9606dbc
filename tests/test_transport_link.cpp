// =============================================================================
// Unit tests for TransportLink and TcpBackend
// =============================================================================
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <future>
#include <thread>
#include "fake_host.hpp"
#include "tcp_backend.hpp"
#include "transport_link.hpp"

using namespace hostlink;
using namespace hostlink::fake;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Loopback listener on an ephemeral port
class LoopbackServer {
public:
    LoopbackServer() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 1);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~LoopbackServer() {
        if (client_ >= 0) ::close(client_);
        if (fd_ >= 0) ::close(fd_);
    }

    int port() const { return port_; }

    int accept() {
        client_ = ::accept(fd_, nullptr, nullptr);
        return client_;
    }

    // Closes the listener so the port refuses connections
    void stopListening() {
        ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
    int client_ = -1;
    int port_ = 0;
};

static std::vector<uint8_t> handshakeFrame(uint32_t id) {
    auto payload = protocol::encodeString("link-test");
    return protocol::encodeFrame(protocol::OP_HANDSHAKE, id, payload.data(), payload.size()).value();
}

// ---------------------------------------------------------------------------
// TransportLink over the fake host
// ---------------------------------------------------------------------------
TEST(TransportLinkTest, UsbWithoutPermissionIsDenied) {
    auto host = std::make_shared<FakeHost>();
    auto platform = std::make_shared<FakePermissionPlatform>(false);
    PermissionGate gate(platform);
    TransportLink link(gate, host->factory());

    auto r = link.open(TransportKind::UsbDirect);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::PermissionDenied);
    EXPECT_TRUE(host->openAttempts().empty());
    EXPECT_FALSE(link.isOpen());

    // Tunnel kinds do not need USB access
    auto tunnel = link.open(TransportKind::AdbTunnel);
    ASSERT_TRUE(tunnel.is_ok());
    EXPECT_EQ(tunnel.value().kind, TransportKind::AdbTunnel);
}

TEST(TransportLinkTest, WriteThenReadResponse) {
    auto host = std::make_shared<FakeHost>();
    PermissionGate gate(std::make_shared<FakePermissionPlatform>(true));
    TransportLink link(gate, host->factory());
    ASSERT_TRUE(link.open(TransportKind::UsbDirect).is_ok());

    auto frame = handshakeFrame(77);
    auto w = link.write(frame.data(), frame.size());
    ASSERT_TRUE(w.is_ok());
    EXPECT_EQ(w.value(), frame.size());

    protocol::ReadFn fn = [&](uint8_t* buf, size_t len) { return link.read(buf, len); };
    auto resp = protocol::readFrame(fn);
    ASSERT_TRUE(resp.is_ok());
    EXPECT_EQ(resp.value().opcode, protocol::OP_DATA);
    EXPECT_EQ(resp.value().correlation_id, 77u);
    EXPECT_EQ(host->lastClientId(), "link-test");
    EXPECT_EQ(link.bytesWritten(), frame.size());
    EXPECT_EQ(link.bytesRead(), resp.value().payload.size() + protocol::FRAME_OVERHEAD);
}

TEST(TransportLinkTest, SecondOpenInProcessIsBusy) {
    auto host = std::make_shared<FakeHost>();
    PermissionGate gate(std::make_shared<FakePermissionPlatform>(true));
    TransportLink first(gate, host->factory());
    TransportLink second(gate, host->factory());

    ASSERT_TRUE(first.open(TransportKind::UsbDirect).is_ok());
    auto r = second.open(TransportKind::AdbTunnel);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Busy);
    EXPECT_TRUE(first.isOpen());

    first.close();
    EXPECT_TRUE(second.open(TransportKind::AdbTunnel).is_ok());
}

TEST(TransportLinkTest, FailedOpenLeavesNoLinkBehind) {
    auto host = std::make_shared<FakeHost>();
    host->setOpenError(TransportKind::UsbDirect, Error(ErrorKind::BackendUnavailable, "no device"));
    PermissionGate gate(std::make_shared<FakePermissionPlatform>(true));
    TransportLink link(gate, host->factory());

    auto r = link.open(TransportKind::UsbDirect);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::BackendUnavailable);
    EXPECT_FALSE(link.isOpen());
    EXPECT_FALSE(link.handle().has_value());

    auto ok = link.open(TransportKind::AdbTunnel);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(host->openAttempts(),
              (std::vector<TransportKind>{TransportKind::UsbDirect, TransportKind::AdbTunnel}));
}

TEST(TransportLinkTest, CloseIsIdempotentAndFailsLaterIo) {
    auto host = std::make_shared<FakeHost>();
    PermissionGate gate(std::make_shared<FakePermissionPlatform>(true));
    TransportLink link(gate, host->factory());

    link.close();
    ASSERT_TRUE(link.open(TransportKind::SimulatedTcp).is_ok());
    link.close();
    link.close();

    uint8_t buf[4];
    auto r = link.read(buf, sizeof(buf));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::LinkLost);
    auto w = link.write(buf, sizeof(buf));
    ASSERT_TRUE(w.is_err());
    EXPECT_EQ(w.error().kind, ErrorKind::LinkLost);
}

TEST(TransportLinkTest, CloseUnblocksPendingRead) {
    auto host = std::make_shared<FakeHost>();
    PermissionGate gate(std::make_shared<FakePermissionPlatform>(true));
    TransportLink link(gate, host->factory());
    ASSERT_TRUE(link.open(TransportKind::UsbDirect).is_ok());

    auto reader = std::async(std::launch::async, [&] {
        uint8_t buf[16];
        return link.read(buf, sizeof(buf));
    });
    std::this_thread::sleep_for(20ms);
    link.close();

    ASSERT_EQ(reader.wait_for(2s), std::future_status::ready);
    auto r = reader.get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::LinkLost);
}

TEST(TransportLinkTest, SessionIncrementsPerOpen) {
    auto host = std::make_shared<FakeHost>();
    PermissionGate gate(std::make_shared<FakePermissionPlatform>(true));
    TransportLink link(gate, host->factory());

    auto a = link.open(TransportKind::UsbDirect);
    ASSERT_TRUE(a.is_ok());
    link.close();
    auto b = link.open(TransportKind::UsbDirect);
    ASSERT_TRUE(b.is_ok());
    EXPECT_GT(b.value().session, a.value().session);
    EXPECT_EQ(link.handle()->session, b.value().session);
}

// ---------------------------------------------------------------------------
// TcpBackend over a real loopback socket
// ---------------------------------------------------------------------------
TEST(TcpBackendTest, ExchangesBytesWithLoopbackPeer) {
    LoopbackServer server;
    TcpBackend tcp("127.0.0.1", server.port(), 1000);
    ASSERT_TRUE(tcp.open().is_ok());
    int peer = server.accept();
    ASSERT_GE(peer, 0);

    const uint8_t out[] = {1, 2, 3, 4};
    auto w = tcp.write(out, sizeof(out));
    ASSERT_TRUE(w.is_ok());
    uint8_t got[4] = {};
    ASSERT_EQ(::recv(peer, got, sizeof(got), MSG_WAITALL), 4);
    EXPECT_EQ(std::vector<uint8_t>(got, got + 4), std::vector<uint8_t>(out, out + 4));

    const uint8_t back[] = {9, 8};
    ASSERT_EQ(::send(peer, back, sizeof(back), 0), 2);
    uint8_t in[8];
    size_t total = 0;
    while (total < 2) {
        auto r = tcp.read(in + total, sizeof(in) - total);
        ASSERT_TRUE(r.is_ok());
        ASSERT_GT(r.value(), 0u);
        total += r.value();
    }
    EXPECT_EQ(in[0], 9);
    EXPECT_EQ(in[1], 8);
}

TEST(TcpBackendTest, PeerCloseReadsAsEndOfStream) {
    LoopbackServer server;
    TcpBackend tcp("127.0.0.1", server.port(), 1000);
    ASSERT_TRUE(tcp.open().is_ok());
    int peer = server.accept();
    ASSERT_GE(peer, 0);
    ::shutdown(peer, SHUT_WR);

    uint8_t buf[4];
    auto r = tcp.read(buf, sizeof(buf));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 0u);
}

TEST(TcpBackendTest, ShutdownUnblocksRead) {
    LoopbackServer server;
    TcpBackend tcp("127.0.0.1", server.port(), 1000);
    ASSERT_TRUE(tcp.open().is_ok());
    ASSERT_GE(server.accept(), 0);

    auto reader = std::async(std::launch::async, [&] {
        uint8_t buf[4];
        return tcp.read(buf, sizeof(buf));
    });
    std::this_thread::sleep_for(20ms);
    tcp.shutdown();
    tcp.shutdown();

    ASSERT_EQ(reader.wait_for(2s), std::future_status::ready);
    // Either end-of-stream or LinkLost, never a hang
    auto r = reader.get();
    EXPECT_TRUE(r.is_err() || r.value() == 0u);
}

TEST(TcpBackendTest, RefusedConnectionIsHostUnreachable) {
    LoopbackServer server;
    int port = server.port();
    server.stopListening();

    TcpBackend tcp("127.0.0.1", port, 500);
    auto s = tcp.open();
    ASSERT_TRUE(s.is_err());
    EXPECT_EQ(s.error().kind, ErrorKind::HostUnreachable);
}

TEST(TcpBackendTest, BadAddressIsHostUnreachable) {
    TcpBackend tcp("not-an-ip", 5555, 100);
    auto s = tcp.open();
    ASSERT_TRUE(s.is_err());
    EXPECT_EQ(s.error().kind, ErrorKind::HostUnreachable);
}
