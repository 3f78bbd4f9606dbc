#pragma once
#include <atomic>
#include <string>
#include "transport_link.hpp"

namespace hostlink {

/**
 * TCP byte stream for the AdbTunnel and SimulatedTcp kinds.
 * open() connects with a timeout; any failure is HostUnreachable.
 * shutdown() half-closes the socket so a blocked recv() returns; the
 * descriptor itself is closed in the destructor.
 */
class TcpBackend : public TransportBackend {
public:
    TcpBackend(std::string host, int port, int connect_timeout_ms);
    ~TcpBackend() override;

    Status open() override;
    Result<size_t> read(uint8_t* buf, size_t len) override;
    Result<size_t> write(const uint8_t* buf, size_t len) override;
    void shutdown() override;
    const char* name() const override { return "tcp"; }

    int port() const { return port_; }

private:
    std::string host_;
    int port_;
    int connect_timeout_ms_;
    int fd_ = -1;
    std::atomic<bool> shut_{false};
};

} // namespace hostlink
