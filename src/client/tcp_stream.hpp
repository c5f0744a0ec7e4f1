#pragma once

#include "protocol/byte_stream.hpp"
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>

namespace hllrcon::client {

// Blocking TCP stream with a deadline on every operation. Each call runs
// an asynchronous asio operation on a private io_context for at most
// `timeout`; if it has not completed by then the socket is closed.
class TcpStream : public protocol::ByteStream {
public:
    using tcp = asio::ip::tcp;

    explicit TcpStream(std::chrono::milliseconds timeout);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    // Throws ConnectionError with host:port context.
    void connect(const std::string& host, uint16_t port);

    void read_exact(std::span<uint8_t> dst) override;
    void write_all(std::span<const uint8_t> src) override;
    void close() override;

    bool is_open() const { return socket_.is_open(); }

private:
    // Runs the io_context until the pending operation completes or the
    // deadline expires. Returns false on expiry.
    bool run_until_complete();

    asio::io_context io_context_;
    tcp::socket socket_;
    std::chrono::milliseconds timeout_;
};

} // namespace hllrcon::client
