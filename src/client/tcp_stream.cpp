#include "tcp_stream.hpp"
#include "asio/buffer.hpp"
#include "asio/connect.hpp"
#include "asio/error.hpp"
#include "asio/error_code.hpp"
#include "asio/read.hpp"
#include "asio/write.hpp"
#include "common/errors.hpp"
#include <SDL3/SDL_log.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace hllrcon::client {

TcpStream::TcpStream(std::chrono::milliseconds timeout)
    : socket_(io_context_)
    , timeout_(timeout) {
}

TcpStream::~TcpStream() {
    close();
}

bool TcpStream::run_until_complete() {
    io_context_.restart();
    io_context_.run_for(timeout_);

    if (io_context_.stopped()) {
        return true;
    }

    // Deadline hit: closing the socket aborts the pending operation, then
    // run until its handler has been invoked.
    asio::error_code ignored;
    socket_.close(ignored);
    io_context_.run();
    return false;
}

void TcpStream::connect(const std::string& host, uint16_t port) {
    asio::error_code ec;
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw ConnectionError(host, port, ec.message());
    }

    asio::async_connect(socket_, endpoints,
        [&](const asio::error_code& result_ec, const tcp::endpoint& /*endpoint*/) {
            ec = result_ec;
        });
    if (!run_until_complete()) {
        throw ConnectionError(host, port,
                              "connect timed out after " + std::to_string(timeout_.count()) + " ms");
    }
    if (ec) {
        asio::error_code ignored;
        socket_.close(ignored);
        throw ConnectionError(host, port, ec.message());
    }

    asio::error_code ignored;
    socket_.set_option(tcp::no_delay(true), ignored);

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "TcpStream::connect: Connected to %s:%u",
                 host.c_str(), static_cast<unsigned>(port));
}

void TcpStream::read_exact(std::span<uint8_t> dst) {
    if (!socket_.is_open()) {
        throw IoError("read on a closed connection");
    }

    asio::error_code ec;
    std::size_t transferred = 0;
    asio::async_read(socket_, asio::buffer(dst.data(), dst.size()),
        [&](const asio::error_code& result_ec, std::size_t length) {
            ec = result_ec;
            transferred = length;
        });

    if (!run_until_complete()) {
        throw IoError("read timed out after " + std::to_string(timeout_.count()) + " ms");
    }
    if (ec == asio::error::eof) {
        throw ConnectionClosed("connection closed by remote host after "
                               + std::to_string(transferred) + " of "
                               + std::to_string(dst.size()) + " bytes");
    }
    if (ec) {
        throw IoError("failed to read response from server: " + ec.message());
    }
}

void TcpStream::write_all(std::span<const uint8_t> src) {
    if (!socket_.is_open()) {
        throw IoError("write on a closed connection");
    }

    asio::error_code ec;
    asio::async_write(socket_, asio::buffer(src.data(), src.size()),
        [&](const asio::error_code& result_ec, std::size_t /*length*/) {
            ec = result_ec;
        });

    if (!run_until_complete()) {
        throw IoError("write timed out after " + std::to_string(timeout_.count()) + " ms");
    }
    if (ec) {
        throw IoError("failed to send data to server: " + ec.message());
    }
}

void TcpStream::close() {
    if (!socket_.is_open()) return;

    asio::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

} // namespace hllrcon::client
