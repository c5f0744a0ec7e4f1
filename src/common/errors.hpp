#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace hllrcon {

enum class ErrorKind : uint8_t {
    Connection = 0,        // socket could not be opened or connected
    Io = 1,                // read/write failure after connect
    ConnectionClosed = 2,  // peer closed the stream mid-read
    Protocol = 3,          // structural violation, session must be discarded
    Command = 4,           // well-formed exchange, non-200 status
};

// Root of everything the codec and the session throw.
class RconError : public std::runtime_error {
public:
    explicit RconError(const std::string& what) : std::runtime_error(what) {}
    virtual ErrorKind kind() const = 0;
};

class ConnectionError : public RconError {
public:
    ConnectionError(const std::string& host, uint16_t port, const std::string& reason);

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

    ErrorKind kind() const override { return ErrorKind::Connection; }

private:
    std::string host_;
    uint16_t port_;
};

class IoError : public RconError {
public:
    explicit IoError(const std::string& what) : RconError(what) {}
    ErrorKind kind() const override { return ErrorKind::Io; }
};

class ConnectionClosed : public IoError {
public:
    explicit ConnectionClosed(const std::string& what) : IoError(what) {}
    ErrorKind kind() const override { return ErrorKind::ConnectionClosed; }
};

class ProtocolError : public RconError {
public:
    explicit ProtocolError(const std::string& what) : RconError(what) {}
    ErrorKind kind() const override { return ErrorKind::Protocol; }
};

class CommandError : public RconError {
public:
    CommandError(const std::string& command, int status_code, const std::string& status_message);

    const std::string& command() const { return command_; }
    int status_code() const { return status_code_; }
    const std::string& status_message() const { return status_message_; }

    ErrorKind kind() const override { return ErrorKind::Command; }

private:
    std::string command_;
    int status_code_;
    std::string status_message_;
};

// Invalid or incomplete configuration. Not part of the RconError hierarchy:
// the registry never degrades on it.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace hllrcon
