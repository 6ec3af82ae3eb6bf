#pragma once
/**
 * @file linux_serial.hpp
 * @brief Linux USB/tty port (termios raw 8N1, non-blocking fd, poll for timing).
 *
 * Depends on: unistd.h, fcntl.h, termios.h, poll.h, sys/ioctl.h.
 */

#if !defined(__linux__)
#  error "linux_serial.hpp is Linux-only."
#endif

#include "bravejig/transport/serial_port.hpp"

#include <string>
#include <termios.h>

namespace bravejig::transport {

/// Map an integer baud to a termios speed; false for unsupported rates.
bool baud_to_speed(int baud, speed_t& out);

class LinuxSerialPort : public ISerialPort {
public:
    LinuxSerialPort() = default;
    ~LinuxSerialPort() override;

    LinuxSerialPort(const LinuxSerialPort&) = delete;
    LinuxSerialPort& operator=(const LinuxSerialPort&) = delete;

    bool        open(const PortConfig& cfg, std::string& err) override;
    void        close() override;
    bool        is_open() const override { return fd_ >= 0; }
    bool        wait_readable(int timeout_ms) override;
    std::size_t available() const override;
    RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override;
    TxResult    send(const uint8_t* data, std::size_t len) override;
    const char* name() const override { return "linux-serial"; }

private:
    int fd_{-1};
    int write_timeout_ms_{1000};
    std::string path_;
};

} // namespace bravejig::transport
