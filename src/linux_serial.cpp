// ============================================================================
// linux_serial.cpp — implementation for transport/linux_serial.hpp
// ============================================================================

#include "bravejig/transport/linux_serial.hpp"

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <unistd.h>        // ::read, ::write, ::close
#include <poll.h>          // poll(2) for readable/writable waits
#include <sys/ioctl.h>     // FIONREAD
#include <cerrno>
#include <chrono>

namespace bravejig::transport {

bool baud_to_speed(int baud, speed_t& out) {
    switch (baud) {
        case 9600:   out = B9600;   return true;
        case 19200:  out = B19200;  return true;
        case 38400:  out = B38400;  return true;
        case 57600:  out = B57600;  return true;
        case 115200: out = B115200; return true;
#ifdef B230400
        case 230400: out = B230400; return true;
#endif
        default: return false;
    }
}

LinuxSerialPort::~LinuxSerialPort() { close(); }

// ---------------------------------------------------------------------------
// open()
// ------
// O_NOCTTY so the port never becomes our controlling terminal, O_NONBLOCK so
// reads and writes never hang; poll() does all the waiting. Raw 8N1, no
// flow control, VMIN=VTIME=0. Boot chatter is flushed before returning.
// ---------------------------------------------------------------------------
bool LinuxSerialPort::open(const PortConfig& cfg, std::string& err) {
    if (fd_ >= 0) { err = "already_open"; return false; }
    if (cfg.path.empty()) { err = "no_port"; return false; }

    speed_t sp;
    if (!baud_to_speed(cfg.baud, sp)) { err = "unsupported_baud"; return false; }

    int fd = ::open(cfg.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) { err = "open_failed"; return false; }

    termios tio{};
    if (::tcgetattr(fd, &tio) != 0) { ::close(fd); err = "tcgetattr_failed"; return false; }

    ::cfmakeraw(&tio);
    ::cfsetispeed(&tio, sp);
    ::cfsetospeed(&tio, sp);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (::tcsetattr(fd, TCSANOW, &tio) != 0) { ::close(fd); err = "tcsetattr_failed"; return false; }
    ::tcflush(fd, TCIOFLUSH);

    fd_ = fd;
    path_ = cfg.path;
    write_timeout_ms_ = cfg.write_timeout_ms;
    return true;
}

void LinuxSerialPort::close() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

bool LinuxSerialPort::wait_readable(int timeout_ms) {
    if (fd_ < 0) return false;
    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr <= 0) return false;                       // timeout or EINTR
    return (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

std::size_t LinuxSerialPort::available() const {
    if (fd_ < 0) return 0;
    int n = 0;
    if (::ioctl(fd_, FIONREAD, &n) != 0) return 0;
    return n > 0 ? static_cast<std::size_t>(n) : 0;
}

RxResult LinuxSerialPort::recv(uint8_t* out, std::size_t cap, std::size_t& out_len) {
    out_len = 0;
    if (fd_ < 0 || cap == 0) return RxResult::Error;
    ssize_t r = ::read(fd_, out, cap);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
    if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return RxResult::None;
    // r == 0 after POLLIN means the device went away (USB unplug)
    return RxResult::Error;
}

// ---------------------------------------------------------------------------
// send()
// ------
// Loop until every byte is written. EAGAIN waits on POLLOUT within the
// remaining write budget; then tcdrain() so one send() is one wire frame.
// ---------------------------------------------------------------------------
TxResult LinuxSerialPort::send(const uint8_t* data, std::size_t len) {
    if (fd_ < 0 || !data || !len) return TxResult::Error;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(write_timeout_ms_);
    std::size_t off = 0;

    while (off < len) {
        ssize_t w = ::write(fd_, data + off, len - off);
        if (w > 0) { off += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) return TxResult::Error;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left <= 0) return TxResult::Timeout;
        pollfd pfd{fd_, POLLOUT, 0};
        if (::poll(&pfd, 1, static_cast<int>(left)) < 0 && errno != EINTR) return TxResult::Error;
    }

    if (::tcdrain(fd_) != 0) return TxResult::Error;
    return TxResult::Ok;
}

} // namespace bravejig::transport
