#pragma once
/**
 * @file serial_port.hpp
 * @brief Minimal port interface the Transport drives; one real and one fake implementation.
 *
 * Contract:
 *  - open(cfg, err) acquires the device; err gets a stable reason on failure.
 *  - wait_readable(ms) blocks up to ms for input; false on timeout or error.
 *  - available() returns bytes ready for recv().
 *  - recv(buf,cap,n) pulls up to cap bytes; RxResult::None means nothing yet.
 *  - send(buf,len) writes the whole buffer and drains it, or fails.
 *  - name() is a short identifier for logs.
 *
 * The Transport owns exactly one ISerialPort and is the only caller; reader
 * and writer threads call recv/send concurrently, which every implementation
 * must tolerate.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace bravejig::transport {

enum class TxResult : uint8_t { Ok = 0, Timeout = 1, Error = 2 };
enum class RxResult : uint8_t { None = 0, Ok = 1, Error = 2 };

struct PortConfig {
    std::string path;            // e.g. /dev/ttyACM0
    int baud{38400};
    int write_timeout_ms{1000};  // per send(), includes drain
};

class ISerialPort {
public:
    virtual ~ISerialPort() = default;
    virtual bool        open(const PortConfig& cfg, std::string& err) = 0;
    virtual void        close() = 0;
    virtual bool        is_open() const = 0;
    virtual bool        wait_readable(int timeout_ms) = 0;
    virtual std::size_t available() const = 0;
    virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
    virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
    virtual const char* name() const = 0;
};

} // namespace bravejig::transport
