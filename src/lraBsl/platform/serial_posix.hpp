#pragma once

// POSIX tty transport for the BSL link.
// Raw 8N1, non-blocking reads (VMIN=0, VTIME=0); callers poll bytes_available().

#include "../core/types.hpp"
#include "../error/result.hpp"
#include "platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace lraBsl::platform {

class serial_port {
public:
    explicit serial_port(bool trace = false) noexcept : trace_(trace) {}
    ~serial_port() { close(); }

    serial_port(const serial_port&) = delete;
    serial_port& operator=(const serial_port&) = delete;

    result<void> open(const char* path, u32 baud_rate) noexcept {
        if (fd_ >= 0) {
            return result<void>(error_code::port_open_failed);
        }
        fd_ = ::open(path, O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd_ < 0) {
            logf("open(%s): %s", path, std::strerror(errno));
            return result<void>(error_code::port_open_failed);
        }
        if (::tcgetattr(fd_, &saved_tio_) != 0) {
            logf("tcgetattr(%s): %s", path, std::strerror(errno));
            ::close(fd_);
            fd_ = -1;
            return result<void>(error_code::port_open_failed);
        }

        termios tio = saved_tio_;
        ::cfmakeraw(&tio);
        tio.c_cflag &= static_cast<tcflag_t>(~(CSTOPB | PARENB | CRTSCTS));
        tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD | CS8);
        tio.c_cc[VMIN] = 0;
        tio.c_cc[VTIME] = 0;
        const speed_t speed = baud_to_speed(baud_rate);
        ::cfsetispeed(&tio, speed);
        ::cfsetospeed(&tio, speed);
        if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
            logf("tcsetattr(%s): %s", path, std::strerror(errno));
            ::close(fd_);
            fd_ = -1;
            return result<void>(error_code::port_open_failed);
        }
        ::tcflush(fd_, TCIOFLUSH);
        return set_dtr(true);
    }

    void close() noexcept {
        if (fd_ < 0) {
            return;
        }
        ::tcsetattr(fd_, TCSANOW, &saved_tio_);
        ::close(fd_);
        fd_ = -1;
    }

    void flush_input() noexcept {
        if (fd_ >= 0) { ::tcflush(fd_, TCIFLUSH); }
    }

    void flush_output() noexcept {
        if (fd_ >= 0) { ::tcflush(fd_, TCOFLUSH); }
    }

    result<void> write(const u8* data, size_t len) noexcept {
        if (fd_ < 0) {
            return result<void>(error_code::io_error);
        }
        if (trace_) { trace("send", data, len); }
        size_t written = 0;
        while (written < len) {
            const ssize_t n = ::write(fd_, data + written, len - written);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    delay_us(100);
                    continue;
                }
                logf("write: %s", std::strerror(errno));
                return result<void>(error_code::io_error);
            }
            written += static_cast<size_t>(n);
        }
        ::tcdrain(fd_);
        return ok();
    }

    size_t bytes_available() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        int count = 0;
        if (::ioctl(fd_, FIONREAD, &count) != 0 || count < 0) {
            return 0;
        }
        return static_cast<size_t>(count);
    }

    size_t read(u8* dst, size_t len) noexcept {
        if (fd_ < 0) {
            return 0;
        }
        const ssize_t n = ::read(fd_, dst, len);
        if (n <= 0) {
            return 0;
        }
        if (trace_) { trace("recv", dst, static_cast<size_t>(n)); }
        return static_cast<size_t>(n);
    }

    // Hold the line in break for roughly duration_ms
    result<void> send_break(duration_t duration_ms) noexcept {
        if (fd_ < 0 || ::ioctl(fd_, TIOCSBRK) != 0) {
            return result<void>(error_code::io_error);
        }
        delay_ms(duration_ms);
        if (::ioctl(fd_, TIOCCBRK) != 0) {
            return result<void>(error_code::io_error);
        }
        return ok();
    }

    result<void> set_dtr(bool asserted) noexcept {
        int bits = TIOCM_DTR;
        if (fd_ < 0 || ::ioctl(fd_, asserted ? TIOCMBIS : TIOCMBIC, &bits) != 0) {
            return result<void>(error_code::io_error);
        }
        return ok();
    }

private:
    static speed_t baud_to_speed(u32 baud) noexcept {
        switch (baud) {
            case 9600U:   return B9600;
            case 19200U:  return B19200;
            case 38400U:  return B38400;
            case 57600U:  return B57600;
            case 230400U: return B230400;
            case 115200U:
            default:      return B115200;
        }
    }

    // hex bytes followed by their printable rendering
    static void trace(const char* tag, const u8* data, size_t len) noexcept {
        char line[256];
        size_t pos = static_cast<size_t>(std::snprintf(line, sizeof(line), "%s ", tag));
        for (size_t i = 0; i < len && pos + 4 < sizeof(line); ++i) {
            pos += static_cast<size_t>(std::snprintf(line + pos, sizeof(line) - pos, "%02x ", data[i]));
        }
        if (pos + 2 < sizeof(line)) { line[pos++] = '"'; }
        for (size_t i = 0; i < len && pos + 2 < sizeof(line); ++i) {
            line[pos++] = (data[i] >= 0x20 && data[i] < 0x7F) ? static_cast<char>(data[i]) : '.';
        }
        if (pos + 1 < sizeof(line)) { line[pos++] = '"'; }
        line[pos < sizeof(line) ? pos : sizeof(line) - 1] = '\0';
        log(line);
    }

    int fd_{-1};
    bool trace_{false};
    termios saved_tio_{};
};

} // namespace lraBsl::platform
