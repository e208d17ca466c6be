#include <anemo/hardware/posix_serial_port.hpp>
#include <anemo/config/config.hpp>
#include <anemo/utils/logger.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

static const char* TAG = "SERIAL";

namespace {
    typedef std::chrono::steady_clock Clock;

    static int remainingMs(Clock::time_point deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    }
}

PosixSerialPort::PosixSerialPort()
    : fd(-1),
      dropping(false) {}

PosixSerialPort::~PosixSerialPort() {
    close();
}

bool PosixSerialPort::baudToSpeed(uint32_t baud, speed_t& out_speed) {
    switch (baud) {
        case 9600:   out_speed = B9600;   return true;
        case 19200:  out_speed = B19200;  return true;
        case 38400:  out_speed = B38400;  return true;
        case 57600:  out_speed = B57600;  return true;
        case 115200: out_speed = B115200; return true;
        default:     return false;
    }
}

void PosixSerialPort::setError(const char* what) {
    int err = errno;
    setErrorText(std::string(what) + ": " + std::strerror(err));
}

void PosixSerialPort::setErrorText(const std::string& text) {
    std::lock_guard<std::mutex> lock(error_mutex);
    last_error = text;
}

std::string PosixSerialPort::lastError() const {
    std::lock_guard<std::mutex> lock(error_mutex);
    return last_error;
}

bool PosixSerialPort::open(const std::string& port, uint32_t baud) {
    if (fd >= 0) {
        close();
    }
    setErrorText(std::string());
    rx_pending.clear();
    dropping = false;

    fd = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        setError("open failed");
        LOG_ERROR(TAG, "%s: %s", port.c_str(), lastError().c_str());
        return false;
    }
    port_name = port;

    if (!configure(baud)) {
        LOG_ERROR(TAG, "%s: %s", port.c_str(), lastError().c_str());
        ::close(fd);
        fd = -1;
        return false;
    }

    LOG_INFO(TAG, "Opened %s at %u baud (8N1)", port.c_str(), static_cast<unsigned>(baud));
    return true;
}

bool PosixSerialPort::configure(uint32_t baud) {
    speed_t speed;
    if (!baudToSpeed(baud, speed)) {
        setErrorText("unsupported baud rate");
        return false;
    }

    struct termios tty;
    std::memset(&tty, 0, sizeof(tty));
    if (tcgetattr(fd, &tty) != 0) {
        setError("tcgetattr failed");
        return false;
    }

    cfmakeraw(&tty);
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    // 8N1, receiver on, ignore modem lines, no flow control
    tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tty.c_cflag |= CS8 | CREAD | CLOCAL;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);

    // Reads are driven by poll(); never block inside read()
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tty) != 0) {
        setError("tcsetattr failed");
        return false;
    }
    return true;
}

void PosixSerialPort::close() {
    if (fd < 0) {
        return;
    }
    if (::close(fd) != 0) {
        setError("close failed");
        LOG_WARN(TAG, "%s: %s", port_name.c_str(), lastError().c_str());
    } else {
        LOG_INFO(TAG, "Closed %s", port_name.c_str());
    }
    fd = -1;
    rx_pending.clear();
    dropping = false;
}

bool PosixSerialPort::takeLine(std::string& out_line) {
    std::size_t nl = rx_pending.find('\n');
    while (nl != std::string::npos) {
        if (dropping) {
            // Tail of an over-long line
            rx_pending.erase(0, nl + 1);
            dropping = false;
            nl = rx_pending.find('\n');
            continue;
        }
        out_line.assign(rx_pending, 0, nl);
        rx_pending.erase(0, nl + 1);
        while (!out_line.empty() && (out_line.back() == '\r' || out_line.back() == '\n')) {
            out_line.pop_back();
        }
        return true;
    }

    if (rx_pending.size() > Config::Serial::max_line_len) {
        LOG_WARN(TAG, "Line exceeds %u bytes, dropping", static_cast<unsigned>(Config::Serial::max_line_len));
        rx_pending.clear();
        dropping = true;
    }
    return false;
}

ReadStatus PosixSerialPort::readLine(std::string& out_line, uint32_t timeout_ms) {
    out_line.clear();
    if (fd < 0) {
        setErrorText("port not open");
        return ReadStatus::ERROR;
    }

    Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        if (takeLine(out_line)) {
            return ReadStatus::LINE;
        }

        int wait_ms = remainingMs(deadline);
        if (wait_ms == 0) {
            // Unterminated input at the deadline is handed back and consumed
            if (!dropping) {
                out_line.swap(rx_pending);
                while (!out_line.empty() && out_line.back() == '\r') {
                    out_line.pop_back();
                }
            }
            rx_pending.clear();
            dropping = false;
            return ReadStatus::TIMEOUT;
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            setError("poll failed");
            return ReadStatus::ERROR;
        }
        if (rc == 0) {
            continue;
        }
        if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 && (pfd.revents & POLLIN) == 0) {
            setErrorText("device disconnected");
            return ReadStatus::ERROR;
        }

        char chunk[256];
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            rx_pending.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            // Readable with no data: the tty went away
            setErrorText("device disconnected");
            return ReadStatus::ERROR;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            setError("read failed");
            return ReadStatus::ERROR;
        }
    }
}

long PosixSerialPort::bytesAvailable() {
    if (fd < 0) {
        return -1;
    }
    int queued = 0;
    if (::ioctl(fd, FIONREAD, &queued) != 0) {
        setError("FIONREAD failed");
        return -1;
    }
    return static_cast<long>(queued) + static_cast<long>(rx_pending.size());
}

bool PosixSerialPort::write(const uint8_t* data, std::size_t len) {
    if (fd < 0) {
        setErrorText("port not open");
        return false;
    }
    Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(Config::Serial::write_timeout_ms);
    std::size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd, data + written, len - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            setError("write failed");
            return false;
        }
        int wait_ms = remainingMs(deadline);
        if (wait_ms == 0) {
            setErrorText("write timed out");
            return false;
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (::poll(&pfd, 1, wait_ms) < 0 && errno != EINTR) {
            setError("poll failed");
            return false;
        }
    }
    return true;
}

bool PosixSerialPort::drain() {
    if (fd < 0) {
        return false;
    }
    if (::tcdrain(fd) != 0) {
        setError("tcdrain failed");
        return false;
    }
    return true;
}

bool PosixSerialPort::flushInput() {
    if (fd < 0) {
        return false;
    }
    rx_pending.clear();
    dropping = false;
    if (::tcflush(fd, TCIFLUSH) != 0) {
        setError("tcflush(input) failed");
        return false;
    }
    return true;
}

bool PosixSerialPort::flushOutput() {
    if (fd < 0) {
        return false;
    }
    if (::tcflush(fd, TCOFLUSH) != 0) {
        setError("tcflush(output) failed");
        return false;
    }
    return true;
}
