#include "SerialDevice/SerialConnection.hpp"
#include "SerialDevice/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <cerrno>
#include <cstring>

namespace SerialDevice {

namespace {

bool baudrateToSpeed(int baudrate, speed_t& speed) {
    switch (baudrate) {
        case 1200: speed = B1200; break;
        case 2400: speed = B2400; break;
        case 4800: speed = B4800; break;
        case 9600: speed = B9600; break;
        case 19200: speed = B19200; break;
        case 38400: speed = B38400; break;
        case 57600: speed = B57600; break;
        case 115200: speed = B115200; break;
        case 230400: speed = B230400; break;
        case 460800: speed = B460800; break;
        case 500000: speed = B500000; break;
        case 576000: speed = B576000; break;
        case 921600: speed = B921600; break;
        case 1000000: speed = B1000000; break;
        case 1152000: speed = B1152000; break;
        case 1500000: speed = B1500000; break;
        case 2000000: speed = B2000000; break;
        default: return false;
    }
    return true;
}

tcflag_t dataBitsFlag(int dataBits) {
    switch (dataBits) {
        case 5: return CS5;
        case 6: return CS6;
        case 7: return CS7;
        default: return CS8;
    }
}

} // namespace

SerialConnection::SerialConnection(const std::string& devicePath)
    : devicePath_(devicePath), fd_(-1) {}

SerialConnection::~SerialConnection() {
    close();
}

bool SerialConnection::open(const ConnectionConfig& config) {
    if (fd_ >= 0) {
        close();
    }
    lastError_.clear();
    readTimeoutMs_ = config.readTimeoutMs;

    fd_ = ::open(devicePath_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        lastError_ = strerror(errno);
        SD_LOG_DEBUG("Failed to open " + devicePath_ + ": " + lastError_);
        return false;
    }

    if (config.exclusive && ioctl(fd_, TIOCEXCL) != 0) {
        lastError_ = "TIOCEXCL failed: " + std::string(strerror(errno));
        SD_LOG_DEBUG(devicePath_ + ": " + lastError_);
        close();
        return false;
    }

    if (!configurePort(config)) {
        close();
        return false;
    }

    return true;
}

void SerialConnection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SerialConnection::isOpen() const {
    return fd_ >= 0;
}

int SerialConnection::read(uint8_t* buffer, size_t size, int timeoutMs) {
    if (fd_ < 0) return -1;

    fd_set readfds;
    struct timeval timeout;

    FD_ZERO(&readfds);
    FD_SET(fd_, &readfds);

    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;

    int ret = select(fd_ + 1, &readfds, nullptr, nullptr, &timeout);
    if (ret < 0) {
        return -1;
    } else if (ret == 0) {
        return 0;
    }

    ssize_t n = ::read(fd_, buffer, size);
    if (n < 0) {
        return (errno == EAGAIN || errno == EWOULDBLOCK) ? 0 : -1;
    }
    return static_cast<int>(n);
}

int SerialConnection::write(const uint8_t* data, size_t size) {
    if (fd_ < 0) return -1;
    return static_cast<int>(::write(fd_, data, size));
}

bool SerialConnection::configurePort(const ConnectionConfig& config) {
    struct termios tty;

    if (tcgetattr(fd_, &tty) != 0) {
        lastError_ = "tcgetattr failed: " + std::string(strerror(errno));
        SD_LOG_DEBUG(devicePath_ + ": " + lastError_);
        return false;
    }

    speed_t speed;
    if (!baudrateToSpeed(config.baudrate, speed)) {
        lastError_ = "Unsupported baudrate: " + std::to_string(config.baudrate);
        SD_LOG_ERROR(lastError_);
        return false;
    }

    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    tty.c_cflag &= ~CSIZE;
    tty.c_cflag |= dataBitsFlag(config.dataBits);

    switch (config.parity) {
        case Parity::NONE:
            tty.c_cflag &= ~PARENB;
            tty.c_iflag &= ~INPCK;
            break;
        case Parity::ODD:
            tty.c_cflag |= PARENB | PARODD;
            tty.c_iflag |= INPCK;
            break;
        case Parity::EVEN:
            tty.c_cflag |= PARENB;
            tty.c_cflag &= ~PARODD;
            tty.c_iflag |= INPCK;
            break;
    }

    if (config.stopBits == 2) {
        tty.c_cflag |= CSTOPB;
    } else {
        tty.c_cflag &= ~CSTOPB;
    }

    tty.c_cflag &= ~CRTSCTS;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);
    if (config.flowControl == FlowControl::HARDWARE) {
        tty.c_cflag |= CRTSCTS;
    } else if (config.flowControl == FlowControl::SOFTWARE) {
        tty.c_iflag |= IXON | IXOFF;
    }

    tty.c_cflag |= CREAD | CLOCAL;

    tty.c_lflag &= ~ICANON;
    tty.c_lflag &= ~ECHO;
    tty.c_lflag &= ~ECHOE;
    tty.c_lflag &= ~ECHONL;
    tty.c_lflag &= ~ISIG;

    tty.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL);

    tty.c_oflag &= ~OPOST;
    tty.c_oflag &= ~ONLCR;

    tty.c_cc[VTIME] = 0;
    tty.c_cc[VMIN] = 0;

    if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
        lastError_ = "tcsetattr failed: " + std::string(strerror(errno));
        SD_LOG_DEBUG(devicePath_ + ": " + lastError_);
        return false;
    }

    tcflush(fd_, TCIOFLUSH);

    return true;
}

} // namespace SerialDevice
