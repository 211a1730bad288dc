/**
 * @file serial_driver.hpp
 * @brief 串口舵机驱动 (主机 <-> Arduino + PCA9685)
 * @date 2026-10-18
 *
 * @note ASCII行协议, '\n' 结尾:
 *   S <ch> <angle>  设置角度 (0-180)
 *   W <ch> <us>     写脉宽 (0-3000)
 *   R <ch>          释放单个舵机
 *   X               释放全部 (急停)
 *   P               心跳, 回复 PONG
 * 每条指令回复 OK 作为流控ACK, 其他内容视为NACK。
 */

#ifndef DUOARM_COMMUNICATION_SERIAL_DRIVER_HPP
#define DUOARM_COMMUNICATION_SERIAL_DRIVER_HPP

#include <cmath>
#include <cstdint>
#include <cstring>
#include <cstdio>
#include <string>
#include <atomic>
#include <mutex>
#include <algorithm>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include <errno.h>

#include "common/constants.hpp"
#include "common/logger.hpp"
#include "common/time_utils.hpp"

namespace duoarm {

/**
 * @brief 串口配置
 */
struct SerialConfig {
    std::string device = SERIAL_DEVICE_DEFAULT;
    int baudrate = SERIAL_BAUDRATE_DEFAULT;
    uint32_t settle_ms = SERIAL_SETTLE_MS;          // 打开后等待设备复位
    uint32_t ping_timeout_ms = PING_TIMEOUT_MS;
    uint32_t ack_timeout_ms = ACK_TIMEOUT_MS;
};

/**
 * @brief 串口驱动类
 *
 * 单个互斥锁保护 "发送 + 等待ACK", 保证请求/应答一一对应。
 * IO错误时自动断开, 需重新 connect() 握手。
 */
class SerialDriver {
public:
    SerialDriver() = default;
    ~SerialDriver() {
        disconnect();
    }

    // 禁止拷贝
    SerialDriver(const SerialDriver&) = delete;
    SerialDriver& operator=(const SerialDriver&) = delete;

    /**
     * @brief 打开串口并握手
     * @return PONG 收到才算连接成功
     */
    bool connect(const SerialConfig& config = SerialConfig()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_) {
            LOG_WARN("Serial already connected: %s", config_.device.c_str());
            return true;
        }
        config_ = config;

        fd_ = ::open(config_.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd_ < 0) {
            LOG_ERROR("Failed to open %s: %s", config_.device.c_str(), strerror(errno));
            return false;
        }

        if (!configure_port()) {
            close_locked();
            return false;
        }

        if (config_.settle_ms > 0) {
            sleep_ms(config_.settle_ms);
        }

        tcflush(fd_, TCIFLUSH);
        rx_buffer_.clear();

        if (!ping_locked()) {
            LOG_ERROR("No PONG from %s within %u ms", config_.device.c_str(),
                      config_.ping_timeout_ms);
            close_locked();
            return false;
        }

        connected_ = true;
        LOG_INFO("Serial connected: %s @ %d", config_.device.c_str(), config_.baudrate);
        return true;
    }

    /**
     * @brief 断开连接, 先发送 X 释放全部舵机
     */
    void disconnect() {
        if (connected_) {
            release_all();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0) {
            LOG_INFO("Serial disconnected: %s", config_.device.c_str());
        }
        close_locked();
    }

    bool is_connected() const { return connected_; }

    /**
     * @brief 设置舵机角度
     * @note 角度钳位到 [0, 180] 并截断为整数; 非有限值直接拒绝
     */
    bool set_servo_angle(int channel, double angle) {
        if (!std::isfinite(angle)) {
            LOG_ERROR("[Serial] Channel %d: non-finite angle rejected", channel);
            return false;
        }
        const int value = static_cast<int>(std::clamp(angle, SERVO_ANGLE_MIN, SERVO_ANGLE_MAX));
        char cmd[32];
        snprintf(cmd, sizeof(cmd), "S %d %d", channel, value);
        return send_command(cmd);
    }

    /**
     * @brief 直接写脉宽 (us)
     */
    bool write_pulse(int channel, int pulse_us) {
        const int value = std::clamp(pulse_us, 0, PULSE_SAFETY_MAX_US);
        char cmd[32];
        snprintf(cmd, sizeof(cmd), "W %d %d", channel, value);
        return send_command(cmd);
    }

    bool release_channel(int channel) {
        char cmd[16];
        snprintf(cmd, sizeof(cmd), "R %d", channel);
        return send_command(cmd);
    }

    bool release_all() {
        return send_command("X");
    }

    /**
     * @brief 统计信息
     */
    struct Stats {
        uint64_t commands_sent = 0;
        uint64_t acks_ok = 0;
        uint64_t ack_failures = 0;     // 超时或NACK
        uint64_t io_errors = 0;
    };

    Stats get_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    void reset_stats() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_ = Stats();
    }

    void print_stats() const {
        Stats s = get_stats();
        LOG_INFO("=== Serial Statistics ===");
        LOG_INFO("Commands: %lu, ACK ok: %lu, ACK failed: %lu, IO errors: %lu",
                 (unsigned long)s.commands_sent, (unsigned long)s.acks_ok,
                 (unsigned long)s.ack_failures, (unsigned long)s.io_errors);
    }

private:
    static speed_t baud_constant(int baudrate) {
        switch (baudrate) {
            case 9600:   return B9600;
            case 19200:  return B19200;
            case 38400:  return B38400;
            case 57600:  return B57600;
            case 115200: return B115200;
            case 230400: return B230400;
            default:     return B0;
        }
    }

    /**
     * @brief 原始模式 8N1
     */
    bool configure_port() {
        const speed_t speed = baud_constant(config_.baudrate);
        if (speed == B0) {
            LOG_ERROR("Unsupported baudrate: %d", config_.baudrate);
            return false;
        }

        struct termios tty;
        if (tcgetattr(fd_, &tty) != 0) {
            LOG_ERROR("tcgetattr failed on %s: %s", config_.device.c_str(), strerror(errno));
            return false;
        }

        cfmakeraw(&tty);
        tty.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
        tty.c_cflag |= CS8 | CLOCAL | CREAD;
        tty.c_cc[VMIN] = 0;
        tty.c_cc[VTIME] = 0;
        cfsetispeed(&tty, speed);
        cfsetospeed(&tty, speed);

        if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
            LOG_ERROR("tcsetattr failed on %s: %s", config_.device.c_str(), strerror(errno));
            return false;
        }
        return true;
    }

    void close_locked() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        rx_buffer_.clear();
        connected_ = false;
    }

    /**
     * @brief IO错误: 计数并断开
     */
    void fail_io_locked(const char* what) {
        stats_.io_errors++;
        LOG_ERROR("Serial %s failed on %s: %s, disconnecting",
                  what, config_.device.c_str(), strerror(errno));
        close_locked();
    }

    bool write_line_locked(const std::string& line) {
        size_t written = 0;
        while (written < line.size()) {
            ssize_t n = ::write(fd_, line.data() + written, line.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
                struct pollfd pfd = {fd_, POLLOUT, 0};
                if (poll(&pfd, 1, static_cast<int>(config_.ack_timeout_ms)) > 0) continue;
            }
            fail_io_locked("write");
            return false;
        }
        return true;
    }

    /**
     * @brief 读取一行 (去除 \r\n)
     * @return 1: 读到一行, 0: 超时, -1: IO错误 (已断开)
     */
    int read_line_locked(std::string& line, uint32_t timeout_ms) {
        const uint64_t deadline = get_time_ms() + timeout_ms;

        while (true) {
            size_t pos = rx_buffer_.find('\n');
            if (pos != std::string::npos) {
                line = rx_buffer_.substr(0, pos);
                rx_buffer_.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return 1;
            }

            const uint64_t now = get_time_ms();
            if (now >= deadline) return 0;

            struct pollfd pfd = {fd_, POLLIN, 0};
            int ret = poll(&pfd, 1, static_cast<int>(deadline - now));
            if (ret < 0) {
                if (errno == EINTR) continue;
                fail_io_locked("poll");
                return -1;
            }
            if (ret == 0) return 0;

            if (pfd.revents & POLLIN) {
                char buf[SERIAL_LINE_MAX];
                ssize_t n = ::read(fd_, buf, sizeof(buf));
                if (n > 0) {
                    rx_buffer_.append(buf, static_cast<size_t>(n));
                    if (rx_buffer_.size() > SERIAL_LINE_MAX * 4) {
                        rx_buffer_.erase(0, rx_buffer_.size() - SERIAL_LINE_MAX);
                    }
                    continue;
                }
                if (n < 0 && (errno == EAGAIN || errno == EINTR)) continue;
                if (n == 0) errno = EIO;
                fail_io_locked("read");
                return -1;
            }
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                errno = EIO;
                fail_io_locked("poll");
                return -1;
            }
        }
    }

    bool ping_locked() {
        if (!write_line_locked("P\n")) return false;

        const uint64_t deadline = get_time_ms() + config_.ping_timeout_ms;
        std::string line;
        while (fd_ >= 0) {
            const uint64_t now = get_time_ms();
            if (now >= deadline) return false;
            int ret = read_line_locked(line, static_cast<uint32_t>(deadline - now));
            if (ret <= 0) return false;
            if (line == "PONG") return true;
            LOG_DEBUG("Ignoring line during ping: '%s'", line.c_str());
        }
        return false;
    }

    /**
     * @brief 发送指令并等待 OK
     */
    bool send_command(const std::string& cmd) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_ || fd_ < 0) {
            return false;
        }

        if (!write_line_locked(cmd + "\n")) return false;
        stats_.commands_sent++;

        std::string line;
        int ret = read_line_locked(line, config_.ack_timeout_ms);
        if (ret < 0) return false;
        if (ret == 0) {
            stats_.ack_failures++;
            LOG_DEBUG("ACK timeout for '%s'", cmd.c_str());
            return false;
        }
        if (line != "OK") {
            stats_.ack_failures++;
            LOG_DEBUG("NACK for '%s': '%s'", cmd.c_str(), line.c_str());
            return false;
        }
        stats_.acks_ok++;
        return true;
    }

private:
    SerialConfig config_;
    int fd_ = -1;
    std::atomic<bool> connected_{false};
    std::string rx_buffer_;
    Stats stats_;
    mutable std::mutex mutex_;
};

} // namespace duoarm

#endif // DUOARM_COMMUNICATION_SERIAL_DRIVER_HPP
