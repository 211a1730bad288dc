/**
 * @file test_serial_driver.cpp
 * @brief 串口驱动与控制器测试 (伪终端模拟下位机)
 * @date 2026-10-18
 *
 * 用 posix_openpt 创建一对伪终端: 驱动打开从端, 测试线程在主端扮演
 * Arduino 固件, 应答 PONG / OK 并记录收到的每一行。
 *
 * 运行: ./test_serial_driver
 */

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "common/logger.hpp"
#include "common/time_utils.hpp"
#include "communication/serial_driver.hpp"
#include "core/robot_controller.hpp"
#include "test_common.hpp"

using namespace duoarm;

/**
 * @brief 伪终端上的模拟下位机
 */
class FakeDevice {
public:
    enum class Mode { Ok, Nack, Silent, NoPong };

    FakeDevice() {
        master_ = posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ < 0 || grantpt(master_) != 0 || unlockpt(master_) != 0) {
            LOG_FATAL("Cannot create pseudo terminal");
            std::exit(2);
        }
        const char* name = ptsname(master_);
        if (!name) {
            LOG_FATAL("ptsname failed");
            std::exit(2);
        }
        slave_name_ = name;
        fcntl(master_, F_SETFL, fcntl(master_, F_GETFL) | O_NONBLOCK);
        thread_ = std::thread(&FakeDevice::run, this);
    }

    ~FakeDevice() {
        running_ = false;
        if (thread_.joinable()) thread_.join();
        ::close(master_);
    }

    const std::string& slave_name() const { return slave_name_; }

    void set_mode(Mode mode) { mode_ = mode; }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    bool received(const std::string& line) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(lines_.begin(), lines_.end(), line) != lines_.end();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

private:
    void run() {
        std::string buffer;
        while (running_) {
            struct pollfd pfd = {master_, POLLIN, 0};
            if (poll(&pfd, 1, 10) <= 0) continue;

            char buf[256];
            ssize_t n = ::read(master_, buf, sizeof(buf));
            if (n <= 0) {
                // 从端未打开或已关闭
                sleep_ms(5);
                continue;
            }
            buffer.append(buf, static_cast<size_t>(n));

            size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                handle(line);
            }
        }
    }

    void handle(const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(line);
        }

        const Mode mode = mode_.load();
        if (line == "P") {
            if (mode != Mode::NoPong) reply("PONG\r\n");
            return;
        }
        switch (mode) {
            case Mode::Ok:
            case Mode::NoPong: reply("OK\n"); break;
            case Mode::Nack:   reply("ERR\n"); break;
            case Mode::Silent: break;
        }
    }

    void reply(const std::string& text) {
        ssize_t n = ::write(master_, text.data(), text.size());
        (void)n;
    }

    int master_ = -1;
    std::string slave_name_;
    std::atomic<bool> running_{true};
    std::atomic<Mode> mode_{Mode::Ok};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

static SerialConfig fake_serial(const FakeDevice& device) {
    SerialConfig cfg;
    cfg.device = device.slave_name();
    cfg.settle_ms = 0;
    cfg.ping_timeout_ms = 500;
    cfg.ack_timeout_ms = 200;
    return cfg;
}

static void test_handshake() {
    FakeDevice device;
    SerialDriver driver;
    CHECK(!driver.is_connected());
    CHECK(driver.connect(fake_serial(device)));
    CHECK(driver.is_connected());
    CHECK(device.received("P"));

    // 重复连接
    CHECK(driver.connect(fake_serial(device)));
}

static void test_connect_failures() {
    SerialDriver driver;
    SerialConfig cfg;
    cfg.device = test::temp_path("no_such_tty");
    cfg.settle_ms = 0;
    CHECK(!driver.connect(cfg));
    CHECK(!driver.is_connected());
    CHECK(!driver.set_servo_angle(0, 90));          // 未连接

    FakeDevice device;
    cfg = fake_serial(device);
    cfg.baudrate = 12345;
    CHECK(!driver.connect(cfg));

    device.set_mode(FakeDevice::Mode::NoPong);
    cfg = fake_serial(device);
    cfg.ping_timeout_ms = 100;
    CHECK(!driver.connect(cfg));
    CHECK(!driver.is_connected());
}

static void test_command_encoding() {
    FakeDevice device;
    SerialDriver driver;
    CHECK(driver.connect(fake_serial(device)));
    device.clear();

    CHECK(driver.set_servo_angle(0, 250.0));
    CHECK(driver.set_servo_angle(1, -5.0));
    CHECK(driver.set_servo_angle(2, 90.7));
    CHECK(driver.write_pulse(3, 5000));
    CHECK(driver.release_channel(4));
    CHECK(driver.release_all());

    const std::vector<std::string> expected = {
        "S 0 180", "S 1 0", "S 2 90", "W 3 3000", "R 4", "X",
    };
    CHECK(device.lines() == expected);

    // 非有限角度不发送
    CHECK(!driver.set_servo_angle(0, std::nan("")));
    CHECK(!driver.set_servo_angle(0, HUGE_VAL));
    CHECK(!driver.set_servo_angle(0, -HUGE_VAL));
    CHECK(device.lines() == expected);

    SerialDriver::Stats s = driver.get_stats();
    CHECK(s.commands_sent == 6);
    CHECK(s.acks_ok == 6);
    CHECK(s.ack_failures == 0);
    CHECK(s.io_errors == 0);

    driver.reset_stats();
    CHECK(driver.get_stats().commands_sent == 0);
}

static void test_ack_failures() {
    FakeDevice device;
    SerialDriver driver;
    CHECK(driver.connect(fake_serial(device)));

    device.set_mode(FakeDevice::Mode::Silent);
    Timer timer;
    CHECK(!driver.set_servo_angle(0, 90));
    CHECK(timer.elapsed_ms() >= 150);
    CHECK(driver.is_connected());                    // 超时不断开

    device.set_mode(FakeDevice::Mode::Nack);
    CHECK(!driver.set_servo_angle(0, 90));

    device.set_mode(FakeDevice::Mode::Ok);
    CHECK(driver.set_servo_angle(0, 90));

    SerialDriver::Stats s = driver.get_stats();
    CHECK(s.commands_sent == 3);
    CHECK(s.acks_ok == 1);
    CHECK(s.ack_failures == 2);
}

static void test_disconnect_releases_all() {
    FakeDevice device;
    SerialDriver driver;
    CHECK(driver.connect(fake_serial(device)));
    device.clear();

    driver.disconnect();
    CHECK(!driver.is_connected());
    auto lines = device.lines();
    CHECK(!lines.empty() && lines.back() == "X");

    // 已断开: 不再发送
    CHECK(!driver.release_all());
    driver.disconnect();
    CHECK(device.lines().size() == lines.size());
}

static MotionConfig fast_motion() {
    MotionConfig motion;
    motion.step_ms = 10;
    motion.sender_period_us = 10000;
    motion.sender_gap_us = 0;
    motion.home_seconds = 0.1;
    motion.gripper_seconds = 0.05;
    return motion;
}

static void test_controller_home_and_pulse() {
    FakeDevice device;
    nlohmann::json doc = test::sample_config_json();
    doc["right_arm"]["slot_6"]["actuation_range"] = 270;
    RobotConfig config;
    std::string error;
    CHECK(parse_robot_config(doc, config, error));

    RobotController robot(config, fake_serial(device), fast_motion());
    CHECK(!robot.go_home());                          // 未连接
    CHECK(robot.connect());
    CHECK(robot.status().sender_running);

    CHECK(robot.go_home());
    sleep_ms(200);
    CHECK(device.received("S 0 90"));
    CHECK(device.received("S 1 130"));
    CHECK(device.received("S 5 30"));
    // 270°舵机: 30° -> 500 + 30/270*2000 = 722us
    CHECK(device.received("W 11 722"));
    CHECK(!device.received("S 11 30"));

    // 已发送的角度不重复发送
    device.clear();
    sleep_ms(100);
    CHECK(device.lines().empty());

    CHECK(robot.close_gripper(ArmRole::Left));
    sleep_ms(100);
    CHECK(device.received("S 5 120"));

    ControllerStatus st = robot.status();
    CHECK(st.connected);
    CHECK(!st.moving);
    CHECK(st.serial.acks_ok >= 13);
    CHECK(st.sender_loops > 0);
    nlohmann::json j = st.to_json();
    CHECK(j["port"] == device.slave_name());

    CHECK(robot.release_all());
    CHECK(device.received("X"));

    robot.disconnect();
    CHECK(!robot.is_connected());
    CHECK(!robot.status().sender_running);
}

static void test_controller_move_and_zero() {
    FakeDevice device;
    RobotController robot(test::sample_config(), fake_serial(device), fast_motion());
    CHECK(robot.connect());

    CHECK(!robot.move_to_angles({{2, 60.0}, {3, std::nan("")}}, 0.1, true));
    CHECK(robot.move_to_angles({{2, 60.0}}, 0.1, true));
    CHECK_NEAR(robot.servo_state().get_angle(2).value_or(-1.0), 60.0, 1e-12);

    CHECK(robot.go_zero());
    sleep_ms(150);
    CHECK(device.received("S 2 90"));
    CHECK(device.received("S 3 120"));                 // slot_4 零位
    CHECK(robot.open_gripper(ArmRole::Right));
    CHECK_NEAR(robot.servo_state().get_angle(11).value_or(-1.0), 30.0, 1e-12);
}

int main() {
    Logger::instance().set_level(LogLevel::INFO);
    LOG_INFO("=== Serial Driver Test ===");

    RUN_TEST(test_handshake);
    RUN_TEST(test_connect_failures);
    RUN_TEST(test_command_encoding);
    RUN_TEST(test_ack_failures);
    RUN_TEST(test_disconnect_releases_all);
    RUN_TEST(test_controller_home_and_pulse);
    RUN_TEST(test_controller_move_and_zero);

    return test::report("test_serial_driver");
}
