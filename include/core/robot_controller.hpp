/**
 * @file robot_controller.hpp
 * @brief 双臂控制器 (串口驱动 + 舵机状态 + 运动规划 + 发送线程)
 * @date 2026-10-18
 *
 * 数据流:
 *   MotionPlanner -> ServoState -> 发送线程 (~30Hz) -> SerialDriver
 * 发送线程每轮只发送变化的通道, 指令间隔 2ms。
 */

#ifndef DUOARM_CORE_ROBOT_CONTROLLER_HPP
#define DUOARM_CORE_ROBOT_CONTROLLER_HPP

#include <cmath>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"
#include "common/time_utils.hpp"
#include "config/robot_config.hpp"
#include "communication/serial_driver.hpp"
#include "kinematics/pulse_mapper.hpp"
#include "motion/servo_state.hpp"
#include "motion/motion_planner.hpp"
#include "realtime/periodic_thread.hpp"

namespace duoarm {

/**
 * @brief 运动参数
 */
struct MotionConfig {
    uint32_t step_ms = MOTION_STEP_MS;
    uint32_t sender_period_us = SENDER_PERIOD_US;
    uint32_t sender_gap_us = SENDER_CMD_GAP_US;
    double home_seconds = 3.0;
    double gripper_seconds = 0.5;
};

/**
 * @brief 控制器状态
 */
struct ControllerStatus {
    bool connected = false;
    std::string port;
    bool sender_running = false;
    bool moving = false;
    uint64_t sender_loops = 0;
    uint64_t sender_missed = 0;
    SerialDriver::Stats serial;

    nlohmann::json to_json() const {
        return {
            {"connected", connected},
            {"port", port},
            {"sender_running", sender_running},
            {"moving", moving},
            {"sender", {{"loops", sender_loops}, {"missed", sender_missed}}},
            {"serial", {
                {"commands_sent", serial.commands_sent},
                {"acks_ok", serial.acks_ok},
                {"ack_failures", serial.ack_failures},
                {"io_errors", serial.io_errors},
            }},
        };
    }
};

inline SerialConfig serial_config_from(const RobotConfig& config) {
    SerialConfig serial;
    serial.device = config.port;
    serial.baudrate = config.baudrate;
    return serial;
}

/**
 * @brief 双臂控制器
 */
class RobotController {
public:
    using Target = MotionPlanner::Target;

    RobotController(const RobotConfig& config, const SerialConfig& serial,
                    const MotionConfig& motion = MotionConfig())
        : config_(config)
        , serial_config_(serial)
        , motion_config_(motion)
        , planner_(state_, motion.step_ms)
        , sender_("serial_sender", motion.sender_period_us) {
        for (ArmRole arm : ALL_ARMS) {
            for (const JointConfig& joint : config_.arm(arm).slots) {
                joints_by_channel_[joint.channel] = joint;
            }
        }
        sender_.set_loop_task([this]() { sender_tick(); });
    }

    explicit RobotController(const RobotConfig& config)
        : RobotController(config, serial_config_from(config)) {}

    ~RobotController() {
        disconnect();
    }

    // 禁止拷贝
    RobotController(const RobotController&) = delete;
    RobotController& operator=(const RobotController&) = delete;

    /**
     * @brief 连接串口并启动发送线程
     */
    bool connect() {
        if (!driver_.connect(serial_config_)) {
            return false;
        }
        if (!sender_.is_running() && !sender_.start()) {
            driver_.disconnect();
            return false;
        }
        LOG_INFO("[Controller] Connected to %s, sender started", serial_config_.device.c_str());
        return true;
    }

    void disconnect() {
        planner_.stop();
        sender_.stop();
        driver_.disconnect();
    }

    bool is_connected() const { return driver_.is_connected(); }

    /**
     * @brief 全部关节回到 Home (slot.initial)
     */
    bool go_home(double seconds = -1.0) {
        std::vector<Target> targets;
        for (ArmRole arm : ALL_ARMS) {
            for (const JointConfig& joint : config_.arm(arm).slots) {
                targets.emplace_back(joint.channel, joint.initial);
            }
        }
        return move_to_angles(targets, seconds < 0 ? motion_config_.home_seconds : seconds, true);
    }

    /**
     * @brief 全部关节回到零位 (slot.zero_offset)
     */
    bool go_zero(double seconds = -1.0) {
        std::vector<Target> targets;
        for (ArmRole arm : ALL_ARMS) {
            for (const JointConfig& joint : config_.arm(arm).slots) {
                targets.emplace_back(joint.channel, joint.zero_offset);
            }
        }
        return move_to_angles(targets, seconds < 0 ? motion_config_.home_seconds : seconds, true);
    }

    /**
     * @brief 平滑运动到指定物理角
     * @param wait 是否阻塞到运动结束
     */
    bool move_to_angles(const std::vector<Target>& targets, double seconds, bool wait = false) {
        if (!is_connected()) {
            LOG_WARN("[Controller] Not connected, motion rejected");
            return false;
        }
        for (const auto& target : targets) {
            if (!std::isfinite(target.second)) {
                LOG_ERROR("[Controller] Channel %d: non-finite target, motion rejected", target.first);
                return false;
            }
        }

        state_.clear_history();
        auto done = planner_.move_all(targets, seconds);
        if (wait) {
            auto timeout = std::chrono::milliseconds(static_cast<int64_t>((seconds + 2.0) * 1000.0));
            if (done.wait_for(timeout) != std::future_status::ready) {
                LOG_WARN("[Controller] Motion did not finish in time");
                return false;
            }
            return done.get() == MotionOutcome::Completed;
        }
        return true;
    }

    bool open_gripper(ArmRole arm, double seconds = -1.0) {
        const JointConfig& gripper = config_.arm(arm).slot(ARM_SLOT_COUNT);
        return move_to_angles({{gripper.channel, gripper.min}},
                              seconds < 0 ? motion_config_.gripper_seconds : seconds, true);
    }

    bool close_gripper(ArmRole arm, double seconds = -1.0) {
        const JointConfig& gripper = config_.arm(arm).slot(ARM_SLOT_COUNT);
        return move_to_angles({{gripper.channel, gripper.max}},
                              seconds < 0 ? motion_config_.gripper_seconds : seconds, true);
    }

    /**
     * @brief 急停: 停止运动并释放全部舵机
     */
    bool release_all() {
        planner_.stop();
        bool ok = driver_.release_all();
        state_.clear_history();
        if (!ok) {
            LOG_WARN("[Controller] Release-all not acknowledged");
        }
        return ok;
    }

    ControllerStatus status() const {
        ControllerStatus s;
        s.connected = is_connected();
        s.port = serial_config_.device;
        s.sender_running = sender_.is_running();
        s.moving = planner_.is_moving();
        s.sender_loops = sender_.get_loop_count();
        s.sender_missed = sender_.get_missed_deadlines();
        s.serial = driver_.get_stats();
        return s;
    }

    ServoState& servo_state() { return state_; }
    MotionPlanner& planner() { return planner_; }
    SerialDriver& driver() { return driver_; }

private:
    void sender_tick() {
        if (!driver_.is_connected()) return;

        for (const auto& update : state_.get_pending_updates()) {
            if (send_one(update.first, update.second)) {
                state_.mark_as_sent(update.first, update.second);
            }
            sleep_us(motion_config_.sender_gap_us);
        }
    }

    /**
     * @brief 发送单通道; 非180°行程的舵机改用脉宽指令
     */
    bool send_one(int channel, double angle) {
        if (!std::isfinite(angle)) {
            LOG_ERROR("[Controller] Channel %d: non-finite angle not sent", channel);
            return false;
        }
        auto it = joints_by_channel_.find(channel);
        if (it != joints_by_channel_.end() && it->second.actuation_range != DEFAULT_ACTUATION_RANGE) {
            return driver_.write_pulse(channel, physical_to_pulse(angle, it->second));
        }
        return driver_.set_servo_angle(channel, angle);
    }

    RobotConfig config_;
    SerialConfig serial_config_;
    MotionConfig motion_config_;
    std::map<int, JointConfig> joints_by_channel_;

    SerialDriver driver_;
    ServoState state_;
    MotionPlanner planner_;
    PeriodicThread sender_;
};

} // namespace duoarm

#endif // DUOARM_CORE_ROBOT_CONTROLLER_HPP
