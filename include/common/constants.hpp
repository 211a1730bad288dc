/**
 * @file constants.hpp
 * @brief 系统常量定义
 * @date 2026-10-18
 */

#ifndef DUOARM_COMMON_CONSTANTS_HPP
#define DUOARM_COMMON_CONSTANTS_HPP

#include <cstdint>
#include <cstddef>

namespace duoarm {

//==============================================================================
// 机械臂结构常量
//==============================================================================

constexpr int ARM_SLOT_COUNT    = 6;           // slot_1 ~ slot_6 (最后一个为夹爪)
constexpr int MIN_ARM_SLOTS     = 3;           // 至少需要 yaw/shoulder/elbow
constexpr int MOTION_SLOT_COUNT = 5;           // 运动指令不含夹爪

// 默认连杆长度 (mm)
constexpr double DEFAULT_D1 = 107.0;           // 底座高度
constexpr double DEFAULT_A2 = 105.0;           // 大臂
constexpr double DEFAULT_A3 = 150.0;           // 小臂
constexpr double DEFAULT_A4 = 65.0;            // 腕部
constexpr double DEFAULT_A5 = 0.0;             // 腕部旋转
constexpr double DEFAULT_A6 = 115.0;           // 夹爪

//==============================================================================
// 舵机常量
//==============================================================================

constexpr int SERVO_CHANNEL_MIN       = 0;
constexpr int SERVO_CHANNEL_MAX       = 15;    // PCA9685: 16通道
constexpr double SERVO_ANGLE_MIN      = 0.0;
constexpr double SERVO_ANGLE_MAX      = 180.0;
constexpr double DEFAULT_ACTUATION_RANGE = 180.0;
constexpr int DEFAULT_PULSE_MIN_US    = 500;
constexpr int DEFAULT_PULSE_MAX_US    = 2500;
constexpr int PULSE_SAFETY_MAX_US     = 3000;

//==============================================================================
// 串口通信常量
//==============================================================================

constexpr const char* SERIAL_DEVICE_DEFAULT = "/dev/ttyACM0";
constexpr int SERIAL_BAUDRATE_DEFAULT = 115200;
constexpr uint32_t SERIAL_SETTLE_MS   = 2000;  // 等待Arduino复位
constexpr uint32_t PING_TIMEOUT_MS    = 2000;
constexpr uint32_t ACK_TIMEOUT_MS     = 100;
constexpr size_t SERIAL_LINE_MAX      = 128;

//==============================================================================
// 运动控制常量
//==============================================================================

constexpr uint32_t MOTION_STEP_MS       = 20;  // 50Hz插值
constexpr uint32_t MOTION_JOIN_TIMEOUT_MS = 500;
constexpr uint32_t SENDER_PERIOD_US     = 33000; // ~30Hz发送线程
constexpr uint32_t SENDER_CMD_GAP_US    = 2000;  // 指令间隔2ms

//==============================================================================
// 几何 / 标定常量
//==============================================================================

constexpr double STANCE_THRESHOLD_DEG   = 90.0;  // 内角 > 90° 为 open
constexpr double SINGULAR_DET_EPS       = 1e-10;
constexpr double MIN_SOLVE_DISTANCE_MM  = 0.001;
constexpr double GEMINI_GRID            = 1000.0;
constexpr double GEMINI_SPLIT_X         = 500.0; // 左右臂分界
constexpr const char* SCALE_VERTEX_A    = "1";   // mm/px 对角顶点
constexpr const char* SCALE_VERTEX_B    = "3";

constexpr double DEFAULT_WORKSPACE_WIDTH_MM  = 600.0;
constexpr double DEFAULT_WORKSPACE_HEIGHT_MM = 500.0;

constexpr double PI = 3.14159265358979323846;

inline double deg2rad(double deg) { return deg * PI / 180.0; }
inline double rad2deg(double rad) { return rad * 180.0 / PI; }

} // namespace duoarm

#endif // DUOARM_COMMON_CONSTANTS_HPP
