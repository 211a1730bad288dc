/**
 * @file types.hpp
 * @brief 通用数据类型定义
 * @date 2026-10-18
 */

#ifndef DUOARM_COMMON_TYPES_HPP
#define DUOARM_COMMON_TYPES_HPP

#include <cstdint>
#include <array>
#include <map>
#include <string>

#include "common/constants.hpp"

namespace duoarm {

//==============================================================================
// 机械臂角色
//==============================================================================

enum class ArmRole : uint8_t {
    Left = 0,
    Right = 1,
};

constexpr std::array<ArmRole, 2> ALL_ARMS = {ArmRole::Left, ArmRole::Right};

/**
 * @brief 配置文件中的键名 ("left_arm" / "right_arm")
 */
inline const char* arm_key(ArmRole arm) {
    return arm == ArmRole::Left ? "left_arm" : "right_arm";
}

/**
 * @brief 短名称 ("left" / "right"), 用于夹爪偏移等
 */
inline const char* arm_short_name(ArmRole arm) {
    return arm == ArmRole::Left ? "left" : "right";
}

/**
 * @brief 解析角色名, 接受 left/right/left_arm/right_arm
 */
inline bool parse_arm(const std::string& text, ArmRole& arm) {
    if (text == "left_arm" || text == "left") {
        arm = ArmRole::Left;
        return true;
    }
    if (text == "right_arm" || text == "right") {
        arm = ArmRole::Right;
        return true;
    }
    return false;
}

//==============================================================================
// 关节配置
//==============================================================================

// 最小位置锚点 (决定物理角方向)
enum class MinPos : uint8_t {
    Top, Bottom, Left, Right, Cw, Ccw,
};

enum class JointType : uint8_t {
    Vertical,
    Horizontal,
};

inline bool parse_min_pos(const std::string& text, MinPos& out) {
    static const std::map<std::string, MinPos> table = {
        {"top", MinPos::Top},   {"bottom", MinPos::Bottom},
        {"left", MinPos::Left}, {"right", MinPos::Right},
        {"cw", MinPos::Cw},     {"ccw", MinPos::Ccw},
    };
    auto it = table.find(text);
    if (it == table.end()) return false;
    out = it->second;
    return true;
}

/**
 * @brief 物理角方向
 * @note top/left/cw 为反向 (-1), 其余为正向 (+1)
 */
inline int joint_direction(MinPos pos) {
    return (pos == MinPos::Top || pos == MinPos::Left || pos == MinPos::Cw) ? -1 : 1;
}

/**
 * @brief 单关节 (slot) 配置, 角度单位: 物理度
 */
struct JointConfig {
    int channel = 0;
    double min = SERVO_ANGLE_MIN;
    double max = SERVO_ANGLE_MAX;
    double zero_offset = 90.0;
    MinPos min_pos = MinPos::Bottom;
    JointType type = JointType::Vertical;
    double length = 0.0;                          // mm
    double initial = 90.0;                        // Home位置
    double actuation_range = DEFAULT_ACTUATION_RANGE;
    int pulse_min = DEFAULT_PULSE_MIN_US;
    int pulse_max = DEFAULT_PULSE_MAX_US;

    int direction() const { return joint_direction(min_pos); }

    /**
     * @brief 数学角 -> 物理角
     */
    double to_physical(double math_deg) const {
        return zero_offset + direction() * math_deg;
    }

    /**
     * @brief 物理角 -> 数学角 (逻辑角)
     */
    double to_logical(double physical_deg) const {
        return direction() * (physical_deg - zero_offset);
    }

    bool within_limits(double physical_deg) const {
        return physical_deg >= min && physical_deg <= max;
    }
};

/**
 * @brief 连杆长度 (mm)
 */
struct LinkSet {
    double d1 = DEFAULT_D1;
    double a2 = DEFAULT_A2;
    double a3 = DEFAULT_A3;
    double a4 = DEFAULT_A4;
    double a5 = DEFAULT_A5;
    double a6 = DEFAULT_A6;

    // 腕部到夹爪尖端总长
    double wrist_length() const { return a4 + a5 + a6; }
};

/**
 * @brief 单臂配置
 */
struct ArmConfig {
    std::array<JointConfig, ARM_SLOT_COUNT> slots;   // slots[0] = slot_1
    double z_offset = 0.0;                           // 夹爪安全高度偏移 (mm)
    int joint_count = ARM_SLOT_COUNT;                // 配置中实际出现的slot数

    const JointConfig& slot(int slot_num) const { return slots[slot_num - 1]; }
    JointConfig& slot(int slot_num) { return slots[slot_num - 1]; }

    LinkSet links() const {
        LinkSet l;
        l.d1 = slots[0].length;
        l.a2 = slots[1].length;
        l.a3 = slots[2].length;
        l.a4 = slots[3].length;
        l.a5 = slots[4].length;
        l.a6 = slots[5].length;
        return l;
    }
};

/**
 * @brief 一组关节物理角 (slot编号 -> 角度)
 */
using SlotAngles = std::map<int, double>;

/**
 * @brief 示教点 (共享点 / 顶点)
 */
struct TaughtPoint {
    ArmRole owner = ArmRole::Left;
    SlotAngles angles;

    /**
     * @brief 读取slot物理角, 缺失时返回该关节零位
     */
    double angle_or_zero(const ArmConfig& arm, int slot_num) const {
        auto it = angles.find(slot_num);
        return it != angles.end() ? it->second : arm.slot(slot_num).zero_offset;
    }
};

//==============================================================================
// 几何基础类型
//==============================================================================

struct Point2D {
    double x = 0.0;
    double y = 0.0;
};

struct Point3D {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

enum class Stance : uint8_t {
    Open,
    Closed,
};

inline const char* stance_str(Stance stance) {
    return stance == Stance::Open ? "open" : "closed";
}

//==============================================================================
// 错误码 / 状态枚举
//==============================================================================

/**
 * @brief 错误分类
 */
enum class ErrorCode {
    Ok = 0,
    Unreachable,            // 超出运动学范围
    JointLimitExceeded,     // 可达但超出关节限位
    SingularGeometry,       // 圆无交点 / 矩阵奇异
    LinkFailure,            // 串口超时 / NACK / IO错误
    CalibrationMissing,     // 无标定数据
    ConfigMissing,          // 配置文件不存在
    ConfigInvalid,          // 配置内容非法
};

inline const char* error_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                 return "ok";
        case ErrorCode::Unreachable:        return "unreachable";
        case ErrorCode::JointLimitExceeded: return "joint limit exceeded";
        case ErrorCode::SingularGeometry:   return "singular geometry";
        case ErrorCode::LinkFailure:        return "link failure";
        case ErrorCode::CalibrationMissing: return "calibration missing";
        case ErrorCode::ConfigMissing:      return "config missing";
        case ErrorCode::ConfigInvalid:      return "config invalid";
        default: return "unknown";
    }
}

} // namespace duoarm

#endif // DUOARM_COMMON_TYPES_HPP
