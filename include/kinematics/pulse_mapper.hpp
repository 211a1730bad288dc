/**
 * @file pulse_mapper.hpp
 * @brief 物理角 <-> 舵机脉宽 (us) 转换
 * @date 2026-10-18
 *
 * 支持不同行程的舵机 (180°, 270° ...):
 *   pulse = pulse_min + (angle / actuation_range) * (pulse_max - pulse_min)
 * 例: 270°舵机, 135° -> 500 + 0.5 * 2000 = 1500us
 */

#ifndef DUOARM_KINEMATICS_PULSE_MAPPER_HPP
#define DUOARM_KINEMATICS_PULSE_MAPPER_HPP

#include <algorithm>

#include "common/types.hpp"
#include "common/constants.hpp"

namespace duoarm {

/**
 * @brief 物理角 -> 脉宽 (us)
 * @note 角度先钳位到 [0, actuation_range], 结果钳位到 [0, 3000]
 */
inline int physical_to_pulse(double physical_deg, const JointConfig& joint) {
    const double angle = std::clamp(physical_deg, 0.0, joint.actuation_range);
    const double ratio = angle / joint.actuation_range;
    const double pulse = joint.pulse_min + ratio * (joint.pulse_max - joint.pulse_min);
    return std::clamp(static_cast<int>(pulse), 0, PULSE_SAFETY_MAX_US);
}

/**
 * @brief 脉宽 -> 物理角 (近似, 用于显示)
 */
inline double pulse_to_physical(int pulse_us, const JointConfig& joint) {
    const double ratio = static_cast<double>(pulse_us - joint.pulse_min)
                       / (joint.pulse_max - joint.pulse_min);
    return std::clamp(ratio * joint.actuation_range, 0.0, joint.actuation_range);
}

} // namespace duoarm

#endif // DUOARM_KINEMATICS_PULSE_MAPPER_HPP
