/**
 * @file ik_solver.hpp
 * @brief 解析法逆/正运动学 (Yaw + 平面两连杆)
 * @date 2026-10-18
 *
 * 坐标系: 以手臂底座为原点, +Y向前, Z向上。
 * 角度单位: 度 (接口), 弧度 (内部计算)。
 *
 *   theta1 = atan2(x, y)              底座偏航
 *   r = hypot(x, y), s = z - d1       平面内水平/竖直分量
 *   D = hypot(r, s)                   肩关节到目标距离
 *   theta2/theta3 由余弦定理求解, 肘上/肘下按策略选择
 */

#ifndef DUOARM_KINEMATICS_IK_SOLVER_HPP
#define DUOARM_KINEMATICS_IK_SOLVER_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

#include "common/types.hpp"
#include "common/constants.hpp"

namespace duoarm {

/**
 * @brief 肘部构型选择策略
 */
enum class ElbowPolicy {
    Up,
    Down,
};

constexpr const char* CONFIG_ELBOW_UP   = "Elbow Up";
constexpr const char* CONFIG_ELBOW_DOWN = "Elbow Down";
constexpr const char* CONFIG_POINTING   = "Pointing";

/**
 * @brief IK解
 * @note valid=false 时 config_name="Pointing", 角度仅为指向估计
 */
struct IKSolution {
    double theta1 = 0.0;        // 底座偏航 (deg)
    double theta2 = 0.0;        // 肩俯仰 (deg)
    double theta3 = 0.0;        // 肘俯仰 (deg), 相对大臂
    bool valid = false;
    std::string config_name;
    double reach = 0.0;         // 肩关节到目标距离 D (mm)
    double r = 0.0;             // 水平距离 (mm)
    double s = 0.0;             // 相对肩高的竖直偏移 (mm)
};

/**
 * @brief 求解3关节IK
 * @param x, y, z 目标位置 (mm, 手臂底座坐标系)
 * @param links 连杆长度 (使用 d1, a2, a3)
 * @param policy 肘部构型, 默认肘上
 */
inline IKSolution solve_ik(double x, double y, double z, const LinkSet& links,
                           ElbowPolicy policy = ElbowPolicy::Up) {
    IKSolution sol;

    sol.theta1 = (x == 0.0 && y == 0.0) ? 0.0 : rad2deg(std::atan2(x, y));
    sol.r = std::hypot(x, y);
    sol.s = z - links.d1;
    sol.reach = std::hypot(sol.r, sol.s);

    const double a2 = links.a2;
    const double a3 = links.a3;
    const double dist = sol.reach;

    if (dist > a2 + a3 || dist < std::fabs(a2 - a3) || dist < MIN_SOLVE_DISTANCE_MM) {
        // 不可达: 仅给出指向方向
        if (sol.r > 0.0) {
            sol.theta2 = rad2deg(std::atan2(sol.s, sol.r));
        } else {
            sol.theta2 = sol.s >= 0.0 ? 90.0 : -90.0;
        }
        sol.theta3 = 0.0;
        sol.valid = false;
        sol.config_name = CONFIG_POINTING;
        return sol;
    }

    // 余弦定理, 钳位吸收边界处的浮点误差
    double cos_t3 = (dist * dist - a2 * a2 - a3 * a3) / (2.0 * a2 * a3);
    cos_t3 = std::clamp(cos_t3, -1.0, 1.0);
    const double t3_mag = std::acos(cos_t3);

    const double alpha = std::atan2(sol.s, sol.r);
    const double beta = std::atan2(a3 * std::sin(t3_mag), a2 + a3 * std::cos(t3_mag));

    if (policy == ElbowPolicy::Up) {
        sol.theta2 = rad2deg(alpha + beta);
        sol.theta3 = -rad2deg(t3_mag);
        sol.config_name = CONFIG_ELBOW_UP;
    } else {
        sol.theta2 = rad2deg(alpha - beta);
        sol.theta3 = rad2deg(t3_mag);
        sol.config_name = CONFIG_ELBOW_DOWN;
    }
    sol.valid = true;
    return sol;
}

/**
 * @brief 正运动学
 * @param theta1, theta2, theta3 关节角 (deg)
 * @return 肘后连杆末端位置 (mm)
 */
inline Point3D forward(double theta1, double theta2, double theta3, const LinkSet& links) {
    const double t1 = deg2rad(theta1);
    const double t2 = deg2rad(theta2);
    const double t23 = deg2rad(theta2 + theta3);

    const double r = links.a2 * std::cos(t2) + links.a3 * std::cos(t23);
    Point3D p;
    p.x = r * std::sin(t1);
    p.y = r * std::cos(t1);
    p.z = links.d1 + links.a2 * std::sin(t2) + links.a3 * std::sin(t23);
    return p;
}

/**
 * @brief 单关节物理角映射结果
 */
struct JointTarget {
    double math_angle = 0.0;    // 数学角 (deg)
    double physical = 0.0;      // 物理角 (deg), 未钳位
    bool within_limits = true;
};

/**
 * @brief 数学角 -> 物理角, 超限只标记不钳位
 */
inline JointTarget map_joint(const JointConfig& joint, double math_angle) {
    JointTarget t;
    t.math_angle = math_angle;
    t.physical = joint.to_physical(math_angle);
    t.within_limits = joint.within_limits(t.physical);
    return t;
}

/**
 * @brief 整臂映射
 */
inline std::array<JointTarget, ARM_SLOT_COUNT> map_arm(
        const ArmConfig& arm, const std::array<double, ARM_SLOT_COUNT>& math_angles) {
    std::array<JointTarget, ARM_SLOT_COUNT> out;
    for (int i = 0; i < ARM_SLOT_COUNT; i++) {
        out[i] = map_joint(arm.slots[i], math_angles[i]);
    }
    return out;
}

} // namespace duoarm

#endif // DUOARM_KINEMATICS_IK_SOLVER_HPP
