/**
 * @file ik_service.hpp
 * @brief IK服务: 世界坐标 -> 六关节数学角/物理角/脉宽
 * @date 2026-10-18
 *
 * 世界坐标系为共享点坐标系 (见 geometry_engine.hpp)。
 * 夹爪竖直向下接近目标:
 *   腕心 z = 目标 z + a4 + a5 + a6
 *   theta4 = -90 - theta2 - theta3
 */

#ifndef DUOARM_KINEMATICS_IK_SERVICE_HPP
#define DUOARM_KINEMATICS_IK_SERVICE_HPP

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"
#include "config/robot_config.hpp"
#include "geometry/geometry_engine.hpp"
#include "kinematics/ik_solver.hpp"
#include "kinematics/pulse_mapper.hpp"

namespace duoarm {

/**
 * @brief 单次IK详细结果
 */
struct IKDetail {
    ArmRole arm = ArmRole::Left;
    Point3D target;                                 // 世界坐标 (mm)
    Point3D local;                                  // 手臂底座坐标 (mm)
    double reach = 0.0;
    std::array<double, ARM_SLOT_COUNT> theta{};     // 数学角 (deg)
    std::array<double, ARM_SLOT_COUNT> physical{};  // 物理角 (deg)
    std::array<int, ARM_SLOT_COUNT> pulse{};        // 脉宽 (us)
    std::array<bool, ARM_SLOT_COUNT> within_limits{};
    std::string config_name;
    bool valid = false;                             // 运动学可达
    ErrorCode error = ErrorCode::Ok;                // 无底座时为 SingularGeometry

    bool all_within_limits() const {
        for (bool ok : within_limits) {
            if (!ok) return false;
        }
        return true;
    }
};

/**
 * @brief 运动目标: 通道 -> 物理角
 */
using ChannelTarget = std::pair<int, double>;

/**
 * @brief 运动用IK结果 (slot_1 ~ slot_5, 不含夹爪)
 */
struct MotionTargets {
    std::vector<ChannelTarget> targets;
    double yaw_deg = 0.0;
    bool reachable = false;
    bool within_limits = false;
    bool valid = false;
    ErrorCode error = ErrorCode::Ok;
    IKDetail detail;
};

/**
 * @brief IK服务
 *
 * 构造时推导一次几何快照 (底座位置), 之后所有求解只读。
 */
class IKService {
public:
    explicit IKService(const RobotConfig& config, ElbowPolicy policy = ElbowPolicy::Up)
        : config_(config)
        , geometry_(compute_geometry(config))
        , policy_(policy) {}

    const RobotConfig& config() const { return config_; }
    const WorkspaceGeometry& geometry() const { return geometry_; }

    /**
     * @brief 完整IK (不加z偏移, 纯函数)
     * @param x, y, z 世界坐标 (mm)
     */
    IKDetail compute_ik_detail(double x, double y, double z, ArmRole arm) const {
        const ArmConfig& cfg = config_.arm(arm);
        const LinkSet links = cfg.links();

        IKDetail d;
        d.arm = arm;
        d.target = Point3D{x, y, z};

        auto base = geometry_.base(arm);
        if (!base) {
            d.error = ErrorCode::SingularGeometry;
            LOG_WARN("[IK] %s: no base position (share point missing)", arm_key(arm));
            return d;
        }
        d.local = Point3D{x - base->x, y - base->y, z};

        const double wrist_z = d.local.z + links.wrist_length();
        const IKSolution sol = solve_ik(d.local.x, d.local.y, wrist_z, links, policy_);

        d.reach = sol.reach;
        d.config_name = sol.config_name;
        d.valid = sol.valid;

        d.theta[0] = sol.theta1;
        d.theta[1] = sol.theta2;
        d.theta[2] = sol.theta3;
        d.theta[3] = -90.0 - sol.theta2 - sol.theta3;
        d.theta[4] = 0.0;
        d.theta[5] = 0.0;

        fill_joints(cfg, d);
        return d;
    }

    /**
     * @brief 运动用IK
     * @param orientation 夹爪绝对朝向 (deg), 仅影响 slot_5
     * @return 恰好5个 (通道, 物理角) 目标; 手臂无底座时为空
     */
    MotionTargets compute_ik_for_motion(double x, double y, double z, ArmRole arm,
                                        std::optional<double> orientation = std::nullopt) const {
        const ArmConfig& cfg = config_.arm(arm);

        MotionTargets m;
        m.detail = compute_ik_detail(x, y, z + cfg.z_offset, arm);
        IKDetail& d = m.detail;
        if (d.error != ErrorCode::Ok) {
            m.error = d.error;
            return m;
        }

        if (orientation) {
            d.theta[4] = *orientation - d.theta[0];
            fill_joints(cfg, d);
        }

        m.targets.reserve(MOTION_SLOT_COUNT);
        for (int i = 0; i < MOTION_SLOT_COUNT; i++) {
            m.targets.emplace_back(cfg.slots[i].channel, d.physical[i]);
        }

        m.yaw_deg = d.theta[0];
        m.reachable = d.valid;
        m.within_limits = true;
        for (int i = 0; i < MOTION_SLOT_COUNT; i++) {
            if (!d.within_limits[i]) m.within_limits = false;
        }
        m.valid = m.reachable && m.within_limits;

        if (!m.reachable) {
            m.error = ErrorCode::Unreachable;
            LOG_DEBUG("[IK] %s: (%.1f, %.1f, %.1f) unreachable, reach=%.1f",
                      arm_key(arm), x, y, z, d.reach);
        } else if (!m.within_limits) {
            m.error = ErrorCode::JointLimitExceeded;
            LOG_DEBUG("[IK] %s: (%.1f, %.1f, %.1f) exceeds joint limits",
                      arm_key(arm), x, y, z);
        }
        return m;
    }

private:
    static void fill_joints(const ArmConfig& cfg, IKDetail& d) {
        const auto joints = map_arm(cfg, d.theta);
        for (int i = 0; i < ARM_SLOT_COUNT; i++) {
            d.physical[i] = joints[i].physical;
            d.within_limits[i] = joints[i].within_limits;
            d.pulse[i] = physical_to_pulse(joints[i].physical, cfg.slots[i]);
        }
    }

    RobotConfig config_;
    WorkspaceGeometry geometry_;
    ElbowPolicy policy_;
};

} // namespace duoarm

#endif // DUOARM_KINEMATICS_IK_SERVICE_HPP
