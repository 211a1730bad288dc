/**
 * @file vision_targeting.hpp
 * @brief 视觉目标 -> 运动目标
 * @date 2026-10-18
 *
 * 流程:
 *   (y, x, detected) -> 选臂 -> 单应矩阵 (像素 -> mm) -> IK -> 5个关节目标
 * 无标定时拒绝执行, 不回退到无标定映射。
 */

#ifndef DUOARM_CORE_VISION_TARGETING_HPP
#define DUOARM_CORE_VISION_TARGETING_HPP

#include <optional>
#include <string>

#include "common/types.hpp"
#include "common/logger.hpp"
#include "calibration/calibration_store.hpp"
#include "kinematics/ik_service.hpp"
#include "transform/coordinate_transform.hpp"
#include "transform/workspace_mapper.hpp"

namespace duoarm {

/**
 * @brief 视觉推理输出 (归一化 0~1000)
 */
struct VisionTarget {
    double y = 0.0;
    double x = 0.0;
    bool detected = false;
    double z = 0.0;                         // 目标高度 (mm)
    std::optional<double> orientation;      // 夹爪朝向 (deg)
};

/**
 * @brief 目标处理结果
 */
struct TargetingResult {
    bool accepted = false;
    ErrorCode error = ErrorCode::Ok;
    std::string reason;
    ArmRole arm = ArmRole::Left;
    Point2D pixel;
    Point2D robot;                          // 共享点坐标系 (mm)
    MotionTargets motion;
};

class VisionTargeting {
public:
    VisionTargeting(const IKService& ik, CalibrationStore& calibration)
        : ik_(ik), calibration_(calibration) {}

    TargetingResult process(const VisionTarget& target) {
        TargetingResult result;

        if (!target.detected) {
            return reject(result, ErrorCode::Unreachable, "no target detected");
        }

        result.arm = WorkspaceMapper::dispatch(target.x);
        const std::string role = arm_key(result.arm);

        auto cal = calibration_.get_homography(role);
        if (!cal) {
            return reject(result, ErrorCode::CalibrationMissing, "no valid calibration for " + role);
        }

        result.pixel = gemini_to_pixel(target.x, target.y, cal->width, cal->height);
        auto robot = pixel_to_robot(cal->matrix, result.pixel);
        if (!robot) {
            return reject(result, ErrorCode::SingularGeometry, "homography for " + role + " is singular");
        }
        result.robot = *robot;

        result.motion = ik_.compute_ik_for_motion(result.robot.x, result.robot.y, target.z,
                                                  result.arm, target.orientation);
        if (!result.motion.valid) {
            return reject(result, result.motion.error, std::string("target rejected: ")
                          + error_str(result.motion.error));
        }

        result.accepted = true;
        LOG_INFO("[Vision] %s -> (%.1f, %.1f) mm, yaw %.1f deg", role.c_str(),
                 result.robot.x, result.robot.y, result.motion.yaw_deg);
        return result;
    }

private:
    static TargetingResult& reject(TargetingResult& result, ErrorCode error,
                                   const std::string& reason) {
        result.accepted = false;
        result.error = error;
        result.reason = reason;
        LOG_WARN("[Vision] %s", reason.c_str());
        return result;
    }

    const IKService& ik_;
    CalibrationStore& calibration_;
};

} // namespace duoarm

#endif // DUOARM_CORE_VISION_TARGETING_HPP
