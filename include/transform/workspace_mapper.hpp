/**
 * @file workspace_mapper.hpp
 * @brief 无标定时的工作区坐标映射 (矩形工作区, 底部安装)
 * @date 2026-10-18
 *
 * 与单应矩阵路径相互独立, 不可互相替代。
 *
 *   左臂原点: 工作区左下角, 右臂原点: 工作区右下角
 *   屏幕顶端 (gy=0) 离机器人最远
 */

#ifndef DUOARM_TRANSFORM_WORKSPACE_MAPPER_HPP
#define DUOARM_TRANSFORM_WORKSPACE_MAPPER_HPP

#include <cmath>

#include "common/types.hpp"
#include "common/constants.hpp"

namespace duoarm {

class WorkspaceMapper {
public:
    WorkspaceMapper(double width_mm, double height_mm)
        : width_(width_mm), height_(height_mm) {}

    double width() const { return width_; }
    double height() const { return height_; }

    /**
     * @brief 按X中线选择手臂
     */
    static ArmRole dispatch(double gx) {
        return gx < GEMINI_SPLIT_X ? ArmRole::Left : ArmRole::Right;
    }

    Point2D map_to_global(double gx, double gy) const {
        return Point2D{gx / GEMINI_GRID * width_, gy / GEMINI_GRID * height_};
    }

    /**
     * @brief 归一化坐标 -> 手臂局部mm
     */
    Point2D map_to_local(double gx, double gy, ArmRole arm) const {
        const Point2D global = map_to_global(gx, gy);
        Point2D local;
        local.x = (arm == ArmRole::Left) ? global.x : global.x - width_;
        local.y = height_ - global.y;
        return local;
    }

    static bool is_reachable(const Point2D& local, double max_reach) {
        return std::hypot(local.x, local.y) <= max_reach;
    }

private:
    double width_;
    double height_;
};

} // namespace duoarm

#endif // DUOARM_TRANSFORM_WORKSPACE_MAPPER_HPP
