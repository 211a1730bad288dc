/**
 * @file geometry_engine.hpp
 * @brief 工作空间几何推导 (底座位置, 顶点位置, 距离矩阵)
 * @date 2026-10-18
 *
 * 坐标系: +X向右, +Y向上, 共享点为原点 (0, 0)。
 *
 * 流程:
 *   1. 共享点 -> reach + yaw -> 底座位置
 *   2. 顶点 -> 两圆求交 (原点圆, 底座圆) -> 顶点位置
 *   3. 距离矩阵
 *
 * 所有函数均为配置的纯函数, 每次调用重新计算。
 */

#ifndef DUOARM_GEOMETRY_GEOMETRY_ENGINE_HPP
#define DUOARM_GEOMETRY_GEOMETRY_ENGINE_HPP

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"
#include "config/robot_config.hpp"

namespace duoarm {

/**
 * @brief 平面FK可达距离
 */
struct ReachResult {
    double horizontal = 0.0;    // |fk_x|
    double reach_3d = 0.0;      // hypot(fk_x, fk_y)
};

/**
 * @brief 顶点姿态分析 (肩/肘三角形)
 */
struct Reach3D {
    double yaw_delta = 0.0;         // deg
    double shoulder_delta = 0.0;    // deg
    double elbow_delta = 0.0;       // deg
    double internal_angle = 180.0;  // 肘部内角, 180 = 伸直
    Stance stance = Stance::Open;
    double r_3d = 0.0;              // 肩到腕 (mm)
    double r_xy = 0.0;
    double z_final = 0.0;
};

/**
 * @brief 顶点推导结果
 * @note valid=false 表示两圆无交点, x/y 无意义
 */
struct VertexGeometry {
    std::string id;
    ArmRole owner = ArmRole::Left;
    bool valid = false;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double reach = 0.0;             // 底座圆半径 (reach_3d)
    double reach_horizontal = 0.0;
    double share_to_vertex = 0.0;   // 原点圆半径
    Stance stance = Stance::Open;
    double internal_angle = 180.0;
};

struct DistanceMatrix {
    std::map<std::string, double> vertex_to_vertex;                 // "1_2" -> mm
    std::map<ArmRole, std::map<std::string, double>> base_to_vertex;
    std::map<std::string, double> share_point_to_vertex;
    std::optional<double> base_to_base;
};

/**
 * @brief 工作空间几何快照
 */
struct WorkspaceGeometry {
    std::map<ArmRole, Point2D> bases;
    std::map<ArmRole, double> base_yaw;     // rad
    std::map<std::string, VertexGeometry> vertices;
    DistanceMatrix distances;

    std::optional<Point2D> base(ArmRole arm) const {
        auto it = bases.find(arm);
        if (it == bases.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Point2D> vertex_position(const std::string& id) const {
        auto it = vertices.find(id);
        if (it == vertices.end() || !it->second.valid) return std::nullopt;
        return Point2D{it->second.x, it->second.y};
    }
};

inline double distance(const Point2D& a, const Point2D& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

//==============================================================================
// 单点FK
//==============================================================================

/**
 * @brief slot逻辑角 (rad), 缺失时按零位处理
 */
inline double logical_angle_rad(const ArmConfig& arm, const TaughtPoint& point, int slot_num) {
    const JointConfig& joint = arm.slot(slot_num);
    return deg2rad(joint.to_logical(point.angle_or_zero(arm, slot_num)));
}

/**
 * @brief 平面FK可达距离
 * @param is_vertex true: 含腕部连杆 (a4+a5+a6, 腕俯仰 slot_4)
 */
inline ReachResult compute_reach(const RobotConfig& config, ArmRole arm,
                                 const TaughtPoint& point, bool is_vertex) {
    const ArmConfig& cfg = config.arm(arm);
    const LinkSet links = cfg.links();

    const double angle_shoulder = logical_angle_rad(cfg, point, 2);
    const double angle_elbow = angle_shoulder + logical_angle_rad(cfg, point, 3);

    double fk_x = links.a2 * std::cos(angle_shoulder) + links.a3 * std::cos(angle_elbow);
    double fk_y = links.a2 * std::sin(angle_shoulder) + links.a3 * std::sin(angle_elbow);

    if (is_vertex) {
        const double angle_wrist = angle_elbow + logical_angle_rad(cfg, point, 4);
        fk_x += links.wrist_length() * std::cos(angle_wrist);
        fk_y += links.wrist_length() * std::sin(angle_wrist);
    }

    ReachResult result;
    result.horizontal = std::fabs(fk_x);
    result.reach_3d = std::hypot(fk_x, fk_y);
    return result;
}

/**
 * @brief 顶点姿态分析
 *
 * 各关节偏离零位的角度 -> 肘部内角 -> 余弦定理求肩腕距离。
 * 内角大于 STANCE_THRESHOLD_DEG 为 open, 否则 closed。
 */
inline Reach3D compute_3d_reach(const RobotConfig& config, ArmRole arm, const TaughtPoint& vertex) {
    const ArmConfig& cfg = config.arm(arm);
    const LinkSet links = cfg.links();

    Reach3D out;
    out.yaw_delta = std::fabs(vertex.angle_or_zero(cfg, 1) - cfg.slot(1).zero_offset);
    out.shoulder_delta = std::fabs(vertex.angle_or_zero(cfg, 2) - cfg.slot(2).zero_offset);
    out.elbow_delta = std::fabs(vertex.angle_or_zero(cfg, 3) - cfg.slot(3).zero_offset);

    out.internal_angle = 180.0 - out.elbow_delta;
    out.stance = out.internal_angle > STANCE_THRESHOLD_DEG ? Stance::Open : Stance::Closed;

    const double internal = deg2rad(out.internal_angle);
    const double r_sq = links.a2 * links.a2 + links.a3 * links.a3
                      - 2.0 * links.a2 * links.a3 * std::cos(internal);
    out.r_3d = std::sqrt(std::max(r_sq, 0.0));

    const double shoulder = deg2rad(out.shoulder_delta);
    out.r_xy = out.r_3d * std::cos(shoulder);
    out.z_final = links.d1 - out.r_3d * std::sin(shoulder);
    return out;
}

/**
 * @brief 偏航角 (rad), 由slot_1物理角/零位/方向决定
 */
inline double compute_yaw(const RobotConfig& config, ArmRole arm, const TaughtPoint& point) {
    return logical_angle_rad(config.arm(arm), point, 1);
}

/**
 * @brief 由已知点反推底座位置
 * @note 与 solve_ik 的 theta1 = atan2(x, y) 同一约定:
 *       底座指向该点的方向为 (sin(yaw), cos(yaw))
 */
inline Point2D compute_base(const Point2D& point, double reach, double yaw) {
    return Point2D{point.x - reach * std::sin(yaw), point.y - reach * std::cos(yaw)};
}

/**
 * @brief 共享点(原点)到顶点的距离
 *
 * 顶点估计位置 = 底座 + 水平可达距离 * yaw方向。
 */
inline double compute_share_to_vertex(const RobotConfig& config, ArmRole arm,
                                      const TaughtPoint& vertex, const Point2D& base) {
    const double reach_h = compute_reach(config, arm, vertex, false).horizontal;
    const double yaw = compute_yaw(config, arm, vertex);
    const double vx = base.x + reach_h * std::sin(yaw);
    const double vy = base.y + reach_h * std::cos(yaw);
    return std::hypot(vx, vy);
}

//==============================================================================
// 两圆求交
//==============================================================================

/**
 * @brief 两圆交点
 * @return 无交点 / 同心时为空; 相切时两点重合
 */
inline std::optional<std::pair<Point2D, Point2D>> circle_intersection(
        const Point2D& c1, double r1, const Point2D& c2, double r2) {
    const double dx = c2.x - c1.x;
    const double dy = c2.y - c1.y;
    const double d = std::hypot(dx, dy);

    if (d > r1 + r2 || d < std::fabs(r1 - r2) || d == 0.0) {
        return std::nullopt;
    }

    const double a = (r1 * r1 - r2 * r2 + d * d) / (2.0 * d);
    const double h = std::sqrt(std::max(r1 * r1 - a * a, 0.0));

    const double px = c1.x + a * dx / d;
    const double py = c1.y + a * dy / d;

    Point2D p1{px + h * dy / d, py - h * dx / d};
    Point2D p2{px - h * dy / d, py + h * dx / d};
    return std::make_pair(p1, p2);
}

/**
 * @brief 两候选点中选取位于所属臂一侧 (与底座x同号) 的点
 * @note 近似规则, 两点同侧或底座在x=0时取第一个
 */
inline Point2D select_owner_side(const std::pair<Point2D, Point2D>& candidates, const Point2D& base) {
    const bool first_on_side = (candidates.first.x > 0.0) == (base.x > 0.0);
    const bool second_on_side = (candidates.second.x > 0.0) == (base.x > 0.0);
    if (base.x != 0.0 && !first_on_side && second_on_side) {
        return candidates.second;
    }
    return candidates.first;
}

//==============================================================================
// 整体几何
//==============================================================================

/**
 * @brief 由配置推导完整几何快照
 */
inline WorkspaceGeometry compute_geometry(const RobotConfig& config) {
    WorkspaceGeometry geo;
    const Point2D origin{};

    // 1. 底座
    for (ArmRole arm : ALL_ARMS) {
        auto it = config.share_points.find(arm);
        if (it == config.share_points.end()) {
            LOG_DEBUG("[Geometry] No share point for %s", arm_key(arm));
            continue;
        }
        const double reach = compute_reach(config, arm, it->second, false).reach_3d;
        const double yaw = compute_yaw(config, arm, it->second);
        geo.bases[arm] = compute_base(origin, reach, yaw);
        geo.base_yaw[arm] = yaw;
    }

    // 2. 顶点
    for (const auto& item : config.vertices) {
        const std::string& id = item.first;
        const TaughtPoint& vertex = item.second;

        VertexGeometry vg;
        vg.id = id;
        vg.owner = vertex.owner;

        auto base = geo.base(vertex.owner);
        if (!base) {
            LOG_WARN("[Geometry] Vertex %s: owner %s has no base", id.c_str(), arm_key(vertex.owner));
            geo.vertices[id] = vg;
            continue;
        }

        const ReachResult reach = compute_reach(config, vertex.owner, vertex, true);
        const Reach3D pose = compute_3d_reach(config, vertex.owner, vertex);
        vg.reach = reach.reach_3d;
        vg.reach_horizontal = reach.horizontal;
        vg.share_to_vertex = compute_share_to_vertex(config, vertex.owner, vertex, *base);
        vg.stance = pose.stance;
        vg.internal_angle = pose.internal_angle;
        vg.z = pose.z_final;

        auto candidates = circle_intersection(origin, vg.share_to_vertex, *base, vg.reach);
        if (!candidates) {
            LOG_WARN("[Geometry] Vertex %s: no circle intersection (r1=%.1f, r2=%.1f)",
                     id.c_str(), vg.share_to_vertex, vg.reach);
        } else {
            const Point2D p = select_owner_side(*candidates, *base);
            vg.x = p.x;
            vg.y = p.y;
            vg.valid = true;
        }
        geo.vertices[id] = vg;
    }

    // 3. 距离矩阵 (仅有效顶点)
    DistanceMatrix& dist = geo.distances;
    for (auto a = geo.vertices.begin(); a != geo.vertices.end(); ++a) {
        if (!a->second.valid) continue;
        const Point2D pa{a->second.x, a->second.y};
        dist.share_point_to_vertex[a->first] = distance(origin, pa);

        for (auto b = std::next(a); b != geo.vertices.end(); ++b) {
            if (!b->second.valid) continue;
            dist.vertex_to_vertex[a->first + "_" + b->first] =
                distance(pa, Point2D{b->second.x, b->second.y});
        }
        for (const auto& base : geo.bases) {
            dist.base_to_vertex[base.first][a->first] = distance(base.second, pa);
        }
    }
    if (geo.bases.size() == 2) {
        dist.base_to_base = distance(geo.bases.at(ArmRole::Left), geo.bases.at(ArmRole::Right));
    }

    return geo;
}

/**
 * @brief 几何快照 -> JSON (配置文件 geometry 段格式)
 */
inline nlohmann::json geometry_to_json(const WorkspaceGeometry& geo) {
    nlohmann::json j;
    j["coordinate_system"] = "+X=right, +Y=up";
    j["origin"] = "share_point";
    j["bases"] = nlohmann::json::object();
    j["vertices"] = nlohmann::json::object();

    for (const auto& base : geo.bases) {
        j["bases"][arm_key(base.first)] = {{"x", base.second.x}, {"y", base.second.y}};
    }
    for (const auto& item : geo.vertices) {
        const VertexGeometry& v = item.second;
        nlohmann::json jv = {
            {"owner", arm_key(v.owner)},
            {"valid", v.valid},
            {"reach", v.reach},
            {"stance", stance_str(v.stance)},
            {"internal_angle", v.internal_angle},
        };
        if (v.valid) {
            jv["x"] = v.x;
            jv["y"] = v.y;
            jv["z"] = v.z;
        }
        j["vertices"][item.first] = jv;
    }

    nlohmann::json dist;
    dist["vertex_to_vertex"] = geo.distances.vertex_to_vertex;
    dist["share_point_to_vertex"] = geo.distances.share_point_to_vertex;
    dist["base_to_vertex"] = nlohmann::json::object();
    for (const auto& arm : geo.distances.base_to_vertex) {
        dist["base_to_vertex"][arm_key(arm.first)] = arm.second;
    }
    if (geo.distances.base_to_base) {
        dist["base_to_base"] = *geo.distances.base_to_base;
    } else {
        dist["base_to_base"] = nullptr;
    }
    j["distances"] = dist;
    return j;
}

} // namespace duoarm

#endif // DUOARM_GEOMETRY_GEOMETRY_ENGINE_HPP
