/**
 * @file calibration_store.hpp
 * @brief 标定数据持久化 (calibration_data.json)
 * @date 2026-10-18
 *
 * 文档结构:
 *   _meta            {version}
 *   <role>           {timestamp, resolution, homography_matrix,
 *                     pixel_coords, reprojection_error, is_valid}
 *   gripper_offsets  {left: {dx, dy}, right: {dx, dy}}
 *
 * 每个角色整体替换, 不做局部更新。
 * 保存先写临时文件再 rename, 保证原子性。
 */

#ifndef DUOARM_CALIBRATION_CALIBRATION_STORE_HPP
#define DUOARM_CALIBRATION_CALIBRATION_STORE_HPP

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"
#include "common/time_utils.hpp"
#include "geometry/geometry_engine.hpp"
#include "transform/coordinate_transform.hpp"

namespace duoarm {

constexpr const char* CALIBRATION_VERSION = "1.0";

/**
 * @brief 单角色单应标定
 */
struct HomographyCalibration {
    Matrix3 matrix = identity_matrix();
    int width = 0;
    int height = 0;
    double reprojection_error = 0.0;
    std::string timestamp;
};

/**
 * @brief 夹爪-相机偏移 (mm, 图像坐标系)
 */
struct GripperOffset {
    double dx = 0.0;
    double dy = 0.0;
};

/**
 * @brief 相机元数据 (供视觉推理使用)
 */
struct CameraMetadata {
    std::string role;
    int width = 0;
    int height = 0;
    double mm_per_pixel = 0.0;
    nlohmann::json pixel_vertices;
    nlohmann::json mm_vertices;
    GripperOffset left_offset;
    GripperOffset right_offset;

    nlohmann::json to_json() const {
        return {
            {"role", role},
            {"resolution", {{"width", width}, {"height", height}}},
            {"mm_per_pixel", mm_per_pixel},
            {"pixel_vertices", pixel_vertices},
            {"mm_vertices", mm_vertices},
            {"gripper_offsets", {
                {"left", {{"dx", left_offset.dx}, {"dy", left_offset.dy}}},
                {"right", {{"dx", right_offset.dx}, {"dy", right_offset.dy}}},
            }},
        };
    }
};

/**
 * @brief 标定数据存储
 *
 * 首次访问时加载文件; 文件不存在时为空文档。
 */
class CalibrationStore {
public:
    explicit CalibrationStore(std::string path) : path_(std::move(path)) {}

    CalibrationStore(std::string path, WorkspaceGeometry geometry)
        : path_(std::move(path)), geometry_(std::move(geometry)) {}

    const std::string& path() const { return path_; }

    /**
     * @brief 设置几何快照 (mm/px 计算需要顶点mm坐标)
     */
    void set_geometry(const WorkspaceGeometry& geometry) {
        std::lock_guard<std::mutex> lock(mutex_);
        geometry_ = geometry;
    }

    /**
     * @brief 从文件重新加载
     * @return 文件不存在视为成功 (空文档), JSON非法返回false
     */
    bool load() {
        std::lock_guard<std::mutex> lock(mutex_);
        return load_locked();
    }

    /**
     * @brief 原子保存
     */
    bool save() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_loaded()) return false;
        return save_locked();
    }

    std::optional<nlohmann::json> get_for_role(const std::string& role) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_loaded()) return std::nullopt;
        if (!is_role_key(role) || !doc_.contains(role)) return std::nullopt;
        return doc_.at(role);
    }

    /**
     * @brief 整体替换一个角色的标定并保存
     * @note 缺少 timestamp 时以当前UTC时间补上
     */
    bool save_for_role(const std::string& role, const nlohmann::json& calibration) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_loaded()) return false;
        if (!is_role_key(role)) {
            LOG_ERROR("[Calibration] Reserved key cannot be used as role: %s", role.c_str());
            return false;
        }
        if (!calibration.is_object()) {
            LOG_ERROR("[Calibration] Calibration for %s must be an object", role.c_str());
            return false;
        }
        doc_[role] = calibration;
        if (!doc_[role].contains("timestamp")) {
            doc_[role]["timestamp"] = iso_timestamp_utc();
        }
        LOG_INFO("[Calibration] Saved role %s", role.c_str());
        return save_locked();
    }

    /**
     * @brief 删除角色标定
     * @return 角色不存在或保存失败时返回false
     */
    bool delete_for_role(const std::string& role) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_loaded()) return false;
        if (!is_role_key(role) || !doc_.contains(role)) return false;
        doc_.erase(role);
        LOG_INFO("[Calibration] Deleted role %s", role.c_str());
        return save_locked();
    }

    /**
     * @brief 读取单应矩阵
     * @return 缺失 / is_valid=false / 格式错误时为空
     */
    std::optional<HomographyCalibration> get_homography(const std::string& role) {
        auto entry = get_for_role(role);
        if (!entry) {
            LOG_WARN("[Calibration] No calibration for role %s", role.c_str());
            return std::nullopt;
        }

        try {
            if (!entry->value("is_valid", false)) {
                LOG_WARN("[Calibration] Calibration for %s is marked invalid", role.c_str());
                return std::nullopt;
            }

            HomographyCalibration cal;
            const auto& h = entry->at("homography_matrix");
            for (size_t r = 0; r < 3; r++) {
                for (size_t c = 0; c < 3; c++) {
                    cal.matrix[r][c] = h.at(r).at(c).get<double>();
                }
            }
            const auto& res = entry->at("resolution");
            cal.width = res.at("width").get<int>();
            cal.height = res.at("height").get<int>();
            cal.reprojection_error = entry->value("reprojection_error", 0.0);
            cal.timestamp = entry->value("timestamp", std::string());
            return cal;
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("[Calibration] Malformed calibration for %s: %s", role.c_str(), e.what());
            return std::nullopt;
        }
    }

    /**
     * @brief 夹爪偏移, 缺省为0
     */
    GripperOffset get_gripper_offset(ArmRole arm) {
        std::lock_guard<std::mutex> lock(mutex_);
        GripperOffset off;
        if (!ensure_loaded() || !doc_.contains("gripper_offsets")) return off;

        const auto& all = doc_.at("gripper_offsets");
        const char* key = arm_short_name(arm);
        if (all.is_object() && all.contains(key) && all.at(key).is_object()) {
            off.dx = all.at(key).value("dx", 0.0);
            off.dy = all.at(key).value("dy", 0.0);
        }
        return off;
    }

    bool set_gripper_offset(ArmRole arm, const GripperOffset& offset) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_loaded()) return false;
        doc_["gripper_offsets"][arm_short_name(arm)] = {{"dx", offset.dx}, {"dy", offset.dy}};
        return save_locked();
    }

    /**
     * @brief mm/像素比例
     *
     * 对角顶点 "1" 与 "3": 几何mm距离 / 标定像素距离。
     * 任一顶点缺失 (像素或几何) 时为空。
     */
    std::optional<double> compute_mm_per_pixel(const std::string& role) {
        auto entry = get_for_role(role);
        if (!entry) return std::nullopt;

        auto pa = pixel_vertex(*entry, SCALE_VERTEX_A);
        auto pb = pixel_vertex(*entry, SCALE_VERTEX_B);

        std::optional<Point2D> ma, mb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ma = geometry_.vertex_position(SCALE_VERTEX_A);
            mb = geometry_.vertex_position(SCALE_VERTEX_B);
        }

        if (!pa || !pb || !ma || !mb) {
            LOG_DEBUG("[Calibration] %s: scale vertices unavailable", role.c_str());
            return std::nullopt;
        }

        const double px = distance(*pa, *pb);
        if (px <= 0.0) return std::nullopt;
        return distance(*ma, *mb) / px;
    }

    /**
     * @brief 构建相机元数据
     * @return 标定或 mm/px 比例不可用时为空
     */
    std::optional<CameraMetadata> build_camera_metadata(const std::string& role) {
        auto cal = get_homography(role);
        if (!cal) return std::nullopt;
        auto entry = get_for_role(role);
        if (!entry) return std::nullopt;

        CameraMetadata meta;
        meta.role = role;
        meta.width = cal->width;
        meta.height = cal->height;
        auto scale = compute_mm_per_pixel(role);
        if (!scale) {
            LOG_WARN("[Calibration] %s: scale unavailable, no camera metadata", role.c_str());
            return std::nullopt;
        }
        meta.mm_per_pixel = *scale;

        meta.pixel_vertices = nlohmann::json::object();
        if (entry->contains("pixel_coords") && entry->at("pixel_coords").contains("vertices")) {
            meta.pixel_vertices = entry->at("pixel_coords").at("vertices");
        }

        meta.mm_vertices = nlohmann::json::object();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& item : geometry_.vertices) {
                if (!item.second.valid) continue;
                meta.mm_vertices[item.first] = {{"x", item.second.x}, {"y", item.second.y}};
            }
        }

        meta.left_offset = get_gripper_offset(ArmRole::Left);
        meta.right_offset = get_gripper_offset(ArmRole::Right);
        return meta;
    }

private:
    static bool is_role_key(const std::string& role) {
        return !role.empty() && role != "_meta" && role != "gripper_offsets";
    }

    static std::optional<Point2D> pixel_vertex(const nlohmann::json& entry, const char* id) {
        if (!entry.contains("pixel_coords")) return std::nullopt;
        const auto& pc = entry.at("pixel_coords");
        if (!pc.contains("vertices") || !pc.at("vertices").contains(id)) return std::nullopt;
        const auto& v = pc.at("vertices").at(id);
        if (!v.contains("x") || !v.contains("y")) return std::nullopt;
        if (!v.at("x").is_number() || !v.at("y").is_number()) return std::nullopt;
        return Point2D{v.at("x").get<double>(), v.at("y").get<double>()};
    }

    bool ensure_loaded() {
        if (loaded_) return true;
        return load_locked();
    }

    bool load_locked() {
        std::ifstream file(path_);
        if (!file.is_open()) {
            doc_ = {{"_meta", {{"version", CALIBRATION_VERSION}}}};
            loaded_ = true;
            return true;
        }

        nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            LOG_ERROR("[Calibration] Invalid calibration file: %s", path_.c_str());
            return false;
        }
        doc_ = doc;
        loaded_ = true;
        return true;
    }

    bool save_locked() {
        const std::string tmp = path_ + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out.is_open()) {
                LOG_ERROR("[Calibration] Cannot write %s: %s", tmp.c_str(), strerror(errno));
                return false;
            }
            out << doc_.dump(2) << "\n";
            if (!out.good()) {
                LOG_ERROR("[Calibration] Write failed: %s", tmp.c_str());
                return false;
            }
        }
        if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
            LOG_ERROR("[Calibration] Rename failed %s -> %s: %s",
                      tmp.c_str(), path_.c_str(), strerror(errno));
            std::remove(tmp.c_str());
            return false;
        }
        return true;
    }

    std::string path_;
    WorkspaceGeometry geometry_;
    nlohmann::json doc_;
    bool loaded_ = false;
    std::mutex mutex_;
};

} // namespace duoarm

#endif // DUOARM_CALIBRATION_CALIBRATION_STORE_HPP
