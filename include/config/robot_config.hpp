/**
 * @file robot_config.hpp
 * @brief 舵机配置文档 (servo_config.json) 的类型化加载与校验
 * @date 2026-10-18
 *
 * 文档结构:
 *   connection   {port, baudrate}
 *   workspace    {width_mm, height_mm}
 *   left_arm / right_arm  {z_offset, slot_1 .. slot_6}
 *   share_points {left_arm: {angles}, right_arm: {angles}}
 *   vertices     {"1": {owner, angles}, ...}
 *
 * 派生的 geometry 段不在此读取, 由 GeometryEngine 重新计算。
 */

#ifndef DUOARM_CONFIG_ROBOT_CONFIG_HPP
#define DUOARM_CONFIG_ROBOT_CONFIG_HPP

#include <array>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>

#include <sys/stat.h>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"

namespace duoarm {

/**
 * @brief 整机配置
 */
struct RobotConfig {
    std::string port = SERIAL_DEVICE_DEFAULT;
    int baudrate = SERIAL_BAUDRATE_DEFAULT;

    double workspace_width_mm = DEFAULT_WORKSPACE_WIDTH_MM;
    double workspace_height_mm = DEFAULT_WORKSPACE_HEIGHT_MM;

    std::array<ArmConfig, 2> arms;
    std::map<ArmRole, TaughtPoint> share_points;
    std::map<std::string, TaughtPoint> vertices;   // 顶点ID -> 顶点

    const ArmConfig& arm(ArmRole role) const { return arms[static_cast<size_t>(role)]; }
    ArmConfig& arm(ArmRole role) { return arms[static_cast<size_t>(role)]; }
};

namespace detail {

inline double default_slot_length(int slot_num) {
    static const double lengths[ARM_SLOT_COUNT] = {
        DEFAULT_D1, DEFAULT_A2, DEFAULT_A3, DEFAULT_A4, DEFAULT_A5, DEFAULT_A6};
    return lengths[slot_num - 1];
}

inline std::string slot_key(int slot_num) {
    return "slot_" + std::to_string(slot_num);
}

inline bool parse_slot(const nlohmann::json& j, ArmRole role, int slot_num,
                       JointConfig& out, std::string& error) {
    const std::string where = std::string(arm_key(role)) + "." + slot_key(slot_num);

    out.channel = j.value("channel",
                          (role == ArmRole::Left ? 0 : ARM_SLOT_COUNT) + slot_num - 1);
    out.min = j.value("min", SERVO_ANGLE_MIN);
    out.max = j.value("max", SERVO_ANGLE_MAX);
    out.zero_offset = j.value("zero_offset", 90.0);
    out.length = j.value("length", default_slot_length(slot_num));
    out.initial = j.value("initial", out.zero_offset);
    out.actuation_range = j.value("actuation_range", DEFAULT_ACTUATION_RANGE);
    out.pulse_min = j.value("pulse_min", DEFAULT_PULSE_MIN_US);
    out.pulse_max = j.value("pulse_max", DEFAULT_PULSE_MAX_US);

    const std::string min_pos = j.value("min_pos", std::string("bottom"));
    if (!parse_min_pos(min_pos, out.min_pos)) {
        error = where + ": unknown min_pos '" + min_pos + "'";
        return false;
    }

    const std::string type = j.value("type", std::string("vertical"));
    if (type == "vertical") {
        out.type = JointType::Vertical;
    } else if (type == "horizontal") {
        out.type = JointType::Horizontal;
    } else {
        error = where + ": unknown type '" + type + "'";
        return false;
    }

    if (out.min > out.max) {
        error = where + ": min > max";
        return false;
    }
    if (out.channel < SERVO_CHANNEL_MIN || out.channel > SERVO_CHANNEL_MAX) {
        error = where + ": channel out of range";
        return false;
    }
    if (out.actuation_range <= 0.0 || out.pulse_max <= out.pulse_min) {
        error = where + ": invalid pulse mapping";
        return false;
    }
    return true;
}

inline bool parse_arm(const nlohmann::json& j, ArmRole role, ArmConfig& out,
                      std::string& error) {
    out.z_offset = j.value("z_offset", 0.0);
    out.joint_count = 0;

    for (int slot = 1; slot <= ARM_SLOT_COUNT; slot++) {
        const std::string key = slot_key(slot);
        JointConfig& joint = out.slot(slot);
        if (j.contains(key)) {
            if (!parse_slot(j.at(key), role, slot, joint, error)) return false;
            out.joint_count = slot;
        } else if (slot <= MIN_ARM_SLOTS) {
            error = std::string(arm_key(role)) + ": missing required " + key;
            return false;
        } else {
            // 可选关节: 缺省值
            if (!parse_slot(nlohmann::json::object(), role, slot, joint, error)) return false;
        }
    }
    return true;
}

inline bool parse_angles(const nlohmann::json& j, const std::string& where,
                         SlotAngles& out, std::string& error) {
    if (!j.contains("angles") || !j.at("angles").is_object()) {
        error = where + ": missing 'angles'";
        return false;
    }
    for (const auto& item : j.at("angles").items()) {
        const std::string& key = item.key();
        if (key.compare(0, 5, "slot_") != 0) continue;
        int slot = std::atoi(key.c_str() + 5);
        if (slot < 1 || slot > ARM_SLOT_COUNT) {
            error = where + ": bad angle key '" + key + "'";
            return false;
        }
        out[slot] = item.value().get<double>();
    }
    return true;
}

} // namespace detail

/**
 * @brief 从JSON文档解析配置
 * @param doc JSON文档
 * @param out 输出配置
 * @param error 失败原因
 * @return 是否成功
 */
inline bool parse_robot_config(const nlohmann::json& doc, RobotConfig& out,
                               std::string& error) {
    try {
        RobotConfig cfg;

        if (doc.contains("connection")) {
            const auto& conn = doc.at("connection");
            cfg.port = conn.value("port", cfg.port);
            cfg.baudrate = conn.value("baudrate", cfg.baudrate);
        }
        if (doc.contains("workspace")) {
            const auto& ws = doc.at("workspace");
            cfg.workspace_width_mm = ws.value("width_mm", cfg.workspace_width_mm);
            cfg.workspace_height_mm = ws.value("height_mm", cfg.workspace_height_mm);
        }

        for (ArmRole role : ALL_ARMS) {
            if (!doc.contains(arm_key(role))) {
                error = std::string("missing arm section '") + arm_key(role) + "'";
                return false;
            }
            if (!detail::parse_arm(doc.at(arm_key(role)), role, cfg.arm(role), error)) {
                return false;
            }
        }

        if (doc.contains("share_points")) {
            for (const auto& item : doc.at("share_points").items()) {
                ArmRole role;
                if (!parse_arm(item.key(), role)) {
                    error = "share_points: unknown arm '" + item.key() + "'";
                    return false;
                }
                TaughtPoint point;
                point.owner = role;
                if (!detail::parse_angles(item.value(), "share_points." + item.key(),
                                          point.angles, error)) {
                    return false;
                }
                cfg.share_points[role] = point;
            }
        }

        if (doc.contains("vertices")) {
            for (const auto& item : doc.at("vertices").items()) {
                const std::string where = "vertices." + item.key();
                const auto& v = item.value();
                if (!v.contains("owner") || !v.at("owner").is_string()) {
                    error = where + ": missing 'owner'";
                    return false;
                }
                TaughtPoint vertex;
                if (!parse_arm(v.at("owner").get<std::string>(), vertex.owner)) {
                    error = where + ": unknown owner";
                    return false;
                }
                if (!detail::parse_angles(v, where, vertex.angles, error)) {
                    return false;
                }
                cfg.vertices[item.key()] = vertex;
            }
        }

        out = cfg;
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}

/**
 * @brief 从文件加载配置
 */
inline ErrorCode load_robot_config(const std::string& path, RobotConfig& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Config file not found: %s", path.c_str());
        return ErrorCode::ConfigMissing;
    }

    nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
        LOG_ERROR("Config file is not valid JSON: %s", path.c_str());
        return ErrorCode::ConfigInvalid;
    }

    std::string error;
    if (!parse_robot_config(doc, out, error)) {
        LOG_ERROR("Invalid config %s: %s", path.c_str(), error.c_str());
        return ErrorCode::ConfigInvalid;
    }
    return ErrorCode::Ok;
}

/**
 * @brief 配置缓存 (按文件修改时间自动刷新)
 *
 * 首次 load() 读取文件; 之后仅当 mtime 变化时重新解析。
 * 调用方持有实例, 无进程级全局状态。
 */
class ConfigCache {
public:
    explicit ConfigCache(std::string path) : path_(std::move(path)) {}

    /**
     * @brief 获取配置, 文件变化时重新加载
     */
    ErrorCode load(RobotConfig& out) {
        struct stat st;
        if (stat(path_.c_str(), &st) != 0) {
            LOG_ERROR("Config file not found: %s", path_.c_str());
            return ErrorCode::ConfigMissing;
        }

        const int64_t mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL
                               + st.st_mtim.tv_nsec;
        if (!loaded_ || mtime_ns != mtime_ns_) {
            RobotConfig fresh;
            ErrorCode rc = load_robot_config(path_, fresh);
            if (rc != ErrorCode::Ok) return rc;

            LOG_INFO("[ConfigCache] %s: %s", loaded_ ? "Reloaded" : "Loaded", path_.c_str());
            config_ = fresh;
            mtime_ns_ = mtime_ns;
            loaded_ = true;
            reload_count_++;
        }

        out = config_;
        return ErrorCode::Ok;
    }

    /**
     * @brief 强制失效, 下次 load() 重新读取
     */
    void invalidate() {
        loaded_ = false;
        mtime_ns_ = 0;
    }

    const std::string& path() const { return path_; }
    uint64_t reload_count() const { return reload_count_; }

private:
    std::string path_;
    RobotConfig config_;
    bool loaded_ = false;
    int64_t mtime_ns_ = 0;
    uint64_t reload_count_ = 0;
};

} // namespace duoarm

#endif // DUOARM_CONFIG_ROBOT_CONFIG_HPP
