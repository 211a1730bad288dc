/**
 * @file main.cpp
 * @brief 双臂舵机驱动主程序
 * @date 2026-10-18
 *
 * @details 本文件是主机端的入口程序，负责：
 *          1. 加载舵机配置并推导工作空间几何
 *          2. 单点IK求解与诊断输出
 *          3. 视觉目标 -> 标定坐标 -> IK -> 运动
 *          4. 串口连接、回零与急停
 *
 * @note 运行: ./duoarm_driver -c servo_config.json [选项]
 *       示例: ./duoarm_driver -c config/servo_config.json -k config/calibration_data.json \
 *                 -t 300,450 -e
 */

#include <cstdio>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <getopt.h>

#include <nlohmann/json.hpp>

#include "common/logger.hpp"
#include "common/time_utils.hpp"
#include "config/robot_config.hpp"
#include "geometry/geometry_engine.hpp"
#include "kinematics/ik_service.hpp"
#include "calibration/calibration_store.hpp"
#include "core/robot_controller.hpp"
#include "core/vision_targeting.hpp"

using namespace duoarm;

/// 运行标志
static volatile sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

/**
 * @brief 命令行选项
 */
struct CliOptions {
    std::string config_path = "servo_config.json";
    std::string calibration_path = "calibration_data.json";
    std::string port;                   // 覆盖配置中的串口
    bool print_geometry = false;
    bool has_ik = false;
    double ik[3] = {0.0, 0.0, 0.0};
    ArmRole ik_arm = ArmRole::Left;
    bool has_target = false;
    double target[2] = {0.0, 0.0};      // gx, gy
    double target_z = 0.0;
    bool has_orientation = false;
    double orientation = 0.0;
    bool execute = false;
    bool home = false;
    double seconds = 2.0;
};

void print_usage(const char* prog) {
    printf("用法: %s [选项]\n", prog);
    printf("  -c <file>       舵机配置 (默认: servo_config.json)\n");
    printf("  -k <file>       标定数据 (默认: calibration_data.json)\n");
    printf("  -g              打印工作空间几何 (JSON)\n");
    printf("  -i x,y,z[,arm]  求解IK (世界坐标mm, arm=left|right)\n");
    printf("  -t gx,gy        视觉目标 (归一化 0~1000)\n");
    printf("  -z <mm>         目标高度 (默认: 0)\n");
    printf("  -o <deg>        夹爪朝向\n");
    printf("  -e              连接串口并执行运动\n");
    printf("  -H              连接串口并回到Home位置\n");
    printf("  -p <port>       串口设备 (覆盖配置)\n");
    printf("  -s <sec>        运动时长 (默认: 2.0)\n");
    printf("  -v <level>      日志级别 trace|debug|info|warn|error\n");
    printf("  -h              显示帮助\n");
    printf("\n示例:\n");
    printf("  %s -c servo_config.json -i 0,150,0,left\n", prog);
    printf("  %s -c servo_config.json -k calibration_data.json -t 300,450 -e\n", prog);
}

/**
 * @brief 解析逗号分隔的数值列表
 */
static int parse_numbers(const char* text, double* out, int max_count, std::string* tail) {
    int count = 0;
    const char* p = text;
    while (*p && count < max_count) {
        char* end = nullptr;
        double value = std::strtod(p, &end);
        if (end == p) break;
        out[count++] = value;
        p = end;
        if (*p == ',') p++;
    }
    if (tail) *tail = p;
    return count;
}

static bool parse_options(int argc, char* argv[], CliOptions& opt) {
    int c;
    while ((c = getopt(argc, argv, "c:k:gi:t:z:o:eHp:s:v:h")) != -1) {
        switch (c) {
            case 'c': opt.config_path = optarg; break;
            case 'k': opt.calibration_path = optarg; break;
            case 'g': opt.print_geometry = true; break;
            case 'i': {
                std::string tail;
                if (parse_numbers(optarg, opt.ik, 3, &tail) != 3) {
                    fprintf(stderr, "无效的IK目标: %s\n", optarg);
                    return false;
                }
                if (!tail.empty() && !parse_arm(tail, opt.ik_arm)) {
                    fprintf(stderr, "无效的手臂: %s\n", tail.c_str());
                    return false;
                }
                opt.has_ik = true;
                break;
            }
            case 't':
                if (parse_numbers(optarg, opt.target, 2, nullptr) != 2) {
                    fprintf(stderr, "无效的视觉目标: %s\n", optarg);
                    return false;
                }
                opt.has_target = true;
                break;
            case 'z': opt.target_z = std::atof(optarg); break;
            case 'o':
                opt.orientation = std::atof(optarg);
                opt.has_orientation = true;
                break;
            case 'e': opt.execute = true; break;
            case 'H': opt.home = true; break;
            case 'p': opt.port = optarg; break;
            case 's': opt.seconds = std::atof(optarg); break;
            case 'v': {
                LogLevel level;
                if (!parse_log_level(optarg, level)) {
                    fprintf(stderr, "无效的日志级别: %s\n", optarg);
                    return false;
                }
                Logger::instance().set_level(level);
                break;
            }
            case 'h':
            default:
                return false;
        }
    }
    return true;
}

static void print_ik_detail(const IKDetail& d) {
    if (d.error != ErrorCode::Ok) {
        LOG_ERROR("IK %s: %s", arm_key(d.arm), error_str(d.error));
        return;
    }
    LOG_INFO("IK %s: 目标 (%.1f, %.1f, %.1f) -> 局部 (%.1f, %.1f, %.1f)",
             arm_key(d.arm), d.target.x, d.target.y, d.target.z,
             d.local.x, d.local.y, d.local.z);
    LOG_INFO("  构型: %s, 可达: %s, reach=%.1f mm",
             d.config_name.c_str(), d.valid ? "是" : "否", d.reach);
    for (int i = 0; i < ARM_SLOT_COUNT; i++) {
        LOG_INFO("  slot_%d: math=%7.2f  phys=%7.2f  pulse=%4d  %s",
                 i + 1, d.theta[i], d.physical[i], d.pulse[i],
                 d.within_limits[i] ? "" : "[超限]");
    }
}

/**
 * @brief 等待运动结束 (可被Ctrl+C中断)
 */
static bool wait_motion(RobotController& robot, double seconds) {
    Timer timer;
    while (g_running && robot.planner().is_moving()) {
        if (timer.elapsed_sec() > seconds + 2.0) return false;
        sleep_ms(100);
    }
    // 留出发送线程送出最后一帧
    sleep_ms(100);
    return g_running;
}

int main(int argc, char* argv[]) {
    CliOptions opt;
    if (!parse_options(argc, argv, opt)) {
        print_usage(argv[0]);
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    LOG_INFO("============================================");
    LOG_INFO("  DuoArm 双臂舵机驱动");
    LOG_INFO("  配置: %s", opt.config_path.c_str());
    LOG_INFO("============================================");

    // ========== 加载配置 ==========
    RobotConfig config;
    ErrorCode rc = load_robot_config(opt.config_path, config);
    if (rc != ErrorCode::Ok) {
        LOG_FATAL("配置加载失败: %s", error_str(rc));
        return 1;
    }
    if (!opt.port.empty()) {
        config.port = opt.port;
    }

    // ========== 工作空间几何 ==========
    IKService ik(config);
    const WorkspaceGeometry& geo = ik.geometry();
    for (const auto& base : geo.bases) {
        LOG_INFO("底座 %s: (%.1f, %.1f)", arm_key(base.first), base.second.x, base.second.y);
    }
    for (const auto& item : geo.vertices) {
        const VertexGeometry& v = item.second;
        if (v.valid) {
            LOG_INFO("顶点 %s [%s]: (%.1f, %.1f) reach=%.1f %s",
                     item.first.c_str(), arm_key(v.owner), v.x, v.y, v.reach, stance_str(v.stance));
        } else {
            LOG_WARN("顶点 %s [%s]: 几何无解", item.first.c_str(), arm_key(v.owner));
        }
    }
    if (opt.print_geometry) {
        printf("%s\n", geometry_to_json(geo).dump(2).c_str());
    }

    // ========== 单点IK ==========
    if (opt.has_ik) {
        print_ik_detail(ik.compute_ik_detail(opt.ik[0], opt.ik[1], opt.ik[2], opt.ik_arm));
    }

    // ========== 视觉目标 ==========
    std::vector<MotionPlanner::Target> motion_targets;
    if (opt.has_target) {
        CalibrationStore calibration(opt.calibration_path, geo);
        VisionTargeting vision(ik, calibration);

        VisionTarget target;
        target.x = opt.target[0];
        target.y = opt.target[1];
        target.detected = true;
        target.z = opt.target_z;
        if (opt.has_orientation) target.orientation = opt.orientation;

        TargetingResult result = vision.process(target);
        if (!result.accepted) {
            LOG_ERROR("目标被拒绝: %s", result.reason.c_str());
            return 2;
        }
        print_ik_detail(result.motion.detail);
        motion_targets = result.motion.targets;
    }

    if (!opt.execute && !opt.home) {
        return 0;
    }

    // ========== 串口执行 ==========
    RobotController robot(config);
    if (!robot.connect()) {
        LOG_FATAL("串口连接失败 (%s): %s", error_str(ErrorCode::LinkFailure), config.port.c_str());
        LOG_FATAL("请检查：");
        LOG_FATAL("  1. 设备是否存在 (%s)", config.port.c_str());
        LOG_FATAL("  2. 当前用户是否有串口权限 (dialout组)");
        return 1;
    }
    LOG_INFO("✓ 串口已连接");

    int exit_code = 0;
    if (opt.home) {
        LOG_INFO("回到Home位置...");
        if (!robot.go_home()) {
            LOG_ERROR("回Home失败");
            exit_code = 1;
        }
    }

    if (opt.execute && !motion_targets.empty() && g_running) {
        LOG_INFO("执行运动 (%.1f s)...", opt.seconds);
        if (!robot.move_to_angles(motion_targets, opt.seconds) || !wait_motion(robot, opt.seconds)) {
            LOG_ERROR("运动未完成");
            exit_code = 1;
        }
    }

    if (!g_running) {
        LOG_WARN("收到退出信号, 释放全部舵机");
        robot.release_all();
    }

    printf("%s\n", robot.status().to_json().dump(2).c_str());
    robot.driver().print_stats();
    robot.disconnect();
    return exit_code;
}
