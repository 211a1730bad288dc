/**
 * @file test_geometry.cpp
 * @brief 工作空间几何推导测试 (底座, 顶点, 两圆求交, 距离矩阵)
 * @date 2026-10-18
 *
 * 运行: ./test_geometry
 */

#include <cmath>

#include "common/logger.hpp"
#include "geometry/geometry_engine.hpp"
#include "test_common.hpp"

using namespace duoarm;

static void test_circle_intersection() {
    auto two = circle_intersection(Point2D{0, 0}, 5.0, Point2D{6, 0}, 5.0);
    CHECK(two.has_value());
    CHECK_NEAR(two->first.x, 3.0, 1e-9);
    CHECK_NEAR(two->first.y, -4.0, 1e-9);
    CHECK_NEAR(two->second.x, 3.0, 1e-9);
    CHECK_NEAR(two->second.y, 4.0, 1e-9);

    // 外切: 两点重合
    auto tangent = circle_intersection(Point2D{0, 0}, 1.0, Point2D{2, 0}, 1.0);
    CHECK(tangent.has_value());
    CHECK_NEAR(tangent->first.x, 1.0, 1e-9);
    CHECK_NEAR(tangent->first.y, 0.0, 1e-9);
    CHECK_NEAR(tangent->second.x, tangent->first.x, 1e-12);
    CHECK_NEAR(tangent->second.y, tangent->first.y, 1e-12);

    CHECK(!circle_intersection(Point2D{0, 0}, 1.0, Point2D{5, 0}, 1.0));   // 相离
    CHECK(!circle_intersection(Point2D{0, 0}, 5.0, Point2D{1, 0}, 1.0));   // 内含
    CHECK(!circle_intersection(Point2D{0, 0}, 2.0, Point2D{0, 0}, 2.0));   // 同心
}

static void test_owner_side_selection() {
    std::pair<Point2D, Point2D> c{Point2D{5, 1}, Point2D{-5, 1}};
    CHECK_NEAR(select_owner_side(c, Point2D{-100, -100}).x, -5.0, 1e-12);
    CHECK_NEAR(select_owner_side(c, Point2D{100, -100}).x, 5.0, 1e-12);
    // 底座在 x=0: 取第一个
    CHECK_NEAR(select_owner_side(c, Point2D{0, -100}).x, 5.0, 1e-12);
}

static void test_yaw_and_base() {
    RobotConfig config = test::sample_config();
    const TaughtPoint& share = config.share_points.at(ArmRole::Left);

    CHECK_NEAR(compute_yaw(config, ArmRole::Left, share), deg2rad(30.0), 1e-12);

    ReachResult r = compute_reach(config, ArmRole::Left, share, false);
    // 肩 +30°, 肘 -60° (min_pos=top 反向)
    const double fk_x = 105.0 * std::cos(deg2rad(30.0)) + 150.0 * std::cos(deg2rad(-30.0));
    const double fk_y = 105.0 * std::sin(deg2rad(30.0)) + 150.0 * std::sin(deg2rad(-30.0));
    CHECK_NEAR(r.horizontal, fk_x, 1e-9);
    CHECK_NEAR(r.reach_3d, std::hypot(fk_x, fk_y), 1e-9);

    // 左臂向右偏30°指向共享点, 底座在其左后方
    Point2D base = compute_base(Point2D{0, 0}, r.reach_3d, deg2rad(30.0));
    CHECK_NEAR(base.x, -110.98986, 1e-4);
    CHECK_NEAR(base.y, -192.24008, 1e-4);

    // 底座 -> 点 的方位即 yaw
    base = compute_base(Point2D{10, 20}, 100.0, deg2rad(-90.0));
    CHECK_NEAR(base.x, 110.0, 1e-9);
    CHECK_NEAR(base.y, 20.0, 1e-9);
    CHECK_NEAR(rad2deg(std::atan2(10.0 - base.x, 20.0 - base.y)), -90.0, 1e-9);
}

static void test_reach_with_wrist() {
    RobotConfig config = test::sample_config();
    const TaughtPoint& v = config.vertices.at("1");

    ReachResult arm_only = compute_reach(config, ArmRole::Left, v, false);
    ReachResult with_wrist = compute_reach(config, ArmRole::Left, v, true);
    // 腕部竖直向下: 水平距离不变
    CHECK_NEAR(with_wrist.horizontal, arm_only.horizontal, 1e-9);
    CHECK_NEAR(with_wrist.horizontal, 176.86601, 1e-4);
    CHECK_NEAR(with_wrist.reach_3d, 179.39716, 1e-4);
    CHECK(arm_only.reach_3d > with_wrist.reach_3d);
}

static void test_3d_reach_and_stance() {
    RobotConfig config = test::sample_config();
    const TaughtPoint& v = config.vertices.at("1");

    Reach3D r = compute_3d_reach(config, ArmRole::Left, v);
    CHECK_NEAR(r.yaw_delta, 15.0, 1e-12);
    CHECK_NEAR(r.shoulder_delta, 70.0, 1e-12);
    CHECK_NEAR(r.elbow_delta, 50.0, 1e-12);
    CHECK_NEAR(r.internal_angle, 130.0, 1e-12);
    CHECK(r.stance == Stance::Open);

    const double expected = std::sqrt(105.0 * 105.0 + 150.0 * 150.0
                                      - 2.0 * 105.0 * 150.0 * std::cos(deg2rad(130.0)));
    CHECK_NEAR(r.r_3d, expected, 1e-9);
    CHECK_NEAR(r.r_xy, expected * std::cos(deg2rad(70.0)), 1e-9);
    CHECK_NEAR(r.z_final, 107.0 - expected * std::sin(deg2rad(70.0)), 1e-9);

    // 肘部折叠90°: 内角恰为90, 判为closed
    TaughtPoint folded = v;
    folded.angles[3] = 180.0;
    r = compute_3d_reach(config, ArmRole::Left, folded);
    CHECK_NEAR(r.internal_angle, 90.0, 1e-12);
    CHECK(r.stance == Stance::Closed);

    // 缺失角度按零位处理
    TaughtPoint empty;
    r = compute_3d_reach(config, ArmRole::Left, empty);
    CHECK_NEAR(r.internal_angle, 180.0, 1e-12);
    CHECK_NEAR(r.r_3d, 255.0, 1e-9);
}

static void test_compute_geometry() {
    RobotConfig config = test::sample_config();
    WorkspaceGeometry geo = compute_geometry(config);

    CHECK(geo.bases.size() == 2);
    CHECK_NEAR(geo.bases.at(ArmRole::Left).x, -110.98986, 1e-4);
    CHECK_NEAR(geo.bases.at(ArmRole::Right).x, 110.98986, 1e-4);
    CHECK_NEAR(geo.bases.at(ArmRole::Right).y, geo.bases.at(ArmRole::Left).y, 1e-9);

    CHECK(geo.vertices.size() == 4);
    for (const auto& item : geo.vertices) {
        const VertexGeometry& v = item.second;
        CHECK(v.valid);
        // 交点同时位于两个圆上
        const Point2D p{v.x, v.y};
        CHECK_NEAR(distance(Point2D{0, 0}, p), v.share_to_vertex, 1e-6);
        CHECK_NEAR(distance(geo.bases.at(v.owner), p), v.reach, 1e-6);
        // 位于所属臂一侧
        CHECK((v.x > 0) == (geo.bases.at(v.owner).x > 0));
    }

    const VertexGeometry& v1 = geo.vertices.at("1");
    CHECK_NEAR(v1.x, -66.07948, 1e-4);
    CHECK_NEAR(v1.y, -18.55532, 1e-4);
    CHECK(v1.stance == Stance::Open);
    CHECK_NEAR(geo.vertices.at("3").x, 66.07948, 1e-4);

    // 距离矩阵
    CHECK(geo.distances.base_to_base.has_value());
    CHECK_NEAR(*geo.distances.base_to_base, 2.0 * 110.98986, 1e-3);
    CHECK(geo.distances.vertex_to_vertex.size() == 6);
    CHECK_NEAR(geo.distances.vertex_to_vertex.at("1_3"), 132.15896, 1e-3);
    CHECK(geo.distances.share_point_to_vertex.size() == 4);
    CHECK(geo.distances.base_to_vertex.at(ArmRole::Right).size() == 4);
    CHECK_NEAR(geo.distances.base_to_vertex.at(ArmRole::Left).at("1"), v1.reach, 1e-6);
}

static void test_unresolvable_vertex_is_reported() {
    nlohmann::json doc = test::sample_config_json();
    doc["vertices"]["9"] = {
        {"owner", "left_arm"},
        {"angles", {{"slot_1", 80}, {"slot_2", 100}, {"slot_3", 130}, {"slot_4", 120}}},
    };
    RobotConfig config;
    std::string error;
    CHECK(parse_robot_config(doc, config, error));

    WorkspaceGeometry geo = compute_geometry(config);
    CHECK(geo.vertices.count("9") == 1);
    CHECK(!geo.vertices.at("9").valid);
    CHECK(!geo.vertex_position("9").has_value());
    CHECK(geo.distances.share_point_to_vertex.count("9") == 0);
    CHECK(geo.distances.vertex_to_vertex.count("1_9") == 0);
}

static void test_missing_share_point() {
    nlohmann::json doc = test::sample_config_json();
    doc["share_points"].erase("right_arm");
    RobotConfig config;
    std::string error;
    CHECK(parse_robot_config(doc, config, error));

    WorkspaceGeometry geo = compute_geometry(config);
    CHECK(geo.bases.size() == 1);
    CHECK(!geo.base(ArmRole::Right).has_value());
    CHECK(!geo.vertices.at("3").valid);
    CHECK(!geo.distances.base_to_base.has_value());
}

static void test_geometry_json() {
    WorkspaceGeometry geo = compute_geometry(test::sample_config());
    nlohmann::json j = geometry_to_json(geo);
    CHECK(j["origin"] == "share_point");
    CHECK(j["bases"].contains("left_arm"));
    CHECK(j["vertices"]["2"]["owner"] == "left_arm");
    CHECK(j["vertices"]["2"]["stance"] == "open");
    CHECK(j["distances"]["vertex_to_vertex"].size() == 6);
}

int main() {
    Logger::instance().set_level(LogLevel::INFO);
    LOG_INFO("=== Geometry Test ===");

    RUN_TEST(test_circle_intersection);
    RUN_TEST(test_owner_side_selection);
    RUN_TEST(test_yaw_and_base);
    RUN_TEST(test_reach_with_wrist);
    RUN_TEST(test_3d_reach_and_stance);
    RUN_TEST(test_compute_geometry);
    RUN_TEST(test_unresolvable_vertex_is_reported);
    RUN_TEST(test_missing_share_point);
    RUN_TEST(test_geometry_json);

    return test::report("test_geometry");
}
