/**
 * @file test_coordinate_transform.cpp
 * @brief 单应矩阵变换与无标定工作区映射测试
 * @date 2026-10-18
 *
 * 运行: ./test_coordinate_transform
 */

#include <cmath>

#include "common/logger.hpp"
#include "transform/coordinate_transform.hpp"
#include "transform/workspace_mapper.hpp"
#include "test_common.hpp"

using namespace duoarm;

static Matrix3 sample_homography() {
    return Matrix3{{{2.0, 0.0, 640.0}, {0.0, 2.0, 360.0}, {0.0, 0.0, 1.0}}};
}

static void test_identity_and_apply() {
    Point2D p = apply_homography(identity_matrix(), Point2D{12.5, -3.0});
    CHECK_NEAR(p.x, 12.5, 1e-12);
    CHECK_NEAR(p.y, -3.0, 1e-12);

    p = apply_homography(sample_homography(), Point2D{10.0, 20.0});
    CHECK_NEAR(p.x, 660.0, 1e-12);
    CHECK_NEAR(p.y, 400.0, 1e-12);

    // 透视项: w = 2
    Matrix3 h = identity_matrix();
    h[2][2] = 2.0;
    p = apply_homography(h, Point2D{4.0, 6.0});
    CHECK_NEAR(p.x, 2.0, 1e-12);
    CHECK_NEAR(p.y, 3.0, 1e-12);
}

static void test_invert() {
    const Matrix3 h{{{1.0, 2.0, 3.0}, {0.0, 1.0, 4.0}, {5.0, 6.0, 0.0}}};
    auto inv = invert_matrix_3x3(h);
    CHECK(inv.has_value());

    // h * inv = I
    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            double sum = 0.0;
            for (int k = 0; k < 3; k++) sum += h[r][k] * (*inv)[k][c];
            CHECK_NEAR(sum, r == c ? 1.0 : 0.0, 1e-9);
        }
    }
    CHECK_NEAR((*inv)[0][0], -24.0, 1e-9);
    CHECK_NEAR((*inv)[2][2], 1.0, 1e-9);
}

static void test_inverse_round_trip() {
    const Matrix3 h{{{1.2, 0.1, 30.0}, {0.05, 0.9, -20.0}, {0.001, 0.0005, 1.0}}};
    auto inv = invert_matrix_3x3(h);
    CHECK(inv.has_value());

    const Point2D points[] = {{0.0, 0.0}, {100.0, -50.0}, {640.0, 360.0}, {-75.5, 12.25}};
    for (const Point2D& p : points) {
        Point2D back = apply_homography(*inv, apply_homography(h, p));
        CHECK_NEAR(back.x, p.x, 1e-6);
        CHECK_NEAR(back.y, p.y, 1e-6);
    }
}

static void test_singular_matrix_rejected() {
    const Matrix3 singular{{{1.0, 2.0, 3.0}, {2.0, 4.0, 6.0}, {0.0, 0.0, 1.0}}};
    CHECK(!invert_matrix_3x3(singular).has_value());
    CHECK(!pixel_to_robot(singular, Point2D{100, 100}).has_value());

    Matrix3 zero{};
    CHECK(!invert_matrix_3x3(zero).has_value());
}

static void test_pixel_to_robot_flips_y() {
    const Matrix3 h = sample_homography();

    auto origin = pixel_to_robot(h, Point2D{640, 360});
    CHECK(origin.has_value());
    CHECK_NEAR(origin->x, 0.0, 1e-9);
    CHECK_NEAR(origin->y, 0.0, 1e-9);

    // 像素向下 -> 机器人 -Y
    auto below = pixel_to_robot(h, Point2D{600, 400});
    CHECK(below.has_value());
    CHECK_NEAR(below->x, -20.0, 1e-9);
    CHECK_NEAR(below->y, -20.0, 1e-9);

    auto above = pixel_to_robot(h, Point2D{700, 300});
    CHECK(above.has_value());
    CHECK_NEAR(above->x, 30.0, 1e-9);
    CHECK_NEAR(above->y, 30.0, 1e-9);
}

static void test_gemini_to_pixel() {
    Point2D p = gemini_to_pixel(500, 500, 1280, 720);
    CHECK_NEAR(p.x, 640.0, 1e-9);
    CHECK_NEAR(p.y, 360.0, 1e-9);

    p = gemini_to_pixel(0, 1000, 1280, 720);
    CHECK_NEAR(p.x, 0.0, 1e-12);
    CHECK_NEAR(p.y, 720.0, 1e-9);

    auto robot = gemini_to_robot(468.75, 500, sample_homography(), 1280, 720);
    CHECK(robot.has_value());
    CHECK_NEAR(robot->x, -20.0, 1e-9);
    CHECK_NEAR(robot->y, 0.0, 1e-9);
}

static void test_dispatch() {
    CHECK(WorkspaceMapper::dispatch(0) == ArmRole::Left);
    CHECK(WorkspaceMapper::dispatch(499.9) == ArmRole::Left);
    CHECK(WorkspaceMapper::dispatch(500) == ArmRole::Right);
    CHECK(WorkspaceMapper::dispatch(1000) == ArmRole::Right);
}

static void test_workspace_mapping() {
    WorkspaceMapper mapper(600, 500);

    Point2D g = mapper.map_to_global(500, 500);
    CHECK_NEAR(g.x, 300.0, 1e-9);
    CHECK_NEAR(g.y, 250.0, 1e-9);

    // 屏幕底部中心
    Point2D left = mapper.map_to_local(250, 1000, ArmRole::Left);
    CHECK_NEAR(left.x, 150.0, 1e-9);
    CHECK_NEAR(left.y, 0.0, 1e-9);

    Point2D right = mapper.map_to_local(750, 0, ArmRole::Right);
    CHECK_NEAR(right.x, -150.0, 1e-9);
    CHECK_NEAR(right.y, 500.0, 1e-9);

    CHECK(WorkspaceMapper::is_reachable(left, 150.0));
    CHECK(!WorkspaceMapper::is_reachable(right, 255.0));
}

int main() {
    Logger::instance().set_level(LogLevel::INFO);
    LOG_INFO("=== Coordinate Transform Test ===");

    RUN_TEST(test_identity_and_apply);
    RUN_TEST(test_invert);
    RUN_TEST(test_inverse_round_trip);
    RUN_TEST(test_singular_matrix_rejected);
    RUN_TEST(test_pixel_to_robot_flips_y);
    RUN_TEST(test_gemini_to_pixel);
    RUN_TEST(test_dispatch);
    RUN_TEST(test_workspace_mapping);

    return test::report("test_coordinate_transform");
}
