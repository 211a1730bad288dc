/**
 * @file coordinate_transform.hpp
 * @brief 视觉归一化坐标 -> 像素 -> 机器人mm (单应矩阵)
 * @date 2026-10-18
 *
 * 单应矩阵方向: 机器人mm -> 像素。
 * 像素 -> 机器人需要求逆, 并翻转Y轴 (屏幕Y向下, 机器人Y向上)。
 */

#ifndef DUOARM_TRANSFORM_COORDINATE_TRANSFORM_HPP
#define DUOARM_TRANSFORM_COORDINATE_TRANSFORM_HPP

#include <array>
#include <cmath>
#include <optional>

#include "common/types.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"

namespace duoarm {

using Matrix3 = std::array<std::array<double, 3>, 3>;

inline Matrix3 identity_matrix() {
    return Matrix3{{{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}}};
}

/**
 * @brief 对二维点应用3x3单应矩阵
 */
inline Point2D apply_homography(const Matrix3& h, const Point2D& p) {
    const double w = h[2][0] * p.x + h[2][1] * p.y + h[2][2];
    Point2D out;
    out.x = (h[0][0] * p.x + h[0][1] * p.y + h[0][2]) / w;
    out.y = (h[1][0] * p.x + h[1][1] * p.y + h[1][2]) / w;
    return out;
}

/**
 * @brief 3x3矩阵求逆 (伴随矩阵法)
 * @return |det| < SINGULAR_DET_EPS 时为空
 */
inline std::optional<Matrix3> invert_matrix_3x3(const Matrix3& m) {
    const double a = m[0][0], b = m[0][1], c = m[0][2];
    const double d = m[1][0], e = m[1][1], f = m[1][2];
    const double g = m[2][0], h = m[2][1], i = m[2][2];

    const double det = a * (e * i - f * h) - b * (d * i - f * g) + c * (d * h - e * g);
    if (std::fabs(det) < SINGULAR_DET_EPS) {
        LOG_WARN("[Transform] Singular matrix (det=%.3e)", det);
        return std::nullopt;
    }

    const double inv = 1.0 / det;
    Matrix3 r;
    r[0] = {(e * i - f * h) * inv, (c * h - b * i) * inv, (b * f - c * e) * inv};
    r[1] = {(f * g - d * i) * inv, (a * i - c * g) * inv, (c * d - a * f) * inv};
    r[2] = {(d * h - e * g) * inv, (b * g - a * h) * inv, (a * e - b * d) * inv};
    return r;
}

/**
 * @brief 像素 -> 机器人mm
 * @param h 机器人 -> 像素 单应矩阵
 */
inline std::optional<Point2D> pixel_to_robot(const Matrix3& h, const Point2D& pixel) {
    auto h_inv = invert_matrix_3x3(h);
    if (!h_inv) return std::nullopt;

    Point2D raw = apply_homography(*h_inv, pixel);
    return Point2D{raw.x, -raw.y};
}

/**
 * @brief 视觉归一化坐标 (0~1000, 左上为原点) -> 像素
 */
inline Point2D gemini_to_pixel(double gx, double gy, int width, int height) {
    return Point2D{gx / GEMINI_GRID * width, gy / GEMINI_GRID * height};
}

/**
 * @brief 视觉归一化坐标 -> 机器人mm
 */
inline std::optional<Point2D> gemini_to_robot(double gx, double gy, const Matrix3& h,
                                              int width, int height) {
    return pixel_to_robot(h, gemini_to_pixel(gx, gy, width, height));
}

} // namespace duoarm

#endif // DUOARM_TRANSFORM_COORDINATE_TRANSFORM_HPP
