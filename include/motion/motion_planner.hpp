/**
 * @file motion_planner.hpp
 * @brief 线性插值运动规划 (独立线程, 可取消)
 * @date 2026-10-18
 *
 * 每 step_ms 写一次插值角度到 ServoState, 由发送线程取走。
 * 新的 move_all() 会先停止当前运动 (最新指令优先)。
 */

#ifndef DUOARM_MOTION_MOTION_PLANNER_HPP
#define DUOARM_MOTION_MOTION_PLANNER_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "common/constants.hpp"
#include "common/logger.hpp"
#include "common/time_utils.hpp"
#include "motion/servo_state.hpp"

namespace duoarm {

/**
 * @brief 运动结果
 */
enum class MotionOutcome {
    Completed,
    Cancelled,
};

inline const char* motion_outcome_str(MotionOutcome outcome) {
    return outcome == MotionOutcome::Completed ? "completed" : "cancelled";
}

/**
 * @brief 运动规划器
 */
class MotionPlanner {
public:
    using Target = std::pair<int, double>;          // (通道, 物理角)
    using Callback = std::function<void()>;

    explicit MotionPlanner(ServoState& state, uint32_t step_ms = MOTION_STEP_MS)
        : state_(state), step_ms_(std::max<uint32_t>(step_ms, 1)) {}

    ~MotionPlanner() {
        stop();
        for (auto& t : retired_) {
            if (t.joinable()) t.join();
        }
    }

    // 禁止拷贝
    MotionPlanner(const MotionPlanner&) = delete;
    MotionPlanner& operator=(const MotionPlanner&) = delete;

    /**
     * @brief 多通道同步运动
     * @param targets (通道, 目标角) 列表
     * @param duration_sec 运动时长
     * @param on_complete 仅在运动完成时调用 (取消时不调用), 在运动线程中执行,
     *                    返回后 future 才就绪; 回调内可调用 move_all()/stop(),
     *                    但不能调用 wait_for_completion()
     * @return 运动结果 future
     */
    std::shared_future<MotionOutcome> move_all(const std::vector<Target>& targets,
                                               double duration_sec,
                                               Callback on_complete = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_current_locked();

        auto stop_flag = std::make_shared<std::atomic<bool>>(false);
        std::promise<MotionOutcome> promise;
        current_.done = promise.get_future().share();
        current_.stop_flag = stop_flag;
        current_.thread = std::thread(&MotionPlanner::execute, this, targets, duration_sec,
                                      std::move(on_complete), stop_flag, std::move(promise));
        return current_.done;
    }

    /**
     * @brief 停止当前运动 (最多等待 MOTION_JOIN_TIMEOUT_MS)
     */
    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_current_locked();
    }

    /**
     * @brief 等待当前运动结束
     * @return 超时返回false
     */
    bool wait_for_completion(double timeout_sec = 10.0) {
        std::shared_future<MotionOutcome> done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done = current_.done;
        }
        if (!done.valid()) return true;
        auto timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout_sec * 1000.0));
        return done.wait_for(timeout) == std::future_status::ready;
    }

    bool is_moving() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_.done.valid()
            && current_.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
    }

    uint32_t step_ms() const { return step_ms_; }

private:
    struct Motion {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> stop_flag;
        std::shared_future<MotionOutcome> done;
    };

    void stop_current_locked() {
        if (!current_.thread.joinable()) return;

        current_.stop_flag->store(true);
        if (current_.thread.get_id() == std::this_thread::get_id()) {
            // 完成回调中再次调用: 插值已结束, 不能自我join
            retired_.push_back(std::move(current_.thread));
            return;
        }
        auto status = current_.done.wait_for(std::chrono::milliseconds(MOTION_JOIN_TIMEOUT_MS));
        if (status == std::future_status::ready) {
            current_.thread.join();
        } else {
            LOG_WARN("Motion thread did not stop in %u ms, retiring it", MOTION_JOIN_TIMEOUT_MS);
            retired_.push_back(std::move(current_.thread));
        }
    }

    void execute(std::vector<Target> targets, double duration_sec, Callback on_complete,
                 std::shared_ptr<std::atomic<bool>> stop_flag,
                 std::promise<MotionOutcome> promise) {
        std::vector<double> start(targets.size());
        for (size_t i = 0; i < targets.size(); i++) {
            start[i] = state_.get_angle(targets[i].first).value_or(targets[i].second);
        }

        const int num_steps = std::max(1, static_cast<int>(duration_sec * 1000.0 / step_ms_));
        bool cancelled = false;

        for (int step = 1; step <= num_steps; step++) {
            if (stop_flag->load()) {
                cancelled = true;
                break;
            }

            const double t = static_cast<double>(step) / num_steps;
            for (size_t i = 0; i < targets.size(); i++) {
                state_.update_angle(targets[i].first, start[i] + (targets[i].second - start[i]) * t);
            }
            sleep_ms(step_ms_);
        }

        if (cancelled) {
            LOG_DEBUG("Motion cancelled");
            promise.set_value(MotionOutcome::Cancelled);
            return;
        }

        // 终点精确对齐
        for (const auto& target : targets) {
            state_.update_angle(target.first, target.second);
        }
        if (on_complete) {
            try {
                on_complete();
            } catch (const std::exception& e) {
                LOG_ERROR("Motion completion callback failed: %s", e.what());
            }
        }
        promise.set_value(MotionOutcome::Completed);
    }

    ServoState& state_;
    uint32_t step_ms_;

    mutable std::mutex mutex_;
    Motion current_;
    std::vector<std::thread> retired_;
};

} // namespace duoarm

#endif // DUOARM_MOTION_MOTION_PLANNER_HPP
