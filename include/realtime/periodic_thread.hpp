/**
 * @file periodic_thread.hpp
 * @brief 周期工作线程封装
 * @date 2026-10-18
 *
 * 普通调度策略 (SCHED_OTHER), 用于串口发送循环等软实时任务。
 */

#ifndef DUOARM_REALTIME_PERIODIC_THREAD_HPP
#define DUOARM_REALTIME_PERIODIC_THREAD_HPP

#include <atomic>
#include <functional>
#include <thread>
#include <string>

#include "common/logger.hpp"
#include "common/time_utils.hpp"

namespace duoarm {

/**
 * @brief 周期线程
 */
class PeriodicThread {
public:
    using TaskFunc = std::function<void()>;

    /**
     * @param name 线程名称 (日志用)
     * @param period_us 周期 (微秒)
     */
    PeriodicThread(const std::string& name, uint64_t period_us)
        : name_(name)
        , period_us_(period_us)
        , running_(false)
        , loop_count_(0)
        , missed_deadlines_(0) {}

    ~PeriodicThread() {
        stop();
    }

    // 禁止拷贝
    PeriodicThread(const PeriodicThread&) = delete;
    PeriodicThread& operator=(const PeriodicThread&) = delete;

    void set_loop_task(TaskFunc task) {
        loop_task_ = std::move(task);
    }

    /**
     * @brief 设置清理任务 (退出前执行一次)
     */
    void set_cleanup_task(TaskFunc task) {
        cleanup_task_ = std::move(task);
    }

    bool start() {
        if (running_.load()) {
            LOG_WARN("Thread '%s' already running", name_.c_str());
            return false;
        }
        if (!loop_task_) {
            LOG_ERROR("Thread '%s' has no loop task", name_.c_str());
            return false;
        }

        running_.store(true);
        thread_ = std::thread(&PeriodicThread::thread_func, this);
        LOG_DEBUG("Thread '%s' started (period=%lu us)", name_.c_str(),
                  (unsigned long)period_us_);
        return true;
    }

    void stop() {
        if (!running_.load()) return;

        running_.store(false);
        if (thread_.joinable()) {
            thread_.join();
        }
        LOG_DEBUG("Thread '%s' stopped (loops=%lu, missed=%lu, task mean=%.1f us, max=%lu us)",
                  name_.c_str(),
                  (unsigned long)loop_count_.load(),
                  (unsigned long)missed_deadlines_.load(),
                  stats_.mean_us(), (unsigned long)stats_.max_us());
    }

    bool is_running() const { return running_.load(); }
    uint64_t get_loop_count() const { return loop_count_.load(); }
    uint64_t get_missed_deadlines() const { return missed_deadlines_.load(); }
    const RuntimeStats& get_stats() const { return stats_; }

private:
    void thread_func() {
        PeriodicTimer timer(period_us_);

        while (running_.load()) {
            Timer loop_timer;
            loop_task_();
            stats_.update(loop_timer.elapsed_us());
            loop_count_++;

            if (timer.wait()) {
                missed_deadlines_++;
            }
        }

        if (cleanup_task_) {
            cleanup_task_();
        }
    }

    std::string name_;
    uint64_t period_us_;

    std::atomic<bool> running_;
    std::thread thread_;

    TaskFunc loop_task_;
    TaskFunc cleanup_task_;

    std::atomic<uint64_t> loop_count_;
    std::atomic<uint64_t> missed_deadlines_;
    RuntimeStats stats_;
};

} // namespace duoarm

#endif // DUOARM_REALTIME_PERIODIC_THREAD_HPP
