/**
 * @file test_periodic_thread.cpp
 * @brief 周期线程与定时工具测试
 * @date 2026-10-18
 *
 * 运行: ./test_periodic_thread [周期us] [次数]
 */

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <numeric>
#include <vector>

#include "common/logger.hpp"
#include "common/time_utils.hpp"
#include "realtime/periodic_thread.hpp"
#include "test_common.hpp"

using namespace duoarm;

static uint64_t g_period_us = 5000;
static uint64_t g_count = 100;

static void test_periodic_timer_latency() {
    std::vector<int64_t> latencies;
    latencies.reserve(g_count);

    // 目标时刻先于计时器取得, 唤醒时刻不会早于它
    uint64_t target_time = get_time_ns() + g_period_us * 1000;
    PeriodicTimer timer(g_period_us);
    uint64_t missed = 0;

    for (uint64_t i = 0; i < g_count; i++) {
        if (timer.wait()) missed++;
        const int64_t now = static_cast<int64_t>(get_time_ns());
        latencies.push_back((now - static_cast<int64_t>(target_time)) / 1000);
        target_time += g_period_us * 1000;
    }

    std::sort(latencies.begin(), latencies.end());
    const double mean = std::accumulate(latencies.begin(), latencies.end(), 0.0) / latencies.size();
    LOG_INFO("Latency (us): min %ld, median %ld, max %ld, mean %.1f, missed %lu",
             (long)latencies.front(), (long)latencies[latencies.size() / 2],
             (long)latencies.back(), mean, (unsigned long)missed);

    CHECK(latencies.front() >= 0);
}

static void test_thread_runs_and_stops() {
    std::atomic<int> loops(0);
    std::atomic<int> cleanups(0);

    PeriodicThread thread("test_loop", 2000);
    CHECK(!thread.start());                             // 无任务
    thread.set_loop_task([&loops]() { loops++; });
    thread.set_cleanup_task([&cleanups]() { cleanups++; });

    CHECK(thread.start());
    CHECK(thread.is_running());
    CHECK(!thread.start());                             // 重复启动
    sleep_ms(100);
    thread.stop();

    CHECK(!thread.is_running());
    CHECK(cleanups.load() == 1);
    CHECK(loops.load() >= 10);
    CHECK(thread.get_loop_count() == static_cast<uint64_t>(loops.load()));
    const RuntimeStats& stats = thread.get_stats();
    CHECK(stats.count() == thread.get_loop_count());
    CHECK(stats.max_us() >= stats.min_us());
    CHECK(stats.mean_us() <= static_cast<double>(stats.max_us()));

    // 停止后不再执行
    const int after_stop = loops.load();
    sleep_ms(20);
    CHECK(loops.load() == after_stop);
    thread.stop();
    CHECK(cleanups.load() == 1);
}

static void test_missed_deadlines_counted() {
    PeriodicThread thread("slow_loop", 1000);
    thread.set_loop_task([]() { sleep_ms(3); });
    CHECK(thread.start());
    sleep_ms(50);
    thread.stop();
    CHECK(thread.get_missed_deadlines() > 0);
    CHECK(thread.get_stats().min_us() >= 3000);
}

static void test_timer_helpers() {
    Timer timer;
    sleep_ms(20);
    CHECK(timer.elapsed_ms() >= 20);
    CHECK(timer.elapsed_sec() >= 0.02);
    timer.reset();
    CHECK(timer.elapsed_ms() < 20);

    const std::string ts = iso_timestamp_utc();
    CHECK(ts.size() == 20);
    CHECK(ts.back() == 'Z');
    CHECK(ts[10] == 'T');
}

int main(int argc, char* argv[]) {
    if (argc > 1) g_period_us = std::strtoull(argv[1], nullptr, 10);
    if (argc > 2) g_count = std::strtoull(argv[2], nullptr, 10);
    if (g_period_us == 0) g_period_us = 5000;
    if (g_count == 0) g_count = 100;

    Logger::instance().set_level(LogLevel::INFO);
    LOG_INFO("=== Periodic Thread Test ===");
    LOG_INFO("Period: %lu us, Count: %lu", (unsigned long)g_period_us, (unsigned long)g_count);

    RUN_TEST(test_periodic_timer_latency);
    RUN_TEST(test_thread_runs_and_stops);
    RUN_TEST(test_missed_deadlines_counted);
    RUN_TEST(test_timer_helpers);

    return test::report("test_periodic_thread");
}
