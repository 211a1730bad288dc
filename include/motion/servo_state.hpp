/**
 * @file servo_state.hpp
 * @brief 舵机目标角共享状态 (运动线程写, 发送线程读)
 * @date 2026-10-18
 */

#ifndef DUOARM_MOTION_SERVO_STATE_HPP
#define DUOARM_MOTION_SERVO_STATE_HPP

#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace duoarm {

/**
 * @brief 舵机状态缓存
 *
 * target: 通道 -> 最新请求角度
 * sent:   通道 -> 最近一次发送成功的角度
 * 两者不同即为待发送。
 */
class ServoState {
public:
    using Update = std::pair<int, double>;

    void update_angle(int channel, double angle) {
        std::lock_guard<std::mutex> lock(mutex_);
        target_[channel] = angle;
    }

    std::optional<double> get_angle(int channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = target_.find(channel);
        if (it == target_.end()) return std::nullopt;
        return it->second;
    }

    /**
     * @brief 待发送列表 (按通道升序)
     */
    std::vector<Update> get_pending_updates() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Update> updates;
        for (const auto& item : target_) {
            auto it = sent_.find(item.first);
            if (it == sent_.end() || it->second != item.second) {
                updates.push_back(item);
            }
        }
        return updates;
    }

    void mark_as_sent(int channel, double angle) {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_[channel] = angle;
    }

    /**
     * @brief 清空发送记录, 下一轮强制全部重发
     */
    void clear_history() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

    std::map<int, double> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return target_;
    }

private:
    mutable std::mutex mutex_;
    std::map<int, double> target_;
    std::map<int, double> sent_;
};

} // namespace duoarm

#endif // DUOARM_MOTION_SERVO_STATE_HPP
