#ifndef LIDARMAP_BACKEND_PROCESSING_FILTER_SETTINGS_H
#define LIDARMAP_BACKEND_PROCESSING_FILTER_SETTINGS_H

#include <atomic>
#include <cstdint>
#include <mutex>

#include "common/DataTypes.h"

namespace lidarmap::backend::processing {

// Operator-adjustable filter shared by the acquisition task (acceptance) and the
// scheduler (view refresh). The version bumps on every set() so readers can tell
// that the presentation view is stale.
class FilterSettings {
public:
    using FilterConfig = lidarmap::backend::common::FilterConfig;

    FilterSettings() = default;
    explicit FilterSettings(const FilterConfig& initial) : cfg_(initial) {}

    FilterConfig get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cfg_;
    }

    void set(const FilterConfig& cfg) {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = cfg;
        version_.fetch_add(1, std::memory_order_release);
    }

    uint64_t version() const { return version_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    FilterConfig cfg_{};
    std::atomic<uint64_t> version_{0};
};

} // namespace lidarmap::backend::processing

#endif // LIDARMAP_BACKEND_PROCESSING_FILTER_SETTINGS_H
