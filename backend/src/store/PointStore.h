#ifndef LIDARMAP_BACKEND_STORE_POINT_STORE_H
#define LIDARMAP_BACKEND_STORE_POINT_STORE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "common/DataTypes.h"

namespace lidarmap::backend::store {

using lidarmap::backend::common::Batch;
using lidarmap::backend::common::Point;

// Fixed-capacity rolling point cloud. Insertion order is eviction order; once full,
// each new point replaces the oldest one. Not internally synchronised: exactly one
// thread mutates a store, everyone else reads snapshots.
class PointStore {
public:
    // Throws std::invalid_argument when capacity is 0.
    explicit PointStore(std::size_t capacity);

    void insert(const Point& p);
    void insertBatch(const Batch& batch);
    void insertPoints(const std::vector<Point>& points);

    // Copy of the current contents, oldest first.
    std::shared_ptr<const std::vector<Point>> snapshot() const;

    // Empties the store and resets the running counters.
    void clear();

    // Logical index, 0 = oldest. Throws std::out_of_range.
    const Point& at(std::size_t i) const;

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == capacity_; }

    uint64_t totalInserted() const { return totalInserted_; }
    uint64_t evicted() const { return evicted_; }

private:
    std::size_t physical(std::size_t logical) const {
        return (head_ + logical) % capacity_;
    }

    std::size_t capacity_;
    std::vector<Point> arena_; // grows up to capacity_, then reused in place
    std::size_t head_ = 0;     // physical slot of the oldest point
    std::size_t size_ = 0;
    uint64_t totalInserted_ = 0;
    uint64_t evicted_ = 0;
};

} // namespace lidarmap::backend::store

#endif // LIDARMAP_BACKEND_STORE_POINT_STORE_H
