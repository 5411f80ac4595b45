#include "store/PointStore.h"

#include <stdexcept>
#include <string>

namespace lidarmap::backend::store {

PointStore::PointStore(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("PointStore capacity must be at least 1");
    }
}

void PointStore::insert(const Point& p) {
    ++totalInserted_;
    if (size_ < capacity_) {
        // While not full head_ stays 0 and the arena is exactly size_ long.
        arena_.push_back(p);
        ++size_;
        return;
    }
    arena_[head_] = p;
    head_ = (head_ + 1) % capacity_;
    ++evicted_;
}

void PointStore::insertBatch(const Batch& batch) {
    insertPoints(batch.points);
}

// The arena grows geometrically while filling.
void PointStore::insertPoints(const std::vector<Point>& points) {
    for (const auto& p : points) insert(p);
}

std::shared_ptr<const std::vector<Point>> PointStore::snapshot() const {
    auto out = std::make_shared<std::vector<Point>>();
    out->reserve(size_);
    // Two contiguous runs: [head_, end) then [0, head_).
    out->insert(out->end(), arena_.begin() + static_cast<std::ptrdiff_t>(head_), arena_.end());
    out->insert(out->end(), arena_.begin(), arena_.begin() + static_cast<std::ptrdiff_t>(head_));
    return out;
}

void PointStore::clear() {
    arena_.clear();
    head_ = 0;
    size_ = 0;
    totalInserted_ = 0;
    evicted_ = 0;
}

const Point& PointStore::at(std::size_t i) const {
    if (i >= size_) {
        throw std::out_of_range("PointStore index " + std::to_string(i) + " >= size " + std::to_string(size_));
    }
    return arena_[physical(i)];
}

} // namespace lidarmap::backend::store
