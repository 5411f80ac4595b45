#include "pipeline/BatchChannel.h"

#include <iterator>

#include <spdlog/logger.h>

namespace lidarmap::backend::pipeline {

BatchChannel::BatchChannel(std::size_t capacity, std::shared_ptr<spdlog::logger> logger)
    : capacity_(capacity == 0 ? 1 : capacity), logger_(std::move(logger)) {}

bool BatchChannel::sendData(common::Batch batch) {
    uint64_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() < capacity_) {
            queue_.push_back(ChannelMessage::data(std::move(batch)));
            return true;
        }
        dropped = ++dropped_;
    }
    // First drop and then every 100th, the consumer is clearly behind.
    if (logger_ && (dropped == 1 || dropped % 100 == 0)) {
        logger_->warn("BatchChannel full (capacity={}); dropped frame {} (total dropped={})",
                      capacity_, batch.frame_index, dropped);
    }
    return false;
}

void BatchChannel::sendFault(common::FaultKind kind, std::string description) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(ChannelMessage::fault(kind, std::move(description)));
}

std::optional<ChannelMessage> BatchChannel::tryReceive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    ChannelMessage m = std::move(queue_.front());
    queue_.pop_front();
    return m;
}

std::vector<ChannelMessage> BatchChannel::drain() {
    std::deque<ChannelMessage> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taken.swap(queue_);
    }
    return std::vector<ChannelMessage>(std::make_move_iterator(taken.begin()),
                                       std::make_move_iterator(taken.end()));
}

std::size_t BatchChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t BatchChannel::droppedBatches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace lidarmap::backend::pipeline
