#ifndef LIDARMAP_BACKEND_PIPELINE_BATCH_CHANNEL_H
#define LIDARMAP_BACKEND_PIPELINE_BATCH_CHANNEL_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/DataTypes.h"
#include "common/Faults.h"

namespace spdlog { class logger; }

namespace lidarmap::backend::pipeline {

struct ChannelMessage {
    enum class Type { Data, Fault };

    Type type = Type::Data;
    common::Batch batch;      // Data
    common::FaultKind faultKind = common::FaultKind::Channel;
    std::string description;  // Fault

    static ChannelMessage data(common::Batch b) {
        ChannelMessage m;
        m.type = Type::Data;
        m.batch = std::move(b);
        return m;
    }
    static ChannelMessage fault(common::FaultKind kind, std::string desc) {
        ChannelMessage m;
        m.type = Type::Fault;
        m.faultKind = kind;
        m.description = std::move(desc);
        return m;
    }
};

// Producer -> consumer hand-off between the acquisition task and the scheduler.
// Neither side ever blocks: a Data push into a full channel is refused and counted,
// Fault messages are always accepted so the consumer learns about aborts.
class BatchChannel {
public:
    explicit BatchChannel(std::size_t capacity, std::shared_ptr<spdlog::logger> logger = nullptr);

    bool sendData(common::Batch batch);
    void sendFault(common::FaultKind kind, std::string description);

    std::optional<ChannelMessage> tryReceive();
    // Everything queued right now, FIFO.
    std::vector<ChannelMessage> drain();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    uint64_t droppedBatches() const;

private:
    const std::size_t capacity_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::deque<ChannelMessage> queue_;
    uint64_t dropped_ = 0;
};

} // namespace lidarmap::backend::pipeline

#endif // LIDARMAP_BACKEND_PIPELINE_BATCH_CHANNEL_H
