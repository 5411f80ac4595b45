#ifndef LIDARMAP_BACKEND_PIPELINE_CANCELLATION_TOKEN_H
#define LIDARMAP_BACKEND_PIPELINE_CANCELLATION_TOKEN_H

#include <atomic>

namespace lidarmap::backend::pipeline {

// Cooperative stop flag shared by the controller and both pipeline tasks.
// One token per scanning session; a cancelled token is never reset.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace lidarmap::backend::pipeline

#endif // LIDARMAP_BACKEND_PIPELINE_CANCELLATION_TOKEN_H
