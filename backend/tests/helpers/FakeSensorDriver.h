#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

#include "hal/ISensorDriver.h"

namespace lidarmap { namespace backend { namespace tests {

// Scripted sensor: each readFrame() consumes the next step. Once the script is used up it
// keeps returning empty frames every `idleDelay` so the acquisition loop stays alive until
// cancelled.
class FakeSensorDriver : public hal::ISensorDriver {
public:
    enum class Step { Frame, Fail, Fatal, End };
    struct Action { Step step = Step::Frame; std::vector<common::Measurement> measurements; };

    static Action frame(std::vector<common::Measurement> m) { return Action{Step::Frame, std::move(m)}; }
    static Action fail() { return Action{Step::Fail, {}}; }
    static Action fatal() { return Action{Step::Fatal, {}}; }
    static Action end() { return Action{Step::End, {}}; }

    // One frame of `count` good measurements, all at `distanceMm`.
    static Action frameAt(double distanceMm, int count = 10) {
        std::vector<common::Measurement> m;
        for (int i = 0; i < count; ++i) m.emplace_back(15, i * (360.0 / count), distanceMm);
        return frame(std::move(m));
    }
    static Action goodFrame(int count = 10) { return frameAt(1000.0, count); }

    void setScript(std::vector<Action> script) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_ = std::move(script);
        next_ = 0;
    }

    common::DeviceInfo connect(const std::string& port) override {
        connectCalls.fetch_add(1);
        if (failConnect) throw hal::ConnectError("fake: nothing on " + port);
        connected.store(true);
        return common::DeviceInfo{"FakeLidar", "1.29", "7", "FAKE-0001"};
    }

    common::HealthStatus getHealth() override {
        common::HealthStatus h;
        h.state = health;
        h.error_code = health == common::HealthState::Error ? 2 : 0;
        return h;
    }

    std::optional<common::ScanFrame> readFrame() override {
        readCalls.fetch_add(1);
        Action action;
        bool scripted = false;
        uint64_t index = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (next_ < script_.size()) {
                action = script_[next_];
                index = next_++;
                scripted = true;
            }
        }
        if (!scripted) {
            std::this_thread::sleep_for(idleDelay);
            return common::ScanFrame{};
        }
        if (frameDelay.count() > 0) std::this_thread::sleep_for(frameDelay);
        switch (action.step) {
            case Step::Fail: throw hal::FrameReadError("fake: checksum mismatch");
            case Step::Fatal: throw hal::DriverError("fake: serial port vanished");
            case Step::End: return std::nullopt;
            case Step::Frame: break;
        }
        common::ScanFrame f;
        f.index = index;
        f.measurements = std::move(action.measurements);
        return f;
    }

    void stop() override {
        stopCalls.fetch_add(1);
        if (throwOnStop) throw hal::DriverError("fake: stop command timed out");
    }

    void disconnect() override {
        disconnectCalls.fetch_add(1);
        connected.store(false);
        if (throwOnDisconnect) throw hal::DriverError("fake: port close failed");
    }

    std::string getDeviceID() const override { return "FakeLidar"; }

    bool scriptConsumed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return next_ >= script_.size();
    }

    // Configure before startConnect().
    bool failConnect = false;
    bool throwOnStop = false;
    bool throwOnDisconnect = false;
    common::HealthState health = common::HealthState::Good;
    std::chrono::milliseconds idleDelay{2};
    std::chrono::milliseconds frameDelay{0}; // before every scripted step

    std::atomic<int> connectCalls{0};
    std::atomic<int> readCalls{0};
    std::atomic<int> stopCalls{0};
    std::atomic<int> disconnectCalls{0};
    std::atomic<bool> connected{false};

private:
    mutable std::mutex mutex_;
    std::vector<Action> script_;
    std::size_t next_ = 0;
};

}}} // namespace lidarmap::backend::tests
