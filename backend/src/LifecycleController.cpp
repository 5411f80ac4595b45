#include "LifecycleController.h"

#include "common/Logger.h"
#include "common/LoggingNames.h"
#include "hal/ISensorDriver.h"
#include "pipeline/AcquisitionTask.h"
#include "pipeline/BatchChannel.h"
#include "pipeline/CancellationToken.h"
#include "pipeline/PipelineScheduler.h"
#include "processing/FilterSettings.h"
#include "store/PointStore.h"

namespace lidarmap::backend {

using pipeline::PipelineState;

namespace {
// Component loggers come from the shared registry when it is up; otherwise everything
// goes through the lifecycle logger.
std::shared_ptr<spdlog::logger> componentLogger(const char* name, const std::shared_ptr<spdlog::logger>& fallback) {
    auto& registry = common::Logger::instance();
    return registry.isInitialized() ? registry.get(name) : fallback;
}
}

LifecycleController::LifecycleController(std::shared_ptr<spdlog::logger> lifecycleLogger,
                                         common::PipelineConfig cfg,
                                         std::shared_ptr<hal::ISensorDriver> driver,
                                         std::shared_ptr<pipeline::IPresentationSink> sink)
    : lifecycleLogger_(std::move(lifecycleLogger)),
      cfg_(std::move(cfg)),
      driver_(std::move(driver)),
      sink_(std::move(sink)),
      filter_(std::make_shared<processing::FilterSettings>(cfg_.filter)),
      store_(std::make_shared<store::PointStore>(cfg_.store_capacity)),
      channel_(std::make_shared<pipeline::BatchChannel>(cfg_.channel_capacity,
                                                        componentLogger(logging_names::PIPE_ACQUISITION, lifecycleLogger_))),
      codec_(componentLogger(logging_names::IO_CODEC, lifecycleLogger_)),
      acquisitionLogger_(componentLogger(logging_names::PIPE_ACQUISITION, lifecycleLogger_))
{
    pipeline::PipelineScheduler::Config scfg;
    scfg.decimation_factor = cfg_.decimation_factor;
    scfg.tick_interval = cfg_.tick_interval;
    scheduler_ = std::make_unique<pipeline::PipelineScheduler>(
        scfg, channel_, store_, filter_, sink_, componentLogger(logging_names::PIPE_SCHEDULER, lifecycleLogger_));
    lifecycleLogger_->info("LifecycleController ready (device={} capacity={} decimation={} threshold={})",
                           driver_->getDeviceID(), cfg_.store_capacity, cfg_.decimation_factor,
                           cfg_.consecutive_error_threshold);
}

LifecycleController::~LifecycleController() {
    stop();
    // A fault-terminated session leaves its scheduler thread to be reaped here.
    scheduler_->join();
    joinAcquisition();
}

void LifecycleController::setState(PipelineState s) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_.store(s);
    }
    stateCv_.notify_all();
    lifecycleLogger_->info("Pipeline state -> {}", pipeline::toString(s));
    if (!sink_) return;
    try {
        sink_->onStateChanged(s);
    } catch (const std::exception& ex) {
        lifecycleLogger_->warn("Presentation sink threw in onStateChanged: {}", ex.what());
    }
}

bool LifecycleController::waitForState(PipelineState s, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(stateMutex_);
    return stateCv_.wait_for(lock, timeout, [&] { return state_.load() == s; });
}

void LifecycleController::reportFault(common::FaultKind kind, const std::string& description) {
    if (kind == common::FaultKind::Teardown) {
        lifecycleLogger_->warn("{}: {}", common::toString(kind), description);
    } else {
        lifecycleLogger_->error("{}: {}", common::toString(kind), description);
    }
    if (!sink_) return;
    try {
        sink_->onFault(kind, description);
    } catch (const std::exception& ex) {
        lifecycleLogger_->warn("Presentation sink threw in onFault: {}", ex.what());
    }
}

bool LifecycleController::startConnect(const std::string& port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != PipelineState::Idle) {
        lifecycleLogger_->warn("startConnect ignored in state {}", pipeline::toString(state_.load()));
        return false;
    }
    scheduler_->join();
    joinAcquisition();
    setState(PipelineState::Connecting);
    // A reader detached by an earlier stop() may still be inside readFrame(); the driver
    // is not touched again until it has returned.
    if (!previousReaderExited()) {
        setState(PipelineState::Error);
        reportFault(common::FaultKind::Connect, "previous acquisition task is still reading from the driver");
        setState(PipelineState::Idle);
        return false;
    }
    lifecycleLogger_->info("Connecting to {} on '{}'", driver_->getDeviceID(), port);

    common::DeviceInfo info;
    try {
        info = driver_->connect(port);
        const auto health = driver_->getHealth();
        if (health.state == common::HealthState::Error) {
            throw hal::ConnectError("device health Error (code " + std::to_string(health.error_code) + ")");
        }
        if (health.state == common::HealthState::Warning) {
            lifecycleLogger_->warn("Device health Warning (code {}); scanning anyway", health.error_code);
        }
    } catch (const std::exception& ex) {
        setState(PipelineState::Error);
        reportFault(common::FaultKind::Connect, ex.what());
        try {
            driver_->disconnect();
        } catch (const std::exception& dex) {
            lifecycleLogger_->debug("Disconnect after failed connect: {}", dex.what());
        }
        setState(PipelineState::Idle);
        return false;
    }
    {
        std::lock_guard<std::mutex> slock(stateMutex_);
        deviceInfo_ = info;
    }
    lifecycleLogger_->info("Connected: model={} firmware={} hardware={} serial={}",
                           info.model, info.firmware, info.hardware, info.serial);

    // New session: previous data is discarded, and a channel of its own keeps a late
    // batch from a detached reader out of it.
    channel_ = std::make_shared<pipeline::BatchChannel>(cfg_.channel_capacity, acquisitionLogger_);
    scheduler_->attachChannel(channel_);
    scheduler_->resetSession();
    token_ = std::make_shared<pipeline::CancellationToken>();
    setState(PipelineState::Scanning);
    startAcquisition();
    scheduler_->start(token_, [this](const common::FaultReport& report) { handleFault(report); });
    return true;
}

void LifecycleController::startAcquisition() {
    pipeline::AcquisitionContext ctx;
    ctx.driver = driver_;
    ctx.channel = channel_;
    ctx.filter = filter_;
    ctx.token = token_;
    ctx.logger = acquisitionLogger_;
    ctx.consecutive_error_threshold = cfg_.consecutive_error_threshold;

    auto done = std::make_shared<std::promise<void>>();
    acquisitionDone_ = done->get_future();
    acquisitionThread_ = std::thread([ctx = std::move(ctx), done]() mutable {
        auto channel = ctx.channel;
        auto token = ctx.token;
        auto log = ctx.logger;
        try {
            pipeline::runAcquisition(std::move(ctx));
        } catch (const std::exception& ex) {
            if (log) log->error("Acquisition task failed: {}", ex.what());
            if (!token->isCancelled()) {
                channel->sendFault(common::FaultKind::Channel, std::string("acquisition task failed: ") + ex.what());
            }
        }
        done->set_value();
    });
}

void LifecycleController::joinAcquisition() {
    if (!acquisitionThread_.joinable()) return;
    if (acquisitionDone_.valid() &&
        acquisitionDone_.wait_for(cfg_.join_timeout) == std::future_status::timeout) {
        lifecycleLogger_->warn("Acquisition task did not exit within {} ms; detaching", cfg_.join_timeout.count());
        acquisitionThread_.detach();
        return;
    }
    acquisitionThread_.join();
}

bool LifecycleController::previousReaderExited() {
    if (!acquisitionDone_.valid()) return true;
    if (acquisitionDone_.wait_for(cfg_.join_timeout) == std::future_status::timeout) return false;
    acquisitionDone_ = std::future<void>();
    return true;
}

void LifecycleController::teardownDriver() {
    try {
        driver_->stop();
    } catch (const std::exception& ex) {
        reportFault(common::FaultKind::Teardown, std::string("driver stop failed: ") + ex.what());
    }
    try {
        driver_->disconnect();
    } catch (const std::exception& ex) {
        reportFault(common::FaultKind::Teardown, std::string("driver disconnect failed: ") + ex.what());
    }
}

void LifecycleController::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() != PipelineState::Scanning) return;
        setState(PipelineState::Stopping);
        token_->cancel();
    }
    // Outside the lock: a fault racing with stop() takes the lock, sees Stopping and backs off.
    joinAcquisition();
    scheduler_->join();
    scheduler_->finish();
    teardownDriver();
    std::lock_guard<std::mutex> lock(mutex_);
    setState(PipelineState::Idle);
}

// Runs on the scheduler thread.
void LifecycleController::handleFault(const common::FaultReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != PipelineState::Scanning) {
        lifecycleLogger_->info("Fault after leaving Scanning ignored: {}", report.description);
        return;
    }
    setState(PipelineState::Error);
    reportFault(report.kind, report.description);
    token_->cancel();
    joinAcquisition();
    scheduler_->finish();
    teardownDriver();
    setState(PipelineState::Idle);
}

std::optional<common::DeviceInfo> LifecycleController::deviceInfo() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return deviceInfo_;
}

void LifecycleController::setFilter(const common::FilterConfig& cfg) {
    filter_->set(cfg);
    lifecycleLogger_->info("Filter changed: max_distance={}mm min_quality={}", cfg.max_distance_mm, cfg.min_quality);
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() == PipelineState::Idle) {
        scheduler_->recompute();
    }
}

common::FilterConfig LifecycleController::filter() const {
    return filter_->get();
}

bool LifecycleController::clearData() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto s = state_.load();
    if (s != PipelineState::Idle && s != PipelineState::Scanning) {
        lifecycleLogger_->warn("clearData ignored in state {}", pipeline::toString(s));
        return false;
    }
    scheduler_->clearStore();
    return true;
}

pipeline::PointSnapshot LifecycleController::snapshot() const {
    return scheduler_->latestSnapshot();
}

std::optional<processing::RoomMetrics> LifecycleController::metrics() const {
    return scheduler_->latestMetrics();
}

processing::SessionStats LifecycleController::sessionStats() const {
    return scheduler_->sessionStats();
}

processing::ViewBounds LifecycleController::viewBounds() const {
    return processing::computeViewBounds(*scheduler_->latestSnapshot());
}

uint64_t LifecycleController::recomputeCount() const {
    return scheduler_->recomputeCount();
}

io::ImportResult LifecycleController::importFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != PipelineState::Idle) {
        io::ImportResult refused;
        refused.error = std::string("import not allowed in state ") + pipeline::toString(state_.load());
        lifecycleLogger_->warn("{}", refused.error);
        return refused;
    }
    auto result = codec_.importFile(path, *store_);
    if (!result.ok) {
        reportFault(common::FaultKind::Import, path + ": " + result.error);
        return result;
    }
    scheduler_->adoptStore(result.meta.scan_count);
    return result;
}

bool LifecycleController::exportFile(const std::string& path) const {
    const auto points = scheduler_->latestRaw();
    if (points->empty()) {
        lifecycleLogger_->warn("No data to export");
        return false;
    }
    io::ExportMetadata meta;
    meta.scan_count = scheduler_->mergedBatches();
    meta.timestamp = io::isoTimestampNow();
    meta.total_points = points->size();
    meta.filter_distance = filter_->get().max_distance_mm;
    return codec_.exportFile(path, *points, meta);
}

bool LifecycleController::writeReport(const std::string& path) const {
    return codec_.writeReport(path, scheduler_->latestMetrics(), scheduler_->sessionStats(),
                              *scheduler_->latestSnapshot());
}

} // namespace lidarmap::backend
