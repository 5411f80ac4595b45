#include "Logger.h"

#include <spdlog/sinks/dist_sink.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string_view>

namespace lidarmap::backend::common {

namespace {

// Positive integer from the environment, or `def` when unset / unparsable.
std::size_t envSize(const char* name, std::size_t def)
{
	const char* v = std::getenv(name);
	if (!v) return def;
	try {
		long long parsed = std::stoll(v);
		if (parsed > 0) return static_cast<std::size_t>(parsed);
	} catch (const std::invalid_argument&) {
	} catch (const std::out_of_range&) {
	}
	return def;
}

} // namespace

Logger& Logger::instance()
{
	static Logger inst;
	return inst;
}

Logger::Logger() = default;

Logger::~Logger() = default;

void Logger::initialize(const std::string& logFilePath,
			  spdlog::level::level_enum defaultLevel,
			  std::chrono::seconds flushEvery,
			  spdlog::level::level_enum flushOn)
{
	std::scoped_lock lock(mutex_);
	if (initialized_) {
		spdlog::warn("Logger::initialize() called more than once; ignoring subsequent call");
		return;
	}
	try {
		if (!logFilePath.empty()) {
			std::filesystem::path p{logFilePath};
			if (p.has_parent_path()) {
				std::error_code ec;
				std::filesystem::create_directories(p.parent_path(), ec);
				if (ec) {
					spdlog::warn("Failed to create log directory '{}': {}", p.parent_path().string(), ec.message());
				}
			}
		}

		// Thread pool must exist before the first async logger is built.
		//   LIDARMAP_LOG_QUEUE_SIZE (default 8192)
		//   LIDARMAP_LOG_WORKERS    (default 1)
		spdlog::init_thread_pool(envSize("LIDARMAP_LOG_QUEUE_SIZE", 8192), envSize("LIDARMAP_LOG_WORKERS", 1));

		console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
		if (!logFilePath.empty()) {
			file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFilePath, 5 * 1024 * 1024, 3);
		}

		spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

		globalLevel_ = envLogLevel().value_or(defaultLevel);
		// Registry baseline stays at trace so per-logger levels are authoritative
		spdlog::set_level(spdlog::level::trace);

		spdlog::flush_on(flushOn);
		spdlog::flush_every(flushEvery);

		initialized_ = true;
	} catch (const spdlog::spdlog_ex& ex) {
		spdlog::error("Logger initialization failed: {}", ex.what());
	}
}

void Logger::shutdown()
{
	std::scoped_lock lock(mutex_);
	if (!initialized_) return;
	spdlog::shutdown();
	console_sink_.reset();
	file_sink_.reset();
	loggerNames_.clear();
	initialized_ = false;
}

spdlog::level::level_enum Logger::resolvedLevelLocked(const std::string& name) const
{
	if (auto it = perLoggerLevels_.find(name); it != perLoggerLevels_.end()) {
		return it->second;
	}
	return globalLevel_;
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string& name)
{
	std::scoped_lock lock(mutex_);
	if (!initialized_) {
		throw std::runtime_error("Logger::get() called before initialize()");
	}
	if (auto existing = spdlog::get(name)) {
		return existing;
	}
	auto dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
	dist->add_sink(console_sink_);
	if (file_sink_) dist->add_sink(file_sink_);
	auto created = std::make_shared<spdlog::async_logger>(
		name,
		spdlog::sinks_init_list{dist},
		spdlog::thread_pool(),
		spdlog::async_overflow_policy::block
	);
	const auto level = resolvedLevelLocked(name);
	spdlog::register_logger(created);
	// Registration applies the registry level; re-assert ours afterwards
	created->set_level(level);
	loggerNames_.push_back(name);
	return created;
}

void Logger::setGlobalLevel(spdlog::level::level_enum level)
{
	std::scoped_lock lock(mutex_);
	globalLevel_ = level;
	for (const auto& n : loggerNames_) {
		if (perLoggerLevels_.count(n) == 0) {
			if (auto l = spdlog::get(n)) l->set_level(level);
		}
	}
}

void Logger::setLoggerLevel(const std::string& name, spdlog::level::level_enum level)
{
	std::scoped_lock lock(mutex_);
	perLoggerLevels_[name] = level;
	if (auto l = spdlog::get(name)) {
		l->set_level(level);
	}
}

void Logger::clearLoggerLevel(const std::string& name)
{
	std::scoped_lock lock(mutex_);
	perLoggerLevels_.erase(name);
	if (auto l = spdlog::get(name)) {
		l->set_level(globalLevel_);
	}
}

std::optional<spdlog::level::level_enum> Logger::envLogLevel() const
{
	const char* lvl = std::getenv("LIDARMAP_LOG_LEVEL");
	if (!lvl || !*lvl) return std::nullopt;
	// from_str maps unknown names to `off`; only accept `off` when asked for explicitly
	auto parsed = spdlog::level::from_str(lvl);
	if (parsed == spdlog::level::off && std::string_view(lvl) != "off") {
		return std::nullopt;
	}
	return parsed;
}

void Logger::warnRateLimited(const std::string& loggerName, const std::string& key,
			     std::chrono::milliseconds period, const std::string& message)
{
	const auto now = std::chrono::steady_clock::now();
	{
		std::scoped_lock lock(mutex_);
		auto& last = rateLimitLast_[key];
		if (now - last < period) return;
		last = now;
	}
	try {
		get(loggerName)->warn(message);
	} catch (const std::runtime_error&) {
		// Not initialized: fall back to the default spdlog logger
		spdlog::warn("[{}] {}", loggerName, message);
	}
}

} // namespace lidarmap::backend::common
