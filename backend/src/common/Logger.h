#ifndef LIDARMAP_BACKEND_COMMON_LOGGER_H
#define LIDARMAP_BACKEND_COMMON_LOGGER_H

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace lidarmap::backend::common {

class Logger {
public:
	static Logger& instance();

	// Configure the shared sinks used by every named logger.
	//   logFilePath  - rotating log file; empty string means console only
	//   defaultLevel - fallback global level (LIDARMAP_LOG_LEVEL wins when set and valid)
	//   flushEvery   - periodic flush interval
	//   flushOn      - level on/above which every message forces a flush
	void initialize(const std::string& logFilePath,
			  spdlog::level::level_enum defaultLevel = spdlog::level::info,
			  std::chrono::seconds flushEvery = std::chrono::seconds{1},
			  spdlog::level::level_enum flushOn = spdlog::level::warn);

	[[nodiscard]] bool isInitialized() const noexcept { return initialized_; }

	// Does NOT override per-logger explicit levels
	void setGlobalLevel(spdlog::level::level_enum level);
	spdlog::level::level_enum getGlobalLevel() const noexcept { return globalLevel_; }

	// Explicit level for a named logger (created now or later)
	void setLoggerLevel(const std::string& name, spdlog::level::level_enum level);
	void clearLoggerLevel(const std::string& name);

	// Emits at most once per period per key (e.g. "frame_read_error").
	void warnRateLimited(const std::string& loggerName, const std::string& key,
			     std::chrono::milliseconds period, const std::string& message);

	void shutdown();

	// Get (or create) a named async logger on the shared sinks. Throws std::runtime_error
	// when called before initialize().
	std::shared_ptr<spdlog::logger> get(const std::string& name);

	Logger(const Logger&) = delete;
	Logger& operator=(const Logger&) = delete;

private:
	Logger();
	~Logger();

	std::optional<spdlog::level::level_enum> envLogLevel() const;
	spdlog::level::level_enum resolvedLevelLocked(const std::string& name) const;

	bool initialized_ = false;
	spdlog::level::level_enum globalLevel_ = spdlog::level::info;
	std::unordered_map<std::string, spdlog::level::level_enum> perLoggerLevels_;
	std::vector<std::string> loggerNames_;
	mutable std::mutex mutex_;

	std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
	std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_; // null in console-only mode

	std::unordered_map<std::string, std::chrono::steady_clock::time_point> rateLimitLast_;
};

} // namespace lidarmap::backend::common

#endif // LIDARMAP_BACKEND_COMMON_LOGGER_H
