#include "common/Logger.h"
#include "common/LoggingNames.h"
#include "common/PipelineConfig.h"
#include "common/StatsUtil.h"

#include "LifecycleController.h"
#include "hal/SyntheticSensorDriver.h"
#include "tools/LoggingPresentationSink.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

void printUsage(const char* program_name) {
	std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
	std::cout << "Options:\n";
	std::cout << "  --sensor TYPE         Sensor type: synthetic, synthetic_circle\n";
	std::cout << "  --port NAME           Port passed to the driver on connect (default: /dev/ttyUSB0)\n";
	std::cout << "  --run-secs N          Scan duration in seconds (default: 5)\n";
	std::cout << "  --max-distance MM     Distance filter in mm (1000-16000)\n";
	std::cout << "  --min-quality Q       Minimum accepted quality (>=1)\n";
	std::cout << "  --capacity N          Point store capacity (2000-150000)\n";
	std::cout << "  --decimation N        Recompute every Nth merged batch\n";
	std::cout << "  --import FILE         Load a .json/.csv point cloud instead of scanning\n";
	std::cout << "  --export FILE         Write the point cloud to .json/.csv when done\n";
	std::cout << "  --report FILE         Write a plain-text room report when done\n";
	std::cout << "  --help, -h            Show this help message\n\n";
	std::cout << "Environment Variables:\n";
	std::cout << "  LIDARMAP_SENSOR_TYPE              Sensor type (same as --sensor)\n";
	std::cout << "  LIDARMAP_PORT                     Port (same as --port)\n";
	std::cout << "  LIDARMAP_RUN_SECS                 Scan duration in seconds\n";
	std::cout << "  LIDARMAP_MAX_DISTANCE_MM          Distance filter in mm\n";
	std::cout << "  LIDARMAP_MIN_QUALITY              Minimum accepted quality\n";
	std::cout << "  LIDARMAP_STORE_CAPACITY           Point store capacity\n";
	std::cout << "  LIDARMAP_DECIMATION               Recompute every Nth merged batch\n";
	std::cout << "  LIDARMAP_ERROR_THRESHOLD          Consecutive frame errors before abort\n";
	std::cout << "  LIDARMAP_TICK_MS                  Scheduler tick interval\n";
	std::cout << "  LIDARMAP_JOIN_TIMEOUT_MS          Acquisition join timeout on stop\n";
	std::cout << "  LIDARMAP_CHANNEL_CAPACITY         Queued batches before drops\n";
	std::cout << "  LIDARMAP_LOG_LEVEL                Global log level\n";
}

namespace {
struct CliOptions {
	std::string sensor;
	std::string port;
	std::optional<int> runSecs;
	std::optional<double> maxDistance;
	std::optional<long> minQuality;
	std::optional<long> capacity;
	std::optional<long> decimation;
	std::string importPath;
	std::string exportPath;
	std::string reportPath;
};

std::string envOr(const char* name, const std::string& fallback) {
	const char* v = std::getenv(name);
	return (v && *v) ? std::string(v) : fallback;
}
}

int main(int argc, char* argv[]) {
	using lidarmap::backend::common::Logger;
	using namespace lidarmap::backend::logging_names;
	using namespace lidarmap::backend;

	// Parse command line arguments
	CliOptions cli;
	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		const bool hasValue = i + 1 < argc;
		try {
			if (arg == "--help" || arg == "-h") {
				printUsage(argv[0]);
				return 0;
			} else if (arg == "--sensor" && hasValue) {
				cli.sensor = argv[++i];
			} else if (arg == "--port" && hasValue) {
				cli.port = argv[++i];
			} else if (arg == "--run-secs" && hasValue) {
				cli.runSecs = std::stoi(argv[++i]);
			} else if (arg == "--max-distance" && hasValue) {
				cli.maxDistance = std::stod(argv[++i]);
			} else if (arg == "--min-quality" && hasValue) {
				cli.minQuality = std::stol(argv[++i]);
			} else if (arg == "--capacity" && hasValue) {
				cli.capacity = std::stol(argv[++i]);
			} else if (arg == "--decimation" && hasValue) {
				cli.decimation = std::stol(argv[++i]);
			} else if (arg == "--import" && hasValue) {
				cli.importPath = argv[++i];
			} else if (arg == "--export" && hasValue) {
				cli.exportPath = argv[++i];
			} else if (arg == "--report" && hasValue) {
				cli.reportPath = argv[++i];
			} else {
				std::cerr << "Unknown argument: " << arg << std::endl;
				printUsage(argv[0]);
				return 1;
			}
		} catch (const std::exception&) {
			std::cerr << "Invalid value for " << arg << ": " << argv[i] << std::endl;
			return 1;
		}
	}

	// Initialize logging early
	Logger::instance().initialize("logs/backend/backend.log", spdlog::level::info);
	Logger::instance().setLoggerLevel(PROC_FRAMES, spdlog::level::warn);

	int exitCode = 0;
	try {
		auto appLog    = Logger::instance().get(APP_LIFECYCLE);
		auto configLog = Logger::instance().get(APP_CONFIG);
		auto halLog    = Logger::instance().get(HAL_SYNTHETIC);
		auto viewLog   = Logger::instance().get(PRESENTATION);

		// Priority: command line flag > environment variable > default
		auto cfg = common::loadPipelineConfig(common::PipelineConfig{}, configLog);
		if (cli.maxDistance) cfg.filter.max_distance_mm = *cli.maxDistance;
		if (cli.minQuality) cfg.filter.min_quality = static_cast<uint32_t>(std::max(0L, *cli.minQuality));
		if (cli.capacity) cfg.store_capacity = static_cast<std::size_t>(std::max(0L, *cli.capacity));
		if (cli.decimation) cfg.decimation_factor = static_cast<uint32_t>(std::max(0L, *cli.decimation));
		cfg = common::sanitizePipelineConfig(cfg, configLog);

		const std::string sensor = !cli.sensor.empty() ? cli.sensor : envOr("LIDARMAP_SENSOR_TYPE", "synthetic");
		const std::string port = !cli.port.empty() ? cli.port : envOr("LIDARMAP_PORT", "/dev/ttyUSB0");
		int runSecs = 5;
		if (cli.runSecs) {
			runSecs = std::max(1, *cli.runSecs);
		} else if (const char* rs = std::getenv("LIDARMAP_RUN_SECS")) {
			try { runSecs = std::max(1, std::stoi(rs)); }
			catch (const std::exception&) { configLog->warn("Ignoring invalid LIDARMAP_RUN_SECS='{}'", rs); }
		}

		// Construct sensor driver via simple factory
		hal::SyntheticSensorDriver::Config dcfg;
		if (sensor == "synthetic") {
			dcfg.pattern = hal::SyntheticSensorDriver::Pattern::RECTANGLE;
		} else if (sensor == "synthetic_circle") {
			dcfg.pattern = hal::SyntheticSensorDriver::Pattern::CIRCLE;
		} else {
			appLog->error("Unsupported sensor type '{}' (this build ships the synthetic driver only)", sensor);
			Logger::instance().shutdown();
			return 1;
		}
		dcfg.noiseMm = 5.0;
		auto driver = std::make_shared<hal::SyntheticSensorDriver>(dcfg, halLog);
		halLog->info("Factory: using SyntheticSensorDriver room={}x{}mm fps={}", dcfg.roomWidthMm, dcfg.roomHeightMm, dcfg.fps);

		auto sink = std::make_shared<tools::LoggingPresentationSink>(viewLog);
		LifecycleController controller(appLog, cfg, driver, sink);

		if (!cli.importPath.empty()) {
			auto res = controller.importFile(cli.importPath);
			if (!res.ok) {
				exitCode = 1;
			} else {
				appLog->info("Loaded {} points (scan_count={} saved={})", res.points_read, res.meta.scan_count,
					     res.meta.timestamp.empty() ? "unknown" : res.meta.timestamp);
			}
		} else if (controller.startConnect(port)) {
			auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(runSecs);
			// The scan may end early on a fault; the controller is then already Idle.
			while (std::chrono::steady_clock::now() < deadline &&
			       controller.state() == pipeline::PipelineState::Scanning) {
				std::this_thread::sleep_for(std::chrono::milliseconds(100));
			}
			controller.stop();
		} else {
			exitCode = 1;
		}

		const auto stats = controller.sessionStats();
		appLog->info("Session: scans={} points={} ({} received) duration={:.1f}s rate={} pts/s memory={}",
			     stats.scans_processed, stats.total_points, stats.points_received, stats.duration_s,
			     common::prettyRate(stats.points_per_second), common::prettyBytes(stats.memory_bytes));
		const auto bounds = controller.viewBounds();
		appLog->info("View extents: x=[{:.0f}, {:.0f}] y=[{:.0f}, {:.0f}] mm", bounds.min_x, bounds.max_x,
			     bounds.min_y, bounds.max_y);

		if (exitCode == 0 && !cli.exportPath.empty() && !controller.exportFile(cli.exportPath)) exitCode = 1;
		if (exitCode == 0 && !cli.reportPath.empty() && !controller.writeReport(cli.reportPath)) exitCode = 1;
	} catch (const std::exception& ex) {
		Logger::instance().get(APP_LIFECYCLE)->critical(std::string("Fatal exception: ") + ex.what());
		Logger::instance().shutdown();
		return 1;
	}

	Logger::instance().shutdown();
	return exitCode;
}
