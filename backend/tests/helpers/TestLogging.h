#pragma once
#include <memory>
#include <string>

#include "common/Logger.h"
#include "common/LoggingNames.h"

namespace lidarmap { namespace backend { namespace tests {

// Shared test log file; warnings and above only unless LIDARMAP_LOG_LEVEL says otherwise.
inline std::shared_ptr<spdlog::logger> testLogger(const std::string& name = logging_names::TEST) {
    auto& registry = common::Logger::instance();
    if (!registry.isInitialized()) {
        registry.initialize("logs/test/lidarmap_tests.log", spdlog::level::warn);
    }
    return registry.get(name);
}

}}} // namespace lidarmap::backend::tests
