#ifndef LIDARMAP_BACKEND_COMMON_LOGGING_NAMES_H
#define LIDARMAP_BACKEND_COMMON_LOGGING_NAMES_H

// Central place for canonical logger name strings.
// Keep names stable for tooling / filtering.
namespace lidarmap::backend::logging_names {
// Application / lifecycle
constexpr const char* APP_LIFECYCLE = "App.Lifecycle";
constexpr const char* APP_CONFIG    = "App.Config";

// Sensor driver layer
constexpr const char* HAL_SYNTHETIC  = "HAL.Synthetic";

// Acquisition / pipeline
constexpr const char* PIPE_ACQUISITION = "Pipeline.Acquisition";
constexpr const char* PIPE_SCHEDULER   = "Pipeline.Scheduler";
constexpr const char* PROC_FRAMES      = "Processing.Frames";

// Interchange files
constexpr const char* IO_CODEC = "IO.Codec";

// Presentation (console stand-in for the GUI)
constexpr const char* PRESENTATION = "Presentation";

// Misc
constexpr const char* TEST      = "Test";
}

#endif // LIDARMAP_BACKEND_COMMON_LOGGING_NAMES_H
