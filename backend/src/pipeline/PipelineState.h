#ifndef LIDARMAP_BACKEND_PIPELINE_PIPELINE_STATE_H
#define LIDARMAP_BACKEND_PIPELINE_PIPELINE_STATE_H

namespace lidarmap::backend::pipeline {

// Idle -> Connecting -> Scanning -> Stopping -> Idle
// Connecting/Scanning --failure--> Error -> Idle
enum class PipelineState { Idle, Connecting, Scanning, Stopping, Error };

inline const char* toString(PipelineState s) {
    switch (s) {
        case PipelineState::Idle: return "Idle";
        case PipelineState::Connecting: return "Connecting";
        case PipelineState::Scanning: return "Scanning";
        case PipelineState::Stopping: return "Stopping";
        case PipelineState::Error: return "Error";
    }
    return "Unknown";
}

} // namespace lidarmap::backend::pipeline

#endif // LIDARMAP_BACKEND_PIPELINE_PIPELINE_STATE_H
