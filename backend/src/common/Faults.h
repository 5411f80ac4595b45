#ifndef LIDARMAP_BACKEND_COMMON_FAULTS_H
#define LIDARMAP_BACKEND_COMMON_FAULTS_H

#include <string>

namespace lidarmap::backend::common {

// Fault classes reported to the presentation layer.
//   Connect  - driver unreachable / misconfigured port; startConnect fails, back to Idle
//   Frame    - transient read/decode failure; fatal only past the consecutive threshold
//   Channel  - producer hit an unrecoverable streaming error; scanning aborted
//   Teardown - driver stop/disconnect failed during shutdown; logged, never blocks Idle
//   Import   - malformed interchange file; store untouched
enum class FaultKind { Connect, Frame, Channel, Teardown, Import };

inline const char* toString(FaultKind k) {
	switch (k) {
		case FaultKind::Connect: return "ConnectFault";
		case FaultKind::Frame: return "FrameFault";
		case FaultKind::Channel: return "ChannelFault";
		case FaultKind::Teardown: return "TeardownFault";
		case FaultKind::Import: return "ImportFault";
	}
	return "UnknownFault";
}

struct FaultReport {
	FaultKind kind = FaultKind::Channel;
	std::string description;
};

} // namespace lidarmap::backend::common

#endif // LIDARMAP_BACKEND_COMMON_FAULTS_H
