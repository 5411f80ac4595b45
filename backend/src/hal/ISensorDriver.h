#ifndef LIDARMAP_BACKEND_HAL_ISENSORDRIVER_H
#define LIDARMAP_BACKEND_HAL_ISENSORDRIVER_H

#include <optional>
#include <stdexcept>
#include <string>

#include "common/DataTypes.h"

namespace lidarmap::backend::hal {

using lidarmap::backend::common::DeviceInfo;
using lidarmap::backend::common::HealthStatus;
using lidarmap::backend::common::ScanFrame;

// Base of every error a driver reports. Anything other than FrameReadError
// raised while streaming is treated as unrecoverable.
class DriverError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Port missing, device unreachable or not answering the info request.
class ConnectError : public DriverError {
public:
	using DriverError::DriverError;
};

// Transient decode/read failure of a single frame; the stream can continue.
class FrameReadError : public DriverError {
public:
	using DriverError::DriverError;
};

// Rotating range sensor as seen by the acquisition pipeline. The wire protocol
// stays behind this interface.
class ISensorDriver {
public:
	virtual ~ISensorDriver() = default;

	virtual DeviceInfo connect(const std::string& port) = 0;
	virtual HealthStatus getHealth() = 0;

	// Blocks until the next full rotation is available. std::nullopt means the
	// stream ended; a stopped stream is not restartable without reconnecting.
	virtual std::optional<ScanFrame> readFrame() = 0;

	virtual void stop() = 0;
	virtual void disconnect() = 0;
	virtual std::string getDeviceID() const = 0;
};

} // namespace lidarmap::backend::hal

#endif // LIDARMAP_BACKEND_HAL_ISENSORDRIVER_H
