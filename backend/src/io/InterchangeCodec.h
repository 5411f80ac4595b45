// InterchangeCodec.h
// Point cloud files: structured (.json) and tabular (.csv) export/import plus the
// human-readable room report. Import is all-or-nothing.

#ifndef LIDARMAP_BACKEND_IO_INTERCHANGE_CODEC_H
#define LIDARMAP_BACKEND_IO_INTERCHANGE_CODEC_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/DataTypes.h"
#include "processing/MetricsEngine.h"

namespace spdlog { class logger; }
namespace lidarmap::backend::store { class PointStore; }

namespace lidarmap::backend::io {

using lidarmap::backend::common::Point;

enum class InterchangeFormat { Structured, Tabular, Unknown };

// Quality given to imported points whose file has no quality value.
constexpr uint32_t kImportedQuality = 1;

// By extension, case-insensitive: .json -> Structured, .csv -> Tabular.
InterchangeFormat formatFromPath(const std::string& path);

struct ExportMetadata {
    uint64_t scan_count = 0;
    std::string timestamp;       // ISO-8601 local time
    uint64_t total_points = 0;
    double filter_distance = 0.0; // mm
};

struct ImportResult {
    bool ok = false;
    std::string error;
    std::size_t points_read = 0;
    ExportMetadata meta;
};

// Local time, millisecond precision: 2024-05-01T13:45:02.123
std::string isoTimestampNow();

std::string serializeStructured(const std::vector<Point>& points, const ExportMetadata& meta);
// Header X,Y,Quality,Distance.
std::string serializeTabular(const std::vector<Point>& points);

// Parsers append to `out` only on success. Missing optional metadata keeps defaults.
// A point given as [x, y] or [x, y, quality] gets kImportedQuality and distance hypot(x, y).
ImportResult parseStructured(const std::string& text, std::vector<Point>& out);
// Header must be X,Y or X,Y,Quality or X,Y,Quality,Distance; absent columns are completed
// the same way.
ImportResult parseTabular(const std::string& text, std::vector<Point>& out);

class InterchangeCodec {
public:
    explicit InterchangeCodec(std::shared_ptr<spdlog::logger> logger);

    bool exportFile(const std::string& path, const std::vector<Point>& points, const ExportMetadata& meta) const;

    // Replaces the store contents with the file's points (oldest evicted first when the
    // file holds more than the capacity). On failure the store is left untouched.
    ImportResult importFile(const std::string& path, store::PointStore& store) const;

    bool writeReport(const std::string& path,
                     const std::optional<processing::RoomMetrics>& metrics,
                     const processing::SessionStats& stats,
                     const std::vector<Point>& points) const;

private:
    bool writeText(const std::string& path, const std::string& text, const char* what) const;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace lidarmap::backend::io

#endif // LIDARMAP_BACKEND_IO_INTERCHANGE_CODEC_H
