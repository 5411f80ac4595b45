#include "io/InterchangeCodec.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

#include <spdlog/logger.h>

#include "store/PointStore.h"

namespace lidarmap::backend::io {

namespace {

std::string lowerCase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Whole-token decimal parse in the classic locale, like the writer; rejects trailing
// garbage, out-of-range values, inf and nan.
bool parseDouble(const std::string& token, double& out) {
    if (token.empty()) return false;
    std::istringstream in(token);
    in.imbue(std::locale::classic());
    double v = 0.0;
    if (!(in >> v)) return false;
    if (in.peek() != std::char_traits<char>::eof() || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool toQuality(double v, uint32_t& out) {
    if (v < 0.0 || v > static_cast<double>(std::numeric_limits<uint32_t>::max())) return false;
    out = static_cast<uint32_t>(std::llround(v));
    return true;
}

// Rows carrying only x,y (or x,y,quality) are completed so the view filter keeps them:
// quality falls back to the lowest accepted value and distance is the range to the origin.
bool makePoint(const double* v, std::size_t n, Point& out) {
    uint32_t q = kImportedQuality;
    if (n >= 3 && !toQuality(v[2], q)) return false;
    const double d = n >= 4 ? v[3] : std::hypot(v[0], v[1]);
    out = Point(v[0], v[1], q, d);
    return true;
}

// Minimal recursive-descent reader for the export document. Unknown keys are skipped.
class JsonReader {
public:
    explicit JsonReader(const std::string& text) : s_(text) {}

    bool readDocument(std::vector<Point>& points, ExportMetadata& meta) {
        bool sawPoints = false;
        skipWs();
        if (!consume('{')) return fail("expected '{' at document start");
        skipWs();
        if (consume('}')) return fail("missing 'points' array");
        while (true) {
            skipWs();
            std::string key;
            if (!readString(key)) return false;
            skipWs();
            if (!consume(':')) return fail("expected ':' after key '" + key + "'");
            skipWs();
            if (key == "points") {
                if (!readPoints(points)) return false;
                sawPoints = true;
            } else if (key == "scan_count") {
                if (!readOptionalCount(meta.scan_count, key)) return false;
            } else if (key == "total_points") {
                if (!readOptionalCount(meta.total_points, key)) return false;
            } else if (key == "filter_distance") {
                if (!readOptionalNumber(meta.filter_distance, key)) return false;
            } else if (key == "timestamp") {
                if (!readTimestamp(meta.timestamp)) return false;
            } else if (!skipValue(0)) {
                return false;
            }
            skipWs();
            if (consume(',')) continue;
            if (consume('}')) break;
            return fail("expected ',' or '}' in document object");
        }
        skipWs();
        if (pos_ != s_.size()) return fail("trailing characters after document");
        if (!sawPoints) return fail("missing 'points' array");
        return true;
    }

    const std::string& error() const { return error_; }

private:
    static constexpr int kMaxDepth = 64;

    bool fail(const std::string& msg) {
        if (error_.empty()) error_ = msg + " (offset " + std::to_string(pos_) + ")";
        return false;
    }

    void skipWs() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
    }

    bool consume(char c) {
        if (pos_ < s_.size() && s_[pos_] == c) { ++pos_; return true; }
        return false;
    }

    bool matchLiteral(const char* lit) {
        const std::size_t n = std::char_traits<char>::length(lit);
        if (s_.compare(pos_, n, lit) == 0) { pos_ += n; return true; }
        return false;
    }

    bool readString(std::string& out) {
        if (!consume('"')) return fail("expected string");
        out.clear();
        while (pos_ < s_.size()) {
            char c = s_[pos_++];
            if (c == '"') return true;
            if (c != '\\') { out.push_back(c); continue; }
            if (pos_ >= s_.size()) break;
            char e = s_[pos_++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    if (pos_ + 4 > s_.size()) return fail("truncated \\u escape");
                    unsigned code = 0;
                    for (int i = 0; i < 4; ++i) {
                        const char h = s_[pos_++];
                        code <<= 4;
                        if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
                        else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
                        else return fail("bad \\u escape");
                    }
                    // Metadata strings are ASCII; anything wider is kept as '?'.
                    out.push_back(code < 0x80 ? static_cast<char>(code) : '?');
                    break;
                }
                default: return fail("bad escape in string");
            }
        }
        return fail("unterminated string");
    }

    bool readNumber(double& out) {
        const std::size_t start = pos_;
        if (pos_ < s_.size() && s_[pos_] == '-') ++pos_;
        const std::size_t intStart = pos_;
        while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) ++pos_;
        if (pos_ == intStart) return fail("expected number");
        if (pos_ < s_.size() && s_[pos_] == '.') {
            ++pos_;
            const std::size_t fracStart = pos_;
            while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) ++pos_;
            if (pos_ == fracStart) return fail("expected digits after '.'");
        }
        if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) ++pos_;
            const std::size_t expStart = pos_;
            while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) ++pos_;
            if (pos_ == expStart) return fail("expected exponent digits");
        }
        if (!parseDouble(s_.substr(start, pos_ - start), out)) return fail("number out of range");
        return true;
    }

    bool readOptionalNumber(double& out, const std::string& key) {
        if (matchLiteral("null")) return true;
        if (pos_ < s_.size() && (s_[pos_] == '-' || std::isdigit(static_cast<unsigned char>(s_[pos_])))) {
            return readNumber(out);
        }
        return fail("'" + key + "' must be a number");
    }

    bool readOptionalCount(uint64_t& out, const std::string& key) {
        double v = 0.0;
        if (matchLiteral("null")) return true;
        if (!readOptionalNumber(v, key)) return false;
        if (v < 0.0) return fail("'" + key + "' must not be negative");
        out = static_cast<uint64_t>(std::llround(v));
        return true;
    }

    // String, or seconds since the epoch as a number (older exports).
    bool readTimestamp(std::string& out) {
        if (matchLiteral("null")) return true;
        if (pos_ < s_.size() && s_[pos_] == '"') return readString(out);
        double v = 0.0;
        if (!readOptionalNumber(v, "timestamp")) return false;
        std::ostringstream os;
        os.imbue(std::locale::classic());
        os << std::fixed << std::setprecision(3) << v;
        out = os.str();
        return true;
    }

    bool readPoints(std::vector<Point>& points) {
        if (!consume('[')) return fail("'points' must be an array");
        skipWs();
        if (consume(']')) return true;
        while (true) {
            skipWs();
            if (!readPoint(points)) return false;
            skipWs();
            if (consume(',')) continue;
            if (consume(']')) return true;
            return fail("expected ',' or ']' in points array");
        }
    }

    // [x, y] / [x, y, quality] / [x, y, quality, distance]
    bool readPoint(std::vector<Point>& points) {
        const std::size_t index = points.size();
        if (!consume('[')) return fail("point " + std::to_string(index) + " must be an array");
        double v[4] = {0.0, 0.0, 0.0, 0.0};
        int n = 0;
        skipWs();
        if (!consume(']')) {
            while (true) {
                skipWs();
                if (n == 4) return fail("point " + std::to_string(index) + " has more than 4 values");
                if (!readNumber(v[n])) return false;
                ++n;
                skipWs();
                if (consume(',')) continue;
                if (consume(']')) break;
                return fail("expected ',' or ']' in point " + std::to_string(index));
            }
        }
        if (n < 2) return fail("point " + std::to_string(index) + " needs at least x and y");
        Point p;
        if (!makePoint(v, static_cast<std::size_t>(n), p)) return fail("point " + std::to_string(index) + " has invalid quality");
        points.push_back(p);
        return true;
    }

    bool skipValue(int depth) {
        if (depth > kMaxDepth) return fail("nesting too deep");
        skipWs();
        if (pos_ >= s_.size()) return fail("unexpected end of input");
        const char c = s_[pos_];
        if (c == '"') { std::string ignored; return readString(ignored); }
        if (c == '{' || c == '[') {
            const char close = (c == '{') ? '}' : ']';
            ++pos_;
            skipWs();
            if (consume(close)) return true;
            while (true) {
                skipWs();
                if (c == '{') {
                    std::string ignored;
                    if (!readString(ignored)) return false;
                    skipWs();
                    if (!consume(':')) return fail("expected ':'");
                }
                if (!skipValue(depth + 1)) return false;
                skipWs();
                if (consume(',')) continue;
                if (consume(close)) return true;
                return fail("unterminated container");
            }
        }
        if (matchLiteral("true") || matchLiteral("false") || matchLiteral("null")) return true;
        double ignored = 0.0;
        return readNumber(ignored);
    }

    const std::string& s_;
    std::size_t pos_ = 0;
    std::string error_;
};

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream is(line);
    while (std::getline(is, cell, ',')) cells.push_back(trim(cell));
    if (!line.empty() && line.back() == ',') cells.emplace_back();
    return cells;
}

std::ostringstream numberStream() {
    std::ostringstream os;
    os.imbue(std::locale::classic());
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    return os;
}

} // namespace

InterchangeFormat formatFromPath(const std::string& path) {
    const auto dot = path.find_last_of('.');
    if (dot == std::string::npos || path.find_first_of("/\\", dot) != std::string::npos) {
        return InterchangeFormat::Unknown;
    }
    const std::string ext = lowerCase(path.substr(dot));
    if (ext == ".json") return InterchangeFormat::Structured;
    if (ext == ".csv") return InterchangeFormat::Tabular;
    return InterchangeFormat::Unknown;
}

std::string isoTimestampNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return os.str();
}

std::string serializeStructured(const std::vector<Point>& points, const ExportMetadata& meta) {
    auto json = numberStream();
    json << "{\n";
    json << "  \"points\": [";
    for (std::size_t i = 0; i < points.size(); ++i) {
        const auto& p = points[i];
        json << (i == 0 ? "\n" : ",\n");
        json << "    [" << p.x_mm << ", " << p.y_mm << ", " << p.quality << ", " << p.distance_mm << "]";
    }
    json << (points.empty() ? "],\n" : "\n  ],\n");
    json << "  \"scan_count\": " << meta.scan_count << ",\n";
    json << "  \"timestamp\": \"" << meta.timestamp << "\",\n";
    json << "  \"total_points\": " << meta.total_points << ",\n";
    json << "  \"filter_distance\": " << meta.filter_distance << "\n";
    json << "}\n";
    return json.str();
}

std::string serializeTabular(const std::vector<Point>& points) {
    auto csv = numberStream();
    csv << "X,Y,Quality,Distance\n";
    for (const auto& p : points) {
        csv << p.x_mm << ',' << p.y_mm << ',' << p.quality << ',' << p.distance_mm << '\n';
    }
    return csv.str();
}

ImportResult parseStructured(const std::string& text, std::vector<Point>& out) {
    ImportResult result;
    std::vector<Point> points;
    JsonReader reader(text);
    if (!reader.readDocument(points, result.meta)) {
        result.error = reader.error();
        return result;
    }
    result.ok = true;
    result.points_read = points.size();
    out.insert(out.end(), points.begin(), points.end());
    return result;
}

ImportResult parseTabular(const std::string& text, std::vector<Point>& out) {
    static const char* kColumns[] = {"x", "y", "quality", "distance"};
    ImportResult result;
    std::vector<Point> points;
    std::istringstream is(text);
    std::string line;
    std::size_t lineNo = 0;
    std::size_t columns = 0;

    while (std::getline(is, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty()) continue;
        auto cells = splitCsvLine(line);
        if (columns == 0) {
            if (cells.size() < 2 || cells.size() > 4) {
                result.error = "line " + std::to_string(lineNo) + ": header needs 2 to 4 columns";
                return result;
            }
            for (std::size_t i = 0; i < cells.size(); ++i) {
                if (lowerCase(cells[i]) != kColumns[i]) {
                    result.error = "line " + std::to_string(lineNo) + ": unexpected header column '" + cells[i] + "'";
                    return result;
                }
            }
            columns = cells.size();
            continue;
        }
        if (cells.size() != columns) {
            result.error = "line " + std::to_string(lineNo) + ": expected " + std::to_string(columns) +
                           " values, got " + std::to_string(cells.size());
            return result;
        }
        double v[4] = {0.0, 0.0, 0.0, 0.0};
        for (std::size_t i = 0; i < columns; ++i) {
            if (!parseDouble(cells[i], v[i])) {
                result.error = "line " + std::to_string(lineNo) + ": invalid number '" + cells[i] + "'";
                return result;
            }
        }
        Point p;
        if (!makePoint(v, columns, p)) {
            result.error = "line " + std::to_string(lineNo) + ": invalid quality";
            return result;
        }
        points.push_back(p);
    }
    if (columns == 0) {
        result.error = "missing header line";
        return result;
    }
    result.ok = true;
    result.points_read = points.size();
    result.meta.total_points = points.size();
    // No scan count in the tabular format; estimate at ~100 points per rotation.
    result.meta.scan_count = points.size() / 100;
    out.insert(out.end(), points.begin(), points.end());
    return result;
}

InterchangeCodec::InterchangeCodec(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

bool InterchangeCodec::writeText(const std::string& path, const std::string& text, const char* what) const {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        if (logger_) logger_->error("Failed to open file for writing: {}", path);
        return false;
    }
    file << text;
    file.close();
    if (file.fail()) {
        if (logger_) logger_->error("Error writing {} to file: {}", what, path);
        return false;
    }
    return true;
}

bool InterchangeCodec::exportFile(const std::string& path, const std::vector<Point>& points,
                                  const ExportMetadata& meta) const {
    std::string text;
    switch (formatFromPath(path)) {
        case InterchangeFormat::Structured: text = serializeStructured(points, meta); break;
        case InterchangeFormat::Tabular: text = serializeTabular(points); break;
        case InterchangeFormat::Unknown:
            if (logger_) logger_->error("Unsupported export format (expected .json or .csv): {}", path);
            return false;
    }
    if (!writeText(path, text, "point cloud")) return false;
    if (logger_) logger_->info("Exported {} points -> {}", points.size(), path);
    return true;
}

ImportResult InterchangeCodec::importFile(const std::string& path, store::PointStore& store) const {
    ImportResult result;
    const auto format = formatFromPath(path);
    if (format == InterchangeFormat::Unknown) {
        result.error = "unsupported file extension (expected .json or .csv)";
    } else {
        std::ifstream file(path);
        if (!file.is_open()) {
            result.error = "cannot open file";
        } else {
            std::stringstream buffer;
            buffer << file.rdbuf();
            std::vector<Point> points;
            result = (format == InterchangeFormat::Structured) ? parseStructured(buffer.str(), points)
                                                               : parseTabular(buffer.str(), points);
            if (result.ok) {
                store.clear();
                store.insertPoints(points);
                if (logger_) logger_->info("Imported {} points from {} (stored={} capacity={})",
                                           result.points_read, path, store.size(), store.capacity());
                return result;
            }
        }
    }
    if (logger_) logger_->error("Import of {} failed: {}", path, result.error);
    return result;
}

bool InterchangeCodec::writeReport(const std::string& path,
                                   const std::optional<processing::RoomMetrics>& metrics,
                                   const processing::SessionStats& stats,
                                   const std::vector<Point>& points) const {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << "Room Scan Data - " << isoTimestampNow() << "\n";
    out << std::string(50, '=') << "\n";
    out << std::fixed << std::setprecision(3);
    if (metrics) {
        out << "Room Width: " << metrics->width / 1000.0 << " m\n";
        out << "Room Height: " << metrics->height / 1000.0 << " m\n";
        out << "Room Area: " << metrics->area_m2 << " m²\n";
        out << "Room Perimeter: " << metrics->perimeter / 1000.0 << " m\n";
    } else {
        out << "Room metrics unavailable (fewer than " << processing::kMinMetricSamples << " points)\n";
    }
    out << "Total Points: " << points.size() << "\n";
    out << "Total Scans: " << stats.scans_processed << "\n\n";
    out << "Point Data (x, y in mm):\n";
    out << std::setprecision(1);
    for (const auto& p : points) {
        out << p.x_mm << ", " << p.y_mm << "\n";
    }
    if (!writeText(path, out.str(), "scan report")) return false;
    if (logger_) logger_->info("Scan report ({} points) -> {}", points.size(), path);
    return true;
}

} // namespace lidarmap::backend::io
