#pragma once
#include <cstddef>
#include <string>
#include <sstream>
#include <iomanip>

namespace lidarmap::backend::common {
// 1234567 -> "1.23M", 4321 -> "4.32k"
inline std::string prettyRate(double v) {
    std::ostringstream o;
    if (v >= 1e6)      o << std::fixed << std::setprecision(2) << (v/1e6) << "M";
    else if (v >= 1e3) o << std::fixed << std::setprecision(2) << (v/1e3) << "k";
    else               o << std::fixed << std::setprecision(2) << v;
    return o.str();
}

inline std::string prettyBytes(std::size_t bytes) {
    std::ostringstream o;
    const double v = static_cast<double>(bytes);
    if (v >= 1024.0 * 1024.0) o << std::fixed << std::setprecision(1) << v / (1024.0 * 1024.0) << " MB";
    else if (v >= 1024.0)     o << std::fixed << std::setprecision(1) << v / 1024.0 << " KB";
    else                      o << bytes << " B";
    return o.str();
}
}
