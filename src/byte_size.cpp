#include "byte_size.hpp"
#include <array>
#include <iomanip>
#include <sstream>

namespace {

template <std::size_t N>
std::string scale(std::uintmax_t bytes, const std::array<const char*, N>& units) {
    double magnitude = static_cast<double>(bytes);
    std::size_t order = 0;
    while (magnitude >= 1024.0 && order + 1 < units.size()) {
        magnitude /= 1024.0;
        ++order;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << magnitude << ' ' << units[order];
    return out.str();
}

} // namespace

std::string groupThousands(std::uintmax_t value) {
    std::string digits = std::to_string(value);
    std::string grouped;
    int counter = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (counter > 0 && counter % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++counter;
    }
    return grouped;
}

std::string humanBytes(std::uintmax_t bytes) {
    static const std::array<const char*, 9> units = {"B", "KB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB"};
    return scale(bytes, units);
}

std::string humanBytesIec(std::uintmax_t bytes) {
    static const std::array<const char*, 5> units = {"B", "KiB", "MiB", "GiB", "TiB"};
    return scale(bytes, units);
}
