#include "core/types.h"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tickagg {

Timestamp nowMillis() {
    return std::chrono::duration_cast<Timestamp>(
        std::chrono::system_clock::now().time_since_epoch()
    );
}

Timestamp floorToMinute(Timestamp t) {
    // floor, not truncate: pre-epoch values still land on the minute at or before t
    auto minutes = std::chrono::floor<std::chrono::minutes>(t);
    return std::chrono::duration_cast<Timestamp>(minutes);
}

Timestamp floorToSecond(Timestamp t) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(t);
    return std::chrono::duration_cast<Timestamp>(seconds);
}

std::string formatTimestamp(Timestamp t) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(t);
    auto ms = (t - std::chrono::duration_cast<Timestamp>(seconds)).count();

    std::time_t time_t = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (ms != 0) {
        ss << '.' << std::setfill('0') << std::setw(3) << ms;
    }
    ss << 'Z';
    return ss.str();
}

std::string sanitizeSymbol(const std::string& symbol) {
    std::string safe = symbol;
    for (auto& c : safe) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            c = '_';
        }
    }
    return safe;
}

} // namespace tickagg
