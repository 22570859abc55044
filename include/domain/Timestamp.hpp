#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace settlement::domain {

/**
 * @brief Временная метка события аудита (UTC)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /// ISO 8601 с миллисекундами: 2025-12-14T15:30:45.123Z
    std::string toString() const {
        auto timeT = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&timeT, &tm);

        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()).count() % 1000;

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
        return ss.str();
    }
};

} // namespace settlement::domain
