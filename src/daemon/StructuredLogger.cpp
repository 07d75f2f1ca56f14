#include "sectionnode/daemon/StructuredLogger.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sectionnode::daemon {

namespace {

std::string escape_control_characters(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                escaped.append("\\\"");
                break;
            case '\\':
                escaped.append("\\\\");
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch);
                    escaped.append(oss.str());
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    return escaped;
}

int severity(StructuredLogger::Level level) {
    return static_cast<int>(level);
}

}  // namespace

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || severity(level) < severity(minimum_level_)) {
        return;
    }

    std::ostringstream oss;
    oss << '{'
        << "\"ts\":\"" << escape_json(format_timestamp()) << "\",";
    oss << "\"level\":\"" << escape_json(level_to_string(level)) << "\",";
    oss << "\"event\":\"" << escape_json(event) << "\"";

    if (!fields.empty()) {
        oss << ",\"fields\":{";
        for (std::size_t i = 0; i < fields.size(); ++i) {
            const auto& [key, value] = fields[i];
            oss << "\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
            if (i + 1 < fields.size()) {
                oss << ',';
            }
        }
        oss << '}';
    }
    oss << "}\n";

    if (sink_) {
        sink_(oss.str());
        return;
    }
    std::clog << oss.str();
    std::clog.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_minimum_level(Level level) {
    std::scoped_lock lock(mutex_);
    minimum_level_ = level;
}

StructuredLogger::Level StructuredLogger::minimum_level() const noexcept {
    std::scoped_lock lock(mutex_);
    return minimum_level_;
}

void StructuredLogger::set_sink(Sink sink) {
    std::scoped_lock lock(mutex_);
    sink_ = std::move(sink);
}

std::optional<StructuredLogger::Level> StructuredLogger::level_from_string(std::string_view text) {
    std::string lowered(text);
    for (auto& ch : lowered) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (lowered == "debug" || lowered == "trace") {
        return Level::Debug;
    }
    if (lowered == "info") {
        return Level::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return Level::Warning;
    }
    if (lowered == "error") {
        return Level::Error;
    }
    return std::nullopt;
}

std::string StructuredLogger::level_to_string(Level level) {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

std::string StructuredLogger::escape_json(std::string_view value) {
    return escape_control_characters(value);
}

std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now_c);
#else
    gmtime_r(&now_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fractional << 'Z';
    return oss.str();
}

}  // namespace sectionnode::daemon
