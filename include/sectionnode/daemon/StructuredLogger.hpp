#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sectionnode::daemon {

class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;
    using Sink = std::function<void(const std::string&)>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_minimum_level(Level level);
    [[nodiscard]] Level minimum_level() const noexcept;

    // Replaces std::clog as the destination; an empty sink restores it.
    void set_sink(Sink sink);

    static std::optional<Level> level_from_string(std::string_view text);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string level_to_string(Level level);
    static std::string escape_json(std::string_view value);

    std::string format_timestamp();

    bool enabled_{true};
    Level minimum_level_{Level::Info};
    Sink sink_{};
    mutable std::mutex mutex_;
};

inline void log_event(StructuredLogger::Level level,
                      std::string_view event,
                      StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace sectionnode::daemon
