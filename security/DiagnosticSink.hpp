#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace security {

    enum class Level { Debug, Info, Warn, Error };

    inline const char* level_to_string(Level level) {
        switch (level) {
            case Level::Debug: return "DEBUG";
            case Level::Info: return "INFO";
            case Level::Warn: return "WARN";
            case Level::Error: return "ERROR";
        }
        return "INFO";
    }

    inline std::optional<Level> level_from_string(std::string_view str) {
        if (str == "DEBUG") return Level::Debug;
        if (str == "INFO") return Level::Info;
        if (str == "WARN") return Level::Warn;
        if (str == "ERROR") return Level::Error;
        return std::nullopt;
    }

    // Receives diagnostic records from the pipeline. Implementations serialize
    // concurrent callers themselves and must not throw or block indefinitely.
    class IDiagnosticSink {
        public:
            virtual void record(Level level, const std::string& message) noexcept = 0;
            virtual void flush() noexcept {}
            virtual ~IDiagnosticSink() = default;
        };

    // Discards everything. Used where records would only distort measurements.
    class NullSink : public IDiagnosticSink {
        public:
            void record(Level, const std::string&) noexcept override {}
        };

} // namespace security
