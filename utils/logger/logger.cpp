#include "logger.hpp"

#include "utils/string/string.hpp"

#include <ctime>
#include <chrono>

namespace IDLX::Utils {

Logger& Logger::GetInstance()
{
    static Logger loggerInstance;
    return loggerInstance;
}

bool Logger::LevelFromName(std::string_view name, Level& outLevel)
{
    struct NamedLevel {
        std::string_view name;
        Level            level;
    };

    static constexpr NamedLevel levels[] = {
        { "trace",   Level::TRACE },
        { "debug",   Level::DEBUG },
        { "info",    Level::INFO  },
        { "warn",    Level::WARN  },
        { "warning", Level::WARN  },
        { "error",   Level::ERR   },
        { "fatal",   Level::FATAL },
        { "none",    Level::NONE  },
    };

    for(const auto& entry : levels) {
        if(CaseInsensitiveCompare(entry.name, name)) {
            outLevel = entry.level;
            return true;
        }
    }

    return false;
}

Logger::LevelMask Logger::MaskFromLevel(Level level)
{
    if(level == Level::NONE)
        return NONE_MASK;

    // Every bit from 'level' up to FATAL
    LevelMask mask = 0;
    for(int i = static_cast<int>(level); i <= static_cast<int>(Level::FATAL); ++i)
        mask |= (1u << i);

    return mask;
}

const char* Logger::LevelToString(Level level) const
{
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERR:   return "ERROR";
        case Level::FATAL: return "FATAL";
        default:           return "UNKNOWN";
    }
}

void Logger::CurrentTimestamp(char* buf, std::size_t len) const
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto t   = system_clock::to_time_t(now);
    auto ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm;
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::snprintf(buf, len, "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, (int)ms.count());
}

} // namespace IDLX::Utils
