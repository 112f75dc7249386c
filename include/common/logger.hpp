#ifndef _COMMON_LOGGER_H_
#define _COMMON_LOGGER_H_

#include "base/defines.hpp"

#include <plog/Log.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace meshrtc {
namespace logging {

enum class Level { // Don't change, it MUST match plog severity
    NONE = 0,
    FATAL = 1,
    ERROR = 2,
    WARNING = 3,
    INFO = 4,
    DEBUG = 5,
    VERBOSE = 6
};

// Return false to let the record fall through to the console.
using LoggingCallback = std::function<bool(Level level, std::string message)>;

// Accepts the lower case names, eg: "warning", std::nullopt otherwise.
MESHRTC_CPP_EXPORT std::optional<Level> LevelFromString(std::string_view level);
MESHRTC_CPP_EXPORT std::string ToString(Level level);

MESHRTC_CPP_EXPORT void InitLogger(Level level, LoggingCallback callback = nullptr);
MESHRTC_CPP_EXPORT void InitLogger(plog::Severity severity, plog::IAppender* appender = nullptr);

} // namespace logging
} // namespace meshrtc

#endif
