#include "common/logger.hpp"

// plog
#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Formatters/FuncMessageFormatter.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Logger.h>

#include <iostream>
#include <memory>
#include <mutex>
#include <utility>

namespace meshrtc {
namespace logging {
namespace {

struct CallbackAppender : public plog::IAppender {
    LoggingCallback callback;

    void write(const plog::Record& record) override {
        const auto severity = record.getSeverity();
        auto formatted = plog::FuncMessageFormatter::format(record);
        if (!formatted.empty()) {
            formatted.pop_back(); // remove newline
        }
        if (!callback || !callback(static_cast<Level>(severity), formatted)) {
            std::cout << plog::severityToString(severity) << " " << formatted << std::endl;
        }
    }
};

constexpr std::pair<Level, const char*> kLevelNames[] = {
    {Level::NONE, "none"},
    {Level::FATAL, "fatal"},
    {Level::ERROR, "error"},
    {Level::WARNING, "warning"},
    {Level::INFO, "info"},
    {Level::DEBUG, "debug"},
    {Level::VERBOSE, "verbose"}
};

} // namespace

std::optional<Level> LevelFromString(std::string_view level) {
    for (const auto& [value, name] : kLevelNames) {
        if (level == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string ToString(Level level) {
    for (const auto& [value, name] : kLevelNames) {
        if (level == value) {
            return name;
        }
    }
    return "unknown";
}

void InitLogger(Level level, LoggingCallback callback) {
    static std::unique_ptr<CallbackAppender> appender;
    const auto severity = static_cast<plog::Severity>(level);
    if (appender) {
        // Already installed, only swap the callback and update the severity.
        appender->callback = std::move(callback);
        InitLogger(severity, nullptr);
    } else if (callback) {
        appender = std::make_unique<CallbackAppender>();
        appender->callback = std::move(callback);
        InitLogger(severity, appender.get());
    } else {
        InitLogger(severity, nullptr);
    }
}

void InitLogger(plog::Severity severity, plog::IAppender* appender) {
    static plog::ColorConsoleAppender<plog::TxtFormatter> console_appender;
    static plog::Logger<0>* logger = nullptr;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    if (!logger) {
        logger = &plog::init(severity, appender ? appender : &console_appender);
        PLOG_DEBUG << "Logger initialized";
    } else {
        logger->setMaxSeverity(severity);
        if (appender) {
            logger->addAppender(appender);
        }
    }
}

} // namespace logging
} // namespace meshrtc
