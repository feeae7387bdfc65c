//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the injected logger and its stream sink.
///
//===----------------------------------------------------------------------===//

#include "srcnav/Support/Logger.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <ctime>
#include <mutex>

namespace srcnav
{

struct Logger::SharedSink final
{
    std::mutex mutex;
    LogSink    sink;
};

llvm::StringRef logLevelName(const LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

std::optional<LogLevel> parseLogLevel(const llvm::StringRef name)
{
    const std::string lowered = name.lower();
    return llvm::StringSwitch<std::optional<LogLevel>>(lowered)
        .Case("debug", LogLevel::Debug)
        .Case("info", LogLevel::Info)
        .Cases("warning", "warn", LogLevel::Warning)
        .Case("error", LogLevel::Error)
        .Default(std::nullopt);
}

namespace
{

void writeLogLine(llvm::raw_ostream& stream, const LogRecord& record)
{
    const auto        now    = std::chrono::system_clock::now();
    const auto        millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm           local{};
    ::localtime_r(&seconds, &local);

    std::string label = logLevelName(record.level).upper();
    stream << "[srcnavd] " << llvm::left_justify(label, 7) << ' '
           << llvm::format("%02d:%02d:%02d.%03d",
                           local.tm_hour,
                           local.tm_min,
                           local.tm_sec,
                           static_cast<int>(millis))
           << ' ' << record.message << '\n';
    stream.flush();
}

}  // namespace

LogSink makeStreamLogSink(llvm::raw_ostream& stream)
{
    return [&stream](const LogRecord& record) { writeLogLine(stream, record); };
}

LogSink makeStreamLogSink(std::shared_ptr<llvm::raw_ostream> stream)
{
    return [stream = std::move(stream)](const LogRecord& record) { writeLogLine(*stream, record); };
}

Logger::Logger(LogSink sink, const LogLevel minLevel)
    : minLevel_(minLevel)
{
    if (sink)
    {
        sink_       = std::make_shared<SharedSink>();
        sink_->sink = std::move(sink);
    }
}

bool Logger::enabled(const LogLevel level) const
{
    return sink_ != nullptr && static_cast<int>(level) >= static_cast<int>(minLevel_);
}

void Logger::log(const LogLevel level, std::string message) const
{
    if (!enabled(level))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(sink_->mutex);
    sink_->sink(LogRecord{level, std::move(message)});
}

}  // namespace srcnav
