//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Injected logging capability shared by transport and dispatch components.
///
/// A `Logger` is a cheap value handle around a synchronized sink. Each
/// component receives its own copy at construction; there is no global
/// logger state.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_SUPPORT_LOGGER_H
#define SRCNAV_SUPPORT_LOGGER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace llvm
{
class raw_ostream;
}  // namespace llvm

namespace srcnav
{

/// @brief Severity of a log record.
enum class LogLevel
{
    /// @brief Verbose tracing.
    Debug,

    /// @brief Normal lifecycle events.
    Info,

    /// @brief Recoverable protocol or handler problems.
    Warning,

    /// @brief Failures that end a component.
    Error,
};

/// @brief One emitted log record.
struct LogRecord final
{
    /// @brief Record severity.
    LogLevel level{LogLevel::Info};

    /// @brief Formatted message text.
    std::string message;
};

/// @brief Sink callback receiving records that pass the level filter.
using LogSink = std::function<void(const LogRecord&)>;

/// @brief Returns the lower-case name of a level (`debug`, `info`, ...).
/// @param[in] level Log level.
/// @return Stable level name.
[[nodiscard]] llvm::StringRef logLevelName(LogLevel level);

/// @brief Parses a level name as accepted by `--log-level`.
/// @param[in] name Level name, case-insensitive. `warn` is accepted for `warning`.
/// @return Parsed level, or empty when the name is unknown.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(llvm::StringRef name);

/// @brief Builds a sink that writes one timestamped line per record.
/// @param[in] stream Destination stream. Must outlive every logger using the sink.
/// @return Sink writing `[srcnavd] <LEVEL> <HH:MM:SS.mmm> <message>` lines.
[[nodiscard]] LogSink makeStreamLogSink(llvm::raw_ostream& stream);

/// @brief Builds a sink that owns its destination stream.
///
/// The stream stays open while any logger copy holding the sink is alive,
/// including copies held by detached threads.
///
/// @param[in] stream Destination stream.
/// @return Sink writing the same lines as the borrowing overload.
[[nodiscard]] LogSink makeStreamLogSink(std::shared_ptr<llvm::raw_ostream> stream);

/// @brief Value-type logging handle with level filtering.
class Logger final
{
public:
    /// @brief Creates a logger that discards everything.
    Logger() = default;

    /// @brief Creates a logger forwarding records at or above `minLevel`.
    /// @param[in] sink Destination sink. Calls are serialized by the logger.
    /// @param[in] minLevel Minimum forwarded level.
    explicit Logger(LogSink sink, LogLevel minLevel = LogLevel::Info);

    /// @brief Returns whether records at `level` reach the sink.
    /// @param[in] level Level to test.
    /// @return `true` when enabled.
    [[nodiscard]] bool enabled(LogLevel level) const;

    /// @brief Emits a pre-formatted record.
    /// @param[in] level Record level.
    /// @param[in] message Message text.
    void log(LogLevel level, std::string message) const;

    template <typename... Ts>
    void debug(const char* fmt, Ts&&... values) const
    {
        emit(LogLevel::Debug, fmt, std::forward<Ts>(values)...);
    }

    template <typename... Ts>
    void info(const char* fmt, Ts&&... values) const
    {
        emit(LogLevel::Info, fmt, std::forward<Ts>(values)...);
    }

    template <typename... Ts>
    void warning(const char* fmt, Ts&&... values) const
    {
        emit(LogLevel::Warning, fmt, std::forward<Ts>(values)...);
    }

    template <typename... Ts>
    void error(const char* fmt, Ts&&... values) const
    {
        emit(LogLevel::Error, fmt, std::forward<Ts>(values)...);
    }

private:
    struct SharedSink;

    template <typename... Ts>
    void emit(LogLevel level, const char* fmt, Ts&&... values) const
    {
        if (!enabled(level))
        {
            return;
        }
        log(level, llvm::formatv(fmt, std::forward<Ts>(values)...).str());
    }

    std::shared_ptr<SharedSink> sink_;
    LogLevel                    minLevel_{LogLevel::Info};
};

}  // namespace srcnav

#endif  // SRCNAV_SUPPORT_LOGGER_H
