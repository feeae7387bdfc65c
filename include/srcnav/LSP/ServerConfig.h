//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Startup configuration for `srcnavd`.
///
/// The configuration is read once from the command line and then handed to
/// the connection and logger set up by the executable.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_SERVER_CONFIG_H
#define SRCNAV_LSP_SERVER_CONFIG_H

#include "srcnav/Support/Logger.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace srcnav::lsp
{

/// @brief Runtime configuration for `srcnavd`.
struct ServerConfig final
{
    /// @brief Pending-message queue capacity.
    std::size_t queueCapacity{10};

    /// @brief Dispatcher poll interval before idle work runs.
    std::chrono::milliseconds pollTimeout{1000};

    /// @brief Minimum level forwarded to the log sink.
    LogLevel logLevel{LogLevel::Info};

    /// @brief Log destination; empty selects standard error.
    std::string logFile;

    /// @brief Print the version and exit.
    bool showVersion{false};

    /// @brief Print usage and exit.
    bool showHelp{false};
};

/// @brief Parses `srcnavd` command-line arguments, excluding the program name.
/// @param[in] args Arguments in order.
/// @param[out] config Configuration updated in place.
/// @return Error naming the offending option or value.
[[nodiscard]] llvm::Error parseServerArguments(llvm::ArrayRef<llvm::StringRef> args, ServerConfig& config);

/// @brief Returns the usage text printed by `--help`.
[[nodiscard]] std::string serverUsage(llvm::StringRef programName);

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_SERVER_CONFIG_H
