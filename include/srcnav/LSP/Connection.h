//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// One client connection: a reader thread feeding a dispatcher.
///
/// `run()` owns the lifecycle. The reader thread decodes frames into the
/// pending queue while the calling thread dispatches them. When the
/// dispatcher exits the queue is closed and the reader is joined, or detached
/// when it is still blocked on input after a short grace period.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_CONNECTION_H
#define SRCNAV_LSP_CONNECTION_H

#include "srcnav/LSP/JsonRpcIO.h"
#include "srcnav/LSP/LanguageClient.h"
#include "srcnav/LSP/LanguageServer.h"
#include "srcnav/LSP/ServerConfig.h"
#include "srcnav/LSP/Telemetry.h"
#include "srcnav/Support/Logger.h"

#include <chrono>
#include <functional>
#include <memory>
#include <utility>

namespace srcnav::lsp
{

/// @brief Creates the handler for a connection.
using ServerFactory = std::function<std::unique_ptr<LanguageServer>(LanguageClient& client, const Logger& logger)>;

/// @brief Time `run()` waits for the reader thread after the dispatcher exits.
inline constexpr std::chrono::milliseconds ReaderJoinGrace{200};

/// @brief Wires transport, queue, reader thread, and dispatcher together.
class Connection final
{
public:
    /// @brief Creates a connection.
    /// @param[in] transport Framed transport. Shared with the reader thread.
    /// @param[in] config Queue and poll settings.
    /// @param[in] logger Logger handed to every component.
    Connection(std::shared_ptr<JsonRpcStdioTransport> transport, ServerConfig config, Logger logger);

    /// @brief Serves the connection until `exit` or end of input.
    /// @param[in] factory Creates the handler once the client sink exists.
    /// @return Process exit code: 0 after `shutdown` then `exit`, otherwise 1.
    [[nodiscard]] int run(const ServerFactory& factory);

    /// @brief Returns dispatch metrics collected by `run()`.
    [[nodiscard]] const Telemetry& telemetry() const
    {
        return telemetry_;
    }

    /// @brief Installs a sink receiving each dispatch sample.
    void setMetricSink(RequestMetricSink sink)
    {
        telemetry_.setSink(std::move(sink));
    }

private:
    std::shared_ptr<JsonRpcStdioTransport> transport_;
    ServerConfig                           config_;
    Logger                                 logger_;
    Telemetry                              telemetry_;
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_CONNECTION_H
