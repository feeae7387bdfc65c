//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Single-threaded control loop routing queued messages to a language server.
///
/// The dispatcher owns the connection lifecycle:
///
/// - `Running` until `shutdown` arrives.
/// - `ShuttingDown` afterwards; only `shutdown` and `exit` are still honoured.
/// - `Exited` once `exit` is dispatched or the input stream closes.
///
/// When the queue stays empty for a full poll interval the handler's idle
/// hook runs once.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_DISPATCHER_H
#define SRCNAV_LSP_DISPATCHER_H

#include "srcnav/LSP/LanguageClient.h"
#include "srcnav/LSP/LanguageServer.h"
#include "srcnav/LSP/MessageQueue.h"
#include "srcnav/LSP/Method.h"
#include "srcnav/LSP/Telemetry.h"
#include "srcnav/Support/Logger.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>

namespace srcnav::lsp
{

/// @brief Default queue poll interval.
inline constexpr std::chrono::milliseconds DefaultPollTimeout{1000};

/// @brief Lifecycle state of a dispatcher.
enum class DispatcherState
{
    Running,
    ShuttingDown,
    Exited,
};

/// @brief Returns a printable name for a dispatcher state.
[[nodiscard]] llvm::StringRef dispatcherStateName(DispatcherState state);

/// @brief Routes queued messages to handler operations and writes replies.
class Dispatcher final
{
public:
    /// @brief Creates a dispatcher. Every collaborator must outlive it.
    /// @param[in] queue Source of pending entries.
    /// @param[in] server Handler receiving routed messages.
    /// @param[in] client Sink for responses.
    /// @param[in] telemetry Recorder for routed messages.
    /// @param[in] logger Logger for routing decisions and failures.
    /// @param[in] pollTimeout Wait before the idle hook runs.
    Dispatcher(MessageQueue&             queue,
               LanguageServer&           server,
               JsonRpcClient&            client,
               Telemetry&                telemetry,
               Logger                    logger,
               std::chrono::milliseconds pollTimeout = DefaultPollTimeout);

    /// @brief Runs until the dispatcher reaches `Exited`.
    void run();

    /// @brief Performs one loop iteration: a poll followed by dispatch or idle work.
    /// @return `false` once the dispatcher has exited.
    [[nodiscard]] bool step();

    /// @brief Dispatches a single message immediately.
    /// @param[in] message Message to route.
    void dispatch(const Message& message);

    /// @brief Returns the current lifecycle state.
    [[nodiscard]] DispatcherState state() const
    {
        return state_;
    }

    /// @brief Returns the process exit code: 0 after an orderly shutdown, 1 otherwise.
    [[nodiscard]] int exitCode() const
    {
        return shutdownReceived_ ? 0 : 1;
    }

private:
    [[nodiscard]] llvm::Expected<llvm::json::Value> invoke(Method method, const Message& message);
    [[nodiscard]] llvm::Expected<llvm::json::Value> invokeGuarded(Method method, const Message& message);
    void                                            runIdleWork();
    void                                            rejectDuringShutdown(const Message& message);

    MessageQueue&             queue_;
    LanguageServer&           server_;
    JsonRpcClient&            client_;
    Telemetry&                telemetry_;
    Logger                    logger_;
    std::chrono::milliseconds pollTimeout_;
    DispatcherState           state_{DispatcherState::Running};
    bool                      shutdownReceived_{false};
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_DISPATCHER_H
