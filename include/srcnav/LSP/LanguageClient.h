//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Outbound side of the connection: responses and server-initiated
/// notifications.
///
/// `LanguageClient` is the capability handed to language-server
/// implementations. `JsonRpcClient` implements it on top of the framed
/// transport and additionally writes responses for the dispatcher.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_LANGUAGE_CLIENT_H
#define SRCNAV_LSP_LANGUAGE_CLIENT_H

#include "srcnav/LSP/JsonRpcIO.h"
#include "srcnav/LSP/Message.h"
#include "srcnav/LSP/Protocol.h"
#include "srcnav/Support/Logger.h"

#include "llvm/Support/JSON.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace srcnav::lsp
{

/// @brief Notifications a language server may push to the editor.
class LanguageClient
{
public:
    virtual ~LanguageClient() = default;

    /// @brief Sends `textDocument/publishDiagnostics`.
    virtual void publishDiagnostics(const PublishDiagnosticsParams& params) = 0;

    /// @brief Sends `window/showMessage`.
    virtual void showMessage(const ShowMessageParams& params) = 0;

    /// @brief Sends `client/registerCapability` with a freshly generated registration id.
    /// @param[in] method Method being registered.
    /// @param[in] options Registration options.
    virtual void registerCapability(llvm::StringRef method, llvm::json::Value options) = 0;

    /// @brief Sends an arbitrary notification.
    /// @param[in] method Notification method.
    /// @param[in] params Notification params.
    virtual void customNotification(llvm::StringRef method, llvm::json::Value params) = 0;
};

/// @brief Returns a random UUID-v4 string used for capability registrations.
[[nodiscard]] std::string generateRegistrationId();

/// @brief Encodes `{"jsonrpc":"2.0","id":<id>,"result":<result>}` with keys in that order.
[[nodiscard]] std::string encodeResponse(std::int64_t id, const llvm::json::Value& result);

/// @brief Encodes `{"jsonrpc":"2.0","id":<id>,"error":{...}}` with keys in that order.
[[nodiscard]] std::string encodeErrorResponse(std::int64_t id, const ErrorPayload& error);

/// @brief Encodes `{"jsonrpc":"2.0","method":<method>,"params":<params>}` with keys in that order.
[[nodiscard]] std::string encodeNotification(llvm::StringRef method, const llvm::json::Value& params);

/// @brief Client sink writing framed JSON-RPC messages to a transport.
class JsonRpcClient final : public LanguageClient
{
public:
    /// @brief Creates a sink over a transport.
    /// @param[in] transport Framed transport; must outlive the sink.
    /// @param[in] logger Logger for write failures and traces.
    JsonRpcClient(JsonRpcStdioTransport& transport, Logger logger);

    /// @brief Sends a successful response.
    /// @param[in] id Request id.
    /// @param[in] result Result value; `null` for empty results.
    void respond(std::int64_t id, const llvm::json::Value& result);

    /// @brief Sends an error response.
    /// @param[in] id Request id.
    /// @param[in] error Error payload.
    void respondError(std::int64_t id, const ErrorPayload& error);

    /// @brief Sends a notification.
    /// @param[in] method Notification method.
    /// @param[in] params Notification params; `null` when absent.
    void notify(llvm::StringRef method, const llvm::json::Value& params);

    void publishDiagnostics(const PublishDiagnosticsParams& params) override;
    void showMessage(const ShowMessageParams& params) override;
    void registerCapability(llvm::StringRef method, llvm::json::Value options) override;
    void customNotification(llvm::StringRef method, llvm::json::Value params) override;

    /// @brief Returns the number of frames that failed to write.
    [[nodiscard]] std::uint64_t failedWrites() const
    {
        return failedWrites_.load(std::memory_order_relaxed);
    }

private:
    void write(const std::string& payload, llvm::StringRef what);

    JsonRpcStdioTransport&     transport_;
    Logger                     logger_;
    std::atomic<std::uint64_t> failedWrites_{0};
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_LANGUAGE_CLIENT_H
