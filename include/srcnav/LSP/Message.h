//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Wire message model for JSON-RPC 2.0 traffic.
///
/// A message is classified by which of `id` and `method` it carries:
/// both make a request, only `method` a notification, only `id` a response.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_MESSAGE_H
#define SRCNAV_LSP_MESSAGE_H

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>

namespace srcnav::lsp
{

/// @brief JSON-RPC error object.
struct ErrorPayload final
{
    /// @brief Error code, see `ErrorCode`.
    int code{0};

    /// @brief Human-readable description.
    std::string message;

    /// @brief Optional structured detail; `null` when absent.
    llvm::json::Value data = nullptr;
};

/// @brief Shape of a message as implied by its fields.
enum class MessageKind
{
    Request,
    Notification,
    Response,
};

/// @brief One decoded JSON-RPC message.
struct Message final
{
    std::optional<std::int64_t> id;
    std::optional<std::string>  method;
    llvm::json::Value           params = nullptr;
    llvm::json::Value           result = nullptr;
    std::optional<ErrorPayload> error;

    /// @brief Classifies the message by its `id`/`method` fields.
    /// @return Request, notification, or response.
    [[nodiscard]] MessageKind kind() const;
};

/// @brief Maps a parsed JSON value onto a message.
/// @param[in] value Parsed message body.
/// @return Message, or an error when the body is not an object or `id` is not an integer.
[[nodiscard]] llvm::Expected<Message> messageFromJson(const llvm::json::Value& value);

/// @brief Parses message text.
/// @param[in] text Raw body text.
/// @return Message, or an error for invalid JSON or shape.
[[nodiscard]] llvm::Expected<Message> parseMessage(llvm::StringRef text);

/// @brief Renders a short description (`request 4 textDocument/hover`) for logs.
/// @param[in] message Message to describe.
/// @return Description text.
[[nodiscard]] std::string describeMessage(const Message& message);

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_MESSAGE_H
