//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Finite table of inbound LSP methods understood by the dispatcher.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_METHOD_H
#define SRCNAV_LSP_METHOD_H

#include "llvm/ADT/StringRef.h"

namespace srcnav::lsp
{

/// @brief Inbound method kinds; `Unknown` covers every unrecognized name.
enum class Method
{
    Initialize,
    Initialized,
    Shutdown,
    Exit,
    CancelRequest,
    DidChangeWorkspaceFolders,
    DidChangeConfiguration,
    DidChangeWatchedFiles,
    WorkspaceSymbol,
    DocumentLink,
    DidOpen,
    DidChange,
    WillSave,
    WillSaveWaitUntil,
    DidSave,
    DidClose,
    Completion,
    ResolveCompletionItem,
    Hover,
    SignatureHelp,
    Definition,
    References,
    DocumentSymbol,
    CodeAction,
    CodeLens,
    ResolveCodeLens,
    PrepareRename,
    Rename,
    Formatting,
    FoldingRange,
    Unknown,
};

/// @brief Expected message shape for a method.
enum class MethodShape
{
    /// @brief Carries an id and expects a response.
    Request,

    /// @brief Carries no id and expects no response.
    Notification,
};

/// @brief Maps a wire method name to its kind.
/// @param[in] name Method name as sent by the client.
/// @return Matching kind, or `Method::Unknown`.
[[nodiscard]] Method methodFromName(llvm::StringRef name);

/// @brief Returns the wire name of a method kind.
/// @param[in] method Method kind.
/// @return Wire name; empty for `Method::Unknown`.
[[nodiscard]] llvm::StringRef methodName(Method method);

/// @brief Returns the shape the protocol defines for a method.
/// @param[in] method Known method kind.
/// @return Request or notification.
[[nodiscard]] MethodShape methodShape(Method method);

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_METHOD_H
