//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Handler contract the dispatcher routes inbound messages to.
///
/// Every operation runs on the dispatcher thread, one at a time, so
/// implementations may keep their state unsynchronized. Request operations
/// return the `result` value or an error that becomes an error response.
/// Notification operations return an error that is only logged.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_LANGUAGE_SERVER_H
#define SRCNAV_LSP_LANGUAGE_SERVER_H

#include "srcnav/LSP/Protocol.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace srcnav::lsp
{

/// @brief Abstract language-server handler.
///
/// Defaults answer requests with `null`, accept notifications and do no idle
/// work, so implementations override only what they support.
class LanguageServer
{
public:
    virtual ~LanguageServer() = default;

    /// @brief Handles `initialize`.
    /// @param[in] params Client process, workspace, and capability information.
    /// @return `InitializeResult` object.
    virtual llvm::Expected<llvm::json::Value> initialize(const InitializeParams& params) = 0;

    virtual llvm::Error initialized();

    /// @brief Called when `shutdown` arrives, before the `null` response is sent.
    virtual llvm::Error shutdown();

    virtual llvm::Error didChangeWorkspaceFolders(const DidChangeWorkspaceFoldersParams& params);
    virtual llvm::Error didChangeConfiguration(const DidChangeConfigurationParams& params);
    virtual llvm::Error didChangeWatchedFiles(const DidChangeWatchedFilesParams& params);

    virtual llvm::Expected<llvm::json::Value> workspaceSymbol(const WorkspaceSymbolParams& params);
    virtual llvm::Expected<llvm::json::Value> documentLink(const DocumentLinkParams& params);

    virtual llvm::Error didOpen(const DidOpenTextDocumentParams& params);
    virtual llvm::Error didChange(const DidChangeTextDocumentParams& params);
    virtual llvm::Error willSave(const WillSaveTextDocumentParams& params);
    virtual llvm::Expected<llvm::json::Value> willSaveWaitUntil(const WillSaveTextDocumentParams& params);
    virtual llvm::Error didSave(const DidSaveTextDocumentParams& params);
    virtual llvm::Error didClose(const DidCloseTextDocumentParams& params);

    virtual llvm::Expected<llvm::json::Value> completion(const TextDocumentPositionParams& params);
    virtual llvm::Expected<llvm::json::Value> resolveCompletionItem(const CompletionItem& params);
    virtual llvm::Expected<llvm::json::Value> hover(const TextDocumentPositionParams& params);
    virtual llvm::Expected<llvm::json::Value> signatureHelp(const TextDocumentPositionParams& params);
    virtual llvm::Expected<llvm::json::Value> definition(const TextDocumentPositionParams& params);
    virtual llvm::Expected<llvm::json::Value> references(const ReferenceParams& params);
    virtual llvm::Expected<llvm::json::Value> documentSymbol(const DocumentSymbolParams& params);
    virtual llvm::Expected<llvm::json::Value> codeAction(const CodeActionParams& params);
    virtual llvm::Expected<llvm::json::Value> codeLens(const CodeLensParams& params);
    virtual llvm::Expected<llvm::json::Value> resolveCodeLens(const CodeLens& params);
    virtual llvm::Expected<llvm::json::Value> prepareRename(const TextDocumentPositionParams& params);
    virtual llvm::Expected<llvm::json::Value> rename(const RenameParams& params);
    virtual llvm::Expected<llvm::json::Value> formatting(const DocumentFormattingParams& params);
    virtual llvm::Expected<llvm::json::Value> foldingRange(const FoldingRangeParams& params);

    /// @brief Idle hook, invoked each time the dispatcher's poll times out.
    ///
    /// Must return promptly; it runs on the dispatcher thread and delays the
    /// next message while it runs.
    virtual void doAsyncWork();
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_LANGUAGE_SERVER_H
