//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Default language server used by `srcnavd`.
///
/// The overlay server tracks open documents and workspace state and answers
/// navigation queries structurally: it validates the target document and
/// position and returns empty results. Analysis engines replace it with
/// their own `LanguageServer` implementation.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_OVERLAY_SERVER_H
#define SRCNAV_LSP_OVERLAY_SERVER_H

#include "srcnav/LSP/DocumentStore.h"
#include "srcnav/LSP/LanguageClient.h"
#include "srcnav/LSP/LanguageServer.h"
#include "srcnav/Support/Logger.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace srcnav::lsp
{

/// @brief Document-tracking language server with empty query results.
class OverlayServer final : public LanguageServer
{
public:
    /// @brief Creates a server.
    /// @param[in] client Outbound notification sink; must outlive the server.
    /// @param[in] logger Logger for lifecycle and document events.
    OverlayServer(LanguageClient& client, Logger logger);

    llvm::Expected<llvm::json::Value> initialize(const InitializeParams& params) override;
    llvm::Error                       initialized() override;
    llvm::Error                       shutdown() override;

    llvm::Error didChangeWorkspaceFolders(const DidChangeWorkspaceFoldersParams& params) override;
    llvm::Error didChangeConfiguration(const DidChangeConfigurationParams& params) override;
    llvm::Error didChangeWatchedFiles(const DidChangeWatchedFilesParams& params) override;

    llvm::Expected<llvm::json::Value> workspaceSymbol(const WorkspaceSymbolParams& params) override;
    llvm::Expected<llvm::json::Value> documentLink(const DocumentLinkParams& params) override;

    llvm::Error                       didOpen(const DidOpenTextDocumentParams& params) override;
    llvm::Error                       didChange(const DidChangeTextDocumentParams& params) override;
    llvm::Error                       willSave(const WillSaveTextDocumentParams& params) override;
    llvm::Expected<llvm::json::Value> willSaveWaitUntil(const WillSaveTextDocumentParams& params) override;
    llvm::Error                       didSave(const DidSaveTextDocumentParams& params) override;
    llvm::Error                       didClose(const DidCloseTextDocumentParams& params) override;

    llvm::Expected<llvm::json::Value> completion(const TextDocumentPositionParams& params) override;
    llvm::Expected<llvm::json::Value> resolveCompletionItem(const CompletionItem& params) override;
    llvm::Expected<llvm::json::Value> hover(const TextDocumentPositionParams& params) override;
    llvm::Expected<llvm::json::Value> signatureHelp(const TextDocumentPositionParams& params) override;
    llvm::Expected<llvm::json::Value> definition(const TextDocumentPositionParams& params) override;
    llvm::Expected<llvm::json::Value> references(const ReferenceParams& params) override;
    llvm::Expected<llvm::json::Value> documentSymbol(const DocumentSymbolParams& params) override;
    llvm::Expected<llvm::json::Value> codeAction(const CodeActionParams& params) override;
    llvm::Expected<llvm::json::Value> codeLens(const CodeLensParams& params) override;
    llvm::Expected<llvm::json::Value> resolveCodeLens(const CodeLens& params) override;
    llvm::Expected<llvm::json::Value> prepareRename(const TextDocumentPositionParams& params) override;
    llvm::Expected<llvm::json::Value> rename(const RenameParams& params) override;
    llvm::Expected<llvm::json::Value> formatting(const DocumentFormattingParams& params) override;
    llvm::Expected<llvm::json::Value> foldingRange(const FoldingRangeParams& params) override;

    /// @brief Publishes diagnostics for every document changed since the last call.
    void doAsyncWork() override;

    [[nodiscard]] const DocumentStore& documents() const
    {
        return documents_;
    }

    [[nodiscard]] const std::vector<WorkspaceFolder>& workspaceFolders() const
    {
        return workspaceFolders_;
    }

    /// @brief Returns the last `settings` value from `workspace/didChangeConfiguration`.
    [[nodiscard]] const llvm::json::Value& settings() const
    {
        return settings_;
    }

    /// @brief Returns the number of file events received from the client watcher.
    [[nodiscard]] std::uint64_t watchedFileEvents() const
    {
        return watchedFileEvents_;
    }

    [[nodiscard]] bool shutdownRequested() const
    {
        return shutdownRequested_;
    }

private:
    [[nodiscard]] llvm::Expected<const Document*> requireDocument(llvm::StringRef uri) const;
    [[nodiscard]] llvm::Error requirePosition(const TextDocumentIdentifier& document, const Position& position) const;
    [[nodiscard]] llvm::Expected<llvm::json::Value> emptyAt(const TextDocumentIdentifier& document,
                                                            const Position&               position,
                                                            llvm::json::Value             empty) const;
    void publishEmptyDiagnostics(const std::string& uri, std::optional<std::int64_t> version);

    LanguageClient&              client_;
    Logger                       logger_;
    DocumentStore                documents_;
    std::vector<WorkspaceFolder> workspaceFolders_;
    llvm::json::Value            settings_ = nullptr;
    std::uint64_t                watchedFileEvents_{0};
    bool                         shutdownRequested_{false};
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_OVERLAY_SERVER_H
