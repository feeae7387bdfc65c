//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the default document-tracking language server.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/OverlayServer.h"

#include "srcnav/Version.h"

#include <algorithm>
#include <utility>

namespace srcnav::lsp
{
namespace
{

llvm::json::Value serverCapabilities()
{
    return llvm::json::Object{
        {"textDocumentSync",
         llvm::json::Object{
             {"openClose", true},
             {"change", 1},
             {"willSave", true},
             {"willSaveWaitUntil", true},
             {"save", llvm::json::Object{{"includeText", true}}},
         }},
        {"hoverProvider", true},
        {"completionProvider", llvm::json::Object{{"resolveProvider", true}, {"triggerCharacters", llvm::json::Array{"."}}}},
        {"signatureHelpProvider", llvm::json::Object{{"triggerCharacters", llvm::json::Array{"(", ","}}}},
        {"definitionProvider", true},
        {"referencesProvider", true},
        {"documentSymbolProvider", true},
        {"workspaceSymbolProvider", true},
        {"codeActionProvider", true},
        {"codeLensProvider", llvm::json::Object{{"resolveProvider", true}}},
        {"renameProvider", llvm::json::Object{{"prepareProvider", true}}},
        {"documentFormattingProvider", true},
        {"foldingRangeProvider", true},
        {"documentLinkProvider", llvm::json::Object{{"resolveProvider", false}}},
        {"workspace",
         llvm::json::Object{
             {"workspaceFolders", llvm::json::Object{{"supported", true}, {"changeNotifications", true}}}}},
    };
}

WorkspaceFolder folderFromRootUri(const llvm::StringRef uri)
{
    llvm::StringRef name = uri.rtrim('/').rsplit('/').second;
    if (name.empty())
    {
        name = uri;
    }
    return WorkspaceFolder{uri.str(), name.str()};
}

}  // namespace

OverlayServer::OverlayServer(LanguageClient& client, Logger logger)
    : client_(client)
    , logger_(std::move(logger))
{
}

llvm::Expected<llvm::json::Value> OverlayServer::initialize(const InitializeParams& params)
{
    workspaceFolders_ = params.workspaceFolders;
    if (workspaceFolders_.empty() && params.rootUri)
    {
        workspaceFolders_.push_back(folderFromRootUri(*params.rootUri));
    }
    logger_.info("Initialized with {0} workspace folder(s)", workspaceFolders_.size());

    llvm::json::Object result;
    result["capabilities"] = serverCapabilities();
    result["serverInfo"]   = llvm::json::Object{{"name", "srcnavd"}, {"version", kVersionString}};
    return llvm::json::Value(std::move(result));
}

llvm::Error OverlayServer::initialized()
{
    client_.registerCapability("workspace/didChangeWatchedFiles",
                               llvm::json::Object{
                                   {"watchers", llvm::json::Array{llvm::json::Object{{"globPattern", "**/*"}}}},
                               });
    return llvm::Error::success();
}

llvm::Error OverlayServer::shutdown()
{
    shutdownRequested_ = true;
    logger_.info("Shutdown requested with {0} open document(s)", documents_.size());
    return llvm::Error::success();
}

llvm::Error OverlayServer::didChangeWorkspaceFolders(const DidChangeWorkspaceFoldersParams& params)
{
    for (const WorkspaceFolder& removed : params.removed)
    {
        workspaceFolders_.erase(std::remove_if(workspaceFolders_.begin(),
                                               workspaceFolders_.end(),
                                               [&](const WorkspaceFolder& folder) { return folder.uri == removed.uri; }),
                                workspaceFolders_.end());
    }
    for (const WorkspaceFolder& added : params.added)
    {
        const bool known = std::any_of(workspaceFolders_.begin(),
                                       workspaceFolders_.end(),
                                       [&](const WorkspaceFolder& folder) { return folder.uri == added.uri; });
        if (!known)
        {
            workspaceFolders_.push_back(added);
        }
    }
    return llvm::Error::success();
}

llvm::Error OverlayServer::didChangeConfiguration(const DidChangeConfigurationParams& params)
{
    settings_ = params.settings;
    return llvm::Error::success();
}

llvm::Error OverlayServer::didChangeWatchedFiles(const DidChangeWatchedFilesParams& params)
{
    watchedFileEvents_ += params.changes.size();
    for (const FileEvent& event : params.changes)
    {
        logger_.debug("Watched file {0} changed ({1})", event.uri, static_cast<int>(event.type));
    }
    return llvm::Error::success();
}

llvm::Expected<llvm::json::Value> OverlayServer::workspaceSymbol(const WorkspaceSymbolParams&)
{
    return llvm::json::Value(llvm::json::Array{});
}

llvm::Expected<llvm::json::Value> OverlayServer::documentLink(const DocumentLinkParams& params)
{
    llvm::Expected<const Document*> document = requireDocument(params.textDocument.uri);
    if (!document)
    {
        return document.takeError();
    }
    return llvm::json::Value(llvm::json::Array{});
}

llvm::Error OverlayServer::didOpen(const DidOpenTextDocumentParams& params)
{
    documents_.open(params.textDocument);
    logger_.debug("Opened {0} (version {1})", params.textDocument.uri, params.textDocument.version);
    return llvm::Error::success();
}

llvm::Error OverlayServer::didChange(const DidChangeTextDocumentParams& params)
{
    return documents_.applyChanges(params.textDocument, params.contentChanges);
}

llvm::Error OverlayServer::willSave(const WillSaveTextDocumentParams& params)
{
    llvm::Expected<const Document*> document = requireDocument(params.textDocument.uri);
    if (!document)
    {
        return document.takeError();
    }
    return llvm::Error::success();
}

llvm::Expected<llvm::json::Value> OverlayServer::willSaveWaitUntil(const WillSaveTextDocumentParams& params)
{
    llvm::Expected<const Document*> document = requireDocument(params.textDocument.uri);
    if (!document)
    {
        return document.takeError();
    }
    return llvm::json::Value(llvm::json::Array{});
}

llvm::Error OverlayServer::didSave(const DidSaveTextDocumentParams& params)
{
    llvm::Expected<const Document*> document = requireDocument(params.textDocument.uri);
    if (!document)
    {
        return document.takeError();
    }
    if (params.text && !documents_.replaceText(params.textDocument.uri, *params.text))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "document not open: %s",
                                       params.textDocument.uri.c_str());
    }
    return llvm::Error::success();
}

llvm::Error OverlayServer::didClose(const DidCloseTextDocumentParams& params)
{
    if (!documents_.close(params.textDocument.uri))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "document not open: %s",
                                       params.textDocument.uri.c_str());
    }
    publishEmptyDiagnostics(params.textDocument.uri, std::nullopt);
    return llvm::Error::success();
}

llvm::Expected<llvm::json::Value> OverlayServer::completion(const TextDocumentPositionParams& params)
{
    return emptyAt(params.textDocument, params.position, llvm::json::Array{});
}

llvm::Expected<llvm::json::Value> OverlayServer::resolveCompletionItem(const CompletionItem& params)
{
    llvm::json::Object item{{"label", params.label}};
    if (params.kind)
    {
        item["kind"] = *params.kind;
    }
    if (params.detail)
    {
        item["detail"] = *params.detail;
    }
    if (!params.data.getAsNull())
    {
        item["data"] = params.data;
    }
    return llvm::json::Value(std::move(item));
}

llvm::Expected<llvm::json::Value> OverlayServer::hover(const TextDocumentPositionParams& params)
{
    return emptyAt(params.textDocument, params.position, nullptr);
}

llvm::Expected<llvm::json::Value> OverlayServer::signatureHelp(const TextDocumentPositionParams& params)
{
    return emptyAt(params.textDocument, params.position, nullptr);
}

llvm::Expected<llvm::json::Value> OverlayServer::definition(const TextDocumentPositionParams& params)
{
    return emptyAt(params.textDocument, params.position, llvm::json::Array{});
}

llvm::Expected<llvm::json::Value> OverlayServer::references(const ReferenceParams& params)
{
    return emptyAt(params.textDocument, params.position, llvm::json::Array{});
}

llvm::Expected<llvm::json::Value> OverlayServer::documentSymbol(const DocumentSymbolParams& params)
{
    llvm::Expected<const Document*> document = requireDocument(params.textDocument.uri);
    if (!document)
    {
        return document.takeError();
    }
    return llvm::json::Value(llvm::json::Array{});
}

llvm::Expected<llvm::json::Value> OverlayServer::codeAction(const CodeActionParams& params)
{
    if (llvm::Error error = requirePosition(params.textDocument, params.range.start))
    {
        return std::move(error);
    }
    return emptyAt(params.textDocument, params.range.end, llvm::json::Array{});
}

llvm::Expected<llvm::json::Value> OverlayServer::codeLens(const CodeLensParams& params)
{
    llvm::Expected<const Document*> document = requireDocument(params.textDocument.uri);
    if (!document)
    {
        return document.takeError();
    }
    return llvm::json::Value(llvm::json::Array{});
}

llvm::Expected<llvm::json::Value> OverlayServer::resolveCodeLens(const CodeLens& params)
{
    llvm::json::Object lens{{"range", toJSON(params.range)}};
    if (!params.command.getAsNull())
    {
        lens["command"] = params.command;
    }
    if (!params.data.getAsNull())
    {
        lens["data"] = params.data;
    }
    return llvm::json::Value(std::move(lens));
}

llvm::Expected<llvm::json::Value> OverlayServer::prepareRename(const TextDocumentPositionParams& params)
{
    return emptyAt(params.textDocument, params.position, nullptr);
}

llvm::Expected<llvm::json::Value> OverlayServer::rename(const RenameParams& params)
{
    if (params.newName.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "new name must not be empty");
    }
    return emptyAt(params.textDocument, params.position, nullptr);
}

llvm::Expected<llvm::json::Value> OverlayServer::formatting(const DocumentFormattingParams& params)
{
    llvm::Expected<const Document*> document = requireDocument(params.textDocument.uri);
    if (!document)
    {
        return document.takeError();
    }
    return llvm::json::Value(llvm::json::Array{});
}

llvm::Expected<llvm::json::Value> OverlayServer::foldingRange(const FoldingRangeParams& params)
{
    llvm::Expected<const Document*> document = requireDocument(params.textDocument.uri);
    if (!document)
    {
        return document.takeError();
    }
    return llvm::json::Value(llvm::json::Array{});
}

void OverlayServer::doAsyncWork()
{
    for (const std::string& uri : documents_.takeDirty())
    {
        const Document* document = documents_.lookup(uri);
        if (!document)
        {
            continue;
        }
        publishEmptyDiagnostics(uri, document->version);
    }
}

llvm::Expected<const Document*> OverlayServer::requireDocument(const llvm::StringRef uri) const
{
    const Document* document = documents_.lookup(uri);
    if (!document)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "document not open: %s", uri.str().c_str());
    }
    return document;
}

llvm::Error OverlayServer::requirePosition(const TextDocumentIdentifier& document, const Position& position) const
{
    llvm::Expected<const Document*> target = requireDocument(document.uri);
    if (!target)
    {
        return target.takeError();
    }
    llvm::Expected<std::size_t> offset = offsetOfPosition((*target)->text, position);
    if (!offset)
    {
        return offset.takeError();
    }
    return llvm::Error::success();
}

llvm::Expected<llvm::json::Value> OverlayServer::emptyAt(const TextDocumentIdentifier& document,
                                                         const Position&               position,
                                                         llvm::json::Value             empty) const
{
    if (llvm::Error error = requirePosition(document, position))
    {
        return std::move(error);
    }
    return std::move(empty);
}

void OverlayServer::publishEmptyDiagnostics(const std::string& uri, const std::optional<std::int64_t> version)
{
    PublishDiagnosticsParams params;
    params.uri     = uri;
    params.version = version;
    client_.publishDiagnostics(params);
}

}  // namespace srcnav::lsp
