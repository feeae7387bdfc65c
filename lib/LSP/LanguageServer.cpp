//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Default handler operations.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/LanguageServer.h"

namespace srcnav::lsp
{
namespace
{

llvm::Expected<llvm::json::Value> nullResult()
{
    return llvm::json::Value(nullptr);
}

}  // namespace

llvm::Error LanguageServer::initialized()
{
    return llvm::Error::success();
}

llvm::Error LanguageServer::shutdown()
{
    return llvm::Error::success();
}

llvm::Error LanguageServer::didChangeWorkspaceFolders(const DidChangeWorkspaceFoldersParams&)
{
    return llvm::Error::success();
}

llvm::Error LanguageServer::didChangeConfiguration(const DidChangeConfigurationParams&)
{
    return llvm::Error::success();
}

llvm::Error LanguageServer::didChangeWatchedFiles(const DidChangeWatchedFilesParams&)
{
    return llvm::Error::success();
}

llvm::Expected<llvm::json::Value> LanguageServer::workspaceSymbol(const WorkspaceSymbolParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::documentLink(const DocumentLinkParams&)
{
    return nullResult();
}

llvm::Error LanguageServer::didOpen(const DidOpenTextDocumentParams&)
{
    return llvm::Error::success();
}

llvm::Error LanguageServer::didChange(const DidChangeTextDocumentParams&)
{
    return llvm::Error::success();
}

llvm::Error LanguageServer::willSave(const WillSaveTextDocumentParams&)
{
    return llvm::Error::success();
}

llvm::Expected<llvm::json::Value> LanguageServer::willSaveWaitUntil(const WillSaveTextDocumentParams&)
{
    return nullResult();
}

llvm::Error LanguageServer::didSave(const DidSaveTextDocumentParams&)
{
    return llvm::Error::success();
}

llvm::Error LanguageServer::didClose(const DidCloseTextDocumentParams&)
{
    return llvm::Error::success();
}

llvm::Expected<llvm::json::Value> LanguageServer::completion(const TextDocumentPositionParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::resolveCompletionItem(const CompletionItem&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::hover(const TextDocumentPositionParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::signatureHelp(const TextDocumentPositionParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::definition(const TextDocumentPositionParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::references(const ReferenceParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::documentSymbol(const DocumentSymbolParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::codeAction(const CodeActionParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::codeLens(const CodeLensParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::resolveCodeLens(const CodeLens&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::prepareRename(const TextDocumentPositionParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::rename(const RenameParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::formatting(const DocumentFormattingParams&)
{
    return nullResult();
}

llvm::Expected<llvm::json::Value> LanguageServer::foldingRange(const FoldingRangeParams&)
{
    return nullResult();
}

void LanguageServer::doAsyncWork() {}

}  // namespace srcnav::lsp
