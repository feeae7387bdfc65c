//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the method-name table.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/Method.h"

#include "llvm/ADT/StringSwitch.h"

namespace srcnav::lsp
{

Method methodFromName(const llvm::StringRef name)
{
    return llvm::StringSwitch<Method>(name)
        .Case("initialize", Method::Initialize)
        .Case("initialized", Method::Initialized)
        .Case("shutdown", Method::Shutdown)
        .Case("exit", Method::Exit)
        .Case("$/cancelRequest", Method::CancelRequest)
        .Case("workspace/didChangeWorkspaceFolders", Method::DidChangeWorkspaceFolders)
        .Case("workspace/didChangeConfiguration", Method::DidChangeConfiguration)
        .Case("workspace/didChangeWatchedFiles", Method::DidChangeWatchedFiles)
        .Case("workspace/symbol", Method::WorkspaceSymbol)
        .Case("textDocument/documentLink", Method::DocumentLink)
        .Case("textDocument/didOpen", Method::DidOpen)
        .Case("textDocument/didChange", Method::DidChange)
        .Case("textDocument/willSave", Method::WillSave)
        .Case("textDocument/willSaveWaitUntil", Method::WillSaveWaitUntil)
        .Case("textDocument/didSave", Method::DidSave)
        .Case("textDocument/didClose", Method::DidClose)
        .Case("textDocument/completion", Method::Completion)
        .Case("completionItem/resolve", Method::ResolveCompletionItem)
        .Case("textDocument/hover", Method::Hover)
        .Case("textDocument/signatureHelp", Method::SignatureHelp)
        .Case("textDocument/definition", Method::Definition)
        .Case("textDocument/references", Method::References)
        .Case("textDocument/documentSymbol", Method::DocumentSymbol)
        .Case("textDocument/codeAction", Method::CodeAction)
        .Case("textDocument/codeLens", Method::CodeLens)
        .Case("codeLens/resolve", Method::ResolveCodeLens)
        .Case("textDocument/prepareRename", Method::PrepareRename)
        .Case("textDocument/rename", Method::Rename)
        .Case("textDocument/formatting", Method::Formatting)
        .Case("textDocument/foldingRange", Method::FoldingRange)
        .Default(Method::Unknown);
}

llvm::StringRef methodName(const Method method)
{
    switch (method)
    {
    case Method::Initialize:
        return "initialize";
    case Method::Initialized:
        return "initialized";
    case Method::Shutdown:
        return "shutdown";
    case Method::Exit:
        return "exit";
    case Method::CancelRequest:
        return "$/cancelRequest";
    case Method::DidChangeWorkspaceFolders:
        return "workspace/didChangeWorkspaceFolders";
    case Method::DidChangeConfiguration:
        return "workspace/didChangeConfiguration";
    case Method::DidChangeWatchedFiles:
        return "workspace/didChangeWatchedFiles";
    case Method::WorkspaceSymbol:
        return "workspace/symbol";
    case Method::DocumentLink:
        return "textDocument/documentLink";
    case Method::DidOpen:
        return "textDocument/didOpen";
    case Method::DidChange:
        return "textDocument/didChange";
    case Method::WillSave:
        return "textDocument/willSave";
    case Method::WillSaveWaitUntil:
        return "textDocument/willSaveWaitUntil";
    case Method::DidSave:
        return "textDocument/didSave";
    case Method::DidClose:
        return "textDocument/didClose";
    case Method::Completion:
        return "textDocument/completion";
    case Method::ResolveCompletionItem:
        return "completionItem/resolve";
    case Method::Hover:
        return "textDocument/hover";
    case Method::SignatureHelp:
        return "textDocument/signatureHelp";
    case Method::Definition:
        return "textDocument/definition";
    case Method::References:
        return "textDocument/references";
    case Method::DocumentSymbol:
        return "textDocument/documentSymbol";
    case Method::CodeAction:
        return "textDocument/codeAction";
    case Method::CodeLens:
        return "textDocument/codeLens";
    case Method::ResolveCodeLens:
        return "codeLens/resolve";
    case Method::PrepareRename:
        return "textDocument/prepareRename";
    case Method::Rename:
        return "textDocument/rename";
    case Method::Formatting:
        return "textDocument/formatting";
    case Method::FoldingRange:
        return "textDocument/foldingRange";
    case Method::Unknown:
        return "";
    }
    return "";
}

MethodShape methodShape(const Method method)
{
    switch (method)
    {
    case Method::Initialized:
    case Method::Exit:
    case Method::CancelRequest:
    case Method::DidChangeWorkspaceFolders:
    case Method::DidChangeConfiguration:
    case Method::DidChangeWatchedFiles:
    case Method::DidOpen:
    case Method::DidChange:
    case Method::WillSave:
    case Method::DidSave:
    case Method::DidClose:
    case Method::Unknown:
        return MethodShape::Notification;
    case Method::Initialize:
    case Method::Shutdown:
    case Method::WorkspaceSymbol:
    case Method::DocumentLink:
    case Method::WillSaveWaitUntil:
    case Method::Completion:
    case Method::ResolveCompletionItem:
    case Method::Hover:
    case Method::SignatureHelp:
    case Method::Definition:
    case Method::References:
    case Method::DocumentSymbol:
    case Method::CodeAction:
    case Method::CodeLens:
    case Method::ResolveCodeLens:
    case Method::PrepareRename:
    case Method::Rename:
    case Method::Formatting:
    case Method::FoldingRange:
        return MethodShape::Request;
    }
    return MethodShape::Notification;
}

}  // namespace srcnav::lsp
