//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed Language Server Protocol payloads and their JSON mappings.
///
/// Inbound parameter structs are decoded with `fromJSON`; outbound payloads
/// are encoded with `toJSON`. Fields the transport core never interprets are
/// kept as opaque `llvm::json::Value` members.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_PROTOCOL_H
#define SRCNAV_LSP_PROTOCOL_H

#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace srcnav::lsp
{

/// @brief JSON-RPC and LSP error codes.
namespace ErrorCode
{
constexpr int ParseError       = -32700;
constexpr int InvalidRequest   = -32600;
constexpr int MethodNotFound   = -32601;
constexpr int InvalidParams    = -32602;
constexpr int InternalError    = -32603;
constexpr int RequestCancelled = -32800;
}  // namespace ErrorCode

/// @brief Zero-based line/character position.
struct Position final
{
    int line{0};
    int character{0};
};

/// @brief Half-open range between two positions.
struct Range final
{
    Position start;
    Position end;
};

struct TextDocumentIdentifier final
{
    std::string uri;
};

struct VersionedTextDocumentIdentifier final
{
    std::string uri;

    /// @brief Document version; absent when the client sent `null`.
    std::optional<std::int64_t> version;
};

struct TextDocumentItem final
{
    std::string  uri;
    std::string  languageId;
    std::int64_t version{0};
    std::string  text;
};

struct WorkspaceFolder final
{
    std::string uri;
    std::string name;
};

struct InitializeParams final
{
    std::optional<std::int64_t>  processId;
    std::optional<std::string>   rootUri;
    std::optional<std::string>   rootPath;
    std::vector<WorkspaceFolder> workspaceFolders;
    llvm::json::Value            capabilities = llvm::json::Object{};
    llvm::json::Value            initializationOptions = nullptr;
};

struct DidChangeWorkspaceFoldersParams final
{
    std::vector<WorkspaceFolder> added;
    std::vector<WorkspaceFolder> removed;
};

struct DidChangeConfigurationParams final
{
    llvm::json::Value settings = nullptr;
};

/// @brief File system change kind reported by the client watcher.
enum class FileChangeType
{
    Created = 1,
    Changed = 2,
    Deleted = 3,
};

struct FileEvent final
{
    std::string    uri;
    FileChangeType type{FileChangeType::Changed};
};

struct DidChangeWatchedFilesParams final
{
    std::vector<FileEvent> changes;
};

struct WorkspaceSymbolParams final
{
    std::string query;
};

struct DocumentLinkParams final
{
    TextDocumentIdentifier textDocument;
};

struct DidOpenTextDocumentParams final
{
    TextDocumentItem textDocument;
};

/// @brief One content change; a missing range means full-text replacement.
struct TextDocumentContentChangeEvent final
{
    std::optional<Range> range;
    std::string          text;
};

struct DidChangeTextDocumentParams final
{
    VersionedTextDocumentIdentifier             textDocument;
    std::vector<TextDocumentContentChangeEvent> contentChanges;
};

struct WillSaveTextDocumentParams final
{
    TextDocumentIdentifier textDocument;

    /// @brief Save reason: 1 manual, 2 after delay, 3 focus out.
    int reason{1};
};

struct DidSaveTextDocumentParams final
{
    TextDocumentIdentifier     textDocument;
    std::optional<std::string> text;
};

struct DidCloseTextDocumentParams final
{
    TextDocumentIdentifier textDocument;
};

struct TextDocumentPositionParams final
{
    TextDocumentIdentifier textDocument;
    Position               position;
};

/// @brief Completion item round-tripped through `completionItem/resolve`.
struct CompletionItem final
{
    std::string                label;
    std::optional<int>         kind;
    std::optional<std::string> detail;
    llvm::json::Value          data = nullptr;
};

struct ReferenceParams final
{
    TextDocumentIdentifier textDocument;
    Position               position;
    bool                   includeDeclaration{false};
};

struct DocumentSymbolParams final
{
    TextDocumentIdentifier textDocument;
};

struct CodeActionParams final
{
    TextDocumentIdentifier textDocument;
    Range                  range;

    /// @brief Diagnostics from the code action context, kept opaque.
    llvm::json::Array diagnostics;

    /// @brief Requested code action kinds, empty when unrestricted.
    std::vector<std::string> only;
};

struct CodeLensParams final
{
    TextDocumentIdentifier textDocument;
};

/// @brief Code lens round-tripped through `codeLens/resolve`.
struct CodeLens final
{
    Range             range;
    llvm::json::Value command = nullptr;
    llvm::json::Value data = nullptr;
};

struct RenameParams final
{
    TextDocumentIdentifier textDocument;
    Position               position;
    std::string            newName;
};

struct DocumentFormattingParams final
{
    TextDocumentIdentifier textDocument;
    llvm::json::Value      options = llvm::json::Object{};
};

struct FoldingRangeParams final
{
    TextDocumentIdentifier textDocument;
};

struct CancelParams final
{
    std::int64_t id{0};
};

/// @brief Diagnostic severity as defined by LSP.
enum class DiagnosticSeverity
{
    Error       = 1,
    Warning     = 2,
    Information = 3,
    Hint        = 4,
};

struct Diagnostic final
{
    Range              range;
    DiagnosticSeverity severity{DiagnosticSeverity::Error};
    std::string        source;
    std::string        message;
};

struct PublishDiagnosticsParams final
{
    std::string                 uri;
    std::optional<std::int64_t> version;
    std::vector<Diagnostic>     diagnostics;
};

/// @brief `window/showMessage` type.
enum class MessageType
{
    Error   = 1,
    Warning = 2,
    Info    = 3,
    Log     = 4,
};

struct ShowMessageParams final
{
    MessageType type{MessageType::Info};
    std::string message;
};

/// @brief Dynamic capability registration sent on `client/registerCapability`.
struct RegistrationParams final
{
    std::string       id;
    std::string       method;
    llvm::json::Value registerOptions = nullptr;
};

bool fromJSON(const llvm::json::Value& value, Position& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, Range& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, TextDocumentIdentifier& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, VersionedTextDocumentIdentifier& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, TextDocumentItem& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, WorkspaceFolder& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, InitializeParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DidChangeWorkspaceFoldersParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DidChangeConfigurationParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, FileEvent& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DidChangeWatchedFilesParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, WorkspaceSymbolParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DocumentLinkParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DidOpenTextDocumentParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, TextDocumentContentChangeEvent& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DidChangeTextDocumentParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, WillSaveTextDocumentParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DidSaveTextDocumentParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DidCloseTextDocumentParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, TextDocumentPositionParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, CompletionItem& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, ReferenceParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DocumentSymbolParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, CodeActionParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, CodeLensParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, CodeLens& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, RenameParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, DocumentFormattingParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, FoldingRangeParams& out, llvm::json::Path path);
bool fromJSON(const llvm::json::Value& value, CancelParams& out, llvm::json::Path path);

llvm::json::Value toJSON(const Position& position);
llvm::json::Value toJSON(const Range& range);
llvm::json::Value toJSON(const Diagnostic& diagnostic);
llvm::json::Value toJSON(const PublishDiagnosticsParams& params);
llvm::json::Value toJSON(const ShowMessageParams& params);
llvm::json::Value toJSON(const RegistrationParams& params);

/// @brief Decodes typed params, reporting the failing JSON path on error.
/// @tparam T Parameter struct with a `fromJSON` overload.
/// @param[in] params Raw `params` value (`null` when absent).
/// @param[in] method Method name used in the error text.
/// @return Decoded params or a descriptive error.
template <typename T>
llvm::Expected<T> decodeParams(const llvm::json::Value& params, llvm::StringRef method)
{
    llvm::json::Path::Root root(method);
    T                      out;
    if (fromJSON(params, out, root))
    {
        return std::move(out);
    }
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "invalid params for %s: %s",
                                   method.str().c_str(),
                                   llvm::toString(root.getError()).c_str());
}

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_PROTOCOL_H
