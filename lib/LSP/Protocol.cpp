//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON mappings for typed LSP payloads.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/Protocol.h"

#include <utility>

namespace srcnav::lsp
{
namespace
{

/// Missing keys and explicit `null` both leave `out` empty.
template <typename T>
bool mapNullable(const llvm::json::Object& object,
                 llvm::StringLiteral       key,
                 std::optional<T>&         out,
                 llvm::json::Path          path)
{
    const llvm::json::Value* value = object.get(key);
    if (!value || value->getAsNull())
    {
        out.reset();
        return true;
    }
    T parsed{};
    if (!fromJSON(*value, parsed, path.field(key)))
    {
        return false;
    }
    out = std::move(parsed);
    return true;
}

void copyOpaque(const llvm::json::Object& object, llvm::StringLiteral key, llvm::json::Value& out)
{
    if (const llvm::json::Value* value = object.get(key))
    {
        out = *value;
    }
}

const llvm::json::Object* expectObject(const llvm::json::Value& value, llvm::json::Path path)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        path.report("expected object");
    }
    return object;
}

}  // namespace

bool fromJSON(const llvm::json::Value& value, Position& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("line", out.line) && mapper.map("character", out.character);
}

bool fromJSON(const llvm::json::Value& value, Range& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("start", out.start) && mapper.map("end", out.end);
}

bool fromJSON(const llvm::json::Value& value, TextDocumentIdentifier& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("uri", out.uri);
}

bool fromJSON(const llvm::json::Value& value, VersionedTextDocumentIdentifier& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    if (!mapper || !mapper.map("uri", out.uri))
    {
        return false;
    }
    return mapNullable(*value.getAsObject(), "version", out.version, path);
}

bool fromJSON(const llvm::json::Value& value, TextDocumentItem& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("uri", out.uri) && mapper.mapOptional("languageId", out.languageId) &&
           mapper.mapOptional("version", out.version) && mapper.map("text", out.text);
}

bool fromJSON(const llvm::json::Value& value, WorkspaceFolder& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("uri", out.uri) && mapper.mapOptional("name", out.name);
}

bool fromJSON(const llvm::json::Value& value, InitializeParams& out, llvm::json::Path path)
{
    const auto* object = expectObject(value, path);
    if (!object)
    {
        return false;
    }
    if (!mapNullable(*object, "processId", out.processId, path) || !mapNullable(*object, "rootUri", out.rootUri, path) ||
        !mapNullable(*object, "rootPath", out.rootPath, path))
    {
        return false;
    }
    if (const auto* folders = object->get("workspaceFolders"); folders && !folders->getAsNull())
    {
        if (!fromJSON(*folders, out.workspaceFolders, path.field("workspaceFolders")))
        {
            return false;
        }
    }
    copyOpaque(*object, "capabilities", out.capabilities);
    copyOpaque(*object, "initializationOptions", out.initializationOptions);
    return true;
}

bool fromJSON(const llvm::json::Value& value, DidChangeWorkspaceFoldersParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    if (!mapper)
    {
        return false;
    }
    const auto* object = value.getAsObject();
    const auto* event  = object->get("event");
    if (!event)
    {
        path.field("event").report("missing value");
        return false;
    }
    llvm::json::ObjectMapper eventMapper(*event, path.field("event"));
    return eventMapper && eventMapper.mapOptional("added", out.added) &&
           eventMapper.mapOptional("removed", out.removed);
}

bool fromJSON(const llvm::json::Value& value, DidChangeConfigurationParams& out, llvm::json::Path path)
{
    const auto* object = expectObject(value, path);
    if (!object)
    {
        return false;
    }
    copyOpaque(*object, "settings", out.settings);
    return true;
}

bool fromJSON(const llvm::json::Value& value, FileEvent& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    int                      type = 0;
    if (!mapper || !mapper.map("uri", out.uri) || !mapper.map("type", type))
    {
        return false;
    }
    if (type < static_cast<int>(FileChangeType::Created) || type > static_cast<int>(FileChangeType::Deleted))
    {
        path.field("type").report("unknown file change type");
        return false;
    }
    out.type = static_cast<FileChangeType>(type);
    return true;
}

bool fromJSON(const llvm::json::Value& value, DidChangeWatchedFilesParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("changes", out.changes);
}

bool fromJSON(const llvm::json::Value& value, WorkspaceSymbolParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("query", out.query);
}

bool fromJSON(const llvm::json::Value& value, DocumentLinkParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument);
}

bool fromJSON(const llvm::json::Value& value, DidOpenTextDocumentParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument);
}

bool fromJSON(const llvm::json::Value& value, TextDocumentContentChangeEvent& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    if (!mapper || !mapper.map("text", out.text))
    {
        return false;
    }
    return mapNullable(*value.getAsObject(), "range", out.range, path);
}

bool fromJSON(const llvm::json::Value& value, DidChangeTextDocumentParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument) && mapper.map("contentChanges", out.contentChanges);
}

bool fromJSON(const llvm::json::Value& value, WillSaveTextDocumentParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument) && mapper.mapOptional("reason", out.reason);
}

bool fromJSON(const llvm::json::Value& value, DidSaveTextDocumentParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    if (!mapper || !mapper.map("textDocument", out.textDocument))
    {
        return false;
    }
    return mapNullable(*value.getAsObject(), "text", out.text, path);
}

bool fromJSON(const llvm::json::Value& value, DidCloseTextDocumentParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument);
}

bool fromJSON(const llvm::json::Value& value, TextDocumentPositionParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument) && mapper.map("position", out.position);
}

bool fromJSON(const llvm::json::Value& value, CompletionItem& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    if (!mapper || !mapper.map("label", out.label))
    {
        return false;
    }
    const auto& object = *value.getAsObject();
    if (!mapNullable(object, "kind", out.kind, path) || !mapNullable(object, "detail", out.detail, path))
    {
        return false;
    }
    copyOpaque(object, "data", out.data);
    return true;
}

bool fromJSON(const llvm::json::Value& value, ReferenceParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    if (!mapper || !mapper.map("textDocument", out.textDocument) || !mapper.map("position", out.position))
    {
        return false;
    }
    if (const auto* context = value.getAsObject()->get("context"))
    {
        llvm::json::ObjectMapper contextMapper(*context, path.field("context"));
        return contextMapper && contextMapper.mapOptional("includeDeclaration", out.includeDeclaration);
    }
    return true;
}

bool fromJSON(const llvm::json::Value& value, DocumentSymbolParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument);
}

bool fromJSON(const llvm::json::Value& value, CodeActionParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    if (!mapper || !mapper.map("textDocument", out.textDocument) || !mapper.map("range", out.range))
    {
        return false;
    }
    const auto* context = value.getAsObject()->get("context");
    if (!context)
    {
        return true;
    }
    const auto* contextObject = expectObject(*context, path.field("context"));
    if (!contextObject)
    {
        return false;
    }
    if (const auto* diagnostics = contextObject->getArray("diagnostics"))
    {
        out.diagnostics = *diagnostics;
    }
    llvm::json::ObjectMapper contextMapper(*context, path.field("context"));
    return contextMapper.mapOptional("only", out.only);
}

bool fromJSON(const llvm::json::Value& value, CodeLensParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument);
}

bool fromJSON(const llvm::json::Value& value, CodeLens& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    if (!mapper || !mapper.map("range", out.range))
    {
        return false;
    }
    copyOpaque(*value.getAsObject(), "command", out.command);
    copyOpaque(*value.getAsObject(), "data", out.data);
    return true;
}

bool fromJSON(const llvm::json::Value& value, RenameParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument) && mapper.map("position", out.position) &&
           mapper.map("newName", out.newName);
}

bool fromJSON(const llvm::json::Value& value, DocumentFormattingParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    if (!mapper || !mapper.map("textDocument", out.textDocument))
    {
        return false;
    }
    copyOpaque(*value.getAsObject(), "options", out.options);
    return true;
}

bool fromJSON(const llvm::json::Value& value, FoldingRangeParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("textDocument", out.textDocument);
}

bool fromJSON(const llvm::json::Value& value, CancelParams& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(value, path);
    return mapper && mapper.map("id", out.id);
}

llvm::json::Value toJSON(const Position& position)
{
    return llvm::json::Object{{"line", position.line}, {"character", position.character}};
}

llvm::json::Value toJSON(const Range& range)
{
    return llvm::json::Object{{"start", toJSON(range.start)}, {"end", toJSON(range.end)}};
}

llvm::json::Value toJSON(const Diagnostic& diagnostic)
{
    llvm::json::Object out{
        {"range", toJSON(diagnostic.range)},
        {"severity", static_cast<int>(diagnostic.severity)},
        {"message", diagnostic.message},
    };
    if (!diagnostic.source.empty())
    {
        out["source"] = diagnostic.source;
    }
    return out;
}

llvm::json::Value toJSON(const PublishDiagnosticsParams& params)
{
    llvm::json::Array diagnostics;
    for (const Diagnostic& diagnostic : params.diagnostics)
    {
        diagnostics.push_back(toJSON(diagnostic));
    }
    llvm::json::Object out{
        {"uri", params.uri},
        {"diagnostics", std::move(diagnostics)},
    };
    if (params.version)
    {
        out["version"] = *params.version;
    }
    return out;
}

llvm::json::Value toJSON(const ShowMessageParams& params)
{
    return llvm::json::Object{{"type", static_cast<int>(params.type)}, {"message", params.message}};
}

llvm::json::Value toJSON(const RegistrationParams& params)
{
    return llvm::json::Object{
        {"id", params.id},
        {"method", params.method},
        {"registerOptions", params.registerOptions},
    };
}

}  // namespace srcnav::lsp
