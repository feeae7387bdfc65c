//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements open-document overlay storage and position mapping.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/DocumentStore.h"

#include <utility>

namespace srcnav::lsp
{
namespace
{

llvm::Error positionOutOfRange()
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "position out of range");
}

llvm::Error documentNotOpen(const llvm::StringRef uri)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "document not open: %s", uri.str().c_str());
}

}  // namespace

llvm::Expected<std::size_t> offsetOfPosition(const llvm::StringRef text, const Position& position)
{
    if (position.line < 0 || position.character < 0)
    {
        return positionOutOfRange();
    }

    std::size_t lineStart = 0;
    for (int line = 0; line < position.line; ++line)
    {
        const std::size_t newline = text.find('\n', lineStart);
        if (newline == llvm::StringRef::npos)
        {
            return positionOutOfRange();
        }
        lineStart = newline + 1U;
    }

    std::size_t lineEnd = text.find('\n', lineStart);
    if (lineEnd == llvm::StringRef::npos)
    {
        lineEnd = text.size();
    }
    const auto column = static_cast<std::size_t>(position.character);
    if (column > lineEnd - lineStart)
    {
        return positionOutOfRange();
    }
    return lineStart + column;
}

void DocumentStore::open(const TextDocumentItem& item)
{
    documents_.insert_or_assign(item.uri, Document{item.uri, item.languageId, item.version, item.text});
    dirty_.insert(item.uri);
}

llvm::Error DocumentStore::applyChanges(const VersionedTextDocumentIdentifier&         document,
                                        llvm::ArrayRef<TextDocumentContentChangeEvent> changes)
{
    const auto it = documents_.find(document.uri);
    if (it == documents_.end())
    {
        return documentNotOpen(document.uri);
    }

    std::string text = it->second.text;
    for (const TextDocumentContentChangeEvent& change : changes)
    {
        if (!change.range)
        {
            text = change.text;
            continue;
        }
        llvm::Expected<std::size_t> start = offsetOfPosition(text, change.range->start);
        if (!start)
        {
            return start.takeError();
        }
        llvm::Expected<std::size_t> end = offsetOfPosition(text, change.range->end);
        if (!end)
        {
            return end.takeError();
        }
        if (*end < *start)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "range end precedes range start");
        }
        text.replace(*start, *end - *start, change.text);
    }

    Document& target = it->second;
    target.text      = std::move(text);
    if (document.version)
    {
        target.version = *document.version;
    }
    dirty_.insert(document.uri);
    return llvm::Error::success();
}

bool DocumentStore::replaceText(const llvm::StringRef uri, std::string text)
{
    const auto it = documents_.find(uri);
    if (it == documents_.end())
    {
        return false;
    }
    it->second.text = std::move(text);
    dirty_.insert(uri.str());
    return true;
}

bool DocumentStore::close(const llvm::StringRef uri)
{
    dirty_.erase(uri.str());
    return documents_.erase(uri);
}

const Document* DocumentStore::lookup(const llvm::StringRef uri) const
{
    const auto it = documents_.find(uri);
    return it == documents_.end() ? nullptr : &it->second;
}

std::vector<std::string> DocumentStore::takeDirty()
{
    std::vector<std::string> out(dirty_.begin(), dirty_.end());
    dirty_.clear();
    return out;
}

}  // namespace srcnav::lsp
