//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// In-memory overlays of documents the editor has open.
///
/// Positions are zero-based lines and byte columns. A column may equal the
/// line length, addressing the end of the line.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_DOCUMENT_STORE_H
#define SRCNAV_LSP_DOCUMENT_STORE_H

#include "srcnav/LSP/Protocol.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace srcnav::lsp
{

/// @brief Snapshot of one open document.
struct Document final
{
    /// @brief LSP document URI.
    std::string uri;

    /// @brief Client language identifier.
    std::string languageId;

    /// @brief Last version reported by the client.
    std::int64_t version{0};

    /// @brief Full document text.
    std::string text;
};

/// @brief Converts a position to a byte offset into `text`.
/// @param[in] text Document text.
/// @param[in] position Zero-based position.
/// @return Offset, or an error when the position lies outside the text.
[[nodiscard]] llvm::Expected<std::size_t> offsetOfPosition(llvm::StringRef text, const Position& position);

/// @brief Tracks open-document overlays keyed by URI, plus the set changed since last drained.
class DocumentStore final
{
public:
    /// @brief Registers a document as opened, replacing any previous overlay.
    /// @param[in] item Document as sent by `textDocument/didOpen`.
    void open(const TextDocumentItem& item);

    /// @brief Applies content changes in order.
    ///
    /// A change without a range replaces the whole text. The overlay and its
    /// version are updated only when every change applies.
    ///
    /// @param[in] document Target document and new version.
    /// @param[in] changes Changes from `textDocument/didChange`.
    /// @return Error when the document is not open or a range is invalid.
    [[nodiscard]] llvm::Error applyChanges(const VersionedTextDocumentIdentifier&               document,
                                           llvm::ArrayRef<TextDocumentContentChangeEvent> changes);

    /// @brief Replaces the full text of an open document.
    /// @param[in] uri LSP document URI.
    /// @param[in] text New full text.
    /// @return `true` when the document exists and is updated.
    [[nodiscard]] bool replaceText(llvm::StringRef uri, std::string text);

    /// @brief Closes a document and removes its overlay entry.
    /// @param[in] uri LSP document URI.
    /// @return `true` when an entry existed and was removed.
    [[nodiscard]] bool close(llvm::StringRef uri);

    /// @brief Looks up a document by URI.
    /// @param[in] uri LSP document URI.
    /// @return Document pointer when open, otherwise `nullptr`.
    [[nodiscard]] const Document* lookup(llvm::StringRef uri) const;

    /// @brief Returns and clears the URIs changed since the last call, sorted.
    [[nodiscard]] std::vector<std::string> takeDirty();

    /// @brief Returns the number of open documents tracked.
    [[nodiscard]] std::size_t size() const
    {
        return documents_.size();
    }

private:
    llvm::StringMap<Document> documents_;
    std::set<std::string>     dirty_;
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_DOCUMENT_STORE_H
