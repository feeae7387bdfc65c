//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "srcnav/LSP/DocumentStore.h"

namespace
{

srcnav::lsp::TextDocumentContentChangeEvent rangeChange(const int startLine,
                                                        const int startCharacter,
                                                        const int endLine,
                                                        const int endCharacter,
                                                        std::string text)
{
    srcnav::lsp::TextDocumentContentChangeEvent change;
    change.range = srcnav::lsp::Range{{startLine, startCharacter}, {endLine, endCharacter}};
    change.text  = std::move(text);
    return change;
}

srcnav::lsp::TextDocumentContentChangeEvent fullChange(std::string text)
{
    srcnav::lsp::TextDocumentContentChangeEvent change;
    change.text = std::move(text);
    return change;
}

}  // namespace

bool runDocumentStoreTests()
{
    {
        const llvm::StringRef text = "ab\ncde\n";
        const auto            at   = [&text](const int line, const int character) -> long {
            llvm::Expected<std::size_t> offset = srcnav::lsp::offsetOfPosition(text, {line, character});
            if (!offset)
            {
                llvm::consumeError(offset.takeError());
                return -1;
            }
            return static_cast<long>(*offset);
        };
        if (at(0, 0) != 0 || at(0, 2) != 2 || at(1, 0) != 3 || at(1, 3) != 6 || at(2, 0) != 7)
        {
            std::cerr << "unexpected position offsets\n";
            return false;
        }
        if (at(0, 3) != -1 || at(3, 0) != -1 || at(-1, 0) != -1 || at(0, -1) != -1)
        {
            std::cerr << "positions outside the text must be rejected\n";
            return false;
        }
    }

    srcnav::lsp::DocumentStore store;
    store.open(srcnav::lsp::TextDocumentItem{"file:///b.txt", "plaintext", 1, "first line\nsecond line\n"});
    store.open(srcnav::lsp::TextDocumentItem{"file:///a.txt", "plaintext", 4, "alpha"});
    if (store.size() != 2U)
    {
        std::cerr << "opened documents must be tracked and dirty\n";
        return false;
    }
    const std::vector<std::string> dirty{"file:///a.txt", "file:///b.txt"};
    if (store.takeDirty() != dirty || !store.takeDirty().empty())
    {
        std::cerr << "takeDirty must return sorted URIs and clear them\n";
        return false;
    }

    {
        const std::vector<srcnav::lsp::TextDocumentContentChangeEvent> changes{
            rangeChange(0, 0, 0, 5, "1st"),
            rangeChange(1, 7, 1, 11, "row"),
            rangeChange(2, 0, 2, 0, "third row"),
        };
        if (llvm::Error error = store.applyChanges({"file:///b.txt", 2}, changes))
        {
            std::cerr << "unexpected change failure: " << llvm::toString(std::move(error)) << "\n";
            return false;
        }
        const auto* document = store.lookup("file:///b.txt");
        if (!document || document->text != "1st line\nsecond row\nthird row" || document->version != 2 ||
            store.takeDirty() != std::vector<std::string>{"file:///b.txt"})
        {
            std::cerr << "range edits must apply in order and bump the version\n";
            return false;
        }
    }

    {
        const std::vector<srcnav::lsp::TextDocumentContentChangeEvent> changes{fullChange("replaced")};
        if (llvm::Error error = store.applyChanges({"file:///a.txt", std::nullopt}, changes))
        {
            std::cerr << "unexpected change failure: " << llvm::toString(std::move(error)) << "\n";
            return false;
        }
        const auto* document = store.lookup("file:///a.txt");
        if (!document || document->text != "replaced" || document->version != 4 ||
            store.takeDirty() != std::vector<std::string>{"file:///a.txt"})
        {
            std::cerr << "a full change must replace the text and keep an unset version\n";
            return false;
        }
    }

    {
        llvm::Error missing = store.applyChanges({"file:///missing.txt", 1}, {});
        if (!missing || llvm::toString(std::move(missing)) != "document not open: file:///missing.txt")
        {
            std::cerr << "changes to a closed document must fail\n";
            return false;
        }
        const std::vector<srcnav::lsp::TextDocumentContentChangeEvent> backwards{rangeChange(0, 4, 0, 1, "")};
        llvm::Error reversed = store.applyChanges({"file:///a.txt", 5}, backwards);
        if (!reversed || llvm::toString(std::move(reversed)) != "range end precedes range start")
        {
            std::cerr << "a reversed range must fail\n";
            return false;
        }
        const std::vector<srcnav::lsp::TextDocumentContentChangeEvent> outside{rangeChange(4, 0, 4, 1, "")};
        llvm::Error beyond = store.applyChanges({"file:///a.txt", 6}, outside);
        if (!beyond || llvm::toString(std::move(beyond)) != "position out of range")
        {
            std::cerr << "a range outside the text must fail\n";
            return false;
        }
        const std::vector<srcnav::lsp::TextDocumentContentChangeEvent> partial{
            rangeChange(0, 0, 0, 3, "XYZ"),
            rangeChange(9, 0, 9, 0, "lost"),
        };
        llvm::Error halfway = store.applyChanges({"file:///a.txt", 7}, partial);
        if (!halfway || llvm::toString(std::move(halfway)) != "position out of range")
        {
            std::cerr << "a later invalid range must fail the whole change\n";
            return false;
        }
        const auto* untouched = store.lookup("file:///a.txt");
        if (!untouched || untouched->text != "replaced" || untouched->version != 4 || !store.takeDirty().empty())
        {
            std::cerr << "a failed change must leave the overlay, version, and dirty set unchanged\n";
            return false;
        }
    }

    if (!store.replaceText("file:///a.txt", "saved") || store.lookup("file:///a.txt")->text != "saved" ||
        store.replaceText("file:///missing.txt", "x"))
    {
        std::cerr << "replaceText must update open documents only\n";
        return false;
    }

    if (!store.close("file:///a.txt") || store.close("file:///a.txt") || store.lookup("file:///a.txt") ||
        !store.takeDirty().empty() || store.size() != 1U)
    {
        std::cerr << "close must remove the overlay and its dirty mark\n";
        return false;
    }

    store.open(srcnav::lsp::TextDocumentItem{"file:///b.txt", "markdown", 9, "reopened"});
    const auto* reopened = store.lookup("file:///b.txt");
    if (!reopened || reopened->languageId != "markdown" || reopened->version != 9 || reopened->text != "reopened")
    {
        std::cerr << "reopening must replace the previous overlay\n";
        return false;
    }

    return true;
}
