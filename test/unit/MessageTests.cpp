//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "srcnav/LSP/Message.h"
#include "srcnav/LSP/Protocol.h"

bool runMessageTests()
{
    using srcnav::lsp::MessageKind;

    {
        auto message = srcnav::lsp::parseMessage(R"({"jsonrpc":"2.0","id":4,"method":"textDocument/hover","params":{"x":1}})");
        if (!message || message->kind() != MessageKind::Request || *message->id != 4 ||
            *message->method != "textDocument/hover" || !message->params.getAsObject())
        {
            std::cerr << "expected a request with id and params\n";
            return false;
        }
        if (srcnav::lsp::describeMessage(*message) != "request 4 textDocument/hover")
        {
            std::cerr << "unexpected request description\n";
            return false;
        }
    }

    {
        auto message = srcnav::lsp::parseMessage(R"({"jsonrpc":"2.0","id":null,"method":"initialized"})");
        if (!message || message->kind() != MessageKind::Notification || message->id || !message->params.getAsNull())
        {
            std::cerr << "a null id with a method is a notification without params\n";
            return false;
        }
    }

    {
        auto message = srcnav::lsp::parseMessage(R"({"jsonrpc":"2.0","id":9,"error":{"code":-32601,"message":"nope"}})");
        if (!message || message->kind() != MessageKind::Response || !message->error ||
            message->error->code != srcnav::lsp::ErrorCode::MethodNotFound || message->error->message != "nope")
        {
            std::cerr << "expected an error response\n";
            return false;
        }
    }

    {
        auto notObject = srcnav::lsp::parseMessage("[1,2]");
        auto stringId  = srcnav::lsp::parseMessage(R"({"id":"abc","method":"shutdown"})");
        auto badJson   = srcnav::lsp::parseMessage(R"({"id":1,)");
        if (notObject || stringId || badJson)
        {
            std::cerr << "expected arrays, string ids, and broken JSON to be rejected\n";
            return false;
        }
        const std::string text = llvm::toString(stringId.takeError());
        llvm::consumeError(notObject.takeError());
        llvm::consumeError(badJson.takeError());
        if (text != "invalid JSON-RPC message: id must be an integer")
        {
            std::cerr << "unexpected shape error: " << text << "\n";
            return false;
        }
    }

    return true;
}
