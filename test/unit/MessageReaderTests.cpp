//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "LspTestSupport.h"
#include "srcnav/LSP/JsonRpcIO.h"
#include "srcnav/LSP/MessageQueue.h"
#include "srcnav/LSP/MessageReader.h"

namespace
{

/// Drains the queue into a compact trace: `id:method`, `-:method`, or `closed`.
std::vector<std::string> drain(srcnav::lsp::MessageQueue& queue)
{
    std::vector<std::string> trace;
    while (auto entry = queue.poll(std::chrono::milliseconds(5)))
    {
        if (std::holds_alternative<srcnav::lsp::StreamClosed>(*entry))
        {
            trace.emplace_back("closed");
            continue;
        }
        const auto& message = std::get<srcnav::lsp::Message>(*entry);
        trace.push_back((message.id ? std::to_string(*message.id) : std::string("-")) + ":" +
                        message.method.value_or(""));
    }
    return trace;
}

std::string hoverRequest(const int id)
{
    return srcnav::test::encodeLspFrame(R"({"jsonrpc":"2.0","id":)" + std::to_string(id) +
                                        R"(,"method":"textDocument/hover","params":{"textDocument":{"uri":"file:///a"},)"
                                        R"("position":{"line":0,"character":0}}})");
}

std::string cancelFor(const std::string& params)
{
    return srcnav::test::encodeLspFrame(R"({"jsonrpc":"2.0","method":"$/cancelRequest","params":)" + params + "}");
}

}  // namespace

bool runMessageReaderTests()
{
    {
        std::istringstream                 in(hoverRequest(1) + hoverRequest(2) + cancelFor(R"({"id":2})"));
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        srcnav::lsp::MessageQueue          queue(10);
        srcnav::test::CapturedLog          log;
        srcnav::lsp::MessageReader         reader(transport, queue, log.logger());
        reader.run();

        const std::vector<std::string> expected{"1:textDocument/hover", "-:$/cancelRequest", "closed"};
        if (drain(queue) != expected)
        {
            std::cerr << "cancellation must remove the queued request and keep the cancel notification\n";
            return false;
        }
        if (!log.contains(srcnav::LogLevel::Info, "Cancelled request 2, which had not yet started") ||
            !log.contains(srcnav::LogLevel::Info, "Client input stream closed"))
        {
            std::cerr << "missing cancellation or stream closure log\n";
            return false;
        }
    }

    {
        std::istringstream                 in(cancelFor(R"({"id":7})"));
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        srcnav::lsp::MessageQueue          queue(10);
        srcnav::test::CapturedLog          log;
        srcnav::lsp::MessageReader         reader(transport, queue, log.logger());
        if (!reader.readNext())
        {
            std::cerr << "expected the cancel frame to be read\n";
            return false;
        }
        if (!log.contains(srcnav::LogLevel::Info, "Cannot cancel request 7 because it has already started"))
        {
            std::cerr << "missing log for a request that is no longer queued\n";
            return false;
        }
        if (reader.readNext())
        {
            std::cerr << "expected the reader to stop at end of input\n";
            return false;
        }
    }

    {
        std::istringstream                 in(cancelFor(R"({"id":"abc"})") + hoverRequest(3));
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        srcnav::lsp::MessageQueue          queue(10);
        srcnav::test::CapturedLog          log;
        srcnav::lsp::MessageReader         reader(transport, queue, log.logger());
        reader.run();
        const std::vector<std::string> expected{"-:$/cancelRequest", "3:textDocument/hover", "closed"};
        if (drain(queue) != expected || !log.contains(srcnav::LogLevel::Warning, "Ignoring cancellation"))
        {
            std::cerr << "invalid cancel params must be logged and otherwise ignored\n";
            return false;
        }
    }

    {
        std::istringstream in(hoverRequest(1) + "Content-Length: 5\r\n\r\n{oops" + hoverRequest(2));
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        srcnav::lsp::MessageQueue          queue(10);
        srcnav::test::CapturedLog          log;
        srcnav::lsp::MessageReader         reader(transport, queue, log.logger());
        reader.run();
        const std::vector<std::string> expected{"1:textDocument/hover", "closed"};
        if (drain(queue) != expected || !log.contains(srcnav::LogLevel::Error, "Stopping reader"))
        {
            std::cerr << "a malformed frame must stop the reader and signal stream closure\n";
            return false;
        }
        if (!out.str().empty())
        {
            std::cerr << "the reader must never write to the client\n";
            return false;
        }
    }

    {
        std::istringstream                 in(hoverRequest(1) + hoverRequest(2));
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        srcnav::lsp::MessageQueue          queue(10);
        srcnav::test::CapturedLog          log;
        srcnav::lsp::MessageReader         reader(transport, queue, log.logger());
        queue.close();
        if (reader.readNext() || !log.contains(srcnav::LogLevel::Warning, "Queue closed, dropping"))
        {
            std::cerr << "a closed queue must stop the reader\n";
            return false;
        }
    }

    return true;
}
