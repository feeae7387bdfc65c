//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "LspTestSupport.h"
#include "srcnav/LSP/JsonRpcIO.h"

namespace
{

enum class ReadFailure
{
    None,
    EndOfStream,
    Malformed,
    Other,
};

ReadFailure classify(llvm::Error error)
{
    if (!error)
    {
        return ReadFailure::None;
    }
    ReadFailure kind = ReadFailure::Other;
    if (error.isA<srcnav::lsp::EndOfStreamError>())
    {
        kind = ReadFailure::EndOfStream;
    }
    else if (error.isA<srcnav::lsp::MalformedFrameError>())
    {
        kind = ReadFailure::Malformed;
    }
    llvm::consumeError(std::move(error));
    return kind;
}

ReadFailure readFrameFailure(const std::string& input)
{
    std::istringstream                 in(input);
    std::ostringstream                 out;
    srcnav::lsp::JsonRpcStdioTransport transport(in, out);
    llvm::Expected<std::string>        frame = transport.readFrame();
    return frame ? ReadFailure::None : classify(frame.takeError());
}

ReadFailure readMessageFailure(const std::string& input)
{
    std::istringstream                 in(input);
    std::ostringstream                 out;
    srcnav::lsp::JsonRpcStdioTransport transport(in, out);
    llvm::Expected<srcnav::lsp::Message> message = transport.readMessage();
    return message ? ReadFailure::None : classify(message.takeError());
}

}  // namespace

bool runJsonRpcIOTests()
{
    using srcnav::test::encodeLspFrame;

    {
        const std::string                    payload = R"({"id":1,"method":"shutdown"})";
        std::istringstream                   in(encodeLspFrame(payload));
        std::ostringstream                   out;
        srcnav::lsp::JsonRpcStdioTransport   transport(in, out);
        llvm::Expected<srcnav::lsp::Message> message = transport.readMessage();
        if (!message)
        {
            std::cerr << "expected shutdown frame to decode: " << llvm::toString(message.takeError()) << "\n";
            return false;
        }
        if (!message->id || *message->id != 1 || !message->method || *message->method != "shutdown")
        {
            std::cerr << "unexpected decoded shutdown message\n";
            return false;
        }
        if (classify(transport.readMessage().takeError()) != ReadFailure::EndOfStream)
        {
            std::cerr << "expected end of stream after the only frame\n";
            return false;
        }
    }

    {
        std::istringstream in("Content-Length: 2\r\nContent-Type: application/vscode-jsonrpc; charset=utf-8\r\n\r\n"
                              "\r\n \t{}"
                              "X-Trace: 1\r\n\r\n[]");
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        llvm::Expected<std::string>        first = transport.readFrame();
        if (!first || *first != "{}")
        {
            std::cerr << "leading whitespace must be skipped without counting toward the length\n";
            return false;
        }
        llvm::Expected<std::string> second = transport.readFrame();
        if (!second || *second != "[]")
        {
            std::cerr << "a frame without Content-Length must reuse the previous length\n";
            return false;
        }
    }

    {
        std::istringstream                 in("Content-Length: 100\r\nContent-Length: 2\r\n\r\n{}");
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        llvm::Expected<std::string>        frame = transport.readFrame();
        if (!frame || *frame != "{}")
        {
            std::cerr << "the last Content-Length header must win\n";
            return false;
        }
    }

    if (readFrameFailure("Header: value\r\n\r\n{}") != ReadFailure::Malformed)
    {
        std::cerr << "expected a malformed frame when no length was ever seen\n";
        return false;
    }
    if (readFrameFailure("Content-Length: abc\r\n\r\n{}") != ReadFailure::Malformed ||
        readFrameFailure("Content-Length: \r\n\r\n{}") != ReadFailure::Malformed)
    {
        std::cerr << "expected a malformed frame for a non-decimal length\n";
        return false;
    }
    if (readFrameFailure("Content-Length: 2\rX\n\r\n{}") != ReadFailure::Malformed)
    {
        std::cerr << "expected a malformed frame for a bare carriage return\n";
        return false;
    }
    if (readFrameFailure("") != ReadFailure::EndOfStream || readFrameFailure("Content-Len") != ReadFailure::EndOfStream ||
        readFrameFailure("Content-Length: 2\r") != ReadFailure::EndOfStream)
    {
        std::cerr << "closure during header read must report end of stream\n";
        return false;
    }
    if (readFrameFailure("Content-Length: 10\r\n\r\n{}") != ReadFailure::EndOfStream ||
        readFrameFailure("Content-Length: 10\r\n\r\n  \r\n") != ReadFailure::EndOfStream)
    {
        std::cerr << "closure during body read must report end of stream\n";
        return false;
    }

    if (readMessageFailure(encodeLspFrame("{\"id\":1,")) != ReadFailure::Malformed ||
        readMessageFailure(encodeLspFrame("\"text\"")) != ReadFailure::Malformed ||
        readMessageFailure(encodeLspFrame(R"({"id":1.5,"method":"shutdown"})")) != ReadFailure::Malformed)
    {
        std::cerr << "undecodable bodies must be malformed frames\n";
        return false;
    }
    if (readMessageFailure("Content-Length: 0\r\n\r\n") != ReadFailure::Malformed)
    {
        std::cerr << "an empty body is not a message\n";
        return false;
    }

    {
        std::istringstream                 in;
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        if (!transport.writeFrame(R"({"jsonrpc":"2.0","id":1,"result":null})") || !transport.writeFrame("\"\xc3\xa9\""))
        {
            std::cerr << "expected writes to succeed\n";
            return false;
        }
        const std::string expected = "Content-Length: 38\r\n\r\n{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":null}"
                                     "Content-Length: 4\r\n\r\n\"\xc3\xa9\"";
        if (out.str() != expected)
        {
            std::cerr << "unexpected framed output: " << out.str() << "\n";
            return false;
        }
    }

    {
        std::istringstream                 in;
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        const auto                         writer = [&transport](const char tag) {
            const std::string payload = "\"" + std::string(64, tag) + "\"";
            for (int i = 0; i < 200; ++i)
            {
                if (!transport.writeFrame(payload))
                {
                    return;
                }
            }
        };
        std::thread first(writer, 'a');
        std::thread second(writer, 'b');
        first.join();
        second.join();

        std::vector<std::string> bodies;
        if (!srcnav::test::splitFrames(out.str(), bodies) || bodies.size() != 400U)
        {
            std::cerr << "concurrent writes must not interleave\n";
            return false;
        }
        for (const std::string& body : bodies)
        {
            if (body != "\"" + std::string(64, 'a') + "\"" && body != "\"" + std::string(64, 'b') + "\"")
            {
                std::cerr << "corrupted frame body under concurrent writes\n";
                return false;
            }
        }
    }

    {
        std::istringstream                 in;
        std::ostringstream                 out;
        srcnav::lsp::JsonRpcStdioTransport transport(in, out);
        out.setstate(std::ios::badbit);
        if (transport.writeFrame("{}"))
        {
            std::cerr << "expected a failed output stream to report a failed write\n";
            return false;
        }
    }

    return true;
}
