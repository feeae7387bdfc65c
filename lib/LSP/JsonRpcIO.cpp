//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framed JSON-RPC stdio transport.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/JsonRpcIO.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace srcnav::lsp
{
namespace
{

constexpr std::size_t MaxReservedBody = 1U << 20U;

llvm::Error malformed(std::string reason)
{
    return llvm::make_error<MalformedFrameError>(std::move(reason));
}

/// Returns the length for `Content-Length: <decimal>`, empty for other headers.
llvm::Expected<std::optional<std::size_t>> parseContentLengthHeader(llvm::StringRef line)
{
    static constexpr llvm::StringLiteral Prefix = "Content-Length: ";
    if (!line.consume_front(Prefix))
    {
        return std::nullopt;
    }
    std::size_t value = 0;
    if (line.empty() || line.getAsInteger(10, value))
    {
        return malformed("invalid Content-Length value '" + line.str() + "'");
    }
    return std::optional<std::size_t>(value);
}

}  // namespace

char EndOfStreamError::ID   = 0;
char MalformedFrameError::ID = 0;

void EndOfStreamError::log(llvm::raw_ostream& os) const
{
    os << "input stream closed";
}

std::error_code EndOfStreamError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

MalformedFrameError::MalformedFrameError(std::string reason)
    : reason_(std::move(reason))
{
}

void MalformedFrameError::log(llvm::raw_ostream& os) const
{
    os << "malformed frame: " << reason_;
}

std::error_code MalformedFrameError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

JsonRpcStdioTransport::JsonRpcStdioTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

llvm::Expected<char> JsonRpcStdioTransport::readByte()
{
    const auto next = input_.get();
    if (next == std::char_traits<char>::eof())
    {
        return llvm::make_error<EndOfStreamError>();
    }
    return static_cast<char>(next);
}

llvm::Expected<std::string> JsonRpcStdioTransport::readHeaderLine()
{
    std::string line;
    while (true)
    {
        llvm::Expected<char> next = readByte();
        if (!next)
        {
            return next.takeError();
        }
        if (*next != '\r')
        {
            line.push_back(*next);
            continue;
        }
        llvm::Expected<char> last = readByte();
        if (!last)
        {
            return last.takeError();
        }
        if (*last != '\n')
        {
            return malformed("header line not terminated by CRLF");
        }
        return line;
    }
}

llvm::Expected<std::string> JsonRpcStdioTransport::readFrame()
{
    while (true)
    {
        llvm::Expected<std::string> line = readHeaderLine();
        if (!line)
        {
            return line.takeError();
        }
        if (line->empty())
        {
            break;
        }
        llvm::Expected<std::optional<std::size_t>> length = parseContentLengthHeader(*line);
        if (!length)
        {
            return length.takeError();
        }
        if (*length)
        {
            contentLength_ = **length;
        }
    }

    if (!contentLength_)
    {
        return malformed("missing Content-Length header");
    }

    const std::size_t expected = *contentLength_;
    std::string       body;
    body.reserve(std::min(expected, MaxReservedBody));
    if (expected == 0U)
    {
        return body;
    }

    llvm::Expected<char> next = readByte();
    while (next && std::isspace(static_cast<unsigned char>(*next)))
    {
        next = readByte();
    }
    while (true)
    {
        if (!next)
        {
            return next.takeError();
        }
        body.push_back(*next);
        if (body.size() == expected)
        {
            return body;
        }
        next = readByte();
    }
}

llvm::Expected<Message> JsonRpcStdioTransport::readMessage()
{
    llvm::Expected<std::string> body = readFrame();
    if (!body)
    {
        return body.takeError();
    }
    llvm::Expected<Message> message = parseMessage(*body);
    if (!message)
    {
        return malformed(llvm::toString(message.takeError()));
    }
    return message;
}

bool JsonRpcStdioTransport::writeFrame(const llvm::StringRef payload)
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n";
    output_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    output_.flush();
    return static_cast<bool>(output_);
}

}  // namespace srcnav::lsp
