//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Stdio JSON-RPC framing for Language Server Protocol transport.
///
/// Inbound frames are read byte by byte from an input stream and decoded into
/// messages. Outbound payloads are written with a `Content-Length` header under
/// a write lock.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_JSON_RPC_IO_H
#define SRCNAV_LSP_JSON_RPC_IO_H

#include "srcnav/LSP/Message.h"

#include "llvm/Support/Error.h"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace srcnav::lsp
{

/// @brief The input stream reported closure while a frame was being read.
class EndOfStreamError final : public llvm::ErrorInfo<EndOfStreamError>
{
public:
    static char ID;

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;
};

/// @brief A frame header or body could not be decoded.
class MalformedFrameError final : public llvm::ErrorInfo<MalformedFrameError>
{
public:
    static char ID;

    explicit MalformedFrameError(std::string reason);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    /// @brief Returns the decoding failure description.
    [[nodiscard]] const std::string& reason() const
    {
        return reason_;
    }

private:
    std::string reason_;
};

/// @brief JSON-RPC stdio transport with `Content-Length` framing.
///
/// Reading is meant for a single reader thread. Writing may happen from any
/// thread; frames never interleave.
class JsonRpcStdioTransport final
{
public:
    /// @brief Creates a transport over input and output streams.
    /// @param[in] in Input stream.
    /// @param[in] out Output stream.
    JsonRpcStdioTransport(std::istream& in, std::ostream& out);

    /// @brief Reads and decodes the next frame.
    ///
    /// The expected body length persists across calls: a frame without a
    /// `Content-Length` header reuses the previous frame's length. Whitespace
    /// preceding the body is skipped and does not count toward the length.
    ///
    /// @return Decoded message, `EndOfStreamError` when the input closes, or
    ///         `MalformedFrameError` when the frame cannot be decoded.
    [[nodiscard]] llvm::Expected<Message> readMessage();

    /// @brief Reads the next frame body without decoding it.
    /// @return Raw body text or the same errors as `readMessage()`.
    [[nodiscard]] llvm::Expected<std::string> readFrame();

    /// @brief Writes one framed payload.
    /// @param[in] payload Already-encoded body.
    /// @return `true` when the write succeeds.
    [[nodiscard]] bool writeFrame(llvm::StringRef payload);

private:
    [[nodiscard]] llvm::Expected<char>        readByte();
    [[nodiscard]] llvm::Expected<std::string> readHeaderLine();

    std::istream&              input_;
    std::ostream&              output_;
    std::mutex                 writeMutex_;
    std::optional<std::size_t> contentLength_;
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_JSON_RPC_IO_H
