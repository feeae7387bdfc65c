//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Reader task moving decoded frames from the transport into the queue.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_MESSAGE_READER_H
#define SRCNAV_LSP_MESSAGE_READER_H

#include "srcnav/LSP/JsonRpcIO.h"
#include "srcnav/LSP/MessageQueue.h"
#include "srcnav/Support/Logger.h"

namespace srcnav::lsp
{

/// @brief Reads messages, applies `$/cancelRequest` to the queue, and enqueues them.
///
/// On end of stream or a malformed frame the reader enqueues `StreamClosed`
/// and stops. It also stops when the queue has been closed.
class MessageReader final
{
public:
    /// @brief Creates a reader.
    /// @param[in] transport Transport to read from; must outlive the reader.
    /// @param[in] queue Destination queue; must outlive the reader.
    /// @param[in] logger Logger for cancellation outcomes and termination.
    MessageReader(JsonRpcStdioTransport& transport, MessageQueue& queue, Logger logger);

    /// @brief Reads until the stream closes, a frame is malformed, or the queue closes.
    void run();

    /// @brief Reads and enqueues one message.
    /// @return `false` once the reader must stop.
    [[nodiscard]] bool readNext();

private:
    void applyCancellation(const Message& message);
    void enqueueStreamClosed();

    JsonRpcStdioTransport& transport_;
    MessageQueue&          queue_;
    Logger                 logger_;
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_MESSAGE_READER_H
