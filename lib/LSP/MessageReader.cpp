//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the transport-to-queue reader task.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/MessageReader.h"

#include "srcnav/LSP/Method.h"
#include "srcnav/LSP/Protocol.h"

#include <utility>

namespace srcnav::lsp
{

MessageReader::MessageReader(JsonRpcStdioTransport& transport, MessageQueue& queue, Logger logger)
    : transport_(transport)
    , queue_(queue)
    , logger_(std::move(logger))
{
}

void MessageReader::run()
{
    while (readNext())
    {
    }
    logger_.debug("Reader finished");
}

bool MessageReader::readNext()
{
    llvm::Expected<Message> message = transport_.readMessage();
    if (!message)
    {
        llvm::Error error = message.takeError();
        if (error.isA<EndOfStreamError>())
        {
            llvm::consumeError(std::move(error));
            logger_.info("Client input stream closed");
        }
        else
        {
            logger_.error("Stopping reader: {0}", llvm::toString(std::move(error)));
        }
        enqueueStreamClosed();
        return false;
    }

    applyCancellation(*message);

    const std::string description = describeMessage(*message);
    if (!queue_.put(std::move(*message)))
    {
        logger_.warning("Queue closed, dropping {0}", description);
        return false;
    }
    logger_.debug("Queued {0}", description);
    return true;
}

void MessageReader::applyCancellation(const Message& message)
{
    if (!message.method || methodFromName(*message.method) != Method::CancelRequest)
    {
        return;
    }
    llvm::Expected<CancelParams> params = decodeParams<CancelParams>(message.params, *message.method);
    if (!params)
    {
        logger_.warning("Ignoring cancellation: {0}", llvm::toString(params.takeError()));
        return;
    }
    if (queue_.removeRequest(params->id))
    {
        logger_.info("Cancelled request {0}, which had not yet started", params->id);
    }
    else
    {
        logger_.info("Cannot cancel request {0} because it has already started", params->id);
    }
}

void MessageReader::enqueueStreamClosed()
{
    if (!queue_.put(StreamClosed{}))
    {
        logger_.debug("Queue already closed, stream closure not enqueued");
    }
}

}  // namespace srcnav::lsp
