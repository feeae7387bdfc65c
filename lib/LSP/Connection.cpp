//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements connection startup and teardown.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/Connection.h"

#include "srcnav/LSP/Dispatcher.h"
#include "srcnav/LSP/MessageQueue.h"
#include "srcnav/LSP/MessageReader.h"

#include <future>
#include <thread>
#include <utility>

namespace srcnav::lsp
{

Connection::Connection(std::shared_ptr<JsonRpcStdioTransport> transport, ServerConfig config, Logger logger)
    : transport_(std::move(transport))
    , config_(std::move(config))
    , logger_(std::move(logger))
{
}

int Connection::run(const ServerFactory& factory)
{
    auto          queue = std::make_shared<MessageQueue>(config_.queueCapacity);
    JsonRpcClient client(*transport_, logger_);

    std::unique_ptr<LanguageServer> server = factory ? factory(client, logger_) : nullptr;
    if (!server)
    {
        logger_.error("No language server available for the connection");
        return 1;
    }

    logger_.debug("Message queue holds at most {0} entries", queue->capacity());

    std::promise<void> readerDone;
    std::future<void>  readerFinished = readerDone.get_future();
    std::thread        reader([transport = transport_, queue, logger = logger_, done = std::move(readerDone)]() mutable {
        MessageReader(*transport, *queue, logger).run();
        done.set_value();
    });

    Dispatcher dispatcher(*queue, *server, client, telemetry_, logger_, config_.pollTimeout);
    dispatcher.run();
    queue->close();

    if (readerFinished.wait_for(ReaderJoinGrace) == std::future_status::ready)
    {
        reader.join();
    }
    else
    {
        logger_.info("Reader still waiting for input, detaching it");
        reader.detach();
    }

    if (client.failedWrites() > 0U)
    {
        logger_.warning("{0} outbound frame(s) could not be written", client.failedWrites());
    }
    for (const MethodStats& stats : telemetry_.snapshot())
    {
        logger_.debug("{0}: {1} dispatched, {2} failed, {3} us total",
                      stats.method,
                      stats.count,
                      stats.failures,
                      stats.totalLatencyMicros);
    }
    return dispatcher.exitCode();
}

}  // namespace srcnav::lsp
