//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements message routing, lifecycle transitions, and error replies.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/Dispatcher.h"

#include "srcnav/LSP/Protocol.h"

#include "llvm/Support/ErrorHandling.h"

#include <exception>
#include <optional>
#include <utility>
#include <variant>

namespace srcnav::lsp
{
namespace
{

using RequestResult = llvm::Expected<llvm::json::Value>;

template <typename Params>
RequestResult callRequest(LanguageServer& server,
                          const Message&  message,
                          RequestResult (LanguageServer::*operation)(const Params&))
{
    llvm::Expected<Params> params = decodeParams<Params>(message.params, *message.method);
    if (!params)
    {
        return params.takeError();
    }
    return (server.*operation)(*params);
}

RequestResult notificationResult(llvm::Error error)
{
    if (error)
    {
        return std::move(error);
    }
    return llvm::json::Value(nullptr);
}

template <typename Params>
RequestResult callNotification(LanguageServer& server,
                               const Message&  message,
                               llvm::Error (LanguageServer::*operation)(const Params&))
{
    llvm::Expected<Params> params = decodeParams<Params>(message.params, *message.method);
    if (!params)
    {
        return params.takeError();
    }
    return notificationResult((server.*operation)(*params));
}

std::uint64_t elapsedMicros(const std::chrono::steady_clock::time_point started)
{
    const auto elapsed = std::chrono::steady_clock::now() - started;
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

}  // namespace

llvm::StringRef dispatcherStateName(const DispatcherState state)
{
    switch (state)
    {
    case DispatcherState::Running:
        return "running";
    case DispatcherState::ShuttingDown:
        return "shutting-down";
    case DispatcherState::Exited:
        return "exited";
    }
    llvm_unreachable("unknown dispatcher state");
}

Dispatcher::Dispatcher(MessageQueue&                   queue,
                       LanguageServer&                 server,
                       JsonRpcClient&                  client,
                       Telemetry&                      telemetry,
                       Logger                          logger,
                       const std::chrono::milliseconds pollTimeout)
    : queue_(queue)
    , server_(server)
    , client_(client)
    , telemetry_(telemetry)
    , logger_(std::move(logger))
    , pollTimeout_(pollTimeout)
{
}

void Dispatcher::run()
{
    while (step())
    {
    }
    logger_.info("Dispatcher exited with code {0}", exitCode());
}

bool Dispatcher::step()
{
    if (state_ == DispatcherState::Exited)
    {
        return false;
    }

    std::optional<PendingEntry> entry = queue_.poll(pollTimeout_);
    if (!entry)
    {
        if (queue_.closed())
        {
            logger_.info("Queue closed, stopping dispatcher");
            state_ = DispatcherState::Exited;
            return false;
        }
        runIdleWork();
        return true;
    }

    if (std::holds_alternative<StreamClosed>(*entry))
    {
        logger_.info("Client disconnected");
        state_ = DispatcherState::Exited;
        return false;
    }

    dispatch(std::get<Message>(*entry));
    return state_ != DispatcherState::Exited;
}

void Dispatcher::dispatch(const Message& message)
{
    if (!message.method)
    {
        logger_.warning("Dropping {0}: no requests are outstanding", describeMessage(message));
        return;
    }

    const Method method = methodFromName(*message.method);
    if (method == Method::Unknown)
    {
        logger_.warning("Don't know what to do with method {0}", *message.method);
        return;
    }
    if (method == Method::Exit)
    {
        logger_.info("Exit received in state {0}", dispatcherStateName(state_));
        state_ = DispatcherState::Exited;
        return;
    }
    if (method == Method::CancelRequest)
    {
        return;
    }
    if (state_ == DispatcherState::ShuttingDown && method != Method::Shutdown)
    {
        rejectDuringShutdown(message);
        return;
    }

    if (message.id.has_value() != (methodShape(method) == MethodShape::Request))
    {
        logger_.debug("{0} does not match the declared shape of {1}", describeMessage(message), *message.method);
    }
    logger_.debug("Dispatching {0}", describeMessage(message));
    const auto    started = std::chrono::steady_clock::now();
    RequestResult result  = invokeGuarded(method, message);
    const bool    failed  = !result;

    if (method == Method::Shutdown)
    {
        shutdownReceived_ = true;
        state_            = DispatcherState::ShuttingDown;
    }

    if (message.id)
    {
        if (result)
        {
            client_.respond(*message.id, *result);
        }
        else
        {
            const std::string text = llvm::toString(result.takeError());
            logger_.warning("Request {0} {1} failed: {2}", *message.id, *message.method, text);
            client_.respondError(*message.id, ErrorPayload{ErrorCode::InternalError, text});
        }
    }
    else if (!result)
    {
        logger_.error("Notification {0} failed: {1}", *message.method, llvm::toString(result.takeError()));
    }

    telemetry_.record(*message.method, elapsedMicros(started), failed);
}

void Dispatcher::rejectDuringShutdown(const Message& message)
{
    if (message.id)
    {
        logger_.warning("Rejecting {0} after shutdown", describeMessage(message));
        client_.respondError(*message.id, ErrorPayload{ErrorCode::InvalidRequest, "server is shutting down"});
        return;
    }
    logger_.warning("Dropping {0} after shutdown", describeMessage(message));
}

RequestResult Dispatcher::invokeGuarded(const Method method, const Message& message)
{
    try
    {
        return invoke(method, message);
    } catch (const std::exception& ex)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "%s", ex.what());
    } catch (...)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "unknown exception");
    }
}

RequestResult Dispatcher::invoke(const Method method, const Message& message)
{
    switch (method)
    {
    case Method::Initialize:
        return callRequest(server_, message, &LanguageServer::initialize);
    case Method::Initialized:
        return notificationResult(server_.initialized());
    case Method::Shutdown:
        return notificationResult(server_.shutdown());
    case Method::DidChangeWorkspaceFolders:
        return callNotification(server_, message, &LanguageServer::didChangeWorkspaceFolders);
    case Method::DidChangeConfiguration:
        return callNotification(server_, message, &LanguageServer::didChangeConfiguration);
    case Method::DidChangeWatchedFiles:
        return callNotification(server_, message, &LanguageServer::didChangeWatchedFiles);
    case Method::WorkspaceSymbol:
        return callRequest(server_, message, &LanguageServer::workspaceSymbol);
    case Method::DocumentLink:
        return callRequest(server_, message, &LanguageServer::documentLink);
    case Method::DidOpen:
        return callNotification(server_, message, &LanguageServer::didOpen);
    case Method::DidChange:
        return callNotification(server_, message, &LanguageServer::didChange);
    case Method::WillSave:
        return callNotification(server_, message, &LanguageServer::willSave);
    case Method::WillSaveWaitUntil:
        return callRequest(server_, message, &LanguageServer::willSaveWaitUntil);
    case Method::DidSave:
        return callNotification(server_, message, &LanguageServer::didSave);
    case Method::DidClose:
        return callNotification(server_, message, &LanguageServer::didClose);
    case Method::Completion:
        return callRequest(server_, message, &LanguageServer::completion);
    case Method::ResolveCompletionItem:
        return callRequest(server_, message, &LanguageServer::resolveCompletionItem);
    case Method::Hover:
        return callRequest(server_, message, &LanguageServer::hover);
    case Method::SignatureHelp:
        return callRequest(server_, message, &LanguageServer::signatureHelp);
    case Method::Definition:
        return callRequest(server_, message, &LanguageServer::definition);
    case Method::References:
        return callRequest(server_, message, &LanguageServer::references);
    case Method::DocumentSymbol:
        return callRequest(server_, message, &LanguageServer::documentSymbol);
    case Method::CodeAction:
        return callRequest(server_, message, &LanguageServer::codeAction);
    case Method::CodeLens:
        return callRequest(server_, message, &LanguageServer::codeLens);
    case Method::ResolveCodeLens:
        return callRequest(server_, message, &LanguageServer::resolveCodeLens);
    case Method::PrepareRename:
        return callRequest(server_, message, &LanguageServer::prepareRename);
    case Method::Rename:
        return callRequest(server_, message, &LanguageServer::rename);
    case Method::Formatting:
        return callRequest(server_, message, &LanguageServer::formatting);
    case Method::FoldingRange:
        return callRequest(server_, message, &LanguageServer::foldingRange);
    case Method::Exit:
    case Method::CancelRequest:
    case Method::Unknown:
        break;
    }
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "method %s is not routed to a handler",
                                   message.method->c_str());
}

void Dispatcher::runIdleWork()
{
    try
    {
        server_.doAsyncWork();
    } catch (const std::exception& ex)
    {
        logger_.error("Idle work failed: {0}", ex.what());
    } catch (...)
    {
        logger_.error("Idle work failed: unknown exception");
    }
}

}  // namespace srcnav::lsp
