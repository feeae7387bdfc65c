//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON-RPC message decoding and encoding.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/Message.h"

#include <utility>

namespace srcnav::lsp
{
namespace
{

llvm::Error shapeError(const char* what)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "invalid JSON-RPC message: %s", what);
}

}  // namespace

MessageKind Message::kind() const
{
    if (method)
    {
        return id ? MessageKind::Request : MessageKind::Notification;
    }
    return MessageKind::Response;
}

llvm::Expected<Message> messageFromJson(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return shapeError("expected object");
    }

    Message message;
    if (const auto* id = object->get("id"); id && !id->getAsNull())
    {
        const auto integer = id->getAsInteger();
        if (!integer)
        {
            return shapeError("id must be an integer");
        }
        message.id = *integer;
    }

    if (const auto* method = object->get("method"); method && !method->getAsNull())
    {
        const auto name = method->getAsString();
        if (!name)
        {
            return shapeError("method must be a string");
        }
        message.method = name->str();
    }

    if (const auto* params = object->get("params"))
    {
        message.params = *params;
    }
    if (const auto* result = object->get("result"))
    {
        message.result = *result;
    }

    if (const auto* error = object->getObject("error"))
    {
        ErrorPayload payload;
        if (const auto code = error->getInteger("code"))
        {
            payload.code = static_cast<int>(*code);
        }
        if (const auto text = error->getString("message"))
        {
            payload.message = text->str();
        }
        if (const auto* data = error->get("data"))
        {
            payload.data = *data;
        }
        message.error = std::move(payload);
    }
    return std::move(message);
}

llvm::Expected<Message> parseMessage(const llvm::StringRef text)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
    if (!parsed)
    {
        return parsed.takeError();
    }
    return messageFromJson(*parsed);
}

std::string describeMessage(const Message& message)
{
    const std::string method = message.method ? *message.method : std::string("<none>");
    switch (message.kind())
    {
    case MessageKind::Request:
        return "request " + std::to_string(*message.id) + " " + method;
    case MessageKind::Notification:
        return "notification " + method;
    case MessageKind::Response:
        return "response " + (message.id ? std::to_string(*message.id) : std::string("null"));
    }
    return method;
}

}  // namespace srcnav::lsp
