//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements response/notification encoding and the transport-backed client.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/LanguageClient.h"

#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <array>
#include <random>
#include <utility>

namespace srcnav::lsp
{
namespace
{

template <typename Body>
std::string encodeEnvelope(Body&& body)
{
    std::string              text;
    llvm::raw_string_ostream stream(text);
    llvm::json::OStream      json(stream);
    json.object([&]() {
        json.attribute("jsonrpc", "2.0");
        body(json);
    });
    stream.flush();
    return text;
}

}  // namespace

std::string generateRegistrationId()
{
    thread_local std::mt19937_64 engine{std::random_device{}()};

    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8U)
    {
        std::uint64_t chunk = engine();
        for (std::size_t j = 0; j < 8U; ++j)
        {
            bytes[i + j] = static_cast<std::uint8_t>(chunk & 0xFFU);
            chunk >>= 8U;
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0FU) | 0x40U);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3FU) | 0x80U);

    std::string              text;
    llvm::raw_string_ostream stream(text);
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        if (i == 4U || i == 6U || i == 8U || i == 10U)
        {
            stream << '-';
        }
        stream << llvm::format_hex_no_prefix(bytes[i], 2);
    }
    stream.flush();
    return text;
}

std::string encodeResponse(const std::int64_t id, const llvm::json::Value& result)
{
    return encodeEnvelope([&](llvm::json::OStream& json) {
        json.attribute("id", id);
        json.attribute("result", result);
    });
}

std::string encodeErrorResponse(const std::int64_t id, const ErrorPayload& error)
{
    return encodeEnvelope([&](llvm::json::OStream& json) {
        json.attribute("id", id);
        json.attributeObject("error", [&]() {
            json.attribute("code", error.code);
            json.attribute("message", error.message);
            if (!error.data.getAsNull())
            {
                json.attribute("data", error.data);
            }
        });
    });
}

std::string encodeNotification(const llvm::StringRef method, const llvm::json::Value& params)
{
    return encodeEnvelope([&](llvm::json::OStream& json) {
        json.attribute("method", method);
        json.attribute("params", params);
    });
}

JsonRpcClient::JsonRpcClient(JsonRpcStdioTransport& transport, Logger logger)
    : transport_(transport)
    , logger_(std::move(logger))
{
}

void JsonRpcClient::respond(const std::int64_t id, const llvm::json::Value& result)
{
    write(encodeResponse(id, result), "response");
}

void JsonRpcClient::respondError(const std::int64_t id, const ErrorPayload& error)
{
    write(encodeErrorResponse(id, error), "error response");
}

void JsonRpcClient::notify(const llvm::StringRef method, const llvm::json::Value& params)
{
    write(encodeNotification(method, params), method);
}

void JsonRpcClient::publishDiagnostics(const PublishDiagnosticsParams& params)
{
    notify("textDocument/publishDiagnostics", toJSON(params));
}

void JsonRpcClient::showMessage(const ShowMessageParams& params)
{
    notify("window/showMessage", toJSON(params));
}

void JsonRpcClient::registerCapability(const llvm::StringRef method, llvm::json::Value options)
{
    RegistrationParams params{generateRegistrationId(), method.str(), std::move(options)};
    logger_.info("Registering capability {0} as {1}", method, params.id);
    notify("client/registerCapability", toJSON(params));
}

void JsonRpcClient::customNotification(const llvm::StringRef method, llvm::json::Value params)
{
    notify(method, params);
}

void JsonRpcClient::write(const std::string& payload, const llvm::StringRef what)
{
    if (transport_.writeFrame(payload))
    {
        logger_.debug("Sent {0} ({1} bytes)", what, payload.size());
        return;
    }
    failedWrites_.fetch_add(1U, std::memory_order_relaxed);
    logger_.error("Failed to write {0} to client", what);
}

}  // namespace srcnav::lsp
