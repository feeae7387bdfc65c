//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Fixtures shared by the LSP unit tests: frame encoding, output decoding,
/// log capture, and a scripted language server.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_TEST_LSP_TEST_SUPPORT_H
#define SRCNAV_TEST_LSP_TEST_SUPPORT_H

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "srcnav/LSP/LanguageClient.h"
#include "srcnav/LSP/LanguageServer.h"
#include "srcnav/Support/Logger.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

namespace srcnav::test
{

inline llvm::json::Value parseJson(const std::string& text)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
    if (!parsed)
    {
        std::cerr << "invalid JSON test fixture: " << llvm::toString(parsed.takeError()) << "\n";
        std::abort();
    }
    return std::move(*parsed);
}

inline std::string encodeLspFrame(const std::string& payload)
{
    std::ostringstream out;
    out << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    return out.str();
}

/// Splits transport output into frame bodies; returns false on a framing error.
inline bool splitFrames(const std::string& output, std::vector<std::string>& bodies)
{
    llvm::StringRef rest(output);
    while (!rest.empty())
    {
        if (!rest.consume_front("Content-Length: "))
        {
            return false;
        }
        const auto [digits, tail] = rest.split("\r\n\r\n");
        std::size_t length        = 0;
        if (digits.getAsInteger(10, length) || tail.size() < length)
        {
            return false;
        }
        bodies.push_back(tail.substr(0, length).str());
        rest = tail.substr(length);
    }
    return true;
}

inline std::vector<llvm::json::Value> decodeFrames(const std::string& output)
{
    std::vector<std::string> bodies;
    if (!splitFrames(output, bodies))
    {
        std::cerr << "malformed transport output: " << output << "\n";
        std::abort();
    }
    std::vector<llvm::json::Value> messages;
    for (const std::string& body : bodies)
    {
        messages.push_back(parseJson(body));
    }
    return messages;
}

inline const llvm::json::Object* findResponseByIntegerId(const std::vector<llvm::json::Value>& outgoing,
                                                         const std::int64_t                    id)
{
    for (const llvm::json::Value& message : outgoing)
    {
        const auto* object = message.getAsObject();
        if (!object || object->get("method"))
        {
            continue;
        }
        const auto responseId = object->getInteger("id");
        if (responseId && *responseId == id)
        {
            return object;
        }
    }
    return nullptr;
}

inline std::vector<const llvm::json::Object*> findNotifications(const std::vector<llvm::json::Value>& outgoing,
                                                                llvm::StringRef                       method)
{
    std::vector<const llvm::json::Object*> out;
    for (const llvm::json::Value& message : outgoing)
    {
        const auto* object = message.getAsObject();
        if (!object)
        {
            continue;
        }
        const auto methodName = object->getString("method");
        if (methodName && *methodName == method)
        {
            out.push_back(object);
        }
    }
    return out;
}

/// Log sink that keeps every record for later inspection.
class CapturedLog final
{
public:
    Logger logger(const LogLevel minLevel = LogLevel::Debug)
    {
        auto records = records_;
        auto mutex   = mutex_;
        return Logger(
            [records, mutex](const LogRecord& record) {
                std::lock_guard<std::mutex> lock(*mutex);
                records->push_back(record);
            },
            minLevel);
    }

    bool contains(const LogLevel level, llvm::StringRef fragment) const
    {
        std::lock_guard<std::mutex> lock(*mutex_);
        for (const LogRecord& record : *records_)
        {
            if (record.level == level && llvm::StringRef(record.message).contains(fragment))
            {
                return true;
            }
        }
        return false;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(*mutex_);
        return records_->size();
    }

private:
    std::shared_ptr<std::vector<LogRecord>> records_ = std::make_shared<std::vector<LogRecord>>();
    std::shared_ptr<std::mutex>             mutex_   = std::make_shared<std::mutex>();
};

/// Client sink recording server-initiated notifications.
class RecordingClient final : public lsp::LanguageClient
{
public:
    void publishDiagnostics(const lsp::PublishDiagnosticsParams& params) override
    {
        diagnostics.push_back(params);
    }

    void showMessage(const lsp::ShowMessageParams& params) override
    {
        messages.push_back(params);
    }

    void registerCapability(llvm::StringRef method, llvm::json::Value options) override
    {
        registrations.push_back(lsp::RegistrationParams{lsp::generateRegistrationId(), method.str(), std::move(options)});
    }

    void customNotification(llvm::StringRef method, llvm::json::Value) override
    {
        custom.push_back(method.str());
    }

    std::vector<lsp::PublishDiagnosticsParams> diagnostics;
    std::vector<lsp::ShowMessageParams>        messages;
    std::vector<lsp::RegistrationParams>       registrations;
    std::vector<std::string>                   custom;
};

/// Language server whose behaviour is scripted per test.
class ScriptedServer final : public lsp::LanguageServer
{
public:
    llvm::Expected<llvm::json::Value> initialize(const lsp::InitializeParams& params) override
    {
        calls.push_back("initialize");
        lastProcessId = params.processId;
        return llvm::json::Value(llvm::json::Object{{"capabilities", llvm::json::Object{}}});
    }

    llvm::Error shutdown() override
    {
        calls.push_back("shutdown");
        return llvm::Error::success();
    }

    llvm::Error didOpen(const lsp::DidOpenTextDocumentParams& params) override
    {
        calls.push_back("didOpen " + params.textDocument.uri);
        if (failNotifications)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "didOpen rejected");
        }
        return llvm::Error::success();
    }

    llvm::Expected<llvm::json::Value> hover(const lsp::TextDocumentPositionParams& params) override
    {
        calls.push_back("hover");
        if (params.position.line < 0)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "position out of range");
        }
        if (throwOnHover)
        {
            throw std::runtime_error("hover exploded");
        }
        return llvm::json::Value(llvm::json::Object{{"contents", "hover text"}});
    }

    llvm::Expected<llvm::json::Value> definition(const lsp::TextDocumentPositionParams&) override
    {
        calls.push_back("definition");
        if (throwUnknownOnDefinition)
        {
            throw 42;
        }
        return llvm::json::Value(llvm::json::Array{});
    }

    void doAsyncWork() override
    {
        ++idleCalls;
        if (onIdle)
        {
            onIdle();
        }
    }

    std::vector<std::string>    calls;
    std::optional<std::int64_t> lastProcessId;
    int                         idleCalls{0};
    bool                        failNotifications{false};
    bool                        throwOnHover{false};
    bool                        throwUnknownOnDefinition{false};
    std::function<void()>       onIdle;
};

}  // namespace srcnav::test

#endif  // SRCNAV_TEST_LSP_TEST_SUPPORT_H
