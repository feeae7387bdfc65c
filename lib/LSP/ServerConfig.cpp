//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements command-line parsing for `srcnavd`.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/ServerConfig.h"

#include "llvm/Support/FormatVariadic.h"

#include <cstdint>
#include <optional>

namespace srcnav::lsp
{
namespace
{

llvm::Error optionError(const llvm::StringRef option, const llvm::StringRef detail)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "%s: %s",
                                   option.str().c_str(),
                                   detail.str().c_str());
}

/// Splits `--name=value`; returns the value when present.
std::optional<llvm::StringRef> splitInlineValue(llvm::StringRef& option)
{
    if (!option.startswith("--"))
    {
        return std::nullopt;
    }
    const auto [name, value] = option.split('=');
    if (name.size() == option.size())
    {
        return std::nullopt;
    }
    option = name;
    return value;
}

llvm::Expected<std::uint64_t> parsePositive(const llvm::StringRef option, const llvm::StringRef text)
{
    std::uint64_t value = 0;
    if (text.empty() || text.getAsInteger(10, value))
    {
        return optionError(option, llvm::formatv("expected a positive integer, got '{0}'", text).str());
    }
    if (value == 0U)
    {
        return optionError(option, "must be at least 1");
    }
    return value;
}

}  // namespace

llvm::Error parseServerArguments(const llvm::ArrayRef<llvm::StringRef> args, ServerConfig& config)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        llvm::StringRef                option      = args[i];
        std::optional<llvm::StringRef> inlineValue = splitInlineValue(option);

        const auto takeValue = [&]() -> llvm::Expected<llvm::StringRef> {
            if (inlineValue)
            {
                return *inlineValue;
            }
            if (i + 1U >= args.size())
            {
                return optionError(option, "missing value");
            }
            return args[++i];
        };
        const auto rejectValue = [&]() -> llvm::Error {
            if (inlineValue)
            {
                return optionError(option, "does not take a value");
            }
            return llvm::Error::success();
        };

        if (option == "--help" || option == "-h")
        {
            if (llvm::Error error = rejectValue())
            {
                return error;
            }
            config.showHelp = true;
        }
        else if (option == "--version" || option == "-V")
        {
            if (llvm::Error error = rejectValue())
            {
                return error;
            }
            config.showVersion = true;
        }
        else if (option == "--queue-capacity")
        {
            llvm::Expected<llvm::StringRef> text = takeValue();
            if (!text)
            {
                return text.takeError();
            }
            llvm::Expected<std::uint64_t> value = parsePositive(option, *text);
            if (!value)
            {
                return value.takeError();
            }
            config.queueCapacity = static_cast<std::size_t>(*value);
        }
        else if (option == "--poll-timeout-ms")
        {
            llvm::Expected<llvm::StringRef> text = takeValue();
            if (!text)
            {
                return text.takeError();
            }
            llvm::Expected<std::uint64_t> value = parsePositive(option, *text);
            if (!value)
            {
                return value.takeError();
            }
            config.pollTimeout = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*value));
        }
        else if (option == "--log-level")
        {
            llvm::Expected<llvm::StringRef> text = takeValue();
            if (!text)
            {
                return text.takeError();
            }
            const std::optional<LogLevel> level = parseLogLevel(*text);
            if (!level)
            {
                return optionError(option, llvm::formatv("unknown level '{0}'", *text).str());
            }
            config.logLevel = *level;
        }
        else if (option == "--log-file")
        {
            llvm::Expected<llvm::StringRef> text = takeValue();
            if (!text)
            {
                return text.takeError();
            }
            if (text->empty())
            {
                return optionError(option, "missing value");
            }
            config.logFile = text->str();
        }
        else
        {
            return optionError(option, "unknown option");
        }
    }
    return llvm::Error::success();
}

std::string serverUsage(const llvm::StringRef programName)
{
    return llvm::formatv("Usage: {0} [options]\n"
                         "\n"
                         "Language server speaking JSON-RPC over stdin/stdout.\n"
                         "\n"
                         "Options:\n"
                         "  --queue-capacity <n>    Pending-message queue capacity (default 10)\n"
                         "  --poll-timeout-ms <n>   Idle poll interval in milliseconds (default 1000)\n"
                         "  --log-level <level>     debug, info, warning or error (default info)\n"
                         "  --log-file <path>       Append logs to <path> instead of stderr\n"
                         "  -V, --version           Print version and exit\n"
                         "  -h, --help              Print this help and exit\n",
                         programName)
        .str();
}

}  // namespace srcnav::lsp
