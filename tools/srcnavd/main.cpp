//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `srcnavd` language server executable.
///
/// The process speaks JSON-RPC over stdin/stdout and logs to stderr or to the
/// file named by `--log-file`.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/Connection.h"
#include "srcnav/LSP/JsonRpcIO.h"
#include "srcnav/LSP/OverlayServer.h"
#include "srcnav/LSP/ServerConfig.h"
#include "srcnav/Support/Logger.h"
#include "srcnav/Version.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <iostream>
#include <memory>
#include <system_error>
#include <utility>

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    llvm::SmallVector<llvm::StringRef, 8> args;
    for (int i = 1; i < argc; ++i)
    {
        args.push_back(argv[i]);
    }

    srcnav::lsp::ServerConfig config;
    if (llvm::Error error = srcnav::lsp::parseServerArguments(args, config))
    {
        llvm::errs() << "srcnavd: " << llvm::toString(std::move(error)) << "\n\n"
                     << srcnav::lsp::serverUsage("srcnavd");
        return 1;
    }
    if (config.showHelp)
    {
        llvm::outs() << srcnav::lsp::serverUsage("srcnavd");
        return 0;
    }
    if (config.showVersion)
    {
        llvm::outs() << "srcnavd " << srcnav::kVersionString << "\n";
        return 0;
    }

    std::shared_ptr<llvm::raw_fd_ostream> logFile;
    if (!config.logFile.empty())
    {
        std::error_code ec;
        logFile = std::make_shared<llvm::raw_fd_ostream>(config.logFile, ec, llvm::sys::fs::OF_Append);
        if (ec)
        {
            llvm::errs() << "srcnavd: cannot open log file '" << config.logFile << "': " << ec.message() << "\n";
            return 1;
        }
    }
    // The file sink owns its stream; a detached reader may still log after main returns.
    srcnav::Logger logger(logFile ? srcnav::makeStreamLogSink(std::move(logFile)) : srcnav::makeStreamLogSink(llvm::errs()),
                          config.logLevel);
    logger.info("srcnavd {0} starting", srcnav::kVersionString);

    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    auto                    transport = std::make_shared<srcnav::lsp::JsonRpcStdioTransport>(std::cin, std::cout);
    srcnav::lsp::Connection connection(transport, config, logger);
    connection.setMetricSink([logger](const srcnav::lsp::RequestMetric& metric) {
        logger.debug("[telemetry] method={0} latency_us={1} failed={2}",
                     metric.method,
                     metric.latencyMicros,
                     metric.failed ? "true" : "false");
    });

    const int exitCode = connection.run(
        [](srcnav::lsp::LanguageClient& client, const srcnav::Logger& serverLogger) {
            return std::make_unique<srcnav::lsp::OverlayServer>(client, serverLogger);
        });
    logger.info("srcnavd exiting with code {0}", exitCode);
    return exitCode;
}
