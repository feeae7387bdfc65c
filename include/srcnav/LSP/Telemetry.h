//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-method dispatch metrics.
///
/// The dispatcher records one sample for every message it hands to the
/// handler. Counters can be queried at any time and samples are forwarded to
/// an optional sink.
///
//===----------------------------------------------------------------------===//
#ifndef SRCNAV_LSP_TELEMETRY_H
#define SRCNAV_LSP_TELEMETRY_H

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace srcnav::lsp
{

/// @brief One dispatched message.
struct RequestMetric final
{
    /// @brief LSP method name.
    std::string method;

    /// @brief Time spent in the handler and writing the reply, in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief Whether the handler reported a failure.
    bool failed{false};
};

/// @brief Sink callback invoked for each sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Aggregated counters for one method.
struct MethodStats final
{
    std::string   method;
    std::uint64_t count{0};
    std::uint64_t failures{0};
    std::uint64_t totalLatencyMicros{0};
};

/// @brief Thread-safe dispatch metrics recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded samples.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one sample.
    /// @param[in] method LSP method name.
    /// @param[in] latencyMicros Elapsed time in microseconds.
    /// @param[in] failed Whether the handler failed.
    void record(llvm::StringRef method, std::uint64_t latencyMicros, bool failed);

    /// @brief Returns the number of samples recorded for `method`.
    [[nodiscard]] std::uint64_t requestCount(llvm::StringRef method) const;

    /// @brief Returns the number of failed samples recorded for `method`.
    [[nodiscard]] std::uint64_t failureCount(llvm::StringRef method) const;

    /// @brief Returns the number of samples across all methods.
    [[nodiscard]] std::uint64_t totalCount() const;

    /// @brief Returns per-method counters sorted by method name.
    [[nodiscard]] std::vector<MethodStats> snapshot() const;

private:
    struct Counters final
    {
        std::uint64_t count{0};
        std::uint64_t failures{0};
        std::uint64_t totalLatencyMicros{0};
    };

    mutable std::mutex        mutex_;
    RequestMetricSink         sink_;
    llvm::StringMap<Counters> counters_;
    std::uint64_t             total_{0};
};

}  // namespace srcnav::lsp

#endif  // SRCNAV_LSP_TELEMETRY_H
