//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements per-method dispatch metrics.
///
//===----------------------------------------------------------------------===//

#include "srcnav/LSP/Telemetry.h"

#include <algorithm>
#include <utility>

namespace srcnav::lsp
{

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(const llvm::StringRef method, const std::uint64_t latencyMicros, const bool failed)
{
    RequestMetricSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Counters&                   counters = counters_[method];
        ++counters.count;
        counters.totalLatencyMicros += latencyMicros;
        if (failed)
        {
            ++counters.failures;
        }
        ++total_;
        sink = sink_;
    }
    if (sink)
    {
        sink(RequestMetric{method.str(), latencyMicros, failed});
    }
}

std::uint64_t Telemetry::requestCount(const llvm::StringRef method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = counters_.find(method);
    return it == counters_.end() ? 0U : it->second.count;
}

std::uint64_t Telemetry::failureCount(const llvm::StringRef method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = counters_.find(method);
    return it == counters_.end() ? 0U : it->second.failures;
}

std::uint64_t Telemetry::totalCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

std::vector<MethodStats> Telemetry::snapshot() const
{
    std::vector<MethodStats> stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.reserve(counters_.size());
        for (const auto& entry : counters_)
        {
            stats.push_back(MethodStats{entry.getKey().str(),
                                        entry.getValue().count,
                                        entry.getValue().failures,
                                        entry.getValue().totalLatencyMicros});
        }
    }
    std::sort(stats.begin(), stats.end(), [](const MethodStats& lhs, const MethodStats& rhs) {
        return lhs.method < rhs.method;
    });
    return stats;
}

}  // namespace srcnav::lsp
