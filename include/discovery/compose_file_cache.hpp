#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>

#include "core/context.hpp"
#include "model/project.hpp"

namespace composedeck::discovery {

class ComposeFileScanner;

// TTL cache over a filesystem scan. Concurrent misses share one scan and all
// of them see its result or its exception. Failures are never cached.
class ComposeFileCache {
public:
    using Clock = std::chrono::steady_clock;
    using ScanFunction = std::function<model::DiscoveredFileList()>;
    using NowFunction = std::function<Clock::time_point()>;

    ComposeFileCache(
        ScanFunction scan,
        std::chrono::seconds ttl,
        const composedeck::Context &ctx,
        NowFunction now = &Clock::now
    );
    ComposeFileCache(const ComposeFileScanner &scanner, const composedeck::Context &ctx);

    ComposeFileCache(const ComposeFileCache &) = delete;
    ComposeFileCache &operator=(const ComposeFileCache &) = delete;

    // bypass forces a new scan, which also refreshes the entry for later callers.
    model::DiscoveredFileList getOrScan(bool bypass = false);
    void invalidate();

private:
    struct Entry {
        model::DiscoveredFileList files;
        Clock::time_point expiresAt;
    };

    model::DiscoveredFileList lead(std::unique_lock<std::mutex> &lock);

    ScanFunction scan_;
    std::chrono::seconds ttl_;
    const composedeck::Context &ctx_;
    NowFunction now_;

    std::mutex mutex_;
    std::optional<Entry> entry_;
    std::shared_future<model::DiscoveredFileList> inFlight_;
    std::uint64_t generation_ = 0;
};

} // namespace composedeck::discovery
