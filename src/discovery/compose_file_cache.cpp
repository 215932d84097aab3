#include "discovery/compose_file_cache.hpp"

#include <cstdint>
#include <exception>
#include <utility>

#include "discovery/compose_file_scanner.hpp"

namespace composedeck::discovery
{

    ComposeFileCache::ComposeFileCache(
        ScanFunction scan,
        std::chrono::seconds ttl,
        const composedeck::Context &ctx,
        NowFunction now)
        : scan_(std::move(scan)), ttl_(ttl), ctx_(ctx), now_(std::move(now))
    {
    }

    ComposeFileCache::ComposeFileCache(const ComposeFileScanner &scanner, const composedeck::Context &ctx)
        : ComposeFileCache(
              [&scanner]()
              { return scanner.scan(); },
              std::chrono::seconds(scanner.settings().cacheDurationSeconds),
              ctx)
    {
    }

    model::DiscoveredFileList ComposeFileCache::getOrScan(bool bypass)
    {
        for (;;)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!bypass && entry_.has_value() && now_() < entry_->expiresAt)
            {
                ctx_.debug("Cache HIT for compose file discovery");
                return entry_->files;
            }

            if (!inFlight_.valid())
            {
                if (bypass)
                {
                    ctx_.debug("Cache bypassed, forcing refresh");
                }
                return lead(lock);
            }

            std::shared_future<model::DiscoveredFileList> flight = inFlight_;
            lock.unlock();

            if (!bypass)
            {
                ctx_.debug("Cache MISS, joining scan in progress");
                return flight.get();
            }

            // A bypass must not reuse a scan that started before it arrived.
            flight.wait();
        }
    }

    model::DiscoveredFileList ComposeFileCache::lead(std::unique_lock<std::mutex> &lock)
    {
        std::promise<model::DiscoveredFileList> promise;
        inFlight_ = promise.get_future().share();
        const std::uint64_t generation = generation_;
        lock.unlock();

        auto abandon = [&]()
        {
            lock.lock();
            inFlight_ = {};
            lock.unlock();
            promise.set_exception(std::current_exception());
        };

        ctx_.debug("Starting compose file discovery scan");
        model::DiscoveredFileList files;
        try
        {
            files = scan_();
        }
        catch (const std::exception &e)
        {
            ctx_.error("Error during compose file discovery scan: ", e.what());
            abandon();
            throw;
        }
        catch (...)
        {
            ctx_.error("Error during compose file discovery scan");
            abandon();
            throw;
        }

        lock.lock();
        // An invalidate() that raced with this scan wins; waiters still get the result.
        if (generation == generation_)
        {
            entry_ = Entry{files, now_() + ttl_};
        }
        inFlight_ = {};
        lock.unlock();

        ctx_.debug("Cache populated with ", files.size(), " compose files, TTL: ", ttl_.count(), "s");
        promise.set_value(files);
        return files;
    }

    void ComposeFileCache::invalidate()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry_.reset();
        ++generation_;
        ctx_.debug("Compose file discovery cache invalidated");
    }

} // namespace composedeck::discovery
