#pragma once

#include "error.hpp"
#include "server.hpp"
#include "server_source.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace clb {

// Current server snapshot for one logical client name.
//
// Readers load the snapshot pointer atomically and never block; refresh()
// builds a complete replacement list and publishes it with a single atomic
// store, so a reader sees either the whole old list or the whole new one.
// A failed or timed-out fetch keeps the last good snapshot and marks the
// registry stale. At most one fetch is outstanding: a fetch that outlives
// its timeout is joined by later refreshes, which use its result once it
// completes, instead of starting another.
class ServerRegistry {
public:
    ServerRegistry(std::string client_name,
                   std::shared_ptr<ServerSource> source,
                   std::chrono::milliseconds refresh_timeout);

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    // Pull a full member list and publish it. Returns the snapshot current
    // after the attempt; never fails.
    Snapshot refresh();

    // Never null.
    Snapshot snapshot() const;

    bool is_stale() const { return stale_.load(std::memory_order_acquire); }
    std::optional<Error> last_error() const;
    uint64_t refresh_count() const { return refresh_count_.load(std::memory_order_relaxed); }

    const std::string& client_name() const { return client_name_; }

private:
    using FetchResult = std::expected<ServerList, Error>;

    FetchResult fetch_with_timeout();

    std::string client_name_;
    std::shared_ptr<ServerSource> source_;
    std::chrono::milliseconds refresh_timeout_;

    std::atomic<Snapshot> snapshot_;
    std::atomic<bool> stale_{false};
    std::atomic<uint64_t> refresh_count_{0};

    std::mutex fetch_mutex_;
    std::shared_future<FetchResult> pending_;
    uint64_t pending_generation_ = 0;

    mutable std::mutex error_mutex_;
    std::optional<Error> last_error_;
};

} // namespace clb
