#include "server_registry.hpp"
#include "logger.hpp"
#include <future>
#include <system_error>
#include <thread>
#include <spdlog/fmt/fmt.h>

namespace clb {

ServerRegistry::ServerRegistry(std::string client_name,
                               std::shared_ptr<ServerSource> source,
                               std::chrono::milliseconds refresh_timeout)
    : client_name_(std::move(client_name)),
      source_(std::move(source)),
      refresh_timeout_(refresh_timeout),
      snapshot_(std::make_shared<const ServerList>()) {}

Snapshot ServerRegistry::refresh() {
    auto result = fetch_with_timeout();

    if (!result.has_value()) {
        auto current = snapshot();
        stale_.store(true, std::memory_order_release);
        {
            std::lock_guard lock(error_mutex_);
            last_error_ = result.error();
        }
        Logger::warn(Logger::Component::Registry,
            fmt::format("Client {}: discovery unavailable ({}), keeping {} known servers",
                client_name_, result.error().message, current->size()));
        return current;
    }

    Snapshot next = std::make_shared<const ServerList>(std::move(result.value()));
    auto previous = snapshot_.exchange(next, std::memory_order_acq_rel);
    refresh_count_.fetch_add(1, std::memory_order_relaxed);

    if (stale_.exchange(false, std::memory_order_acq_rel)) {
        Logger::info(Logger::Component::Registry,
            fmt::format("Client {}: discovery recovered", client_name_));
    }

    if (next->empty()) {
        Logger::warn(Logger::Component::Registry,
            fmt::format("Client {}: discovery returned no servers", client_name_));
    } else if (previous->size() != next->size()) {
        Logger::info(Logger::Component::Registry,
            fmt::format("Client {}: server list changed {} -> {}",
                client_name_, previous->size(), next->size()));
    } else {
        Logger::debug(Logger::Component::Registry,
            fmt::format("Client {}: refreshed {} servers", client_name_, next->size()));
    }

    return next;
}

Snapshot ServerRegistry::snapshot() const {
    return snapshot_.load(std::memory_order_acquire);
}

std::optional<Error> ServerRegistry::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

ServerRegistry::FetchResult ServerRegistry::fetch_with_timeout() {
    if (!source_) {
        return std::unexpected(Error{ErrorCode::DiscoveryUnavailable, "no server source"});
    }

    std::shared_future<FetchResult> future;
    uint64_t generation = 0;
    {
        std::lock_guard lock(fetch_mutex_);
        if (pending_.valid()) {
            // A previous fetch outlived its timeout; join it rather than
            // stacking another thread on a hung backend.
            future = pending_;
            generation = pending_generation_;
            Logger::debug(Logger::Component::Registry,
                fmt::format("Client {}: waiting on outstanding fetch", client_name_));
        } else {
            // The fetch runs on its own thread so a hung backend cannot hold
            // the caller past refresh_timeout_.
            auto source = source_;
            auto name = client_name_;
            auto task = std::make_shared<std::packaged_task<FetchResult()>>(
                [source, name]() -> FetchResult {
                    try {
                        return source->fetch(name);
                    } catch (const std::exception& e) {
                        return std::unexpected(Error{ErrorCode::DiscoveryUnavailable,
                            fmt::format("fetch failed: {}", e.what())});
                    } catch (...) {
                        return std::unexpected(Error{ErrorCode::DiscoveryUnavailable,
                            "fetch failed: unknown exception"});
                    }
                });
            future = task->get_future().share();

            try {
                std::thread([task]() { (*task)(); }).detach();
            } catch (const std::system_error& e) {
                return std::unexpected(Error{ErrorCode::DiscoveryUnavailable,
                    fmt::format("cannot start fetch: {}", e.what())});
            }
            pending_ = future;
            generation = ++pending_generation_;
        }
    }

    if (future.wait_for(refresh_timeout_) != std::future_status::ready) {
        return std::unexpected(Error{ErrorCode::DiscoveryUnavailable,
            fmt::format("fetch timed out after {}ms", refresh_timeout_.count())});
    }

    {
        std::lock_guard lock(fetch_mutex_);
        if (pending_generation_ == generation) {
            pending_ = {};
        }
    }
    return future.get();
}

} // namespace clb
