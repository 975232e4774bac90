#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "nascore/server/identity_lookup.hpp"
#include "nascore/server/periodic_task.hpp"

namespace nascore::server
{

    /// uid/gid to name cache. A miss costs one single-id lookup; the bulk loader
    /// is merged over the cached entries on a fixed interval.
    class OwnershipCache
    {
    public:
        OwnershipCache(std::shared_ptr<IdLookup> lookup, std::shared_ptr<IdTableLoader> loader);
        ~OwnershipCache();

        OwnershipCache(const OwnershipCache &) = delete;
        OwnershipCache &operator=(const OwnershipCache &) = delete;

        std::string username_for(std::uint32_t uid);
        std::string groupname_for(std::uint32_t gid);

        /// Merges freshly loaded bulk tables over the cache. An empty load
        /// leaves the cache untouched.
        void refresh();

        void start_refresh(std::chrono::milliseconds interval);
        void stop_refresh();

        std::size_t cached_users() const;
        std::size_t cached_groups() const;

    private:
        using NameTable = std::unordered_map<std::uint32_t, std::string>;

        std::string cached_or_lookup(NameTable &table, std::uint32_t id, bool is_user);

        std::shared_ptr<IdLookup> lookup_;
        std::shared_ptr<IdTableLoader> loader_;

        mutable std::shared_mutex mutex_;
        NameTable users_;
        NameTable groups_;

        std::unique_ptr<PeriodicTask> refresher_;
    };

} // namespace nascore::server
