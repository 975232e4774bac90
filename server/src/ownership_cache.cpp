#include "nascore/server/ownership_cache.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace nascore::server
{

    OwnershipCache::OwnershipCache(std::shared_ptr<IdLookup> lookup, std::shared_ptr<IdTableLoader> loader)
        : lookup_(std::move(lookup)), loader_(std::move(loader)) {}

    OwnershipCache::~OwnershipCache()
    {
        stop_refresh();
    }

    std::string OwnershipCache::username_for(std::uint32_t uid)
    {
        return cached_or_lookup(users_, uid, true);
    }

    std::string OwnershipCache::groupname_for(std::uint32_t gid)
    {
        return cached_or_lookup(groups_, gid, false);
    }

    std::string OwnershipCache::cached_or_lookup(NameTable &table, std::uint32_t id, bool is_user)
    {
        {
            std::shared_lock lock(mutex_);
            const auto it = table.find(id);
            if (it != table.end())
            {
                return it->second;
            }
        }

        auto name = is_user ? lookup_->user_name(id) : lookup_->group_name(id);
        std::string resolved = name ? std::move(*name) : std::to_string(id);

        std::unique_lock lock(mutex_);
        table.insert_or_assign(id, resolved);
        return resolved;
    }

    void OwnershipCache::refresh()
    {
        auto tables = loader_->load();
        const auto user_count = tables.users.size();
        const auto group_count = tables.groups.size();
        if (user_count == 0 && group_count == 0)
        {
            spdlog::warn("Ownership cache refresh loaded no entries; keeping cached names");
            return;
        }

        // Bulk entries win; ids only known from single lookups stay cached.
        {
            std::unique_lock lock(mutex_);
            tables.users.merge(users_);
            tables.groups.merge(groups_);
            users_ = std::move(tables.users);
            groups_ = std::move(tables.groups);
        }
        spdlog::debug("Ownership cache refreshed: {} users, {} groups", user_count, group_count);
    }

    void OwnershipCache::start_refresh(std::chrono::milliseconds interval)
    {
        stop_refresh();
        refresher_ = std::make_unique<PeriodicTask>("ownership-refresh", interval, [this]
                                                    { refresh(); });
        refresher_->start();
    }

    void OwnershipCache::stop_refresh()
    {
        if (refresher_)
        {
            refresher_->stop();
            refresher_.reset();
        }
    }

    std::size_t OwnershipCache::cached_users() const
    {
        std::shared_lock lock(mutex_);
        return users_.size();
    }

    std::size_t OwnershipCache::cached_groups() const
    {
        std::shared_lock lock(mutex_);
        return groups_.size();
    }

} // namespace nascore::server
