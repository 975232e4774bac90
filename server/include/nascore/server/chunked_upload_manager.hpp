#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "nascore/server/identity_lookup.hpp"
#include "nascore/server/path_sandbox.hpp"
#include "nascore/server/periodic_task.hpp"
#include "nascore/server/upload_session.hpp"

namespace nascore::server
{

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct UploadManagerConfig
    {
        std::filesystem::path base_dir;
        std::uint64_t default_chunk_size{5ULL * 1024 * 1024};
        std::uint64_t max_chunk_size{64ULL * 1024 * 1024};
        std::chrono::seconds session_ttl{std::chrono::hours{24}};
        std::chrono::milliseconds sweep_interval{std::chrono::hours{1}};
        Clock clock; // system_clock::now when empty
    };

    struct SessionOptions
    {
        std::optional<std::uint64_t> chunk_size;
        std::optional<std::string> content_hash;
        std::map<std::string, std::string> metadata;
    };

    /// Resumable multi-chunk uploads. Every session lives in its own directory
    /// under the base dir (chunk files plus session.json) and is restored from
    /// there on construction. All mutating calls check the caller against the
    /// session owner.
    class ChunkedUploadManager
    {
    public:
        ChunkedUploadManager(UploadManagerConfig config, std::shared_ptr<IdLookup> identities);
        ~ChunkedUploadManager();

        ChunkedUploadManager(const ChunkedUploadManager &) = delete;
        ChunkedUploadManager &operator=(const ChunkedUploadManager &) = delete;

        UploadSession create_session(const std::string &filename, std::uint64_t total_size,
                                     const ResolvedPath &target_dir, const std::string &owner_id,
                                     const std::string &owner_principal, const SessionOptions &options = {});

        /// Reads exactly the expected chunk length from `data`. Anything else
        /// fails with SizeMismatch and leaves no chunk file behind.
        void upload_chunk(const std::string &session_id, std::uint64_t index, std::istream &data,
                          const std::string &caller);

        UploadProgress progress(const std::string &session_id);

        /// Current state of a live session.
        UploadSession snapshot(const std::string &session_id);

        std::vector<std::uint64_t> missing_chunks(const std::string &session_id, const std::string &caller);

        /// Assembles the chunks into target_dir/filename and removes the session.
        std::filesystem::path finalize(const std::string &session_id, const std::string &caller);

        void delete_session(const std::string &session_id, const std::string &caller);

        std::vector<UploadProgress> list_sessions_for_owner(const std::string &owner_id);

        /// Returns the number of sessions removed.
        std::size_t sweep_expired();

        void start_sweeper();
        void stop_sweeper();

        std::size_t session_count() const;
        const std::filesystem::path &base_dir() const noexcept { return config_.base_dir; }
        std::uint64_t max_chunk_size() const noexcept { return config_.max_chunk_size; }

    private:
        struct SessionSlot
        {
            std::mutex mutex;
            std::mutex persist_mutex;
            UploadSession state;
        };

        std::chrono::system_clock::time_point now() const;

        std::shared_ptr<SessionSlot> acquire(const std::string &session_id);
        std::shared_ptr<SessionSlot> acquire_owned(const std::string &session_id, const std::string &caller,
                                                   const char *action);
        void discard(const std::string &session_id);
        void persist(SessionSlot &slot);
        void restore_sessions();
        std::filesystem::path assemble(const UploadSession &session);
        void remove_temp_dir(const UploadSession &session) const;

        UploadManagerConfig config_;
        std::shared_ptr<IdLookup> identities_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<SessionSlot>> sessions_;

        std::unique_ptr<PeriodicTask> sweeper_;
    };

} // namespace nascore::server
