#include "nascore/server/chunked_upload_manager.hpp"

#include <algorithm>
#include <fstream>
#include <limits>

#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "nascore/crypto.hpp"
#include "nascore/error_codes.hpp"

namespace nascore::server
{

    namespace
    {
        constexpr auto kMetadataFile = "session.json";
        constexpr std::size_t kSessionIdBytes = 16;
        constexpr std::size_t kCopyBufferSize = 64 * 1024;

        std::filesystem::path chunk_path(const UploadSession &session, std::uint64_t index)
        {
            return session.temp_dir / ("chunk_" + std::to_string(index));
        }

        void validate_filename(const std::string &filename)
        {
            if (filename.empty() || filename == "." || filename == "..")
            {
                throw OperationError(ErrorCode::ValidationFailed, "Invalid filename");
            }
            if (filename.size() > PathSandbox::kMaxComponentLength)
            {
                throw OperationError(ErrorCode::ValidationFailed, "Filename too long");
            }
            if (filename.find_first_of(std::string_view("/\\\0", 3)) != std::string::npos)
            {
                throw OperationError(ErrorCode::ValidationFailed, "Filename must be a single path component");
            }
        }

        /// Removes the file on scope exit unless committed.
        class PartialFile
        {
        public:
            explicit PartialFile(std::filesystem::path path) : path_(std::move(path)) {}
            ~PartialFile()
            {
                if (!committed_)
                {
                    std::error_code ec;
                    std::filesystem::remove(path_, ec);
                }
            }
            PartialFile(const PartialFile &) = delete;
            PartialFile &operator=(const PartialFile &) = delete;

            const std::filesystem::path &path() const noexcept { return path_; }
            void commit() noexcept { committed_ = true; }

        private:
            std::filesystem::path path_;
            bool committed_{false};
        };

        void copy_into(std::ofstream &out, const std::filesystem::path &source)
        {
            std::ifstream in(source, std::ios::binary);
            if (!in.is_open())
            {
                throw OperationError(ErrorCode::InternalError, "Missing chunk file " + source.filename().string());
            }
            std::vector<char> buffer(kCopyBufferSize);
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = in.gcount();
                if (count > 0)
                {
                    out.write(buffer.data(), count);
                }
            }
            if (in.bad() || !out)
            {
                throw OperationError(ErrorCode::InternalError, "Failed to assemble upload");
            }
        }

    } // namespace

    ChunkedUploadManager::ChunkedUploadManager(UploadManagerConfig config, std::shared_ptr<IdLookup> identities)
        : config_(std::move(config)), identities_(std::move(identities))
    {
        if (config_.default_chunk_size == 0)
        {
            config_.default_chunk_size = UploadManagerConfig{}.default_chunk_size;
        }
        config_.max_chunk_size = std::max(config_.max_chunk_size, config_.default_chunk_size);
        std::filesystem::create_directories(config_.base_dir);
        restore_sessions();
    }

    ChunkedUploadManager::~ChunkedUploadManager()
    {
        stop_sweeper();
    }

    std::chrono::system_clock::time_point ChunkedUploadManager::now() const
    {
        return config_.clock ? config_.clock() : std::chrono::system_clock::now();
    }

    UploadSession ChunkedUploadManager::create_session(const std::string &filename, std::uint64_t total_size,
                                                       const ResolvedPath &target_dir, const std::string &owner_id,
                                                       const std::string &owner_principal,
                                                       const SessionOptions &options)
    {
        validate_filename(filename);
        const auto chunk_size = options.chunk_size.value_or(config_.default_chunk_size);
        if (chunk_size == 0 || chunk_size > config_.max_chunk_size)
        {
            throw OperationError(ErrorCode::ValidationFailed, "Chunk size out of range");
        }
        // The assembled file is addressed through off_t.
        if (total_size > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max()))
        {
            throw OperationError(ErrorCode::ValidationFailed, "Total size exceeds the largest file offset");
        }

        auto slot = std::make_shared<SessionSlot>();
        auto &state = slot->state;
        state.filename = filename;
        state.total_size = total_size;
        state.chunk_size = chunk_size;
        state.total_chunks = chunk_count(total_size, chunk_size);
        state.target_root = target_dir.root();
        state.target_dir = target_dir.relative();
        state.owner_id = owner_id;
        state.owner_principal = owner_principal;
        state.content_hash = options.content_hash;
        state.metadata = options.metadata;
        state.created_at = now();
        state.updated_at = state.created_at;
        state.expires_at = state.created_at + config_.session_ttl;

        // create_directory reports false for an existing directory, so ids never collide.
        for (;;)
        {
            state.id = crypto::random_hex(kSessionIdBytes);
            state.temp_dir = config_.base_dir / state.id;
            if (std::filesystem::create_directory(state.temp_dir))
            {
                break;
            }
        }
        std::filesystem::permissions(state.temp_dir, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace);

        try
        {
            persist(*slot);
        }
        catch (const std::exception &)
        {
            remove_temp_dir(state);
            throw;
        }

        {
            std::unique_lock lock(mutex_);
            sessions_[state.id] = slot;
        }
        spdlog::info("Upload session {} created by {}: {} ({} bytes, {} chunks)", state.id, owner_id, filename,
                     total_size, state.total_chunks);
        return state;
    }

    void ChunkedUploadManager::upload_chunk(const std::string &session_id, std::uint64_t index, std::istream &data,
                                            const std::string &caller)
    {
        auto slot = acquire_owned(session_id, caller, "upload to");

        UploadSession session;
        {
            std::lock_guard lock(slot->mutex);
            session = slot->state;
        }
        if (index >= session.total_chunks)
        {
            throw OperationError(ErrorCode::InvalidIndex, "Chunk index " + std::to_string(index) +
                                                              " outside [0, " +
                                                              std::to_string(session.total_chunks) + ")");
        }

        const auto expected = session.expected_chunk_size(index);
        PartialFile partial(session.temp_dir /
                            ("chunk_" + std::to_string(index) + "." + crypto::random_hex(6) + ".part"));
        std::uint64_t written = 0;
        bool overflow = false;
        {
            std::ofstream out(partial.path(), std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw OperationError(ErrorCode::InternalError, "Failed to open chunk file");
            }
            std::vector<char> buffer(kCopyBufferSize);
            while (data && !overflow)
            {
                data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = static_cast<std::uint64_t>(data.gcount());
                if (count == 0)
                {
                    break;
                }
                if (written + count > expected)
                {
                    overflow = true;
                    break;
                }
                out.write(buffer.data(), static_cast<std::streamsize>(count));
                written += count;
            }
            out.flush();
            if (!out)
            {
                throw OperationError(ErrorCode::InternalError, "Failed to write chunk file");
            }
        }
        if (data.bad())
        {
            throw OperationError(ErrorCode::SizeMismatch, "Chunk stream failed after " + std::to_string(written) +
                                                              " bytes");
        }
        if (overflow || written != expected)
        {
            throw OperationError(ErrorCode::SizeMismatch,
                                 "Chunk " + std::to_string(index) + " must be " + std::to_string(expected) +
                                     " bytes" + (overflow ? ", received more" : ", received " + std::to_string(written)));
        }

        // Finalize and delete detach under the exclusive lock, so holding the shared
        // lock keeps the slot registered until the chunk is recorded.
        std::shared_lock table_lock(mutex_);
        if (const auto it = sessions_.find(session_id); it == sessions_.end() || it->second != slot)
        {
            throw OperationError(ErrorCode::NotFound, "Upload session is no longer active");
        }

        std::error_code ec;
        std::filesystem::rename(partial.path(), chunk_path(session, index), ec);
        if (ec)
        {
            throw OperationError(ErrorCode::InternalError, "Failed to store chunk: " + ec.message());
        }
        partial.commit();

        {
            std::lock_guard lock(slot->mutex);
            slot->state.uploaded_chunks.insert(index);
            slot->state.updated_at = now();
        }
        persist(*slot);
        table_lock.unlock();
        spdlog::debug("Upload session {}: chunk {} stored ({} bytes)", session_id, index, written);
    }

    UploadProgress ChunkedUploadManager::progress(const std::string &session_id)
    {
        auto slot = acquire(session_id);
        std::lock_guard lock(slot->mutex);
        return make_progress(slot->state);
    }

    UploadSession ChunkedUploadManager::snapshot(const std::string &session_id)
    {
        auto slot = acquire(session_id);
        std::lock_guard lock(slot->mutex);
        return slot->state;
    }

    std::vector<std::uint64_t> ChunkedUploadManager::missing_chunks(const std::string &session_id,
                                                                    const std::string &caller)
    {
        auto slot = acquire_owned(session_id, caller, "inspect");
        std::lock_guard lock(slot->mutex);
        std::vector<std::uint64_t> missing;
        for (std::uint64_t index = 0; index < slot->state.total_chunks; ++index)
        {
            if (!slot->state.uploaded_chunks.contains(index))
            {
                missing.push_back(index);
            }
        }
        return missing;
    }

    std::filesystem::path ChunkedUploadManager::finalize(const std::string &session_id, const std::string &caller)
    {
        auto slot = acquire_owned(session_id, caller, "finalize");
        {
            std::lock_guard lock(slot->mutex);
            if (!slot->state.complete())
            {
                throw OperationError(ErrorCode::IncompleteUpload,
                                     std::to_string(slot->state.uploaded_chunks.size()) + " of " +
                                         std::to_string(slot->state.total_chunks) + " chunks uploaded");
            }
        }

        {
            std::unique_lock lock(mutex_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end() || it->second != slot)
            {
                throw OperationError(ErrorCode::NotFound, "Upload session is no longer active");
            }
            sessions_.erase(it);
        }

        UploadSession session;
        {
            std::lock_guard lock(slot->mutex);
            session = slot->state;
        }

        std::filesystem::path result;
        try
        {
            result = assemble(session);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Upload session {} failed to finalize: {}", session_id, ex.what());
            remove_temp_dir(session);
            throw;
        }
        remove_temp_dir(session);
        spdlog::info("Upload session {} finalized into {}", session_id, result.string());
        return result;
    }

    void ChunkedUploadManager::delete_session(const std::string &session_id, const std::string &caller)
    {
        acquire_owned(session_id, caller, "delete");
        discard(session_id);
        spdlog::info("Upload session {} deleted by {}", session_id, caller);
    }

    std::vector<UploadProgress> ChunkedUploadManager::list_sessions_for_owner(const std::string &owner_id)
    {
        const auto current = now();
        std::vector<UploadProgress> result;
        {
            std::shared_lock lock(mutex_);
            for (const auto &[id, slot] : sessions_)
            {
                std::lock_guard slot_lock(slot->mutex);
                if (slot->state.owner_id == owner_id && current <= slot->state.expires_at)
                {
                    result.push_back(make_progress(slot->state));
                }
            }
        }
        std::sort(result.begin(), result.end(), [](const UploadProgress &lhs, const UploadProgress &rhs)
                  { return lhs.created_at != rhs.created_at ? lhs.created_at < rhs.created_at
                                                            : lhs.session_id < rhs.session_id; });
        return result;
    }

    std::size_t ChunkedUploadManager::sweep_expired()
    {
        const auto current = now();
        std::vector<UploadSession> expired;
        {
            std::unique_lock lock(mutex_);
            for (auto it = sessions_.begin(); it != sessions_.end();)
            {
                std::unique_lock slot_lock(it->second->mutex);
                if (current > it->second->state.expires_at)
                {
                    expired.push_back(it->second->state);
                    slot_lock.unlock();
                    it = sessions_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }
        for (const auto &session : expired)
        {
            remove_temp_dir(session);
            spdlog::info("Upload session {} expired", session.id);
        }
        return expired.size();
    }

    void ChunkedUploadManager::start_sweeper()
    {
        if (sweeper_)
        {
            return;
        }
        sweeper_ = std::make_unique<PeriodicTask>("upload-sweeper", config_.sweep_interval, [this]
                                                  { sweep_expired(); });
        sweeper_->start();
    }

    void ChunkedUploadManager::stop_sweeper()
    {
        if (sweeper_)
        {
            sweeper_->stop();
            sweeper_.reset();
        }
    }

    std::size_t ChunkedUploadManager::session_count() const
    {
        std::shared_lock lock(mutex_);
        return sessions_.size();
    }

    std::shared_ptr<ChunkedUploadManager::SessionSlot> ChunkedUploadManager::acquire(const std::string &session_id)
    {
        std::shared_ptr<SessionSlot> slot;
        {
            std::shared_lock lock(mutex_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end())
            {
                throw OperationError(ErrorCode::NotFound, "Upload session not found");
            }
            slot = it->second;
        }

        bool expired = false;
        {
            std::lock_guard lock(slot->mutex);
            expired = now() > slot->state.expires_at;
        }
        if (expired)
        {
            discard(session_id);
            spdlog::info("Upload session {} expired", session_id);
            throw OperationError(ErrorCode::Expired, "Upload session expired");
        }
        return slot;
    }

    std::shared_ptr<ChunkedUploadManager::SessionSlot> ChunkedUploadManager::acquire_owned(
        const std::string &session_id, const std::string &caller, const char *action)
    {
        auto slot = acquire(session_id);
        std::lock_guard lock(slot->mutex);
        if (slot->state.owner_id != caller)
        {
            spdlog::warn("Identity '{}' tried to {} upload session {} owned by '{}'", caller, action, session_id,
                         slot->state.owner_id);
            throw OperationError(ErrorCode::Forbidden, "Upload session belongs to another user");
        }
        return slot;
    }

    void ChunkedUploadManager::discard(const std::string &session_id)
    {
        std::shared_ptr<SessionSlot> slot;
        {
            std::unique_lock lock(mutex_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end())
            {
                return;
            }
            slot = it->second;
            sessions_.erase(it);
        }
        UploadSession session;
        {
            std::lock_guard lock(slot->mutex);
            session = slot->state;
        }
        remove_temp_dir(session);
    }

    void ChunkedUploadManager::persist(SessionSlot &slot)
    {
        std::lock_guard persist_lock(slot.persist_mutex);
        nlohmann::json json;
        std::filesystem::path dir;
        {
            std::lock_guard lock(slot.mutex);
            json = slot.state;
            dir = slot.state.temp_dir;
        }

        const auto target = dir / kMetadataFile;
        PartialFile temp(dir / (std::string(kMetadataFile) + ".tmp"));
        {
            std::ofstream out(temp.path(), std::ios::trunc);
            if (!out.is_open())
            {
                throw OperationError(ErrorCode::InternalError, "Failed to write session metadata");
            }
            out << json.dump(2);
            out.flush();
            if (!out)
            {
                throw OperationError(ErrorCode::InternalError, "Failed to write session metadata");
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp.path(), target, ec);
        if (ec)
        {
            throw OperationError(ErrorCode::InternalError, "Failed to store session metadata: " + ec.message());
        }
        temp.commit();
    }

    void ChunkedUploadManager::restore_sessions()
    {
        const auto current = now();
        std::size_t restored = 0;
        for (const auto &entry : std::filesystem::directory_iterator(config_.base_dir))
        {
            std::error_code ec;
            if (!entry.is_directory(ec))
            {
                continue;
            }
            const auto metadata_path = entry.path() / kMetadataFile;
            std::ifstream in(metadata_path);
            if (!in.is_open())
            {
                spdlog::warn("Skipping upload directory {} without session metadata", entry.path().string());
                continue;
            }

            auto slot = std::make_shared<SessionSlot>();
            auto &state = slot->state;
            try
            {
                const auto json = nlohmann::json::parse(in);
                state = json.get<UploadSession>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping unreadable session metadata {}: {}", metadata_path.string(), ex.what());
                continue;
            }
            if (state.id != entry.path().filename().string())
            {
                spdlog::warn("Skipping session metadata {} with mismatched id {}", metadata_path.string(), state.id);
                continue;
            }
            state.temp_dir = entry.path();

            if (current > state.expires_at)
            {
                remove_temp_dir(state);
                spdlog::info("Upload session {} expired while offline", state.id);
                continue;
            }

            for (auto it = state.uploaded_chunks.begin(); it != state.uploaded_chunks.end();)
            {
                std::error_code size_ec;
                const auto size = *it < state.total_chunks
                                      ? std::filesystem::file_size(chunk_path(state, *it), size_ec)
                                      : 0;
                if (*it >= state.total_chunks || size_ec || size != state.expected_chunk_size(*it))
                {
                    spdlog::warn("Upload session {}: dropping chunk {} missing on disk", state.id, *it);
                    it = state.uploaded_chunks.erase(it);
                }
                else
                {
                    ++it;
                }
            }

            sessions_[state.id] = std::move(slot);
            ++restored;
        }
        if (restored > 0)
        {
            spdlog::info("Restored {} upload session(s) from {}", restored, config_.base_dir.string());
        }
    }

    std::filesystem::path ChunkedUploadManager::assemble(const UploadSession &session)
    {
        const auto directory = PathSandbox::resolve(session.target_root, session.target_dir);
        const auto target = PathSandbox::resolve_within(directory, session.filename);
        PathSandbox::ensure_not_root(target);

        std::filesystem::create_directories(directory.path());
        PartialFile partial(directory.path() / ("." + session.filename + "." + crypto::random_hex(6) + ".partial"));
        {
            std::ofstream out(partial.path(), std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw OperationError(ErrorCode::InternalError, "Failed to create output file");
            }
            for (std::uint64_t index = 0; index < session.total_chunks; ++index)
            {
                copy_into(out, chunk_path(session, index));
            }
            out.flush();
            if (!out)
            {
                throw OperationError(ErrorCode::InternalError, "Failed to write output file");
            }
        }

        const auto size = std::filesystem::file_size(partial.path());
        if (size != session.total_size)
        {
            throw OperationError(ErrorCode::SizeMismatch, "Assembled " + std::to_string(size) + " bytes, expected " +
                                                              std::to_string(session.total_size));
        }
        if (session.content_hash && !crypto::digests_equal(crypto::hash_file(partial.path()), *session.content_hash))
        {
            throw OperationError(ErrorCode::ChecksumMismatch, "Content hash mismatch");
        }

        std::filesystem::permissions(partial.path(),
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                                         std::filesystem::perms::group_read | std::filesystem::perms::others_read,
                                     std::filesystem::perm_options::replace);

        if (!session.owner_principal.empty())
        {
            const auto ids = identities_ ? identities_->principal(session.owner_principal)
                                         : std::optional<PrincipalIds>{};
            if (!ids)
            {
                throw OperationError(ErrorCode::InternalError, "Unknown account " + session.owner_principal);
            }
            if (::chown(directory.path().c_str(), ids->uid, ids->gid) != 0)
            {
                spdlog::warn("Could not change owner of {} to {}", directory.path().string(), session.owner_principal);
            }
            if (::chown(partial.path().c_str(), ids->uid, ids->gid) != 0)
            {
                throw OperationError(ErrorCode::InternalError, "Failed to change owner to " + session.owner_principal);
            }
        }

        std::error_code ec;
        std::filesystem::rename(partial.path(), target.path(), ec);
        if (ec)
        {
            throw OperationError(ErrorCode::InternalError, "Failed to move upload into place: " + ec.message());
        }
        partial.commit();
        return target.path();
    }

    void ChunkedUploadManager::remove_temp_dir(const UploadSession &session) const
    {
        if (session.temp_dir.empty())
        {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(session.temp_dir, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove upload directory {}: {}", session.temp_dir.string(), ec.message());
        }
    }

} // namespace nascore::server
