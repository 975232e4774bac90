#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace nascore::server
{

    struct UploadSession
    {
        std::string id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::set<std::uint64_t> uploaded_chunks;
        std::filesystem::path target_root;
        std::string target_dir; // relative to target_root
        std::filesystem::path temp_dir;
        std::string owner_id;
        std::string owner_principal;
        std::optional<std::string> content_hash;
        std::map<std::string, std::string> metadata;
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point updated_at{};
        std::chrono::system_clock::time_point expires_at{};

        bool complete() const noexcept { return uploaded_chunks.size() == total_chunks; }

        /// chunk_size for every chunk but the last, which carries the remainder.
        std::uint64_t expected_chunk_size(std::uint64_t index) const noexcept;
    };

    /// At least one chunk, so an empty file is a single empty chunk.
    std::uint64_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

    void to_json(nlohmann::json &json, const UploadSession &session);
    void from_json(const nlohmann::json &json, UploadSession &session);

    struct UploadProgress
    {
        std::string session_id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t uploaded_size{};
        std::uint64_t total_chunks{};
        std::uint64_t uploaded_count{};
        double percent_complete{};
        bool complete{};
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point updated_at{};
    };

    UploadProgress make_progress(const UploadSession &session);

    void to_json(nlohmann::json &json, const UploadProgress &progress);

} // namespace nascore::server
