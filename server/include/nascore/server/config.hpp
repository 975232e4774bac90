#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "nascore/server/upload_policy.hpp"

namespace nascore::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::filesystem::path upload_dir;
        std::uint64_t chunk_size{5ULL * 1024 * 1024};
        std::chrono::seconds session_ttl{std::chrono::hours{24}};
        std::chrono::seconds sweep_interval{std::chrono::hours{1}};
        std::chrono::seconds owner_refresh{std::chrono::minutes{5}};
        std::uint64_t max_request_body{1ULL * 1024 * 1024}; // non-chunk bodies
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
        UploadPolicy policy;

        /// upload_dir, or a directory beside root when unset.
        std::filesystem::path effective_upload_dir() const;
    };

    void from_json(const nlohmann::json &json, UploadPolicy &policy);
    void to_json(nlohmann::json &json, const UploadPolicy &policy);

    /// Overlays the keys present in `json` onto `config`.
    void apply_config_json(const nlohmann::json &json, ServerConfig &config);

    /// Throws OperationError(InvalidPayload) for unreadable or malformed files.
    void load_config_file(const std::filesystem::path &path, ServerConfig &config);

    /// Reads only the upload policy section of a config file.
    UploadPolicy load_policy_file(const std::filesystem::path &path);

} // namespace nascore::server
