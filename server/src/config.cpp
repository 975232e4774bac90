#include "nascore/server/config.hpp"

#include <fstream>

#include "nascore/error_codes.hpp"

namespace nascore::server
{

    namespace
    {

        nlohmann::json read_json_file(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw OperationError(ErrorCode::InvalidPayload, "Cannot open config file " + path.string());
            }
            try
            {
                auto json = nlohmann::json::parse(in);
                if (!json.is_object())
                {
                    throw OperationError(ErrorCode::InvalidPayload, "Config file must hold a JSON object");
                }
                return json;
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw OperationError(ErrorCode::InvalidPayload,
                                     "Malformed config file " + path.string() + ": " + ex.what());
            }
        }

        const nlohmann::json &policy_section(const nlohmann::json &json)
        {
            if (const auto it = json.find("policy"); it != json.end() && it->is_object())
            {
                return *it;
            }
            return json;
        }

    } // namespace

    std::filesystem::path ServerConfig::effective_upload_dir() const
    {
        if (!upload_dir.empty())
        {
            return upload_dir;
        }
        auto base = root.lexically_normal();
        if (!base.has_filename())
        {
            base = base.parent_path();
        }
        return base.parent_path() / (".nascore-uploads-" + base.filename().string());
    }

    void from_json(const nlohmann::json &json, UploadPolicy &policy)
    {
        policy.max_file_size = json.value("max_file_size", std::uint64_t{0});
        policy.allowed_types = json.value("allowed_types", std::vector<std::string>{});
        policy.denied_types = json.value("denied_types", std::vector<std::string>{});
        policy.allowed_extensions = json.value("allowed_extensions", std::vector<std::string>{});
        policy.denied_extensions = json.value("denied_extensions", std::vector<std::string>{});
    }

    void to_json(nlohmann::json &json, const UploadPolicy &policy)
    {
        json = nlohmann::json{
            {"max_file_size", policy.max_file_size},
            {"allowed_types", policy.allowed_types},
            {"denied_types", policy.denied_types},
            {"allowed_extensions", policy.allowed_extensions},
            {"denied_extensions", policy.denied_extensions},
        };
    }

    void apply_config_json(const nlohmann::json &json, ServerConfig &config)
    {
        try
        {
            config.address = json.value("address", config.address);
            config.port = json.value("port", config.port);
            if (json.contains("root"))
            {
                config.root = json.at("root").get<std::string>();
            }
            config.worker_threads = json.value("threads", config.worker_threads);
            if (json.contains("upload_dir"))
            {
                config.upload_dir = json.at("upload_dir").get<std::string>();
            }
            config.chunk_size = json.value("chunk_size", config.chunk_size);
            config.session_ttl = std::chrono::seconds{json.value("session_ttl", config.session_ttl.count())};
            config.sweep_interval = std::chrono::seconds{json.value("sweep_interval", config.sweep_interval.count())};
            config.owner_refresh = std::chrono::seconds{json.value("owner_refresh", config.owner_refresh.count())};
            config.max_request_body = json.value("max_request_body", config.max_request_body);
            if (json.contains("log"))
            {
                config.log_file = std::filesystem::path(json.at("log").get<std::string>());
            }
            config.verbose = json.value("verbose", config.verbose);
            config.policy = policy_section(json).get<UploadPolicy>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw OperationError(ErrorCode::InvalidPayload, std::string("Invalid config value: ") + ex.what());
        }
    }

    void load_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        apply_config_json(read_json_file(path), config);
        config.config_file = path;
    }

    UploadPolicy load_policy_file(const std::filesystem::path &path)
    {
        const auto json = read_json_file(path);
        try
        {
            return policy_section(json).get<UploadPolicy>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw OperationError(ErrorCode::InvalidPayload, std::string("Invalid upload policy: ") + ex.what());
        }
    }

} // namespace nascore::server
