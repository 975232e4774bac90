#include "nascore/server/connection.hpp"

#include <chrono>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "connection_common.hpp"
#include "nascore/server/path_sandbox.hpp"

namespace nascore::server
{

    namespace
    {

        std::int64_t unix_seconds(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        nlohmann::json parse_body(const http::Request &request)
        {
            try
            {
                auto json = nlohmann::json::parse(request.body());
                if (!json.is_object())
                {
                    throw OperationError(ErrorCode::InvalidPayload, "Request body must be a JSON object");
                }
                return json;
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw OperationError(ErrorCode::InvalidPayload, std::string("Malformed JSON body: ") + ex.what());
            }
        }

        /// Session view exposed to clients; internal paths stay private.
        nlohmann::json describe_session(const UploadSession &session)
        {
            nlohmann::json json{
                {"session_id", session.id},
                {"filename", session.filename},
                {"total_size", session.total_size},
                {"chunk_size", session.chunk_size},
                {"total_chunks", session.total_chunks},
                {"target_path", session.target_dir},
                {"metadata", session.metadata},
                {"created_at", unix_seconds(session.created_at)},
                {"expires_at", unix_seconds(session.expires_at)},
            };
            if (session.content_hash)
            {
                json["content_hash"] = *session.content_hash;
            }
            return json;
        }

    } // namespace

    void Connection::handle_upload_create(const http::Request &request)
    {
        const auto owner = owner_id(request);
        const auto body = parse_body(request);

        std::string filename;
        std::uint64_t total_size = 0;
        std::string target_path;
        SessionOptions options;
        try
        {
            filename = body.at("filename").get<std::string>();
            total_size = body.at("total_size").get<std::uint64_t>();
            target_path = body.value("target_path", std::string{"."});
            if (body.contains("chunk_size") && !body.at("chunk_size").is_null())
            {
                options.chunk_size = body.at("chunk_size").get<std::uint64_t>();
            }
            if (body.contains("content_hash") && !body.at("content_hash").is_null())
            {
                options.content_hash = body.at("content_hash").get<std::string>();
            }
            options.metadata = body.value("metadata", std::map<std::string, std::string>{});
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw OperationError(ErrorCode::InvalidPayload, std::string("Invalid upload request: ") + ex.what());
        }

        const auto policy = services_.policy.current();
        validate_upload(filename, total_size, *policy);

        const auto target = PathSandbox::resolve(services_.root, target_path.empty() ? "." : target_path);
        const auto principal = http::header(request, "X-Owner-Principal").value_or("");
        const auto session = services_.uploads.create_session(filename, total_size, target, owner, principal, options);
        send_json(201, describe_session(session));
    }

    void Connection::handle_upload_list(const http::Request &request)
    {
        const auto owner = owner_id(request);
        nlohmann::json sessions = nlohmann::json::array();
        for (const auto &progress : services_.uploads.list_sessions_for_owner(owner))
        {
            sessions.push_back(progress);
        }
        send_json(200, nlohmann::json{{"sessions", std::move(sessions)}});
    }

    void Connection::handle_upload_progress(const http::Request &request, const std::string &session_id)
    {
        const auto owner = owner_id(request);
        const auto session = services_.uploads.snapshot(session_id);
        if (session.owner_id != owner)
        {
            spdlog::warn("Identity '{}' tried to read upload session {} owned by '{}'", owner, session_id,
                         session.owner_id);
            throw OperationError(ErrorCode::Forbidden, "Upload session belongs to another user");
        }
        nlohmann::json payload = make_progress(session);
        payload["session"] = describe_session(session);
        send_json(200, payload);
    }

    void Connection::handle_upload_missing(const http::Request &request, const std::string &session_id)
    {
        const auto missing = services_.uploads.missing_chunks(session_id, owner_id(request));
        send_json(200, nlohmann::json{{"session_id", session_id}, {"missing", missing}});
    }

    void Connection::handle_upload_chunk(http::Request &request, const std::string &session_id,
                                         std::string_view index)
    {
        const auto owner = owner_id(request);
        const auto parsed = connection_common::parse_unsigned(index);
        if (!parsed)
        {
            throw OperationError(ErrorCode::InvalidIndex, "Chunk index must be a non-negative integer");
        }
        std::istringstream data(std::move(request.body()));
        services_.uploads.upload_chunk(session_id, *parsed, data, owner);
        send_json(200, services_.uploads.progress(session_id));
    }

    void Connection::handle_upload_finalize(const http::Request &request, const std::string &session_id)
    {
        const auto owner = owner_id(request);
        const auto path = services_.uploads.finalize(session_id, owner);
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        send_json(200, nlohmann::json{
                           {"session_id", session_id},
                           {"path", relative_to_root(path)},
                           {"size", ec ? 0 : size},
                       });
    }

    void Connection::handle_upload_delete(const http::Request &request, const std::string &session_id)
    {
        services_.uploads.delete_session(session_id, owner_id(request));
        send_json(200, nlohmann::json{{"deleted", session_id}});
    }

} // namespace nascore::server
