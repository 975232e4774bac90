#include "nascore/server/upload_session.hpp"

#include <algorithm>

namespace nascore::server
{

    namespace
    {

        std::int64_t to_seconds(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        std::chrono::system_clock::time_point from_seconds(std::int64_t seconds)
        {
            return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
        }

    } // namespace

    std::uint64_t UploadSession::expected_chunk_size(std::uint64_t index) const noexcept
    {
        if (index + 1 < total_chunks)
        {
            return chunk_size;
        }
        return total_size - index * chunk_size;
    }

    std::uint64_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size) noexcept
    {
        if (chunk_size == 0 || total_size == 0)
        {
            return 1;
        }
        return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
    }

    void to_json(nlohmann::json &json, const UploadSession &session)
    {
        json = nlohmann::json{
            {"id", session.id},
            {"filename", session.filename},
            {"total_size", session.total_size},
            {"chunk_size", session.chunk_size},
            {"total_chunks", session.total_chunks},
            {"uploaded_chunks", session.uploaded_chunks},
            {"target_root", session.target_root.generic_string()},
            {"target_path", session.target_dir},
            {"temp_dir", session.temp_dir.generic_string()},
            {"owner_id", session.owner_id},
            {"owner_principal", session.owner_principal},
            {"metadata", session.metadata},
            {"created_at", to_seconds(session.created_at)},
            {"updated_at", to_seconds(session.updated_at)},
            {"expires_at", to_seconds(session.expires_at)},
        };
        if (session.content_hash)
        {
            json["content_hash"] = *session.content_hash;
        }
    }

    void from_json(const nlohmann::json &json, UploadSession &session)
    {
        session.id = json.at("id").get<std::string>();
        session.filename = json.at("filename").get<std::string>();
        session.total_size = json.at("total_size").get<std::uint64_t>();
        session.chunk_size = json.at("chunk_size").get<std::uint64_t>();
        session.total_chunks = json.value("total_chunks", chunk_count(session.total_size, session.chunk_size));
        session.uploaded_chunks = json.value("uploaded_chunks", std::set<std::uint64_t>{});
        session.target_root = json.at("target_root").get<std::string>();
        session.target_dir = json.value("target_path", std::string{"."});
        session.temp_dir = json.value("temp_dir", std::string{});
        session.owner_id = json.at("owner_id").get<std::string>();
        session.owner_principal = json.value("owner_principal", std::string{});
        if (json.contains("content_hash") && json.at("content_hash").is_string())
        {
            session.content_hash = json.at("content_hash").get<std::string>();
        }
        else
        {
            session.content_hash.reset();
        }
        session.metadata = json.value("metadata", std::map<std::string, std::string>{});
        session.created_at = from_seconds(json.value("created_at", std::int64_t{0}));
        session.updated_at = from_seconds(json.value("updated_at", to_seconds(session.created_at)));
        session.expires_at = from_seconds(json.at("expires_at").get<std::int64_t>());
    }

    UploadProgress make_progress(const UploadSession &session)
    {
        UploadProgress progress{};
        progress.session_id = session.id;
        progress.filename = session.filename;
        progress.total_size = session.total_size;
        progress.total_chunks = session.total_chunks;
        progress.uploaded_count = session.uploaded_chunks.size();
        progress.uploaded_size = std::min(progress.uploaded_count * session.chunk_size, session.total_size);
        progress.percent_complete = session.total_chunks == 0
                                        ? 100.0
                                        : static_cast<double>(progress.uploaded_count) * 100.0 /
                                              static_cast<double>(session.total_chunks);
        progress.complete = session.complete();
        progress.created_at = session.created_at;
        progress.updated_at = session.updated_at;
        return progress;
    }

    void to_json(nlohmann::json &json, const UploadProgress &progress)
    {
        json = nlohmann::json{
            {"session_id", progress.session_id},
            {"filename", progress.filename},
            {"total_size", progress.total_size},
            {"uploaded_size", progress.uploaded_size},
            {"total_chunks", progress.total_chunks},
            {"uploaded_chunks", progress.uploaded_count},
            {"progress", progress.percent_complete},
            {"complete", progress.complete},
            {"created_at", to_seconds(progress.created_at)},
            {"updated_at", to_seconds(progress.updated_at)},
        };
    }

} // namespace nascore::server
