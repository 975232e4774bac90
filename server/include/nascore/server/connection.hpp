#pragma once

#include <asio/ip/tcp.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core/flat_buffer.hpp>
#include <nlohmann/json.hpp>

#include "nascore/error_codes.hpp"
#include "nascore/http.hpp"
#include "nascore/server/chunked_upload_manager.hpp"
#include "nascore/server/file_tree.hpp"
#include "nascore/server/upload_policy.hpp"

namespace nascore::server
{

    struct ServerServices
    {
        std::filesystem::path root;
        FileTree &file_tree;
        ChunkedUploadManager &uploads;
        PolicyStore &policy;
        std::uint64_t max_request_body;
        std::uint64_t max_chunk_body;
    };

    /// One HTTP/1.1 client connection. Bytes are read asynchronously and fed to
    /// a Beast request parser; handlers run on the worker thread that completed
    /// the read and write the response with blocking writes.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, ServerServices services);
        ~Connection();

        void start();

        void stop();

    private:
        class SocketWriter;

        void read_request();
        void read_more();
        void parse_buffered();
        bool on_header();
        void handle_request(http::Request &request);
        void finish_request(bool keep_alive);

        void dispatch(http::Request &request);

        // File routes
        void handle_download(const http::Request &request, std::string_view path);
        void handle_list(const http::Request &request, std::string_view path);
        void handle_stat(std::string_view path);
        void handle_mkdir(std::string_view path);
        void handle_delete(std::string_view path);
        void handle_move(const http::Request &request);

        // Upload session routes
        void handle_upload_create(const http::Request &request);
        void handle_upload_list(const http::Request &request);
        void handle_upload_progress(const http::Request &request, const std::string &session_id);
        void handle_upload_missing(const http::Request &request, const std::string &session_id);
        void handle_upload_chunk(http::Request &request, const std::string &session_id, std::string_view index);
        void handle_upload_finalize(const http::Request &request, const std::string &session_id);
        void handle_upload_delete(const http::Request &request, const std::string &session_id);

        /// Answers with an error and closes the connection.
        void reject(ErrorCode code, std::string_view message);

        void send_json(int status, const nlohmann::json &body);
        void send_error(ErrorCode code, std::string_view message);
        void send_error(int status, std::string_view code, std::string_view message);

        std::string owner_id(const http::Request &request) const;
        std::string relative_to_root(const std::filesystem::path &path) const;
        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        boost::beast::flat_buffer buffer_;
        std::unique_ptr<http::RequestReader> reader_;
        std::uint64_t body_limit_{0};
        std::unique_ptr<SocketWriter> writer_;
        std::string remote_;
    };

} // namespace nascore::server
