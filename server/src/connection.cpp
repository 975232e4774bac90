#include "nascore/server/connection.hpp"

#include <asio/write.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "connection_common.hpp"
#include "nascore/version.hpp"

namespace nascore::server
{

    namespace
    {
        constexpr std::uint32_t kMaxHeadSize = 64 * 1024;
        constexpr std::size_t kReadSize = 64 * 1024;

        bool is_chunk_upload(const http::Request &request)
        {
            const std::string_view target = request.target();
            return request.method() == http::beast_http::verb::put && target.starts_with("/uploads/") &&
                   target.find("/chunks/") != std::string_view::npos;
        }

        ErrorCode code_for(const std::filesystem::filesystem_error &error)
        {
            const auto condition = error.code().default_error_condition();
            if (condition == std::errc::no_such_file_or_directory || condition == std::errc::not_a_directory)
            {
                return ErrorCode::NotFound;
            }
            if (condition == std::errc::permission_denied || condition == std::errc::operation_not_permitted)
            {
                return ErrorCode::Forbidden;
            }
            if (condition == std::errc::file_exists || condition == std::errc::directory_not_empty)
            {
                return ErrorCode::InvalidPayload;
            }
            return ErrorCode::InternalError;
        }

    } // namespace

    void Connection::SocketWriter::reset(bool keep_alive)
    {
        keep_alive_ = keep_alive;
        started_ = false;
        status_ = 0;
    }

    void Connection::SocketWriter::write_head(http::ResponseHead head)
    {
        head.version(11);
        head.set(http::beast_http::field::date, http::format_http_date(std::chrono::system_clock::now()));
        head.set(http::beast_http::field::server, "nascore/" + std::string(nascore::version()));
        head.set(http::beast_http::field::connection, keep_alive_ ? "keep-alive" : "close");
        started_ = true;
        status_ = static_cast<int>(head.result_int());
        write_all(http::serialize_head(head));
    }

    void Connection::SocketWriter::write_body(std::string_view data)
    {
        if (!data.empty())
        {
            write_all(data);
        }
    }

    void Connection::SocketWriter::write_all(std::string_view data)
    {
        std::error_code ec;
        asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
        if (ec)
        {
            throw WriteFailed(ec.message());
        }
    }

    Connection::Connection(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)),
          services_(std::move(services)),
          writer_(std::make_unique<SocketWriter>(socket_))
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        remote_ = ec ? std::string{"unknown"} : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Connection::~Connection() = default;

    void Connection::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        read_request();
    }

    void Connection::stop()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        spdlog::debug("Connection closed for {}", remote_endpoint());
    }

    void Connection::read_request()
    {
        // The parser allows the larger of the two limits; on_header narrows it per route.
        reader_ = std::make_unique<http::RequestReader>(
            kMaxHeadSize, std::max(services_.max_request_body, services_.max_chunk_body));
        body_limit_ = services_.max_request_body;
        writer_->reset(false);
        parse_buffered();
    }

    void Connection::read_more()
    {
        auto self = shared_from_this();
        const auto space = buffer_.prepare(kReadSize);
        socket_.async_read_some(asio::buffer(space.data(), space.size()),
                                [this, self](const std::error_code &ec, std::size_t bytes)
                                {
                                    if (ec)
                                    {
                                        if (reader_ && reader_->header_done())
                                        {
                                            spdlog::debug("{} disconnected while sending a request body: {}",
                                                          remote_endpoint(), ec.message());
                                        }
                                        stop();
                                        return;
                                    }
                                    buffer_.commit(bytes);
                                    parse_buffered();
                                });
    }

    void Connection::parse_buffered()
    {
        try
        {
            while (buffer_.size() > 0 && !reader_->done())
            {
                const auto data = buffer_.data();
                const bool had_header = reader_->header_done();
                const auto used = reader_->feed(std::string_view(static_cast<const char *>(data.data()), data.size()));
                buffer_.consume(used);
                if (!had_header && reader_->header_done() && !on_header())
                {
                    return;
                }
                if (used == 0)
                {
                    break;
                }
            }
        }
        catch (const OperationError &ex)
        {
            reject(ex.code(), ex.what());
            return;
        }

        if (!reader_->done())
        {
            read_more();
            return;
        }
        auto request = reader_->release();
        reader_.reset();
        if (request.body().size() > body_limit_)
        {
            // Chunked bodies carry no length up front.
            reject(ErrorCode::PayloadTooLarge, "Request body exceeds " + std::to_string(body_limit_) + " bytes");
            return;
        }
        handle_request(request);
    }

    bool Connection::on_header()
    {
        const auto &request = reader_->peek();
        writer_->reset(request.keep_alive());
        body_limit_ = is_chunk_upload(request) ? services_.max_chunk_body : services_.max_request_body;
        if (const auto length = reader_->content_length(); length && *length > body_limit_)
        {
            reject(ErrorCode::PayloadTooLarge, "Request body exceeds " + std::to_string(body_limit_) + " bytes");
            return false;
        }
        return true;
    }

    void Connection::handle_request(http::Request &request)
    {
        spdlog::debug("{} -> {} {}", remote_endpoint(), request.method_string(), request.target());
        try
        {
            dispatch(request);
        }
        catch (const WriteFailed &ex)
        {
            spdlog::debug("{} write failed: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }
        finish_request(writer_->keep_alive());
    }

    void Connection::finish_request(bool keep_alive)
    {
        if (keep_alive && socket_.is_open())
        {
            read_request();
        }
        else
        {
            stop();
        }
    }

    void Connection::dispatch(http::Request &request)
    {
        using connection_common::route_tail;
        try
        {
            const auto decoded = http::request_path(request);
            if (!decoded || decoded->empty() || decoded->front() != '/')
            {
                throw OperationError(ErrorCode::InvalidPayload, "Malformed request target");
            }
            const std::string_view path = *decoded;
            using http::beast_http::verb;
            const auto method = request.method();

            if (const auto file_path = route_tail(path, "/files"))
            {
                if (method == verb::get || method == verb::head)
                {
                    handle_download(request, *file_path);
                    return;
                }
                if (method == verb::delete_)
                {
                    handle_delete(*file_path);
                    return;
                }
            }
            else if (const auto list_path = route_tail(path, "/list"))
            {
                if (method == verb::get)
                {
                    handle_list(request, *list_path);
                    return;
                }
            }
            else if (const auto stat_path = route_tail(path, "/stat"))
            {
                if (method == verb::get)
                {
                    handle_stat(*stat_path);
                    return;
                }
            }
            else if (const auto mkdir_path = route_tail(path, "/mkdir"))
            {
                if (method == verb::post)
                {
                    handle_mkdir(*mkdir_path);
                    return;
                }
            }
            else if (path == "/move")
            {
                if (method == verb::post)
                {
                    handle_move(request);
                    return;
                }
            }
            else if (const auto upload_path = route_tail(path, "/uploads"))
            {
                if (upload_path->empty())
                {
                    if (method == verb::post)
                    {
                        handle_upload_create(request);
                        return;
                    }
                    if (method == verb::get)
                    {
                        handle_upload_list(request);
                        return;
                    }
                }
                else
                {
                    const auto slash = upload_path->find('/');
                    const std::string session_id(upload_path->substr(0, slash));
                    const auto rest = slash == std::string_view::npos ? std::string_view{} : upload_path->substr(slash + 1);
                    if (rest.empty())
                    {
                        if (method == verb::get)
                        {
                            handle_upload_progress(request, session_id);
                            return;
                        }
                        if (method == verb::delete_)
                        {
                            handle_upload_delete(request, session_id);
                            return;
                        }
                    }
                    else if (rest == "missing" && method == verb::get)
                    {
                        handle_upload_missing(request, session_id);
                        return;
                    }
                    else if (rest == "finalize" && method == verb::post)
                    {
                        handle_upload_finalize(request, session_id);
                        return;
                    }
                    else if (rest.starts_with("chunks/") && method == verb::put)
                    {
                        handle_upload_chunk(request, session_id, rest.substr(7));
                        return;
                    }
                }
            }
            else
            {
                throw OperationError(ErrorCode::NotFound, "No such route");
            }
            send_error(405, "method_not_allowed", "Method " + std::string(request.method_string()) + " not allowed here");
        }
        catch (const WriteFailed &)
        {
            throw;
        }
        catch (const OperationError &ex)
        {
            if (ex.code() == ErrorCode::Traversal)
            {
                spdlog::warn("Path traversal attempt from {}: {} {} ({})", remote_endpoint(), request.method_string(),
                             request.target(), ex.what());
            }
            send_error(ex.code(), ex.what());
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            const auto code = code_for(ex);
            if (code == ErrorCode::InternalError)
            {
                spdlog::error("{} {} failed: {}", request.method_string(), request.target(), ex.what());
            }
            send_error(code, ex.code().message());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} {} failed: {}", request.method_string(), request.target(), ex.what());
            send_error(ErrorCode::InternalError, ex.what());
        }
    }

    void Connection::reject(ErrorCode code, std::string_view message)
    {
        writer_->reset(false);
        try
        {
            send_error(code, message);
        }
        catch (const WriteFailed &ex)
        {
            spdlog::debug("{} write failed: {}", remote_endpoint(), ex.what());
        }
        stop();
    }

    void Connection::send_json(int status, const nlohmann::json &body)
    {
        const auto payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        http::ResponseHead head;
        head.result(static_cast<unsigned>(status));
        head.set(http::beast_http::field::content_type, "application/json");
        head.set(http::beast_http::field::content_length, std::to_string(payload.size()));
        writer_->write_head(std::move(head));
        writer_->write_body(payload);
    }

    void Connection::send_error(ErrorCode code, std::string_view message)
    {
        send_error(http_status(code), to_string(code), message);
    }

    void Connection::send_error(int status, std::string_view code, std::string_view message)
    {
        if (writer_->started())
        {
            // Headers are out; the only way to signal failure is to drop the connection.
            writer_->close_after();
            return;
        }
        send_json(status, nlohmann::json{{"error", code}, {"message", message}});
    }

    std::string Connection::owner_id(const http::Request &request) const
    {
        const auto owner = http::header(request, "X-Owner-Id");
        if (!owner || owner->empty())
        {
            throw OperationError(ErrorCode::Forbidden, "Missing X-Owner-Id header");
        }
        return *owner;
    }

    std::string Connection::relative_to_root(const std::filesystem::path &path) const
    {
        const auto relative = path.lexically_relative(services_.root).generic_string();
        return relative.empty() ? std::string{"."} : relative;
    }

    std::string Connection::remote_endpoint() const
    {
        return remote_;
    }

} // namespace nascore::server

namespace nascore::server::connection_common
{

    std::optional<std::uint64_t> parse_unsigned(std::string_view text)
    {
        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return value;
    }

    bool parse_flag(const std::optional<std::string> &value)
    {
        if (!value)
        {
            return false;
        }
        return value->empty() || *value == "1" || http::iequals(*value, "true") || http::iequals(*value, "yes");
    }

    std::optional<std::string_view> route_tail(std::string_view path, std::string_view prefix)
    {
        if (!path.starts_with(prefix))
        {
            return std::nullopt;
        }
        auto rest = path.substr(prefix.size());
        if (rest.empty())
        {
            return rest;
        }
        if (rest.front() != '/')
        {
            return std::nullopt;
        }
        rest.remove_prefix(1);
        return rest;
    }

} // namespace nascore::server::connection_common
