#pragma once

#include <asio/ip/tcp.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "nascore/http.hpp"
#include "nascore/server/connection.hpp"

namespace nascore::server
{

    /// Thrown when the peer can no longer be written to.
    class WriteFailed : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class Connection::SocketWriter : public http::ResponseWriter
    {
    public:
        explicit SocketWriter(asio::ip::tcp::socket &socket) : socket_(socket) {}

        void reset(bool keep_alive);
        void close_after() noexcept { keep_alive_ = false; }

        void write_head(http::ResponseHead head) override;
        void write_body(std::string_view data) override;

        bool started() const noexcept { return started_; }
        bool keep_alive() const noexcept { return keep_alive_; }
        int status() const noexcept { return status_; }

    private:
        void write_all(std::string_view data);

        asio::ip::tcp::socket &socket_;
        bool keep_alive_{true};
        bool started_{false};
        int status_{0};
    };

} // namespace nascore::server

namespace nascore::server::connection_common
{

    std::optional<std::uint64_t> parse_unsigned(std::string_view text);

    bool parse_flag(const std::optional<std::string> &value);

    /// Splits "/prefix/rest" into rest when `path` starts with the route prefix.
    std::optional<std::string_view> route_tail(std::string_view path, std::string_view prefix);

} // namespace nascore::server::connection_common
