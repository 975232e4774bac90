/**
 * nascore - HTTP/1.1 message helpers on top of Boost.Beast.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>

namespace nascore::http
{

    namespace beast_http = boost::beast::http;

    using Request = beast_http::request<beast_http::string_body>;
    using ResponseHead = beast_http::response_header<>;

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

    std::optional<std::string> header(const Request &request, std::string_view name);

    /// Percent-decoded path component of the target, without the query string.
    std::optional<std::string> request_path(const Request &request);

    std::optional<std::string> query_param(const Request &request, std::string_view key);

    std::optional<std::string> percent_decode(std::string_view input, bool plus_as_space = false);

    std::string format_http_date(std::chrono::system_clock::time_point time);

    std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value);

    std::string serialize_head(const ResponseHead &head);

    /// Incremental request parser. Bytes are pushed in as they arrive; the
    /// reader stops once after the header so the caller can vet it before the
    /// body is accepted.
    class RequestReader
    {
    public:
        RequestReader(std::uint32_t header_limit, std::uint64_t body_limit);

        /// Returns the number of bytes consumed. Throws OperationError
        /// (HeaderTooLarge, PayloadTooLarge or InvalidPayload) on bad input.
        std::size_t feed(std::string_view data);

        bool header_done() const { return parser_.is_header_done(); }
        bool done() const { return parser_.is_done(); }
        std::optional<std::uint64_t> content_length() const;

        const Request &peek() const { return parser_.get(); }
        Request release() { return parser_.release(); }

    private:
        beast_http::request_parser<beast_http::string_body> parser_;
    };

    /// Destination of a response. Implementations may block on write.
    class ResponseWriter
    {
    public:
        virtual ~ResponseWriter() = default;

        virtual void write_head(ResponseHead head) = 0;
        virtual void write_body(std::string_view data) = 0;
    };

    class BufferedResponse : public ResponseWriter
    {
    public:
        void write_head(ResponseHead response_head) override;
        void write_body(std::string_view data) override;

        std::optional<std::string> header(std::string_view name) const;

        int status{0};
        ResponseHead head;
        std::string body;
    };

} // namespace nascore::http
