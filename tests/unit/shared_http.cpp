#include <cassert>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <span>
#include <sstream>
#include <string>

#include "nascore/crypto.hpp"
#include "nascore/error_codes.hpp"
#include "nascore/http.hpp"
#include "test_support.hpp"

void run_path_sandbox_tests();
void run_ownership_tests();
void run_upload_manager_tests();
void run_transfer_tests();
void run_config_tests();

using namespace nascore;

namespace
{

    http::Request read_all(std::string_view wire, std::uint64_t body_limit = 1024)
    {
        http::RequestReader reader(1024, body_limit);
        std::size_t used = 0;
        while (!reader.done())
        {
            const auto consumed = reader.feed(wire.substr(used));
            assert(consumed > 0 || reader.done());
            used += consumed;
        }
        return reader.release();
    }

    void test_read_request()
    {
        const auto request = read_all("GET /files/docs/report%20v2.pdf?download=1&x=a+b HTTP/1.1\r\n"
                                      "Host: example\r\n"
                                      "Range:  bytes=0-99 \r\n"
                                      "X-Owner-Id: alice\r\n"
                                      "\r\n");
        assert(request.method() == http::beast_http::verb::get);
        assert(request.version() == 11);
        assert(http::request_path(request) == std::optional<std::string>("/files/docs/report v2.pdf"));
        assert(http::query_param(request, "download") == std::optional<std::string>("1"));
        assert(http::query_param(request, "x") == std::optional<std::string>("a b"));
        assert(!http::query_param(request, "missing"));
        assert(http::header(request, "range") == std::optional<std::string>("bytes=0-99"));
        assert(http::header(request, "x-owner-id") == std::optional<std::string>("alice"));
        assert(request.keep_alive());
        assert(request.body().empty());
    }

    void test_reader_stops_after_header()
    {
        const std::string wire = "PUT /uploads/abc/chunks/0 HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello";
        http::RequestReader reader(1024, 1024);

        // An incomplete head consumes nothing.
        assert(reader.feed(std::string_view(wire).substr(0, 20)) == 0);
        assert(!reader.header_done());

        const auto head_size = reader.feed(wire);
        assert(reader.header_done());
        assert(!reader.done());
        assert(head_size == wire.size() - 5);
        assert(reader.content_length() == std::optional<std::uint64_t>(5));
        assert(http::request_path(reader.peek()) == std::optional<std::string>("/uploads/abc/chunks/0"));

        assert(reader.feed(std::string_view(wire).substr(head_size, 2)) == 2);
        assert(!reader.done());
        assert(reader.feed(std::string_view(wire).substr(head_size + 2)) == 3);
        assert(reader.done());
        assert(reader.release().body() == "hello");
    }

    void test_chunked_body()
    {
        const auto request = read_all("POST /move HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
                                      "3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n");
        assert(request.body() == "abcde");
    }

    void test_malformed_requests()
    {
        const auto fails_with = [](ErrorCode code, std::string wire, std::uint64_t body_limit = 1024)
        {
            return test::throws_code(code, [&]
                                     {
                                         http::RequestReader reader(256, body_limit);
                                         (void)reader.feed(wire);
                                     });
        };
        assert(fails_with(ErrorCode::InvalidPayload, "GET / SPDY/3\r\n\r\n"));
        assert(fails_with(ErrorCode::InvalidPayload, "GET / HTTP/1.1\r\nBad Header\r\n\r\n"));
        assert(fails_with(ErrorCode::InvalidPayload, "PUT /x HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n"));
        assert(fails_with(ErrorCode::HeaderTooLarge, "GET / HTTP/1.1\r\nX-Pad: " + std::string(400, 'a') + "\r\n\r\n"));
        assert(fails_with(ErrorCode::PayloadTooLarge, "PUT /x HTTP/1.1\r\nContent-Length: 20\r\n\r\n", 10));

        assert(!read_all("GET /x HTTP/1.0\r\n\r\n").keep_alive());
        assert(!read_all("GET /x HTTP/1.1\r\nConnection: close\r\n\r\n").keep_alive());
        assert(!http::request_path(read_all("GET /a%zz HTTP/1.1\r\n\r\n")));
    }

    void test_percent_decode()
    {
        assert(http::percent_decode("%2e%2e/etc") == std::optional<std::string>("../etc"));
        assert(!http::percent_decode("abc%2"));
        assert(!http::percent_decode("abc%zz"));
        assert(http::percent_decode("a+b") == std::optional<std::string>("a+b"));
        assert(http::percent_decode("a+b", true) == std::optional<std::string>("a b"));
    }

    void test_http_dates()
    {
        const auto time = std::chrono::system_clock::from_time_t(784111777);
        assert(http::format_http_date(time) == "Sun, 06 Nov 1994 08:49:37 GMT");
        assert(http::parse_http_date("Sun, 06 Nov 1994 08:49:37 GMT") == time);
        assert(http::parse_http_date("Sunday, 06-Nov-94 08:49:37 GMT") == time);
        assert(http::parse_http_date("Sun Nov  6 08:49:37 1994") == time);
        assert(!http::parse_http_date("yesterday"));
    }

    void test_serialize_head()
    {
        http::ResponseHead head;
        head.result(http::beast_http::status::partial_content);
        head.set(http::beast_http::field::content_range, "bytes 0-9/100");
        assert(http::serialize_head(head) == "HTTP/1.1 206 Partial Content\r\nContent-Range: bytes 0-9/100\r\n\r\n");

        http::BufferedResponse buffered;
        buffered.write_head(head);
        buffered.write_body("0123456789");
        assert(buffered.status == 206);
        assert(buffered.header("content-range") == std::optional<std::string>("bytes 0-9/100"));
        assert(!buffered.header("ETag"));
        assert(buffered.body == "0123456789");
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::Traversal) == "traversal");
        assert(error_code_from_string("incomplete_upload") == ErrorCode::IncompleteUpload);
        assert(http_status(ErrorCode::Traversal) == 403);
        assert(http_status(ErrorCode::Expired) == 404);
        assert(http_status(ErrorCode::ChecksumMismatch) == 422);
        assert(http_status(ErrorCode::IncompleteUpload) == 409);
        assert(http_status(ErrorCode::RangeNotSatisfiable) == 416);
        assert(http_status(ErrorCode::PayloadTooLarge) == 413);
        assert(http_status(ErrorCode::HeaderTooLarge) == 431);
        assert(to_string(ErrorCode::RangeNotSatisfiable) == "range_not_satisfiable");

        const OperationError error(ErrorCode::Forbidden, "nope");
        assert(error.code() == ErrorCode::Forbidden);
        assert(std::string(error.what()) == "nope");
    }

    void test_crypto()
    {
        const auto first = crypto::random_hex(16);
        const auto second = crypto::random_hex(16);
        assert(first.size() == 32);
        assert(first != second);

        const std::string text = "nascore";
        const auto digest = crypto::hash_bytes(std::as_bytes(std::span(text.data(), text.size())));
        std::istringstream stream(text);
        assert(crypto::hash_stream(stream) == digest);

        test::TempDir dir("crypto");
        test::write_file(dir.path() / "blob", text);
        assert(crypto::hash_file(dir.path() / "blob") == digest);

        std::string upper = digest;
        for (auto &ch : upper)
        {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        assert(crypto::digests_equal(digest, upper));
        assert(!crypto::digests_equal(digest, digest.substr(1)));
    }

} // namespace

int main()
{
    try
    {
        test_read_request();
        test_reader_stops_after_header();
        test_chunked_body();
        test_malformed_requests();
        test_percent_decode();
        test_http_dates();
        test_serialize_head();
        test_error_codes();
        test_crypto();
        run_path_sandbox_tests();
        run_ownership_tests();
        run_upload_manager_tests();
        run_transfer_tests();
        run_config_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All nascore tests passed\n";
    return 0;
}
