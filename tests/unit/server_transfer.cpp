#include <cassert>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "nascore/error_codes.hpp"
#include "nascore/http.hpp"
#include "nascore/server/content_type.hpp"
#include "nascore/server/path_sandbox.hpp"
#include "nascore/server/range_server.hpp"
#include "nascore/server/upload_policy.hpp"
#include "test_support.hpp"

using namespace nascore;
using namespace nascore::server;

namespace
{

    using Fields = std::vector<std::pair<std::string, std::string>>;

    http::Request make_request(http::beast_http::verb method, const Fields &fields)
    {
        http::Request request{method, "/files/data.bin", 11};
        for (const auto &[name, value] : fields)
        {
            request.set(name, value);
        }
        return request;
    }

    http::Request get(const Fields &fields = {})
    {
        return make_request(http::beast_http::verb::get, fields);
    }

    http::Request head_request(const Fields &fields = {})
    {
        return make_request(http::beast_http::verb::head, fields);
    }

    void test_parse_range_header()
    {
        using Ranges = std::vector<ByteRange>;
        assert((parse_range_header("bytes=0-99", 1000) == Ranges{{0, 99}}));
        assert((parse_range_header("bytes=-100", 1000) == Ranges{{900, 999}}));
        assert((parse_range_header("bytes=900-", 1000) == Ranges{{900, 999}}));
        assert((parse_range_header("bytes=990-5000", 1000) == Ranges{{990, 999}}));
        assert((parse_range_header("bytes=-5000", 1000) == Ranges{{0, 999}}));
        assert((parse_range_header("bytes=0-9, 20-29", 1000) == Ranges{{0, 9}, {20, 29}}));

        assert(parse_range_header("bytes=2000-", 1000)->empty());
        assert(parse_range_header("bytes=50-10", 1000)->empty());
        assert(parse_range_header("bytes=abc", 1000)->empty());
        assert(parse_range_header("bytes=-0", 1000)->empty());
        assert(parse_range_header("bytes=0-0", 0)->empty());

        assert(!parse_range_header("items=0-5", 1000));
        assert(!parse_range_header("", 1000));
    }

    struct TransferFixture
    {
        TransferFixture() : dir("transfer"), content(test::pattern_bytes(1000, 3))
        {
            test::write_file(dir.path() / "data.bin", content);
            test::write_file(dir.path() / "notes.txt", "plain text");
            std::filesystem::create_directories(dir.path() / "folder");
        }

        ResolvedPath at(std::string_view path) const { return PathSandbox::resolve(dir.path(), path); }

        http::BufferedResponse serve(const http::Request &request, std::string_view path = "data.bin",
                                     const TransferOptions &options = {}) const
        {
            http::BufferedResponse response;
            const auto status = serve_file(request, at(path), options, response);
            assert(status == response.status);
            return response;
        }

        test::TempDir dir;
        std::string content;
    };

    void test_full_and_single_range()
    {
        TransferFixture fixture;
        const auto full = fixture.serve(get());
        assert(full.status == 200);
        assert(full.body == fixture.content);
        assert(full.header("Content-Length") == std::optional<std::string>("1000"));
        assert(full.header("Accept-Ranges") == std::optional<std::string>("bytes"));
        assert(full.header("ETag"));
        assert(full.header("Last-Modified"));
        assert(full.header("Content-Disposition") == std::optional<std::string>("inline; filename=\"data.bin\""));

        const auto first = fixture.serve(get({{"Range", "bytes=0-99"}}));
        assert(first.status == 206);
        assert(first.header("Content-Range") == std::optional<std::string>("bytes 0-99/1000"));
        assert(first.header("Content-Length") == std::optional<std::string>("100"));
        assert(first.body == fixture.content.substr(0, 100));

        const auto tail = fixture.serve(get({{"Range", "bytes=-100"}}));
        assert(tail.status == 206);
        assert(tail.header("Content-Range") == std::optional<std::string>("bytes 900-999/1000"));
        assert(tail.body == fixture.content.substr(900));

        const auto beyond = fixture.serve(get({{"Range", "bytes=2000-"}}));
        assert(beyond.status == 416);
        assert(beyond.header("Content-Range") == std::optional<std::string>("bytes */1000"));
        assert(beyond.header("Content-Type") == std::optional<std::string>("application/json"));
        const auto error = nlohmann::json::parse(beyond.body);
        assert(error_code_from_string(error.at("error").get<std::string>()) == ErrorCode::RangeNotSatisfiable);
        assert(beyond.header("Content-Length") == std::optional<std::string>(std::to_string(beyond.body.size())));

        const auto beyond_head = fixture.serve(head_request({{"Range", "bytes=2000-"}}));
        assert(beyond_head.status == 416);
        assert(beyond_head.body.empty());

        // Unknown units are ignored and the whole file is sent.
        const auto other_unit = fixture.serve(get({{"Range", "lines=1-2"}}));
        assert(other_unit.status == 200);
        assert(other_unit.body.size() == 1000);
    }

    void test_multipart_ranges()
    {
        TransferFixture fixture;
        const auto response = fixture.serve(get({{"Range", "bytes=0-9,500-509"}}));
        assert(response.status == 206);
        const auto type = response.header("Content-Type");
        assert(type && type->starts_with("multipart/byteranges; boundary="));
        const auto boundary = type->substr(type->find('=') + 1);
        assert(response.header("Content-Length") == std::optional<std::string>(std::to_string(response.body.size())));
        assert(response.body.find("--" + boundary + "\r\n") != std::string::npos);
        assert(response.body.find("Content-Range: bytes 0-9/1000") != std::string::npos);
        assert(response.body.find("Content-Range: bytes 500-509/1000") != std::string::npos);
        assert(response.body.find(fixture.content.substr(500, 10)) != std::string::npos);
        assert(response.body.ends_with("--" + boundary + "--\r\n"));
    }

    void test_conditional_requests()
    {
        TransferFixture fixture;
        const auto full = fixture.serve(get());
        const auto etag = *full.header("ETag");
        const auto modified = *full.header("Last-Modified");

        const auto by_etag = fixture.serve(get({{"If-None-Match", etag}}));
        assert(by_etag.status == 304);
        assert(by_etag.body.empty());
        assert(fixture.serve(get({{"If-None-Match", "W/" + etag}})).status == 304);
        assert(fixture.serve(get({{"If-None-Match", "\"other\", " + etag}})).status == 304);
        assert(fixture.serve(get({{"If-None-Match", "*"}})).status == 304);

        assert(fixture.serve(get({{"If-Modified-Since", modified}})).status == 304);
        assert(fixture.serve(get({{"If-Modified-Since", "Thu, 01 Jan 1998 00:00:00 GMT"}})).status == 200);

        // A stale ETag does not override a satisfied If-Modified-Since.
        const auto stale_etag = fixture.serve(get({{"If-None-Match", "\"stale\""}, {"If-Modified-Since", modified}}));
        assert(stale_etag.status == 304);
        assert(stale_etag.body.empty());

        const auto neither = fixture.serve(
            get({{"If-None-Match", "\"stale\""}, {"If-Modified-Since", "Thu, 01 Jan 1998 00:00:00 GMT"}}));
        assert(neither.status == 200);
        assert(neither.body.size() == 1000);

        const auto etag_only = fixture.serve(
            get({{"If-None-Match", etag}, {"If-Modified-Since", "Thu, 01 Jan 1998 00:00:00 GMT"}}));
        assert(etag_only.status == 304);
    }

    void test_head_and_options()
    {
        TransferFixture fixture;
        const auto head = fixture.serve(head_request());
        assert(head.status == 200);
        assert(head.body.empty());
        assert(head.header("Content-Length") == std::optional<std::string>("1000"));

        const auto ranged_head = fixture.serve(head_request({{"Range", "bytes=0-99"}}));
        assert(ranged_head.status == 206);
        assert(ranged_head.body.empty());

        TransferOptions download;
        download.force_download = true;
        const auto attachment = fixture.serve(get(), "notes.txt", download);
        assert(attachment.header("Content-Disposition") == std::optional<std::string>("attachment; filename=\"notes.txt\""));
        assert(attachment.header("Content-Type") == std::optional<std::string>("text/plain; charset=utf-8"));
        assert(attachment.body == "plain text");

        assert(test::throws_code(ErrorCode::InvalidPayload, [&]
                                 { (void)fixture.serve(get(), "folder"); }));
        assert(test::throws_code(ErrorCode::NotFound, [&]
                                 { (void)fixture.serve(get(), "absent.bin"); }));
    }

    void test_content_types()
    {
        assert(extension_of("Photo.JPG") == ".jpg");
        assert(extension_of("archive.tar.gz") == ".gz");
        assert(extension_of("README").empty());

        assert(content_type_for_name("index.html") == "text/html; charset=utf-8");
        assert(content_type_for_name("clip.MP4") == "video/mp4");
        assert(base_mime_type("text/plain; charset=utf-8") == "text/plain");

        assert(sniff_content_type(std::string("\x89PNG\r\n\x1a\n....", 12)) == "image/png");
        assert(sniff_content_type("%PDF-1.7") == "application/pdf");
        assert(sniff_content_type("hello\nworld") == "text/plain; charset=utf-8");
        assert(sniff_content_type(std::string("\x00\x01\x02", 3)).empty());

        test::TempDir dir("content_type");
        test::write_file(dir.path() / "unnamed", "%PDF-1.4 body");
        assert(detect_content_type(dir.path() / "unnamed") == "application/pdf");

        assert(mime_matches("image/png", "image/*"));
        assert(mime_matches("IMAGE/PNG", "image/png"));
        assert(mime_matches("video/mp4", "*/*"));
        assert(!mime_matches("video/mp4", "image/*"));
        assert(!mime_matches("imagex/png", "image/*"));
    }

    void test_upload_policy()
    {
        UploadPolicy policy;
        validate_upload("anything.exe", 1ULL << 40, policy);

        policy.max_file_size = 100;
        assert(test::throws_code(ErrorCode::PayloadTooLarge, []
                                 { validate_upload("a.txt", 101, UploadPolicy{.max_file_size = 100}); }));
        validate_upload("a.txt", 100, policy);

        policy.denied_extensions = {"EXE", ".sh"};
        assert(test::throws_code(ErrorCode::ValidationFailed, [&]
                                 { validate_upload("setup.exe", 1, policy); }));
        assert(test::throws_code(ErrorCode::ValidationFailed, [&]
                                 { validate_upload("run.SH", 1, policy); }));

        policy.allowed_types = {"image/*", "application/pdf"};
        validate_upload("photo.jpeg", 1, policy);
        validate_upload("paper.pdf", 1, policy);
        assert(test::throws_code(ErrorCode::ValidationFailed, [&]
                                 { validate_upload("notes.txt", 1, policy); }));

        policy.denied_types = {"image/gif"};
        assert(test::throws_code(ErrorCode::ValidationFailed, [&]
                                 { validate_upload("anim.gif", 1, policy); }));

        UploadPolicy extensions_only;
        extensions_only.allowed_extensions = {"md"};
        validate_upload("README.md", 1, extensions_only);
        assert(test::throws_code(ErrorCode::ValidationFailed, [&]
                                 { validate_upload("README", 1, extensions_only); }));
    }

    void test_policy_store_swap()
    {
        PolicyStore store(UploadPolicy{.max_file_size = 10});
        const auto before = store.current();
        assert(before->max_file_size == 10);

        std::thread writer([&]
                           { store.replace(UploadPolicy{.max_file_size = 20}); });
        writer.join();

        // Snapshots taken earlier are unaffected by a swap.
        assert(before->max_file_size == 10);
        assert(store.current()->max_file_size == 20);
    }

} // namespace

void run_transfer_tests()
{
    test_parse_range_header();
    test_full_and_single_range();
    test_multipart_ranges();
    test_conditional_requests();
    test_head_and_options();
    test_content_types();
    test_upload_policy();
    test_policy_store_swap();
}
