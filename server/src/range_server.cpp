#include "nascore/server/range_server.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "nascore/crypto.hpp"
#include "nascore/error_codes.hpp"
#include "nascore/server/content_type.hpp"

namespace nascore::server
{

    namespace
    {
        constexpr std::size_t kStreamBufferSize = 64 * 1024;
        constexpr std::size_t kBoundaryBytes = 12;

        class FileHandle
        {
        public:
            explicit FileHandle(int fd) : fd_(fd) {}
            ~FileHandle()
            {
                if (fd_ >= 0)
                {
                    ::close(fd_);
                }
            }
            FileHandle(const FileHandle &) = delete;
            FileHandle &operator=(const FileHandle &) = delete;

            int get() const noexcept { return fd_; }

        private:
            int fd_;
        };

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::optional<std::uint64_t> parse_offset(std::string_view text)
        {
            if (text.empty())
            {
                return std::nullopt;
            }
            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        std::optional<ByteRange> parse_range_spec(std::string_view spec, std::uint64_t size)
        {
            const auto dash = spec.find('-');
            if (dash == std::string_view::npos || size == 0)
            {
                return std::nullopt;
            }
            const auto start_text = trim(spec.substr(0, dash));
            const auto end_text = trim(spec.substr(dash + 1));

            ByteRange range{};
            if (start_text.empty())
            {
                const auto suffix = parse_offset(end_text);
                if (!suffix || *suffix == 0)
                {
                    return std::nullopt;
                }
                range.start = *suffix >= size ? 0 : size - *suffix;
                range.end = size - 1;
                return range;
            }

            const auto start = parse_offset(start_text);
            if (!start)
            {
                return std::nullopt;
            }
            range.start = *start;
            if (end_text.empty())
            {
                range.end = size - 1;
            }
            else
            {
                const auto end = parse_offset(end_text);
                if (!end)
                {
                    return std::nullopt;
                }
                range.end = *end;
            }

            if (range.start > range.end || range.start >= size)
            {
                return std::nullopt;
            }
            if (range.end >= size)
            {
                range.end = size - 1;
            }
            return range;
        }

        bool etag_matches(std::string_view header, std::string_view etag)
        {
            header = trim(header);
            if (header == "*")
            {
                return true;
            }
            while (!header.empty())
            {
                const auto comma = header.find(',');
                auto candidate = trim(header.substr(0, comma));
                header = comma == std::string_view::npos ? std::string_view{} : header.substr(comma + 1);
                if (candidate.starts_with("W/"))
                {
                    candidate.remove_prefix(2);
                }
                if (candidate == etag)
                {
                    return true;
                }
            }
            return false;
        }

        bool not_modified(const http::Request &request, std::string_view etag,
                          std::chrono::system_clock::time_point modified)
        {
            // Either validator matching is enough.
            if (const auto if_none_match = http::header(request, "If-None-Match");
                if_none_match && etag_matches(*if_none_match, etag))
            {
                return true;
            }
            if (const auto if_modified_since = http::header(request, "If-Modified-Since"))
            {
                const auto since = http::parse_http_date(*if_modified_since);
                return since && modified <= *since;
            }
            return false;
        }

        std::string content_range(const ByteRange &range, std::uint64_t size)
        {
            return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" +
                   std::to_string(size);
        }

        std::string disposition(const TransferOptions &options, const std::string &filename)
        {
            std::string quoted;
            quoted.reserve(filename.size());
            for (const char ch : filename)
            {
                if (ch == '\r' || ch == '\n')
                {
                    continue;
                }
                if (ch == '"' || ch == '\\')
                {
                    quoted.push_back('\\');
                }
                quoted.push_back(ch);
            }
            return std::string(options.force_download ? "attachment" : "inline") + "; filename=\"" + quoted + "\"";
        }

        void stream_range(int fd, const ByteRange &range, http::ResponseWriter &writer)
        {
            std::vector<char> buffer(kStreamBufferSize);
            auto offset = range.start;
            auto remaining = range.length();
            while (remaining > 0)
            {
                const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
                const auto got = ::pread(fd, buffer.data(), want, static_cast<off_t>(offset));
                if (got < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    throw OperationError(ErrorCode::InternalError, "Read failed while streaming file");
                }
                if (got == 0)
                {
                    throw OperationError(ErrorCode::InternalError, "File shrank while streaming");
                }
                writer.write_body(std::string_view(buffer.data(), static_cast<std::size_t>(got)));
                offset += static_cast<std::uint64_t>(got);
                remaining -= static_cast<std::uint64_t>(got);
            }
        }

    } // namespace

    std::optional<std::vector<ByteRange>> parse_range_header(std::string_view header, std::uint64_t size)
    {
        header = trim(header);
        if (!http::iequals(header.substr(0, 6), "bytes="))
        {
            return std::nullopt;
        }
        auto specs = header.substr(6);
        std::vector<ByteRange> ranges;
        while (!specs.empty())
        {
            const auto comma = specs.find(',');
            const auto spec = trim(specs.substr(0, comma));
            specs = comma == std::string_view::npos ? std::string_view{} : specs.substr(comma + 1);
            if (spec.empty())
            {
                continue;
            }
            if (auto range = parse_range_spec(spec, size))
            {
                ranges.push_back(*range);
            }
        }
        return ranges;
    }

    std::string make_etag(std::chrono::system_clock::time_point modified, std::uint64_t size)
    {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(modified.time_since_epoch()).count();
        char buffer[64];
        const auto written = std::snprintf(buffer, sizeof(buffer), "\"%llx-%llx\"",
                                           static_cast<unsigned long long>(seconds),
                                           static_cast<unsigned long long>(size));
        return std::string(buffer, static_cast<std::size_t>(written));
    }

    int serve_file(const http::Request &request, const ResolvedPath &file, const TransferOptions &options,
                   http::ResponseWriter &writer)
    {
        FileHandle handle(::open(file.path().c_str(), O_RDONLY | O_CLOEXEC));
        if (handle.get() < 0)
        {
            if (errno == ENOENT || errno == ENOTDIR)
            {
                throw OperationError(ErrorCode::NotFound, "File does not exist");
            }
            if (errno == EACCES)
            {
                throw OperationError(ErrorCode::Forbidden, "File is not readable");
            }
            throw OperationError(ErrorCode::InternalError, "Failed to open file");
        }

        struct stat info{};
        if (::fstat(handle.get(), &info) != 0)
        {
            throw OperationError(ErrorCode::InternalError, "Failed to stat file");
        }
        if (S_ISDIR(info.st_mode))
        {
            throw OperationError(ErrorCode::InvalidPayload, "Cannot serve a directory");
        }
        if (!S_ISREG(info.st_mode))
        {
            throw OperationError(ErrorCode::InvalidPayload, "Not a regular file");
        }

        const auto size = static_cast<std::uint64_t>(info.st_size);
        const auto modified = std::chrono::system_clock::from_time_t(info.st_mtim.tv_sec);
        const auto etag = make_etag(modified, size);
        const auto content_type = options.content_type ? *options.content_type : detect_content_type(file.path());
        const auto filename = options.filename.value_or(file.path().filename().string());
        const bool head_only = request.method() == http::beast_http::verb::head;

        using http::beast_http::field;
        http::ResponseHead head;
        head.set(field::accept_ranges, "bytes");
        head.set(field::last_modified, http::format_http_date(modified));
        head.set(field::etag, etag);
        head.set(field::content_disposition, disposition(options, filename));

        if (not_modified(request, etag, modified))
        {
            head.result(http::beast_http::status::not_modified);
            writer.write_head(std::move(head));
            return 304;
        }

        const auto range_header = http::header(request, "Range");
        const auto ranges = range_header ? parse_range_header(*range_header, size) : std::nullopt;

        if (!ranges)
        {
            head.result(http::beast_http::status::ok);
            head.set(field::content_type, content_type);
            head.set(field::content_length, std::to_string(size));
            writer.write_head(std::move(head));
            if (!head_only && size > 0)
            {
                stream_range(handle.get(), ByteRange{0, size - 1}, writer);
            }
            return 200;
        }

        if (ranges->empty())
        {
            constexpr auto code = ErrorCode::RangeNotSatisfiable;
            const auto payload = nlohmann::json{{"error", to_string(code)},
                                                {"message", "No requested range overlaps the file"}}
                                     .dump();
            const auto status = http_status(code);
            head.result(static_cast<unsigned>(status));
            head.set(field::content_range, "bytes */" + std::to_string(size));
            head.set(field::content_type, "application/json");
            head.set(field::content_length, std::to_string(payload.size()));
            writer.write_head(std::move(head));
            if (!head_only)
            {
                writer.write_body(payload);
            }
            return status;
        }

        if (ranges->size() == 1)
        {
            const auto &range = ranges->front();
            head.result(http::beast_http::status::partial_content);
            head.set(field::content_type, content_type);
            head.set(field::content_range, content_range(range, size));
            head.set(field::content_length, std::to_string(range.length()));
            writer.write_head(std::move(head));
            if (!head_only)
            {
                stream_range(handle.get(), range, writer);
            }
            return 206;
        }

        const auto boundary = crypto::random_hex(kBoundaryBytes);
        std::vector<std::string> part_heads;
        part_heads.reserve(ranges->size());
        std::uint64_t total = 0;
        for (const auto &range : *ranges)
        {
            part_heads.push_back("\r\n--" + boundary + "\r\nContent-Type: " + content_type +
                                 "\r\nContent-Range: " + content_range(range, size) + "\r\n\r\n");
            total += part_heads.back().size() + range.length();
        }
        const auto closing = "\r\n--" + boundary + "--\r\n";
        total += closing.size();

        head.result(http::beast_http::status::partial_content);
        head.set(field::content_type, "multipart/byteranges; boundary=" + boundary);
        head.set(field::content_length, std::to_string(total));
        writer.write_head(std::move(head));
        if (!head_only)
        {
            for (std::size_t i = 0; i < ranges->size(); ++i)
            {
                writer.write_body(part_heads[i]);
                stream_range(handle.get(), (*ranges)[i], writer);
            }
            writer.write_body(closing);
        }
        return 206;
    }

} // namespace nascore::server
