#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nascore/http.hpp"
#include "nascore/server/path_sandbox.hpp"

namespace nascore::server
{

    /// Inclusive byte interval, always normalized so that start <= end < size.
    struct ByteRange
    {
        std::uint64_t start{};
        std::uint64_t end{};

        std::uint64_t length() const noexcept { return end - start + 1; }

        bool operator==(const ByteRange &) const = default;
    };

    /// Parses a Range header against a file of `size` bytes.
    /// nullopt: not a "bytes=" range, the header is to be ignored.
    /// Empty vector: every spec was malformed or unsatisfiable.
    std::optional<std::vector<ByteRange>> parse_range_header(std::string_view header, std::uint64_t size);

    struct TransferOptions
    {
        bool force_download{false};
        std::optional<std::string> filename;
        std::optional<std::string> content_type;
    };

    /// Quoted strong validator derived from modification time and size.
    std::string make_etag(std::chrono::system_clock::time_point modified, std::uint64_t size);

    /// Writes a complete response for `file` honouring Range, If-None-Match and
    /// If-Modified-Since. HEAD requests receive headers only. Returns the status sent.
    /// Throws OperationError before anything is written when the file cannot be served.
    int serve_file(const http::Request &request, const ResolvedPath &file, const TransferOptions &options,
                   http::ResponseWriter &writer);

} // namespace nascore::server
