#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace nascore::server
{

    /// Lower-cased extension including the dot, empty when there is none.
    std::string extension_of(std::string_view filename);

    /// Built-in table, then the system mime.types; "application/octet-stream" otherwise.
    std::string content_type_for_name(std::string_view filename);

    /// Like content_type_for_name, but sniffs the leading bytes of `path`
    /// when the name alone is inconclusive.
    std::string detect_content_type(const std::filesystem::path &path);

    /// Guess from magic numbers; empty when nothing matches.
    std::string sniff_content_type(std::string_view head);

    /// "text/plain; charset=utf-8" -> "text/plain"
    std::string_view base_mime_type(std::string_view content_type);

    /// Case-insensitive match supporting "*", "*/*" and "type/*" patterns.
    bool mime_matches(std::string_view mime_type, std::string_view pattern);

} // namespace nascore::server
