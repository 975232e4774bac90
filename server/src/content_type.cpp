#include "nascore/server/content_type.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace nascore::server
{

    namespace
    {
        constexpr auto kDefaultType = "application/octet-stream";
        constexpr auto kSystemMimeTypes = "/etc/mime.types";
        constexpr std::size_t kProbeBytes = 512;

        const std::unordered_map<std::string, std::string> &builtin_types()
        {
            static const std::unordered_map<std::string, std::string> kTypes{
                {".txt", "text/plain; charset=utf-8"},
                {".log", "text/plain; charset=utf-8"},
                {".conf", "text/plain; charset=utf-8"},
                {".ini", "text/plain; charset=utf-8"},
                {".html", "text/html; charset=utf-8"},
                {".htm", "text/html; charset=utf-8"},
                {".css", "text/css; charset=utf-8"},
                {".js", "application/javascript; charset=utf-8"},
                {".json", "application/json; charset=utf-8"},
                {".xml", "application/xml; charset=utf-8"},
                {".md", "text/markdown; charset=utf-8"},
                {".yaml", "text/yaml; charset=utf-8"},
                {".yml", "text/yaml; charset=utf-8"},
                {".csv", "text/csv; charset=utf-8"},
                {".pdf", "application/pdf"},
                {".zip", "application/zip"},
                {".gz", "application/gzip"},
                {".tar", "application/x-tar"},
                {".rar", "application/vnd.rar"},
                {".7z", "application/x-7z-compressed"},
                {".doc", "application/msword"},
                {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
                {".xls", "application/vnd.ms-excel"},
                {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
                {".ppt", "application/vnd.ms-powerpoint"},
                {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
                {".jpg", "image/jpeg"},
                {".jpeg", "image/jpeg"},
                {".png", "image/png"},
                {".gif", "image/gif"},
                {".svg", "image/svg+xml"},
                {".webp", "image/webp"},
                {".ico", "image/x-icon"},
                {".bmp", "image/bmp"},
                {".tif", "image/tiff"},
                {".tiff", "image/tiff"},
                {".mp3", "audio/mpeg"},
                {".wav", "audio/wav"},
                {".ogg", "audio/ogg"},
                {".flac", "audio/flac"},
                {".aac", "audio/aac"},
                {".m4a", "audio/mp4"},
                {".mp4", "video/mp4"},
                {".m4v", "video/mp4"},
                {".webm", "video/webm"},
                {".avi", "video/x-msvideo"},
                {".mkv", "video/x-matroska"},
                {".mov", "video/quicktime"},
                {".wmv", "video/x-ms-wmv"},
                {".flv", "video/x-flv"},
                {".sh", "application/x-sh"},
                {".sql", "application/sql"},
                {".woff", "font/woff"},
                {".woff2", "font/woff2"},
                {".ttf", "font/ttf"},
                {".otf", "font/otf"},
                {".eot", "application/vnd.ms-fontobject"},
            };
            return kTypes;
        }

        std::unordered_map<std::string, std::string> load_mime_types(const std::filesystem::path &path)
        {
            std::unordered_map<std::string, std::string> types;
            std::ifstream in(path);
            std::string line;
            while (std::getline(in, line))
            {
                if (line.empty() || line.front() == '#')
                {
                    continue;
                }
                std::istringstream fields(line);
                std::string type;
                std::string ext;
                fields >> type;
                while (fields >> ext)
                {
                    types.try_emplace("." + ext, type);
                }
            }
            return types;
        }

        const std::unordered_map<std::string, std::string> &system_types()
        {
            static const auto kTypes = load_mime_types(kSystemMimeTypes);
            return kTypes;
        }

        std::string to_lower(std::string_view value)
        {
            std::string lowered(value);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return lowered;
        }

        bool starts_with(std::string_view data, std::string_view magic)
        {
            return data.substr(0, magic.size()) == magic;
        }

        bool looks_like_text(std::string_view data)
        {
            return std::none_of(data.begin(), data.end(), [](char ch)
                                {
                const auto byte = static_cast<unsigned char>(ch);
                return byte < 0x20 && byte != '\n' && byte != '\r' && byte != '\t' && byte != '\f'; });
        }

    } // namespace

    std::string extension_of(std::string_view filename)
    {
        return to_lower(std::filesystem::path(std::string(filename)).extension().string());
    }

    std::string content_type_for_name(std::string_view filename)
    {
        const auto ext = extension_of(filename);
        if (ext.empty())
        {
            return kDefaultType;
        }
        if (const auto it = builtin_types().find(ext); it != builtin_types().end())
        {
            return it->second;
        }
        if (const auto it = system_types().find(ext); it != system_types().end())
        {
            return it->second;
        }
        return kDefaultType;
    }

    std::string detect_content_type(const std::filesystem::path &path)
    {
        auto by_name = content_type_for_name(path.filename().string());
        if (by_name != kDefaultType)
        {
            return by_name;
        }
        std::ifstream in(path, std::ios::binary);
        std::string head(kProbeBytes, '\0');
        in.read(head.data(), static_cast<std::streamsize>(head.size()));
        head.resize(static_cast<std::size_t>(in.gcount()));
        auto sniffed = sniff_content_type(head);
        return sniffed.empty() ? by_name : sniffed;
    }

    std::string sniff_content_type(std::string_view head)
    {
        struct Signature
        {
            std::string_view magic;
            std::string_view type;
        };
        static constexpr std::array<Signature, 10> kSignatures{{
            {"\x89PNG\r\n\x1a\n", "image/png"},
            {"\xFF\xD8\xFF", "image/jpeg"},
            {"GIF87a", "image/gif"},
            {"GIF89a", "image/gif"},
            {"%PDF-", "application/pdf"},
            {"PK\x03\x04", "application/zip"},
            {"\x1F\x8B\x08", "application/gzip"},
            {"7z\xBC\xAF\x27\x1C", "application/x-7z-compressed"},
            {"OggS", "application/ogg"},
            {"ID3", "audio/mpeg"},
        }};
        if (head.empty())
        {
            return {};
        }
        for (const auto &signature : kSignatures)
        {
            if (starts_with(head, signature.magic))
            {
                return std::string(signature.type);
            }
        }
        if (head.size() >= 12 && head.substr(4, 4) == "ftyp")
        {
            return "video/mp4";
        }
        if (looks_like_text(head))
        {
            return "text/plain; charset=utf-8";
        }
        return {};
    }

    std::string_view base_mime_type(std::string_view content_type)
    {
        auto base = content_type.substr(0, content_type.find(';'));
        while (!base.empty() && base.back() == ' ')
        {
            base.remove_suffix(1);
        }
        return base;
    }

    bool mime_matches(std::string_view mime_type, std::string_view pattern)
    {
        if (pattern == "*" || pattern == "*/*")
        {
            return true;
        }
        const auto type = to_lower(mime_type);
        const auto lowered = to_lower(pattern);
        if (type == lowered)
        {
            return true;
        }
        if (lowered.size() > 2 && lowered.ends_with("/*"))
        {
            const auto prefix = lowered.substr(0, lowered.size() - 1);
            return type.starts_with(prefix);
        }
        return false;
    }

} // namespace nascore::server
