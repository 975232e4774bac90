#include "nascore/server/file_tree.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include <sys/stat.h>

#include "nascore/error_codes.hpp"
#include "nascore/server/content_type.hpp"

namespace nascore::server
{

    namespace
    {

        struct DirectoryItem
        {
            std::string name;
            bool is_directory{};
        };

        std::string to_lower(std::string_view value)
        {
            std::string lowered(value);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return lowered;
        }

        std::string mode_string(mode_t mode)
        {
            std::string result(10, '-');
            if (S_ISDIR(mode))
            {
                result[0] = 'd';
            }
            else if (S_ISLNK(mode))
            {
                result[0] = 'l';
            }
            static constexpr std::array<mode_t, 9> kBits{S_IRUSR, S_IWUSR, S_IXUSR, S_IRGRP, S_IWGRP,
                                                         S_IXGRP, S_IROTH, S_IWOTH, S_IXOTH};
            static constexpr char kLetters[] = "rwxrwxrwx";
            for (std::size_t i = 0; i < kBits.size(); ++i)
            {
                if (mode & kBits[i])
                {
                    result[i + 1] = kLetters[i];
                }
            }
            return result;
        }

        std::string child_path(const ResolvedPath &directory, const std::string &name)
        {
            const auto base = directory.relative();
            if (base == ".")
            {
                return name;
            }
            return base + "/" + name;
        }

        template <typename T>
        void paginate(std::vector<T> &items, const ListOptions &options)
        {
            if (options.offset > 0)
            {
                if (options.offset >= items.size())
                {
                    items.clear();
                }
                else
                {
                    items.erase(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(options.offset));
                }
            }
            if (options.limit > 0 && items.size() > options.limit)
            {
                items.resize(options.limit);
            }
        }

        bool info_less(const FileInfo &lhs, const FileInfo &rhs, SortKey key)
        {
            switch (key)
            {
            case SortKey::Size:
                if (lhs.size != rhs.size)
                {
                    return lhs.size < rhs.size;
                }
                break;
            case SortKey::Modified:
                if (lhs.modified_time != rhs.modified_time)
                {
                    return lhs.modified_time < rhs.modified_time;
                }
                break;
            case SortKey::Type:
                if (lhs.extension != rhs.extension)
                {
                    return lhs.extension < rhs.extension;
                }
                break;
            case SortKey::Owner:
                if (lhs.owner != rhs.owner)
                {
                    return lhs.owner < rhs.owner;
                }
                break;
            case SortKey::Name:
                break;
            }
            return to_lower(lhs.name) < to_lower(rhs.name);
        }

    } // namespace

    void to_json(nlohmann::json &json, const FileInfo &info)
    {
        json = nlohmann::json{
            {"name", info.name},
            {"path", info.path},
            {"size", info.size},
            {"is_dir", info.is_directory},
            {"modified_time", info.modified_time},
            {"mode", info.mode},
            {"owner", info.owner},
            {"group", info.group},
            {"uid", info.uid},
            {"gid", info.gid},
        };
        if (!info.is_directory)
        {
            json["mime_type"] = info.mime_type;
            json["extension"] = info.extension;
        }
    }

    void to_json(nlohmann::json &json, const ListResult &result)
    {
        json = nlohmann::json{
            {"files", result.entries},
            {"total", result.total},
            {"limit", result.limit},
            {"offset", result.offset},
            {"has_more", result.has_more},
        };
    }

    std::optional<SortKey> sort_key_from_string(std::string_view value) noexcept
    {
        if (value.empty() || value == "name")
        {
            return SortKey::Name;
        }
        if (value == "size")
        {
            return SortKey::Size;
        }
        if (value == "modified")
        {
            return SortKey::Modified;
        }
        if (value == "type")
        {
            return SortKey::Type;
        }
        if (value == "owner")
        {
            return SortKey::Owner;
        }
        return std::nullopt;
    }

    std::optional<TypeFilter> type_filter_from_string(std::string_view value) noexcept
    {
        if (value.empty() || value == "all")
        {
            return TypeFilter::All;
        }
        if (value == "file")
        {
            return TypeFilter::Files;
        }
        if (value == "folder")
        {
            return TypeFilter::Folders;
        }
        return std::nullopt;
    }

    FileTree::FileTree(OwnershipCache &owners) : owners_(owners) {}

    ListResult FileTree::list_directory(const ResolvedPath &directory, const ListOptions &options) const
    {
        std::error_code ec;
        const auto status = std::filesystem::status(directory.path(), ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw OperationError(ErrorCode::NotFound, "Path does not exist");
        }
        if (!std::filesystem::is_directory(status))
        {
            throw OperationError(ErrorCode::InvalidPayload, "Path is not a directory");
        }

        std::vector<DirectoryItem> items;
        for (const auto &entry : std::filesystem::directory_iterator(directory.path()))
        {
            // lstat semantics, matching describe(): a symlink to a directory is not a folder.
            std::error_code type_ec;
            const bool is_directory = std::filesystem::is_directory(entry.symlink_status(type_ec));
            if (options.filter == TypeFilter::Files && is_directory)
            {
                continue;
            }
            if (options.filter == TypeFilter::Folders && !is_directory)
            {
                continue;
            }
            items.push_back(DirectoryItem{.name = entry.path().filename().string(), .is_directory = is_directory});
        }

        ListResult result;
        result.total = items.size();
        result.limit = options.limit;
        result.offset = options.offset;

        if (options.sort_by == SortKey::Name && options.limit > 0)
        {
            std::sort(items.begin(), items.end(), [&](const DirectoryItem &lhs, const DirectoryItem &rhs)
                      {
                if (lhs.is_directory != rhs.is_directory) {
                    return lhs.is_directory;
                }
                const auto left = to_lower(lhs.name);
                const auto right = to_lower(rhs.name);
                return options.descending ? right < left : left < right; });
            paginate(items, options);

            result.entries.reserve(items.size());
            for (const auto &item : items)
            {
                if (auto info = describe(directory.path() / item.name, child_path(directory, item.name)))
                {
                    result.entries.push_back(std::move(*info));
                }
            }
        }
        else
        {
            result.entries.reserve(items.size());
            for (const auto &item : items)
            {
                if (auto info = describe(directory.path() / item.name, child_path(directory, item.name)))
                {
                    result.entries.push_back(std::move(*info));
                }
            }
            std::sort(result.entries.begin(), result.entries.end(), [&](const FileInfo &lhs, const FileInfo &rhs)
                      {
                if (lhs.is_directory != rhs.is_directory) {
                    return lhs.is_directory;
                }
                return options.descending ? info_less(rhs, lhs, options.sort_by)
                                          : info_less(lhs, rhs, options.sort_by); });
            paginate(result.entries, options);
        }

        result.has_more = options.offset + result.entries.size() < result.total;
        return result;
    }

    FileInfo FileTree::stat_path(const ResolvedPath &path) const
    {
        auto info = describe(path.path(), path.relative());
        if (!info)
        {
            throw OperationError(ErrorCode::NotFound, "Path does not exist");
        }
        return *info;
    }

    void FileTree::create_directory(const ResolvedPath &path) const
    {
        std::filesystem::create_directories(path.path());
    }

    void FileTree::remove_path(const ResolvedPath &path) const
    {
        PathSandbox::ensure_not_root(path);
        std::error_code ec;
        if (!std::filesystem::exists(std::filesystem::symlink_status(path.path(), ec)))
        {
            throw OperationError(ErrorCode::NotFound, "Path does not exist");
        }
        std::filesystem::remove_all(path.path());
    }

    void FileTree::move_path(const ResolvedPath &from, const ResolvedPath &to) const
    {
        PathSandbox::ensure_not_root(from);
        PathSandbox::ensure_not_root(to);
        std::error_code ec;
        if (!std::filesystem::exists(std::filesystem::symlink_status(from.path(), ec)))
        {
            throw OperationError(ErrorCode::NotFound, "Source does not exist");
        }
        if (PathSandbox::is_within(from.path(), to.path()))
        {
            throw OperationError(ErrorCode::InvalidPayload, "Cannot move a directory into itself");
        }
        std::filesystem::create_directories(to.path().parent_path());
        std::filesystem::rename(from.path(), to.path());
    }

    std::optional<FileInfo> FileTree::describe(const std::filesystem::path &path, std::string relative_path) const
    {
        struct stat info{};
        if (::lstat(path.c_str(), &info) != 0)
        {
            return std::nullopt;
        }
        FileInfo result;
        result.name = path.filename().string();
        result.path = std::move(relative_path);
        result.is_directory = S_ISDIR(info.st_mode);
        result.size = static_cast<std::uint64_t>(info.st_size);
        result.modified_time = static_cast<std::int64_t>(info.st_mtim.tv_sec);
        result.mode = mode_string(info.st_mode);
        result.uid = info.st_uid;
        result.gid = info.st_gid;
        result.owner = owners_.username_for(info.st_uid);
        result.group = owners_.groupname_for(info.st_gid);
        if (!result.is_directory)
        {
            result.extension = extension_of(result.name);
            if (!result.extension.empty())
            {
                result.extension.erase(0, 1);
            }
            result.mime_type = std::string(base_mime_type(content_type_for_name(result.name)));
        }
        return result;
    }

} // namespace nascore::server
