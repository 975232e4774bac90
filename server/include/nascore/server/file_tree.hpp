#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "nascore/server/ownership_cache.hpp"
#include "nascore/server/path_sandbox.hpp"

namespace nascore::server
{

    struct FileInfo
    {
        std::string name;
        std::string path;
        std::uint64_t size{};
        bool is_directory{};
        std::int64_t modified_time{};
        std::string mode;
        std::string owner;
        std::string group;
        std::uint32_t uid{};
        std::uint32_t gid{};
        std::string mime_type;
        std::string extension;
    };

    void to_json(nlohmann::json &json, const FileInfo &info);

    enum class SortKey : std::uint8_t
    {
        Name,
        Size,
        Modified,
        Type,
        Owner
    };

    enum class TypeFilter : std::uint8_t
    {
        All,
        Files,
        Folders
    };

    std::optional<SortKey> sort_key_from_string(std::string_view value) noexcept;
    std::optional<TypeFilter> type_filter_from_string(std::string_view value) noexcept;

    struct ListOptions
    {
        std::size_t limit{0}; // 0 = everything
        std::size_t offset{0};
        SortKey sort_by{SortKey::Name};
        bool descending{false};
        TypeFilter filter{TypeFilter::All};
    };

    struct ListResult
    {
        std::vector<FileInfo> entries;
        std::size_t total{};
        std::size_t limit{};
        std::size_t offset{};
        bool has_more{};
    };

    void to_json(nlohmann::json &json, const ListResult &result);

    /// Metadata and tree operations on sandboxed paths.
    class FileTree
    {
    public:
        explicit FileTree(OwnershipCache &owners);

        /// Folders first. Name-sorted pages only stat the entries they return.
        ListResult list_directory(const ResolvedPath &directory, const ListOptions &options) const;

        FileInfo stat_path(const ResolvedPath &path) const;

        void create_directory(const ResolvedPath &path) const;
        void remove_path(const ResolvedPath &path) const;
        void move_path(const ResolvedPath &from, const ResolvedPath &to) const;

    private:
        std::optional<FileInfo> describe(const std::filesystem::path &path, std::string relative_path) const;

        OwnershipCache &owners_;
    };

} // namespace nascore::server
