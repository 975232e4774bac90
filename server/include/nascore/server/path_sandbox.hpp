#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace nascore::server
{

    class PathSandbox;

    /// An absolute path confined to `root()` after symlink resolution.
    /// Only PathSandbox can produce one.
    class ResolvedPath
    {
    public:
        const std::filesystem::path &path() const noexcept { return path_; }
        const std::filesystem::path &root() const noexcept { return root_; }

        bool is_root() const { return path_ == root_; }

        /// Path relative to root, "." for the root itself.
        std::string relative() const;

        bool operator==(const ResolvedPath &other) const = default;

    private:
        friend class PathSandbox;

        ResolvedPath(std::filesystem::path root, std::filesystem::path path)
            : root_(std::move(root)), path_(std::move(path)) {}

        std::filesystem::path root_;
        std::filesystem::path path_;
    };

    class PathSandbox
    {
    public:
        static constexpr std::size_t kMaxComponentLength = 255;
        static constexpr std::size_t kMaxPathLength = 4096;

        /// Throws OperationError(Traversal) when the request escapes `root`,
        /// contains NUL, or exceeds the length limits; NotFound when `root` is missing.
        static ResolvedPath resolve(const std::filesystem::path &root, std::string_view requested);

        /// Resolves `requested` against the root a previous resolution was confined to.
        static ResolvedPath resolve_within(const ResolvedPath &base, std::string_view requested);

        /// Throws OperationError(Forbidden) for the sandbox root itself.
        static void ensure_not_root(const ResolvedPath &path);

        static bool is_within(const std::filesystem::path &root, const std::filesystem::path &candidate);
    };

} // namespace nascore::server
