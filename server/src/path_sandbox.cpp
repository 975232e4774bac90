#include "nascore/server/path_sandbox.hpp"

#include <system_error>

#include "nascore/error_codes.hpp"

namespace nascore::server
{

    namespace
    {

        std::filesystem::path strip_trailing_separator(std::filesystem::path path)
        {
            if (path.has_relative_path() && !path.has_filename())
            {
                return path.parent_path();
            }
            return path;
        }

        [[noreturn]] void reject(std::string message)
        {
            throw OperationError(ErrorCode::Traversal, std::move(message));
        }

        // weakly_canonical leaves dangling links unresolved; anything still a
        // symlink below the root could point anywhere once created.
        void reject_dangling_links(const std::filesystem::path &root, const std::filesystem::path &path)
        {
            std::filesystem::path current = root;
            for (const auto &part : path.lexically_relative(root))
            {
                if (part == ".")
                {
                    continue;
                }
                current /= part;
                std::error_code ec;
                const auto status = std::filesystem::symlink_status(current, ec);
                if (ec)
                {
                    return;
                }
                if (std::filesystem::is_symlink(status))
                {
                    reject("Path crosses an unresolved symlink");
                }
            }
        }

    } // namespace

    std::string ResolvedPath::relative() const
    {
        const auto rel = path_.lexically_relative(root_).generic_string();
        if (rel.empty())
        {
            return ".";
        }
        return rel;
    }

    bool PathSandbox::is_within(const std::filesystem::path &root, const std::filesystem::path &candidate)
    {
        const auto rel = candidate.lexically_relative(root);
        if (rel.empty())
        {
            return false;
        }
        const auto first = *rel.begin();
        return first != "..";
    }

    ResolvedPath PathSandbox::resolve(const std::filesystem::path &root, std::string_view requested)
    {
        if (requested.find('\0') != std::string_view::npos)
        {
            reject("Path contains a NUL byte");
        }
        if (requested.size() > kMaxPathLength)
        {
            reject("Path exceeds maximum length");
        }

        std::error_code ec;
        const auto clean_root = strip_trailing_separator(std::filesystem::absolute(root, ec).lexically_normal());
        if (ec)
        {
            throw OperationError(ErrorCode::InternalError, "Cannot make root absolute: " + ec.message());
        }

        std::filesystem::path relative{std::string(requested)};
        if (relative.has_root_path())
        {
            relative = relative.relative_path();
        }
        for (const auto &part : relative)
        {
            if (part.native().size() > kMaxComponentLength)
            {
                reject("Path component exceeds maximum length");
            }
        }

        const auto joined = strip_trailing_separator((clean_root / relative).lexically_normal());
        if (!is_within(clean_root, joined))
        {
            reject("Path escapes its root");
        }

        const auto real_root = std::filesystem::canonical(clean_root, ec);
        if (ec)
        {
            throw OperationError(ErrorCode::NotFound, "Sandbox root does not exist: " + clean_root.string());
        }
        const auto real_path = strip_trailing_separator(std::filesystem::weakly_canonical(joined, ec));
        if (ec)
        {
            throw OperationError(ErrorCode::InternalError, "Cannot resolve path: " + ec.message());
        }
        if (!is_within(real_root, real_path))
        {
            reject("Path escapes its root through a symlink");
        }
        reject_dangling_links(real_root, real_path);
        if (real_path.native().size() > kMaxPathLength)
        {
            reject("Resolved path exceeds maximum length");
        }
        return ResolvedPath(real_root, real_path);
    }

    ResolvedPath PathSandbox::resolve_within(const ResolvedPath &base, std::string_view requested)
    {
        std::filesystem::path relative{std::string(requested)};
        if (relative.has_root_path())
        {
            relative = relative.relative_path();
        }
        const auto combined = (std::filesystem::path(base.relative()) / relative).generic_string();
        return resolve(base.root(), combined);
    }

    void PathSandbox::ensure_not_root(const ResolvedPath &path)
    {
        if (path.is_root())
        {
            throw OperationError(ErrorCode::Forbidden, "Refusing to modify the sandbox root");
        }
    }

} // namespace nascore::server
