#include "nascore/server/identity_lookup.hpp"

#include <charconv>
#include <fstream>
#include <string_view>
#include <vector>

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace nascore::server
{

    namespace
    {

        std::size_t buffer_size_hint(int name)
        {
            const auto hint = ::sysconf(name);
            return hint > 0 ? static_cast<std::size_t>(hint) : 16384;
        }

        // Lines look like "name:x:id:...". Returns false for comments and junk.
        bool parse_id_line(std::string_view line, std::string &name, std::uint32_t &id)
        {
            if (line.empty() || line.front() == '#')
            {
                return false;
            }
            const auto first = line.find(':');
            if (first == std::string_view::npos || first == 0)
            {
                return false;
            }
            const auto second = line.find(':', first + 1);
            if (second == std::string_view::npos)
            {
                return false;
            }
            const auto third = line.find(':', second + 1);
            const auto id_text = line.substr(second + 1, third == std::string_view::npos ? std::string_view::npos
                                                                                         : third - second - 1);
            const auto [ptr, ec] = std::from_chars(id_text.data(), id_text.data() + id_text.size(), id);
            if (ec != std::errc{} || ptr != id_text.data() + id_text.size() || id_text.empty())
            {
                return false;
            }
            name = std::string(line.substr(0, first));
            return true;
        }

        void load_file(const std::filesystem::path &path, std::unordered_map<std::uint32_t, std::string> &table)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                spdlog::warn("Cannot read id table {}", path.string());
                return;
            }
            std::string line;
            std::string name;
            std::uint32_t id = 0;
            while (std::getline(in, line))
            {
                if (parse_id_line(line, name, id))
                {
                    table.try_emplace(id, name);
                }
            }
        }

    } // namespace

    std::optional<std::string> PosixIdLookup::user_name(std::uint32_t uid)
    {
        std::vector<char> buffer(buffer_size_hint(_SC_GETPW_R_SIZE_MAX));
        passwd entry{};
        passwd *result = nullptr;
        if (::getpwuid_r(static_cast<uid_t>(uid), &entry, buffer.data(), buffer.size(), &result) != 0 ||
            result == nullptr)
        {
            return std::nullopt;
        }
        return std::string(result->pw_name);
    }

    std::optional<std::string> PosixIdLookup::group_name(std::uint32_t gid)
    {
        std::vector<char> buffer(buffer_size_hint(_SC_GETGR_R_SIZE_MAX));
        group entry{};
        group *result = nullptr;
        if (::getgrgid_r(static_cast<gid_t>(gid), &entry, buffer.data(), buffer.size(), &result) != 0 ||
            result == nullptr)
        {
            return std::nullopt;
        }
        return std::string(result->gr_name);
    }

    std::optional<PrincipalIds> PosixIdLookup::principal(const std::string &account)
    {
        std::vector<char> buffer(buffer_size_hint(_SC_GETPW_R_SIZE_MAX));
        passwd entry{};
        passwd *result = nullptr;
        if (::getpwnam_r(account.c_str(), &entry, buffer.data(), buffer.size(), &result) != 0 || result == nullptr)
        {
            return std::nullopt;
        }
        return PrincipalIds{.uid = result->pw_uid, .gid = result->pw_gid};
    }

    PasswdFileLoader::PasswdFileLoader(std::filesystem::path passwd_file, std::filesystem::path group_file)
        : passwd_file_(std::move(passwd_file)), group_file_(std::move(group_file)) {}

    IdTables PasswdFileLoader::load()
    {
        IdTables tables;
        load_file(passwd_file_, tables.users);
        load_file(group_file_, tables.groups);
        return tables;
    }

} // namespace nascore::server
