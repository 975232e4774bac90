#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace nascore::server
{

    struct IdTables
    {
        std::unordered_map<std::uint32_t, std::string> users;
        std::unordered_map<std::uint32_t, std::string> groups;
    };

    struct PrincipalIds
    {
        std::uint32_t uid{};
        std::uint32_t gid{};
    };

    /// Resolves one id (or account name) at a time.
    class IdLookup
    {
    public:
        virtual ~IdLookup() = default;

        virtual std::optional<std::string> user_name(std::uint32_t uid) = 0;
        virtual std::optional<std::string> group_name(std::uint32_t gid) = 0;
        virtual std::optional<PrincipalIds> principal(const std::string &account) = 0;
    };

    /// Loads every known user and group in one pass.
    class IdTableLoader
    {
    public:
        virtual ~IdTableLoader() = default;

        virtual IdTables load() = 0;
    };

    /// getpwuid_r / getgrgid_r / getpwnam_r, so NSS sources are honoured.
    class PosixIdLookup : public IdLookup
    {
    public:
        std::optional<std::string> user_name(std::uint32_t uid) override;
        std::optional<std::string> group_name(std::uint32_t gid) override;
        std::optional<PrincipalIds> principal(const std::string &account) override;
    };

    /// Parses passwd(5) and group(5) formatted files.
    class PasswdFileLoader : public IdTableLoader
    {
    public:
        explicit PasswdFileLoader(std::filesystem::path passwd_file = "/etc/passwd",
                                  std::filesystem::path group_file = "/etc/group");

        IdTables load() override;

    private:
        std::filesystem::path passwd_file_;
        std::filesystem::path group_file_;
    };

} // namespace nascore::server
