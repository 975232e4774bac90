#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "nascore/error_codes.hpp"
#include "nascore/server/file_tree.hpp"
#include "nascore/server/identity_lookup.hpp"
#include "nascore/server/ownership_cache.hpp"
#include "nascore/server/path_sandbox.hpp"
#include "test_support.hpp"

using namespace nascore;
using namespace nascore::server;

namespace
{

    class CountingLookup : public IdLookup
    {
    public:
        std::optional<std::string> user_name(std::uint32_t uid) override
        {
            ++user_calls;
            if (uid == 4242)
            {
                return std::nullopt;
            }
            return "user" + std::to_string(uid);
        }
        std::optional<std::string> group_name(std::uint32_t gid) override
        {
            ++group_calls;
            return "group" + std::to_string(gid);
        }
        std::optional<PrincipalIds> principal(const std::string &) override { return std::nullopt; }

        std::atomic<int> user_calls{0};
        std::atomic<int> group_calls{0};
    };

    class FixedLoader : public IdTableLoader
    {
    public:
        IdTables load() override
        {
            ++loads;
            IdTables tables;
            if (empty)
            {
                return tables;
            }
            tables.users.emplace(1000, "alice");
            tables.users.emplace(1001, "bob");
            tables.groups.emplace(100, "staff");
            return tables;
        }

        std::atomic<int> loads{0};
        std::atomic<bool> empty{false};
    };

    void test_cache_miss_costs_one_lookup()
    {
        auto lookup = std::make_shared<CountingLookup>();
        auto loader = std::make_shared<FixedLoader>();
        OwnershipCache cache(lookup, loader);

        assert(cache.username_for(7) == "user7");
        assert(cache.username_for(7) == "user7");
        assert(lookup->user_calls == 1);

        // Failed lookups cache the numeric id.
        assert(cache.username_for(4242) == "4242");
        assert(cache.username_for(4242) == "4242");
        assert(lookup->user_calls == 2);

        assert(cache.groupname_for(5) == "group5");
        assert(lookup->group_calls == 1);
    }

    void test_refresh_merges_tables()
    {
        auto lookup = std::make_shared<CountingLookup>();
        auto loader = std::make_shared<FixedLoader>();
        OwnershipCache cache(lookup, loader);

        assert(cache.username_for(1000) == "user1000");
        assert(cache.username_for(7) == "user7");
        assert(cache.groupname_for(5) == "group5");
        cache.refresh();
        assert(loader->loads == 1);
        assert(cache.cached_users() == 3);
        assert(cache.cached_groups() == 2);
        assert(cache.username_for(1000) == "alice");
        assert(cache.groupname_for(100) == "staff");

        // Ids the bulk tables do not know keep their looked-up names.
        assert(cache.username_for(7) == "user7");
        assert(cache.groupname_for(5) == "group5");
        assert(lookup->user_calls == 2);
        assert(lookup->group_calls == 1);

        loader->empty = true;
        cache.refresh();
        assert(loader->loads == 2);
        assert(cache.cached_users() == 3);
        assert(cache.cached_groups() == 2);
        assert(cache.username_for(1001) == "bob");
        assert(lookup->user_calls == 2);
    }

    void test_background_refresh()
    {
        auto lookup = std::make_shared<CountingLookup>();
        auto loader = std::make_shared<FixedLoader>();
        OwnershipCache cache(lookup, loader);
        cache.start_refresh(std::chrono::milliseconds{10});
        for (int i = 0; i < 200 && loader->loads < 2; ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
        cache.stop_refresh();
        assert(loader->loads >= 2);
        assert(cache.username_for(1001) == "bob");
    }

    void test_passwd_file_loader()
    {
        test::TempDir dir("passwd");
        test::write_file(dir.path() / "passwd", "# comment\n"
                                                "root:x:0:0:root:/root:/bin/sh\n"
                                                "alice:x:1000:1000::/home/alice:/bin/sh\n"
                                                "broken line\n"
                                                "nobody:x:notanumber:1::/:/bin/false\n");
        test::write_file(dir.path() / "group", "root:x:0:\nstaff:x:50:alice,bob\n");

        PasswdFileLoader loader(dir.path() / "passwd", dir.path() / "group");
        const auto tables = loader.load();
        assert(tables.users.size() == 2);
        assert(tables.users.at(0) == "root");
        assert(tables.users.at(1000) == "alice");
        assert(tables.groups.size() == 2);
        assert(tables.groups.at(50) == "staff");
    }

    struct TreeFixture
    {
        TreeFixture()
            : dir("tree"),
              cache(std::make_shared<CountingLookup>(), std::make_shared<FixedLoader>()),
              tree(cache)
        {
            std::filesystem::create_directories(dir.path() / "zeta");
            std::filesystem::create_directories(dir.path() / "Alpha");
            test::write_file(dir.path() / "b.txt", "abc");
            test::write_file(dir.path() / "A.md", "0123456789");
            test::write_file(dir.path() / "c.bin", "x");
        }

        ResolvedPath at(std::string_view path) const { return PathSandbox::resolve(dir.path(), path); }

        static std::vector<std::string> names(const ListResult &result)
        {
            std::vector<std::string> out;
            for (const auto &entry : result.entries)
            {
                out.push_back(entry.name);
            }
            return out;
        }

        test::TempDir dir;
        OwnershipCache cache;
        FileTree tree;
    };

    void test_listing_by_name()
    {
        TreeFixture fixture;
        const auto all = fixture.tree.list_directory(fixture.at("."), ListOptions{});
        assert(all.total == 5);
        assert(!all.has_more);
        assert((TreeFixture::names(all) == std::vector<std::string>{"Alpha", "zeta", "A.md", "b.txt", "c.bin"}));

        ListOptions page;
        page.limit = 2;
        page.offset = 1;
        const auto second = fixture.tree.list_directory(fixture.at("."), page);
        assert(second.total == 5);
        assert(second.has_more);
        assert((TreeFixture::names(second) == std::vector<std::string>{"zeta", "A.md"}));
        assert(second.entries[1].size == 10);
        assert(second.entries[1].path == "A.md");
        assert(second.entries[1].extension == "md");
        assert(second.entries[1].mime_type == "text/markdown");
        assert(second.entries[0].is_directory);
        assert(second.entries[0].mode.front() == 'd');

        page.offset = 4;
        const auto last = fixture.tree.list_directory(fixture.at("."), page);
        assert(last.entries.size() == 1);
        assert(!last.has_more);

        page.offset = 10;
        assert(fixture.tree.list_directory(fixture.at("."), page).entries.empty());

        ListOptions descending;
        descending.descending = true;
        descending.limit = 10;
        const auto reversed = fixture.tree.list_directory(fixture.at("."), descending);
        assert((TreeFixture::names(reversed) ==
                std::vector<std::string>{"zeta", "Alpha", "c.bin", "b.txt", "A.md"}));
    }

    void test_listing_symlinked_directory()
    {
        TreeFixture fixture;
        std::filesystem::create_directory_symlink(fixture.dir.path() / "zeta", fixture.dir.path() / "link");

        // The paged name sort and the full listing classify the link the same way.
        ListOptions paged;
        paged.limit = 10;
        const auto page = fixture.tree.list_directory(fixture.at("."), paged);
        assert((TreeFixture::names(page) == std::vector<std::string>{"Alpha", "zeta", "A.md", "b.txt", "c.bin", "link"}));
        assert(!page.entries.back().is_directory);
        assert(TreeFixture::names(fixture.tree.list_directory(fixture.at("."), ListOptions{})) == TreeFixture::names(page));

        ListOptions folders;
        folders.limit = 10;
        folders.filter = TypeFilter::Folders;
        const auto dirs = fixture.tree.list_directory(fixture.at("."), folders);
        assert(dirs.total == 2);
        assert((TreeFixture::names(dirs) == std::vector<std::string>{"Alpha", "zeta"}));

        ListOptions files;
        files.limit = 10;
        files.filter = TypeFilter::Files;
        const auto plain = fixture.tree.list_directory(fixture.at("."), files);
        assert(plain.total == 4);
        assert(TreeFixture::names(plain).back() == "link");
    }

    void test_listing_by_other_keys()
    {
        TreeFixture fixture;
        ListOptions by_size;
        by_size.sort_by = SortKey::Size;
        by_size.filter = TypeFilter::Files;
        const auto files = fixture.tree.list_directory(fixture.at("."), by_size);
        assert(files.total == 3);
        assert((TreeFixture::names(files) == std::vector<std::string>{"c.bin", "b.txt", "A.md"}));

        by_size.descending = true;
        const auto largest_first = fixture.tree.list_directory(fixture.at("."), by_size);
        assert((TreeFixture::names(largest_first) == std::vector<std::string>{"A.md", "b.txt", "c.bin"}));

        ListOptions folders;
        folders.filter = TypeFilter::Folders;
        folders.sort_by = SortKey::Modified;
        const auto dirs = fixture.tree.list_directory(fixture.at("."), folders);
        assert(dirs.total == 2);
        for (const auto &entry : dirs.entries)
        {
            assert(entry.is_directory);
        }

        const nlohmann::json json = dirs;
        assert(json.at("total") == 2);
        assert(json.at("files").size() == 2);
        assert(!json.at("files")[0].contains("mime_type"));

        assert(sort_key_from_string("owner") == SortKey::Owner);
        assert(!sort_key_from_string("colour"));
        assert(type_filter_from_string("folder") == TypeFilter::Folders);
        assert(!type_filter_from_string("links"));
    }

    void test_tree_mutations()
    {
        TreeFixture fixture;
        assert(test::throws_code(ErrorCode::NotFound, [&]
                                 { (void)fixture.tree.list_directory(fixture.at("missing"), ListOptions{}); }));
        assert(test::throws_code(ErrorCode::InvalidPayload, [&]
                                 { (void)fixture.tree.list_directory(fixture.at("b.txt"), ListOptions{}); }));

        fixture.tree.create_directory(fixture.at("docs/2024"));
        assert(std::filesystem::is_directory(fixture.dir.path() / "docs" / "2024"));
        const auto info = fixture.tree.stat_path(fixture.at("docs"));
        assert(info.is_directory);
        assert(info.path == "docs");

        fixture.tree.move_path(fixture.at("b.txt"), fixture.at("docs/2024/b.txt"));
        assert(!std::filesystem::exists(fixture.dir.path() / "b.txt"));
        assert(test::read_file(fixture.dir.path() / "docs" / "2024" / "b.txt") == "abc");

        assert(test::throws_code(ErrorCode::InvalidPayload, [&]
                                 { fixture.tree.move_path(fixture.at("docs"), fixture.at("docs/2024/inner")); }));
        assert(test::throws_code(ErrorCode::NotFound, [&]
                                 { fixture.tree.move_path(fixture.at("nope"), fixture.at("other")); }));
        assert(test::throws_code(ErrorCode::Forbidden, [&]
                                 { fixture.tree.remove_path(fixture.at(".")); }));
        assert(test::throws_code(ErrorCode::Forbidden, [&]
                                 { fixture.tree.move_path(fixture.at("."), fixture.at("elsewhere")); }));

        fixture.tree.remove_path(fixture.at("docs"));
        assert(!std::filesystem::exists(fixture.dir.path() / "docs"));
        assert(test::throws_code(ErrorCode::NotFound, [&]
                                 { fixture.tree.remove_path(fixture.at("docs")); }));
        assert(test::throws_code(ErrorCode::NotFound, [&]
                                 { (void)fixture.tree.stat_path(fixture.at("docs")); }));
    }

} // namespace

void run_ownership_tests()
{
    test_cache_miss_costs_one_lookup();
    test_refresh_merges_tables();
    test_background_refresh();
    test_passwd_file_loader();
    test_listing_by_name();
    test_listing_symlinked_directory();
    test_listing_by_other_keys();
    test_tree_mutations();
}
