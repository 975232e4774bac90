#include <cassert>
#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "nascore/error_codes.hpp"
#include "nascore/server/config.hpp"
#include "nascore/server/upload_policy.hpp"
#include "test_support.hpp"

using namespace nascore;
using namespace nascore::server;

namespace
{

    void test_defaults()
    {
        ServerConfig config;
        assert(config.address == "0.0.0.0");
        assert(config.chunk_size == 5ULL * 1024 * 1024);
        assert(config.session_ttl == std::chrono::hours{24});
        assert(config.max_request_body == 1024 * 1024);
        assert(!config.config_file);

        config.root = "/srv/share";
        assert(config.effective_upload_dir() == std::filesystem::path("/srv/.nascore-uploads-share"));
        config.root = "/srv/share/";
        assert(config.effective_upload_dir() == std::filesystem::path("/srv/.nascore-uploads-share"));
        config.upload_dir = "/var/lib/nascore";
        assert(config.effective_upload_dir() == std::filesystem::path("/var/lib/nascore"));
    }

    void test_load_config_file()
    {
        test::TempDir dir("config");
        const auto path = dir.path() / "nascore.json";
        test::write_file(path, R"({
            "address": "127.0.0.1",
            "port": 8080,
            "root": "/data",
            "threads": 3,
            "chunk_size": 1048576,
            "session_ttl": 3600,
            "verbose": true,
            "log": "/tmp/nascore.log",
            "policy": {
                "max_file_size": 2048,
                "denied_extensions": [".exe"],
                "allowed_types": ["image/*"]
            }
        })");

        ServerConfig config;
        load_config_file(path, config);
        assert(config.address == "127.0.0.1");
        assert(config.port == 8080);
        assert(config.root == "/data");
        assert(config.worker_threads == 3);
        assert(config.chunk_size == 1048576);
        assert(config.session_ttl == std::chrono::hours{1});
        assert(config.sweep_interval == std::chrono::hours{1});
        assert(config.verbose);
        assert(config.log_file == std::filesystem::path("/tmp/nascore.log"));
        assert(config.config_file == path);
        assert(config.policy.max_file_size == 2048);
        assert(config.policy.denied_extensions.size() == 1);
        assert(config.policy.allowed_types.front() == "image/*");

        const nlohmann::json dumped = config.policy;
        assert(dumped.at("max_file_size") == 2048);
        assert(dumped.at("denied_extensions")[0] == ".exe");
    }

    void test_flat_policy_keys()
    {
        ServerConfig config;
        apply_config_json(nlohmann::json{{"max_file_size", 10}, {"allowed_extensions", nlohmann::json::array({"txt"})}}, config);
        assert(config.policy.max_file_size == 10);
        assert(config.policy.allowed_extensions.front() == "txt");
        assert(config.port == 0);
    }

    void test_rejects_bad_files()
    {
        test::TempDir dir("config_bad");
        ServerConfig config;
        assert(test::throws_code(ErrorCode::InvalidPayload, [&]
                                 { load_config_file(dir.path() / "missing.json", config); }));

        test::write_file(dir.path() / "broken.json", "{ \"port\": ");
        assert(test::throws_code(ErrorCode::InvalidPayload, [&]
                                 { load_config_file(dir.path() / "broken.json", config); }));

        test::write_file(dir.path() / "array.json", "[1, 2]");
        assert(test::throws_code(ErrorCode::InvalidPayload, [&]
                                 { load_config_file(dir.path() / "array.json", config); }));

        test::write_file(dir.path() / "typed.json", R"({"port": "eighty"})");
        assert(test::throws_code(ErrorCode::InvalidPayload, [&]
                                 { load_config_file(dir.path() / "typed.json", config); }));
        assert(!config.config_file);
    }

    void test_policy_reload()
    {
        test::TempDir dir("config_reload");
        const auto path = dir.path() / "nascore.json";
        test::write_file(path, R"({"policy": {"max_file_size": 100}})");

        PolicyStore store(load_policy_file(path));
        assert(store.current()->max_file_size == 100);
        assert(test::throws_code(ErrorCode::PayloadTooLarge, [&]
                                 { validate_upload("a.bin", 200, *store.current()); }));

        test::write_file(path, R"({"policy": {"max_file_size": 500, "denied_types": ["video/*"]}})");
        store.replace(load_policy_file(path));
        validate_upload("a.bin", 200, *store.current());
        assert(test::throws_code(ErrorCode::ValidationFailed, [&]
                                 { validate_upload("clip.mp4", 200, *store.current()); }));

        test::write_file(path, "not json");
        assert(test::throws_code(ErrorCode::InvalidPayload, [&]
                                 { (void)load_policy_file(path); }));
        assert(store.current()->max_file_size == 500);
    }

} // namespace

void run_config_tests()
{
    test_defaults();
    test_load_config_file();
    test_flat_policy_keys();
    test_rejects_bad_files();
    test_policy_reload();
}
