#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include "nascore/server/chunked_upload_manager.hpp"
#include "nascore/server/config.hpp"
#include "nascore/server/file_tree.hpp"
#include "nascore/server/identity_lookup.hpp"
#include "nascore/server/ownership_cache.hpp"
#include "nascore/server/upload_policy.hpp"

namespace nascore::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void wait_for_signal();
        void handle_signal(int signal);
        void reload_policy();

        ServerConfig config_;
        std::filesystem::path root_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        std::shared_ptr<PosixIdLookup> identities_;
        OwnershipCache owners_;
        FileTree file_tree_;
        ChunkedUploadManager uploads_;
        PolicyStore policy_;

        std::vector<std::thread> workers_;
    };

} // namespace nascore::server
