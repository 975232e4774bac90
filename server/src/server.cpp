#include "nascore/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "nascore/error_codes.hpp"
#include "nascore/server/connection.hpp"

namespace nascore::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::filesystem::path canonical_root(const std::filesystem::path &root)
        {
            std::error_code ec;
            auto canonical = std::filesystem::canonical(root, ec);
            if (ec || !std::filesystem::is_directory(canonical))
            {
                throw OperationError(ErrorCode::NotFound, "Root directory " + root.string() + " does not exist");
            }
            return canonical;
        }

        UploadManagerConfig upload_config(const ServerConfig &config)
        {
            UploadManagerConfig upload;
            upload.base_dir = config.effective_upload_dir();
            upload.default_chunk_size = config.chunk_size;
            upload.session_ttl = config.session_ttl;
            upload.sweep_interval = config.sweep_interval;
            return upload;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          root_(canonical_root(config_.root)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          identities_(std::make_shared<PosixIdLookup>()),
          owners_(identities_, std::make_shared<PasswdFileLoader>()),
          file_tree_(owners_),
          uploads_(upload_config(config_), identities_),
          policy_(config_.policy)
    {
        if (PathSandbox::is_within(root_, std::filesystem::weakly_canonical(uploads_.base_dir())))
        {
            spdlog::warn("Upload directory {} lies inside the served root", uploads_.base_dir().string());
        }

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, config_.port, root_.string());
        spdlog::info("Upload sessions in {} (chunk size {}, ttl {}s)", uploads_.base_dir().string(),
                     config_.chunk_size, config_.session_ttl.count());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.add(SIGHUP);
        wait_for_signal();
    }

    Server::~Server()
    {
        uploads_.stop_sweeper();
        owners_.stop_refresh();
    }

    void Server::run()
    {
        owners_.refresh();
        owners_.start_refresh(config_.owner_refresh);
        uploads_.start_sweeper();
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        uploads_.stop_sweeper();
        owners_.stop_refresh();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{
                .root = root_,
                .file_tree = file_tree_,
                .uploads = uploads_,
                .policy = policy_,
                .max_request_body = config_.max_request_body,
                .max_chunk_body = uploads_.max_chunk_size(),
            };
            auto connection = std::make_shared<Connection>(std::move(socket), std::move(services));
            connection->start();
        }
        if (ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        if (acceptor_.is_open())
        {
            accept_next();
        }
    }

    void Server::wait_for_signal()
    {
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
            if (!ec) {
                handle_signal(signal);
            } });
    }

    void Server::handle_signal(int signal)
    {
        if (signal == SIGHUP)
        {
            reload_policy();
            wait_for_signal();
            return;
        }
        std::error_code ec;
        acceptor_.close(ec);
        io_context_.stop();
        spdlog::info("Signal {} received, shutting down", signal);
    }

    void Server::reload_policy()
    {
        if (!config_.config_file)
        {
            spdlog::info("SIGHUP received but no config file is in use");
            return;
        }
        try
        {
            policy_.replace(load_policy_file(*config_.config_file));
            spdlog::info("Upload policy reloaded from {}", config_.config_file->string());
        }
        catch (const OperationError &ex)
        {
            spdlog::error("Keeping previous upload policy: {}", ex.what());
        }
    }

} // namespace nascore::server
