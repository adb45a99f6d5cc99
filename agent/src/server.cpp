#include "capydeploy/agent/server.hpp"

#include <asio/dispatch.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/host_name.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <thread>

#include <spdlog/spdlog.h>

#include "capydeploy/agent/session.hpp"
#include "capydeploy/crypto.hpp"
#include "capydeploy/version.hpp"

namespace capydeploy::agent
{

    namespace
    {

        constexpr std::chrono::seconds kCleanupInterval{60};

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::filesystem::path home_directory()
        {
            if (const char *home = std::getenv("HOME"))
            {
                return home;
            }
            return std::filesystem::current_path();
        }

        protocol::AgentInfo build_info(const AgentConfig &config)
        {
            return {
                .id = config.agent_id.empty() ? load_or_create_agent_id(config.root) : config.agent_id,
                .name = config.agent_name.empty() ? asio::ip::host_name() : config.agent_name,
                .platform = detect_platform(),
                .version = std::string(capydeploy::version()),
                .accept_connections = true,
            };
        }

    } // namespace

    std::string load_or_create_agent_id(const std::filesystem::path &root)
    {
        const auto path = root / ".capydeploy" / "agent-id";
        {
            std::ifstream in(path);
            std::string id;
            if (in && std::getline(in, id) && !id.empty())
            {
                return id;
            }
        }
        auto id = crypto::random_hex(8);
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::trunc);
        out << id << '\n';
        if (!out)
        {
            spdlog::warn("Could not persist agent id to {}", path.string());
        }
        return id;
    }

    Server::Server(AgentConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          cleanup_timer_(io_context_),
          info_(build_info(config_)),
          agent_(info_),
          steam_(SteamLocation{.home = home_directory(), .steam_root = config_.steam_root}),
          artwork_(steam_),
          shortcut_store_(steam_),
          shortcuts_(shortcut_store_, &artwork_),
          uploads_(UploadManagerOptions{.storage_root = config_.root, .shortcut_user = config_.steam_user}, &shortcuts_,
                   &steam_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Agent {} ({}) listening on {}:{} with root {}", info_.name, info_.id, config_.address,
                     local_port(), config_.root.string());

        if (config_.announce)
        {
            responder_ = std::make_unique<DiscoveryResponder>(
                io_context_, discovery::Announcement{
                                 .instance_name = info_.name,
                                 .host = asio::ip::host_name(),
                                 .port = local_port(),
                                 .info_fields = {"id=" + info_.id, "name=" + info_.name, "platform=" + info_.platform,
                                                 "version=" + info_.version},
                             });
        }

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            spdlog::info("Signal received, shutting down");
            stop();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_cleanup();
        if (responder_)
        {
            responder_->start();
        }

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Agent event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   {
            std::error_code ec;
            acceptor_.close(ec);
            cleanup_timer_.cancel();
            signals_.cancel(ec);
            if (responder_)
            {
                responder_->stop();
            }
            io_context_.stop(); });
    }

    std::uint16_t Server::local_port() const
    {
        std::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            AgentServices services{agent_, uploads_, shortcuts_, steam_, progress_};
            auto session = std::make_shared<Session>(std::move(socket), services);
            // Start on the socket's strand so every session handler is serialized.
            asio::dispatch(session->executor(), [session]
                           { session->start(); });
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else if (acceptor_.is_open())
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_cleanup()
    {
        cleanup_timer_.expires_after(kCleanupInterval);
        cleanup_timer_.async_wait([this](const std::error_code &ec)
                                  {
            if (ec)
            {
                return;
            }
            uploads_.cleanup_expired(config_.upload_timeout);
            progress_.prune(config_.upload_timeout);
            schedule_cleanup(); });
    }

} // namespace capydeploy::agent
