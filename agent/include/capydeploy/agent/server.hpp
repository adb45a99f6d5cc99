#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "capydeploy/agent/artwork_manager.hpp"
#include "capydeploy/agent/config.hpp"
#include "capydeploy/agent/discovery_responder.hpp"
#include "capydeploy/agent/local_agent.hpp"
#include "capydeploy/agent/progress_throttle.hpp"
#include "capydeploy/agent/shortcut_manager.hpp"
#include "capydeploy/agent/shortcut_store.hpp"
#include "capydeploy/agent/steam_controller.hpp"
#include "capydeploy/agent/upload_manager.hpp"

namespace capydeploy::agent
{

    // Reads the agent id persisted under `root`, generating one on first use.
    std::string load_or_create_agent_id(const std::filesystem::path &root);

    class Server
    {
    public:
        explicit Server(AgentConfig config);

        void run();

        void stop();

        std::uint16_t local_port() const;

        const protocol::AgentInfo &info() const noexcept { return info_; }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_cleanup();

        AgentConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer cleanup_timer_;

        protocol::AgentInfo info_;
        LocalAgent agent_;
        LocalSteamController steam_;
        FileArtworkManager artwork_;
        JsonShortcutStore shortcut_store_;
        SteamShortcutManager shortcuts_;
        UploadManager uploads_;
        ProgressThrottle progress_;
        std::unique_ptr<DiscoveryResponder> responder_;

        std::vector<std::thread> workers_;
    };

} // namespace capydeploy::agent
