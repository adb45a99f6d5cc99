#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "capydeploy/event_queue.hpp"
#include "capydeploy/protocol.hpp"

namespace capydeploy::hub
{

    struct ClientOptions
    {
        std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
        std::size_t event_capacity{256};
    };

    // Synchronous request/response channel to one Agent. Calls are
    // serialized; `upload_progress` events read while waiting for a response
    // go to progress_events(). Transport failures surface as TIMEOUT or
    // AGENT_BUSY, remote failures as the ProtocolError the Agent reported.
    class AgentClient
    {
    public:
        AgentClient(std::string host, std::uint16_t port, ClientOptions options = {});
        ~AgentClient();

        AgentClient(const AgentClient &) = delete;
        AgentClient &operator=(const AgentClient &) = delete;

        void connect();
        void close();
        bool connected() const;

        const std::string &host() const noexcept { return host_; }
        std::uint16_t port() const noexcept { return port_; }

        protocol::Message request(protocol::MessageType type, nlohmann::json payload = nlohmann::json::object());

        template <typename Response>
        Response call(protocol::MessageType type, nlohmann::json payload = nlohmann::json::object())
        {
            return protocol::parse_payload<Response>(request(type, std::move(payload)));
        }

        void ping();
        protocol::AgentInfo get_info();
        protocol::InitUploadResponse init_upload(const protocol::InitUploadRequest &request);
        protocol::UploadChunkResponse upload_chunk(const protocol::UploadChunkRequest &request);
        protocol::CompleteUploadResponse complete_upload(const std::string &upload_id, bool create_shortcut);
        void cancel_upload(const std::string &upload_id);
        protocol::ShortcutResponse create_shortcut(std::uint32_t user_id, const protocol::ShortcutConfig &shortcut);
        void delete_shortcut(const protocol::DeleteShortcutRequest &request);
        std::vector<protocol::ShortcutInfo> list_shortcuts(std::uint32_t user_id);
        protocol::SteamResponse get_steam_status();
        protocol::SteamResponse restart_steam();

        BoundedEventQueue<protocol::UploadProgress> &progress_events() noexcept { return progress_; }

    private:
        using Deadline = std::chrono::steady_clock::time_point;

        void connect_locked(Deadline deadline);
        void close_locked();
        void write_message(const protocol::Message &message, Deadline deadline);
        protocol::Message read_message(Deadline deadline);
        std::error_code run_until_done(Deadline deadline, const std::function<void(std::function<void(std::error_code)>)> &start);

        std::string host_;
        std::uint16_t port_;
        ClientOptions options_;

        mutable std::mutex mutex_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        BoundedEventQueue<protocol::UploadProgress> progress_;
    };

} // namespace capydeploy::hub
