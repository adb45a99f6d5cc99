#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <deque>
#include <memory>
#include <vector>

#include "capydeploy/agent/capabilities.hpp"
#include "capydeploy/agent/progress_throttle.hpp"
#include "capydeploy/framing.hpp"
#include "capydeploy/protocol.hpp"

namespace capydeploy::agent
{

    struct AgentServices
    {
        BaseAgent &agent;
        FileReceiver &uploads;
        ShortcutManager &shortcuts;
        SteamController &steam;
        ProgressThrottle &progress;
    };

    // One Hub connection. The socket carries a strand executor, so every
    // handler of a session runs serialized.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, AgentServices services);
        ~Session();

        void start();

        void stop();

        asio::ip::tcp::socket::executor_type executor() { return socket_.get_executor(); }

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        protocol::Message dispatch(const protocol::Message &request);
        void send(const protocol::Message &message);
        void write_next();

        protocol::Message handle_init_upload(const protocol::Message &request);
        protocol::Message handle_upload_chunk(const protocol::Message &request);
        protocol::Message handle_complete_upload(const protocol::Message &request);
        protocol::Message handle_cancel_upload(const protocol::Message &request);
        protocol::Message handle_create_shortcut(const protocol::Message &request);
        protocol::Message handle_delete_shortcut(const protocol::Message &request);
        protocol::Message handle_list_shortcuts(const protocol::Message &request);
        protocol::Message handle_steam(const protocol::Message &request);

        void emit_progress(const std::string &upload_id);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        AgentServices services_;

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> outbox_;
        bool stopped_{false};
    };

} // namespace capydeploy::agent
