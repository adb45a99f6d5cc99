#include "capydeploy/hub/agent_client.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <optional>

#include <spdlog/spdlog.h>

#include "capydeploy/framing.hpp"

namespace capydeploy::hub
{

    namespace
    {
        class TimedOut : public std::exception
        {
        };
    } // namespace

    AgentClient::AgentClient(std::string host, std::uint16_t port, ClientOptions options)
        : host_(std::move(host)),
          port_(port),
          options_(options),
          socket_(io_context_),
          progress_(options.event_capacity)
    {
    }

    AgentClient::~AgentClient()
    {
        close();
        progress_.close();
    }

    void AgentClient::connect()
    {
        std::lock_guard lock(mutex_);
        if (!socket_.is_open())
        {
            connect_locked(std::chrono::steady_clock::now() + options_.request_timeout);
        }
    }

    void AgentClient::close()
    {
        std::lock_guard lock(mutex_);
        close_locked();
    }

    bool AgentClient::connected() const
    {
        std::lock_guard lock(mutex_);
        return socket_.is_open();
    }

    std::error_code AgentClient::run_until_done(Deadline deadline,
                                                const std::function<void(std::function<void(std::error_code)>)> &start)
    {
        std::optional<std::error_code> result;
        start([&result](std::error_code ec)
              { result = ec; });
        io_context_.restart();
        io_context_.run_until(deadline);
        if (!result)
        {
            close_locked();
            io_context_.restart();
            io_context_.run();
            throw TimedOut{};
        }
        return *result;
    }

    void AgentClient::connect_locked(Deadline deadline)
    {
        const auto endpoint_text = host_ + ":" + std::to_string(port_);
        try
        {
            asio::ip::tcp::resolver resolver(io_context_);
            const auto endpoints = resolver.resolve(host_, std::to_string(port_));
            const auto ec = run_until_done(deadline, [&](auto done)
                                           { asio::async_connect(socket_, endpoints,
                                                                 [done](const std::error_code &connect_ec, const auto &)
                                                                 { done(connect_ec); }); });
            if (ec)
            {
                close_locked();
                throw std::system_error(ec, "connect");
            }
        }
        catch (const TimedOut &)
        {
            throw ProtocolError(ErrorCode::Timeout, "connecting to " + endpoint_text + " timed out");
        }
        catch (const std::system_error &)
        {
            throw ProtocolError(ErrorCode::AgentBusy, "cannot reach agent at " + endpoint_text, std::current_exception());
        }
        socket_.set_option(asio::ip::tcp::no_delay(true));
        spdlog::debug("Connected to agent {}", endpoint_text);
    }

    void AgentClient::close_locked()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void AgentClient::write_message(const protocol::Message &message, Deadline deadline)
    {
        const auto frame = protocol::encode_frame(nlohmann::json(message));
        const auto ec = run_until_done(deadline, [&](auto done)
                                       { asio::async_write(socket_, asio::buffer(frame),
                                                           [done](const std::error_code &write_ec, std::size_t)
                                                           { done(write_ec); }); });
        if (ec)
        {
            throw std::system_error(ec, "write");
        }
    }

    protocol::Message AgentClient::read_message(Deadline deadline)
    {
        std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
        auto ec = run_until_done(deadline, [&](auto done)
                                 { asio::async_read(socket_, asio::buffer(header),
                                                    [done](const std::error_code &read_ec, std::size_t)
                                                    { done(read_ec); }); });
        if (ec)
        {
            throw std::system_error(ec, "read");
        }

        std::uint32_t length = 0;
        try
        {
            length = protocol::decode_frame_length(header);
        }
        catch (const ProtocolError &)
        {
            // The body was never read, so the stream cannot be resynchronized.
            close_locked();
            throw;
        }
        std::vector<std::uint8_t> body(length);
        ec = run_until_done(deadline, [&](auto done)
                            { asio::async_read(socket_, asio::buffer(body),
                                               [done](const std::error_code &read_ec, std::size_t)
                                               { done(read_ec); }); });
        if (ec)
        {
            throw std::system_error(ec, "read");
        }

        try
        {
            return nlohmann::json::parse(body.begin(), body.end()).get<protocol::Message>();
        }
        catch (const nlohmann::json::exception &)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "malformed frame from agent", std::current_exception());
        }
    }

    protocol::Message AgentClient::request(protocol::MessageType type, nlohmann::json payload)
    {
        std::lock_guard lock(mutex_);
        const auto deadline = std::chrono::steady_clock::now() + options_.request_timeout;
        if (!socket_.is_open())
        {
            connect_locked(deadline);
        }

        const auto outbound = protocol::make_request(type, std::move(payload));
        const auto expected = protocol::response_type_for(type);
        try
        {
            write_message(outbound, deadline);
            while (true)
            {
                auto reply = read_message(deadline);
                if (reply.type == protocol::MessageType::UploadProgress)
                {
                    progress_.try_push(protocol::parse_payload<protocol::UploadProgress>(reply));
                    continue;
                }
                if (reply.id != outbound.id)
                {
                    spdlog::debug("Discarding {} for unknown request {}", protocol::to_string(reply.type), reply.id);
                    continue;
                }
                if (reply.type == protocol::MessageType::Error)
                {
                    const auto error = protocol::parse_payload<protocol::ErrorResponse>(reply);
                    if (error.details)
                    {
                        spdlog::warn("{} failed on agent: {} ({})", protocol::to_string(type), error.message, *error.details);
                    }
                    throw protocol::from_error_response(error);
                }
                if (reply.type != expected)
                {
                    throw ProtocolError(ErrorCode::InvalidRequest, "unexpected " + std::string(protocol::to_string(reply.type)) +
                                                                       " in reply to " + std::string(protocol::to_string(type)));
                }
                return reply;
            }
        }
        catch (const TimedOut &)
        {
            throw ProtocolError(ErrorCode::Timeout,
                                std::string(protocol::to_string(type)) + " timed out after " +
                                    std::to_string(options_.request_timeout.count()) + " ms");
        }
        catch (const std::system_error &)
        {
            close_locked();
            throw ProtocolError(ErrorCode::AgentBusy, "connection to agent lost", std::current_exception());
        }
    }

    void AgentClient::ping()
    {
        request(protocol::MessageType::Ping);
    }

    protocol::AgentInfo AgentClient::get_info()
    {
        return call<protocol::InfoResponse>(protocol::MessageType::GetInfo).agent;
    }

    protocol::InitUploadResponse AgentClient::init_upload(const protocol::InitUploadRequest &request)
    {
        return call<protocol::InitUploadResponse>(protocol::MessageType::InitUpload, request);
    }

    protocol::UploadChunkResponse AgentClient::upload_chunk(const protocol::UploadChunkRequest &request)
    {
        return call<protocol::UploadChunkResponse>(protocol::MessageType::UploadChunk, request);
    }

    protocol::CompleteUploadResponse AgentClient::complete_upload(const std::string &upload_id, bool create_shortcut)
    {
        return call<protocol::CompleteUploadResponse>(
            protocol::MessageType::CompleteUpload,
            protocol::CompleteUploadRequest{.upload_id = upload_id, .create_shortcut = create_shortcut});
    }

    void AgentClient::cancel_upload(const std::string &upload_id)
    {
        request(protocol::MessageType::CancelUpload, protocol::CancelUploadRequest{.upload_id = upload_id});
    }

    protocol::ShortcutResponse AgentClient::create_shortcut(std::uint32_t user_id, const protocol::ShortcutConfig &shortcut)
    {
        return call<protocol::ShortcutResponse>(protocol::MessageType::CreateShortcut,
                                                protocol::CreateShortcutRequest{.user_id = user_id, .shortcut = shortcut});
    }

    void AgentClient::delete_shortcut(const protocol::DeleteShortcutRequest &request)
    {
        this->request(protocol::MessageType::DeleteShortcut, request);
    }

    std::vector<protocol::ShortcutInfo> AgentClient::list_shortcuts(std::uint32_t user_id)
    {
        return call<protocol::ShortcutResponse>(protocol::MessageType::ListShortcuts,
                                                protocol::ListShortcutsRequest{.user_id = user_id})
            .shortcuts;
    }

    protocol::SteamResponse AgentClient::get_steam_status()
    {
        return call<protocol::SteamResponse>(protocol::MessageType::GetSteamStatus);
    }

    protocol::SteamResponse AgentClient::restart_steam()
    {
        return call<protocol::SteamResponse>(protocol::MessageType::RestartSteam);
    }

} // namespace capydeploy::hub
