#include "capydeploy/agent/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <span>
#include <string>

#include <spdlog/spdlog.h>

#include "capydeploy/crypto.hpp"
#include "capydeploy/encoding/base64.hpp"

namespace capydeploy::agent
{

    Session::Session(asio::ip::tcp::socket socket, AgentServices services)
        : socket_(std::move(socket)), services_(services) {}

    Session::~Session()
    {
        spdlog::debug("Session released");
    }

    void Session::start()
    {
        spdlog::info("Hub connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = protocol::decode_frame_length(header_buffer_);
                             }
                             catch (const ProtocolError &error)
                             {
                                 // The stream cannot be resynchronised after an oversized header.
                                 spdlog::warn("{}: {}", remote_endpoint(), error.what());
                                 send(protocol::make_error("", error));
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             nlohmann::json json;
                             try
                             {
                                 json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                             }
                             catch (const nlohmann::json::exception &)
                             {
                                 send(protocol::make_error("", ProtocolError(ErrorCode::InvalidRequest, "malformed frame",
                                                                             std::current_exception())));
                                 read_frame_header();
                                 return;
                             }
                             process_message(json);
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        std::string correlation_id;
        if (json.is_object() && json.contains("id") && json["id"].is_string())
        {
            correlation_id = json["id"].get<std::string>();
        }

        try
        {
            const auto request = json.get<protocol::Message>();
            if (protocol::kind_of(request.type) != protocol::MessageKind::Request)
            {
                throw ProtocolError(ErrorCode::InvalidRequest,
                                    "unexpected " + std::string(protocol::to_string(request.type)) + " message");
            }
            spdlog::debug("{} -> {}", remote_endpoint(), protocol::to_string(request.type));
            send(dispatch(request));
            if (request.type == protocol::MessageType::UploadChunk)
            {
                emit_progress(request.payload.value("uploadId", std::string{}));
            }
        }
        catch (const std::exception &)
        {
            const auto error = to_protocol_error(std::current_exception());
            spdlog::warn("{}: request {} failed: {}", remote_endpoint(), correlation_id, error.what());
            send(protocol::make_error(correlation_id, error));
        }
    }

    protocol::Message Session::dispatch(const protocol::Message &request)
    {
        using protocol::MessageType;
        switch (request.type)
        {
        case MessageType::Ping:
            services_.agent.ping();
            return protocol::make_response(request);
        case MessageType::GetInfo:
            return protocol::make_response(request, protocol::InfoResponse{.agent = services_.agent.get_info()});
        case MessageType::InitUpload:
            return handle_init_upload(request);
        case MessageType::UploadChunk:
            return handle_upload_chunk(request);
        case MessageType::CompleteUpload:
            return handle_complete_upload(request);
        case MessageType::CancelUpload:
            return handle_cancel_upload(request);
        case MessageType::CreateShortcut:
            return handle_create_shortcut(request);
        case MessageType::DeleteShortcut:
            return handle_delete_shortcut(request);
        case MessageType::ListShortcuts:
            return handle_list_shortcuts(request);
        case MessageType::RestartSteam:
        case MessageType::GetSteamStatus:
            return handle_steam(request);
        default:
            throw ProtocolError(ErrorCode::InvalidRequest, "unsupported request " + std::string(protocol::to_string(request.type)));
        }
    }

    protocol::Message Session::handle_init_upload(const protocol::Message &request)
    {
        const auto payload = protocol::parse_payload<protocol::InitUploadRequest>(request);
        const auto result = services_.uploads.init_upload(payload.config, payload.total_size, payload.file_count);
        if (payload.resume_from && *payload.resume_from != result.resume_from)
        {
            spdlog::info("Upload {}: hub expected resume at {}, agent holds {}", result.upload_id, *payload.resume_from,
                         result.resume_from);
        }
        return protocol::make_response(request, protocol::InitUploadResponse{
                                                    .upload_id = result.upload_id,
                                                    .resume_from = result.resume_from,
                                                });
    }

    protocol::Message Session::handle_upload_chunk(const protocol::Message &request)
    {
        const auto payload = protocol::parse_payload<protocol::UploadChunkRequest>(request);
        const auto data = encoding::decode_base64(payload.data_base64);
        if (!data)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "chunk data is not valid base64");
        }
        if (payload.hash && crypto::hash_bytes(*data) != *payload.hash)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "chunk digest mismatch");
        }

        const auto result = services_.uploads.upload_chunk(payload.upload_id, payload.file_path, *data, payload.offset);
        return protocol::make_response(request, protocol::UploadChunkResponse{
                                                    .upload_id = payload.upload_id,
                                                    .bytes_written = result.bytes_accepted,
                                                    .total_written = result.total_written,
                                                });
    }

    protocol::Message Session::handle_complete_upload(const protocol::Message &request)
    {
        const auto payload = protocol::parse_payload<protocol::CompleteUploadRequest>(request);
        const auto result = services_.uploads.complete_upload(payload.upload_id, payload.create_shortcut);
        services_.progress.forget(payload.upload_id);
        return protocol::make_response(request, protocol::CompleteUploadResponse{
                                                    .upload_id = payload.upload_id,
                                                    .success = true,
                                                    .app_id = result.app_id,
                                                });
    }

    protocol::Message Session::handle_cancel_upload(const protocol::Message &request)
    {
        const auto payload = protocol::parse_payload<protocol::CancelUploadRequest>(request);
        services_.uploads.cancel_upload(payload.upload_id);
        services_.progress.forget(payload.upload_id);
        return protocol::make_response(request, protocol::CompleteUploadResponse{
                                                    .upload_id = payload.upload_id,
                                                    .success = true,
                                                });
    }

    protocol::Message Session::handle_create_shortcut(const protocol::Message &request)
    {
        const auto payload = protocol::parse_payload<protocol::CreateShortcutRequest>(request);
        const auto app_id = services_.shortcuts.create_shortcut(payload.user_id, payload.shortcut);
        return protocol::make_response(request, protocol::ShortcutResponse{.success = true, .app_id = app_id});
    }

    protocol::Message Session::handle_delete_shortcut(const protocol::Message &request)
    {
        const auto payload = protocol::parse_payload<protocol::DeleteShortcutRequest>(request);
        services_.shortcuts.delete_shortcut(payload.user_id, payload.app_id, payload.name);
        return protocol::make_response(request, protocol::ShortcutResponse{.success = true});
    }

    protocol::Message Session::handle_list_shortcuts(const protocol::Message &request)
    {
        const auto payload = protocol::parse_payload<protocol::ListShortcutsRequest>(request);
        return protocol::make_response(request, protocol::ShortcutResponse{
                                                    .success = true,
                                                    .shortcuts = services_.shortcuts.list_shortcuts(payload.user_id),
                                                });
    }

    protocol::Message Session::handle_steam(const protocol::Message &request)
    {
        const auto path = services_.steam.get_steam_path();
        if (request.type == protocol::MessageType::RestartSteam)
        {
            services_.steam.restart_steam();
        }
        return protocol::make_response(request, protocol::SteamResponse{
                                                    .success = true,
                                                    .running = services_.steam.get_steam_status(),
                                                    .path = path.string(),
                                                });
    }

    void Session::emit_progress(const std::string &upload_id)
    {
        try
        {
            const auto progress = services_.uploads.get_upload_progress(upload_id);
            if (services_.progress.should_emit(upload_id, progress.bytes_written, progress.total_size))
            {
                send(protocol::make_event(protocol::MessageType::UploadProgress, progress));
            }
        }
        catch (const ProtocolError &error)
        {
            spdlog::debug("No progress for upload {}: {}", upload_id, error.what());
        }
    }

    void Session::send(const protocol::Message &message)
    {
        if (stopped_)
        {
            return;
        }
        outbox_.push_back(protocol::encode_frame(nlohmann::json(message)));
        if (outbox_.size() == 1)
        {
            write_next();
        }
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbox_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  outbox_.clear();
                                  stop();
                                  return;
                              }
                              outbox_.pop_front();
                              if (!outbox_.empty())
                              {
                                  write_next();
                              }
                          });
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace capydeploy::agent
