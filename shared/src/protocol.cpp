#include "capydeploy/protocol.hpp"

#include <array>

#include "capydeploy/crypto.hpp"

namespace capydeploy::protocol
{

    namespace
    {

        struct MessageTypeMapping
        {
            MessageType type;
            std::string_view label;
            MessageKind kind;
        };

        constexpr std::array<MessageTypeMapping, 18> kMessageTypeMappings{{
            {MessageType::Ping, "ping", MessageKind::Request},
            {MessageType::GetInfo, "get_info", MessageKind::Request},
            {MessageType::InitUpload, "init_upload", MessageKind::Request},
            {MessageType::UploadChunk, "upload_chunk", MessageKind::Request},
            {MessageType::CompleteUpload, "complete_upload", MessageKind::Request},
            {MessageType::CancelUpload, "cancel_upload", MessageKind::Request},
            {MessageType::CreateShortcut, "create_shortcut", MessageKind::Request},
            {MessageType::DeleteShortcut, "delete_shortcut", MessageKind::Request},
            {MessageType::ListShortcuts, "list_shortcuts", MessageKind::Request},
            {MessageType::RestartSteam, "restart_steam", MessageKind::Request},
            {MessageType::GetSteamStatus, "get_steam_status", MessageKind::Request},
            {MessageType::Pong, "pong", MessageKind::Response},
            {MessageType::InfoResponse, "info_response", MessageKind::Response},
            {MessageType::UploadResponse, "upload_response", MessageKind::Response},
            {MessageType::ShortcutResponse, "shortcut_response", MessageKind::Response},
            {MessageType::SteamResponse, "steam_response", MessageKind::Response},
            {MessageType::Error, "error", MessageKind::Response},
            {MessageType::UploadProgress, "upload_progress", MessageKind::Event},
        }};

        struct UploadStateMapping
        {
            UploadState state;
            std::string_view label;
        };

        constexpr std::array<UploadStateMapping, 6> kUploadStateMappings{{
            {UploadState::Initializing, "initializing"},
            {UploadState::Active, "active"},
            {UploadState::Completing, "completing"},
            {UploadState::Completed, "completed"},
            {UploadState::Cancelled, "cancelled"},
            {UploadState::Failed, "failed"},
        }};

        constexpr std::size_t kCorrelationIdBytes = 12;

        template <typename T>
        void read_optional(const nlohmann::json &json, const char *key, std::optional<T> &target)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                target = it->get<T>();
            }
            else
            {
                target.reset();
            }
        }

    } // namespace

    std::string_view to_string(MessageType type) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    MessageKind kind_of(MessageType type) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.kind;
            }
        }
        return MessageKind::Response;
    }

    MessageType response_type_for(MessageType request)
    {
        switch (request)
        {
        case MessageType::Ping:
            return MessageType::Pong;
        case MessageType::GetInfo:
            return MessageType::InfoResponse;
        case MessageType::InitUpload:
        case MessageType::UploadChunk:
        case MessageType::CompleteUpload:
        case MessageType::CancelUpload:
            return MessageType::UploadResponse;
        case MessageType::CreateShortcut:
        case MessageType::DeleteShortcut:
        case MessageType::ListShortcuts:
            return MessageType::ShortcutResponse;
        case MessageType::RestartSteam:
        case MessageType::GetSteamStatus:
            return MessageType::SteamResponse;
        default:
            throw ProtocolError(ErrorCode::InvalidRequest,
                                std::string(to_string(request)) + " is not a request type");
        }
    }

    void to_json(nlohmann::json &json, const Message &message)
    {
        json = {
            {"id", message.id},
            {"type", to_string(message.type)},
        };
        if (!message.payload.is_null() && !(message.payload.is_object() && message.payload.empty()))
        {
            json["payload"] = message.payload;
        }
    }

    void from_json(const nlohmann::json &json, Message &message)
    {
        if (!json.is_object())
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "message envelope must be a JSON object");
        }
        const auto type_it = json.find("type");
        if (type_it == json.end() || !type_it->is_string())
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "message envelope is missing its type");
        }
        const auto label = type_it->get<std::string>();
        auto type = message_type_from_string(label);
        if (!type)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "unknown message type: " + label);
        }
        message.type = *type;
        message.id = json.value("id", std::string{});
        message.payload = json.value("payload", nlohmann::json::object());
    }

    std::string new_correlation_id()
    {
        return crypto::random_hex(kCorrelationIdBytes);
    }

    Message make_request(MessageType type, nlohmann::json payload)
    {
        if (kind_of(type) != MessageKind::Request)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, std::string(to_string(type)) + " is not a request type");
        }
        return Message{.id = new_correlation_id(), .type = type, .payload = std::move(payload)};
    }

    Message make_response(const Message &request, nlohmann::json payload)
    {
        return Message{.id = request.id, .type = response_type_for(request.type), .payload = std::move(payload)};
    }

    Message make_event(MessageType type, nlohmann::json payload)
    {
        return Message{.id = new_correlation_id(), .type = type, .payload = std::move(payload)};
    }

    Message make_error(const std::string &correlation_id, const ProtocolError &error)
    {
        return Message{.id = correlation_id, .type = MessageType::Error, .payload = to_error_response(error)};
    }

    void to_json(nlohmann::json &json, const AgentInfo &info)
    {
        json = {
            {"id", info.id},
            {"name", info.name},
            {"platform", info.platform},
            {"version", info.version},
            {"acceptConnections", info.accept_connections},
        };
    }

    void from_json(const nlohmann::json &json, AgentInfo &info)
    {
        info.id = json.at("id").get<std::string>();
        info.name = json.value("name", std::string{});
        info.platform = json.value("platform", std::string{});
        info.version = json.value("version", std::string{});
        info.accept_connections = json.value("acceptConnections", true);
    }

    void to_json(nlohmann::json &json, const InfoResponse &response)
    {
        json = {{"agent", response.agent}};
    }

    void from_json(const nlohmann::json &json, InfoResponse &response)
    {
        response.agent = json.at("agent").get<AgentInfo>();
    }

    void to_json(nlohmann::json &json, const UploadConfig &config)
    {
        json = {
            {"gameName", config.game_name},
            {"installPath", config.install_path},
            {"executable", config.executable},
            {"launchOptions", config.launch_options},
            {"tags", config.tags},
        };
    }

    void from_json(const nlohmann::json &json, UploadConfig &config)
    {
        config.game_name = json.at("gameName").get<std::string>();
        config.install_path = json.value("installPath", std::string{});
        config.executable = json.value("executable", std::string{});
        config.launch_options = json.value("launchOptions", std::string{});
        config.tags = json.value("tags", std::vector<std::string>{});
    }

    void to_json(nlohmann::json &json, const InitUploadRequest &request)
    {
        json = {
            {"config", request.config},
            {"totalSize", request.total_size},
            {"fileCount", request.file_count},
        };
        if (request.resume_from)
        {
            json["resumeFrom"] = *request.resume_from;
        }
    }

    void from_json(const nlohmann::json &json, InitUploadRequest &request)
    {
        request.config = json.at("config").get<UploadConfig>();
        request.total_size = json.at("totalSize").get<std::uint64_t>();
        request.file_count = json.value("fileCount", 0ULL);
        read_optional(json, "resumeFrom", request.resume_from);
    }

    void to_json(nlohmann::json &json, const InitUploadResponse &response)
    {
        json = {
            {"uploadId", response.upload_id},
            {"resumeFrom", response.resume_from},
        };
    }

    void from_json(const nlohmann::json &json, InitUploadResponse &response)
    {
        response.upload_id = json.at("uploadId").get<std::string>();
        response.resume_from = json.value("resumeFrom", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"uploadId", request.upload_id},
            {"offset", request.offset},
            {"data", request.data_base64},
            {"filePath", request.file_path},
            {"isLast", request.is_last},
        };
        if (request.hash)
        {
            json["hash"] = *request.hash;
        }
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.upload_id = json.at("uploadId").get<std::string>();
        request.offset = json.at("offset").get<std::uint64_t>();
        request.data_base64 = json.value("data", std::string{});
        request.file_path = json.at("filePath").get<std::string>();
        request.is_last = json.value("isLast", false);
        read_optional(json, "hash", request.hash);
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"uploadId", response.upload_id},
            {"bytesWritten", response.bytes_written},
            {"totalWritten", response.total_written},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkResponse &response)
    {
        response.upload_id = json.at("uploadId").get<std::string>();
        response.bytes_written = json.value("bytesWritten", 0ULL);
        response.total_written = json.value("totalWritten", 0ULL);
    }

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request)
    {
        json = {
            {"uploadId", request.upload_id},
            {"createShortcut", request.create_shortcut},
        };
    }

    void from_json(const nlohmann::json &json, CompleteUploadRequest &request)
    {
        request.upload_id = json.at("uploadId").get<std::string>();
        request.create_shortcut = json.value("createShortcut", false);
    }

    void to_json(nlohmann::json &json, const CompleteUploadResponse &response)
    {
        json = {
            {"uploadId", response.upload_id},
            {"success", response.success},
        };
        if (response.app_id)
        {
            json["appId"] = *response.app_id;
        }
    }

    void from_json(const nlohmann::json &json, CompleteUploadResponse &response)
    {
        response.upload_id = json.at("uploadId").get<std::string>();
        response.success = json.value("success", false);
        read_optional(json, "appId", response.app_id);
    }

    void to_json(nlohmann::json &json, const CancelUploadRequest &request)
    {
        json = {{"uploadId", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, CancelUploadRequest &request)
    {
        request.upload_id = json.at("uploadId").get<std::string>();
    }

    std::string_view to_string(UploadState state) noexcept
    {
        for (const auto &mapping : kUploadStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadState> upload_state_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kUploadStateMappings)
        {
            if (mapping.label == value)
            {
                return mapping.state;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const UploadProgress &progress)
    {
        json = {
            {"uploadId", progress.upload_id},
            {"bytesWritten", progress.bytes_written},
            {"totalSize", progress.total_size},
            {"state", to_string(progress.state)},
        };
    }

    void from_json(const nlohmann::json &json, UploadProgress &progress)
    {
        progress.upload_id = json.at("uploadId").get<std::string>();
        progress.bytes_written = json.value("bytesWritten", 0ULL);
        progress.total_size = json.value("totalSize", 0ULL);
        const auto state_label = json.value("state", std::string{"active"});
        auto state = upload_state_from_string(state_label);
        if (!state)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "unknown upload state: " + state_label);
        }
        progress.state = *state;
    }

    void to_json(nlohmann::json &json, const ArtworkConfig &artwork)
    {
        json = {
            {"gridPortrait", artwork.grid_portrait},
            {"gridLandscape", artwork.grid_landscape},
            {"heroImage", artwork.hero_image},
            {"logoImage", artwork.logo_image},
            {"iconImage", artwork.icon_image},
        };
    }

    void from_json(const nlohmann::json &json, ArtworkConfig &artwork)
    {
        artwork.grid_portrait = json.value("gridPortrait", std::string{});
        artwork.grid_landscape = json.value("gridLandscape", std::string{});
        artwork.hero_image = json.value("heroImage", std::string{});
        artwork.logo_image = json.value("logoImage", std::string{});
        artwork.icon_image = json.value("iconImage", std::string{});
    }

    void to_json(nlohmann::json &json, const ShortcutConfig &config)
    {
        json = {
            {"name", config.name},
            {"exe", config.exe},
            {"startDir", config.start_dir},
            {"launchOptions", config.launch_options},
            {"tags", config.tags},
        };
        if (config.artwork)
        {
            json["artwork"] = *config.artwork;
        }
    }

    void from_json(const nlohmann::json &json, ShortcutConfig &config)
    {
        config.name = json.at("name").get<std::string>();
        config.exe = json.at("exe").get<std::string>();
        config.start_dir = json.value("startDir", std::string{});
        config.launch_options = json.value("launchOptions", std::string{});
        config.tags = json.value("tags", std::vector<std::string>{});
        read_optional(json, "artwork", config.artwork);
    }

    void to_json(nlohmann::json &json, const ShortcutInfo &info)
    {
        json = {
            {"appId", info.app_id},
            {"name", info.name},
            {"exe", info.exe},
            {"startDir", info.start_dir},
            {"launchOptions", info.launch_options},
            {"tags", info.tags},
        };
    }

    void from_json(const nlohmann::json &json, ShortcutInfo &info)
    {
        info.app_id = json.value("appId", 0U);
        info.name = json.at("name").get<std::string>();
        info.exe = json.value("exe", std::string{});
        info.start_dir = json.value("startDir", std::string{});
        info.launch_options = json.value("launchOptions", std::string{});
        info.tags = json.value("tags", std::vector<std::string>{});
    }

    void to_json(nlohmann::json &json, const CreateShortcutRequest &request)
    {
        json = {
            {"userId", request.user_id},
            {"shortcut", request.shortcut},
        };
    }

    void from_json(const nlohmann::json &json, CreateShortcutRequest &request)
    {
        request.user_id = json.at("userId").get<std::uint32_t>();
        request.shortcut = json.at("shortcut").get<ShortcutConfig>();
    }

    void to_json(nlohmann::json &json, const DeleteShortcutRequest &request)
    {
        json = {{"userId", request.user_id}};
        if (request.app_id)
        {
            json["appId"] = *request.app_id;
        }
        if (request.name)
        {
            json["name"] = *request.name;
        }
    }

    void from_json(const nlohmann::json &json, DeleteShortcutRequest &request)
    {
        request.user_id = json.at("userId").get<std::uint32_t>();
        read_optional(json, "appId", request.app_id);
        read_optional(json, "name", request.name);
    }

    void to_json(nlohmann::json &json, const ListShortcutsRequest &request)
    {
        json = {{"userId", request.user_id}};
    }

    void from_json(const nlohmann::json &json, ListShortcutsRequest &request)
    {
        request.user_id = json.at("userId").get<std::uint32_t>();
    }

    void to_json(nlohmann::json &json, const ShortcutResponse &response)
    {
        json = {{"success", response.success}};
        if (!response.shortcuts.empty())
        {
            json["shortcuts"] = response.shortcuts;
        }
        if (response.app_id)
        {
            json["appId"] = *response.app_id;
        }
    }

    void from_json(const nlohmann::json &json, ShortcutResponse &response)
    {
        response.success = json.value("success", false);
        response.shortcuts = json.value("shortcuts", std::vector<ShortcutInfo>{});
        read_optional(json, "appId", response.app_id);
    }

    void to_json(nlohmann::json &json, const SteamResponse &response)
    {
        json = {
            {"success", response.success},
            {"running", response.running},
        };
        if (response.path)
        {
            json["path"] = *response.path;
        }
    }

    void from_json(const nlohmann::json &json, SteamResponse &response)
    {
        response.success = json.value("success", false);
        response.running = json.value("running", false);
        read_optional(json, "path", response.path);
    }

    void to_json(nlohmann::json &json, const ErrorResponse &response)
    {
        json = {
            {"code", response.code},
            {"message", response.message},
        };
        if (response.details && !response.details->empty())
        {
            json["details"] = *response.details;
        }
    }

    void from_json(const nlohmann::json &json, ErrorResponse &response)
    {
        response.code = json.value("code", std::string(to_string(ErrorCode::Unknown)));
        response.message = json.value("message", std::string{});
        read_optional(json, "details", response.details);
    }

    ErrorResponse to_error_response(const ProtocolError &error)
    {
        ErrorResponse response{
            .code = std::string(to_string(error.code())),
            .message = error.message(),
        };
        if (auto details = error.details(); !details.empty())
        {
            response.details = std::move(details);
        }
        return response;
    }

    ProtocolError from_error_response(const ErrorResponse &response)
    {
        const auto code = error_code_from_string(response.code).value_or(ErrorCode::Unknown);
        if (response.message.empty())
        {
            return ProtocolError::from_code(code);
        }
        return ProtocolError(code, response.message);
    }

} // namespace capydeploy::protocol
