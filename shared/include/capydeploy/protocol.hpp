/**
 * CapyDeploy - Message envelope, type catalogue and payload schema.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "capydeploy/error_codes.hpp"
#include "capydeploy/protocol_error.hpp"

namespace capydeploy::protocol
{

    constexpr std::uint16_t kDefaultAgentPort = 9999;

    enum class MessageType : std::uint8_t
    {
        // Hub -> Agent requests
        Ping,
        GetInfo,
        InitUpload,
        UploadChunk,
        CompleteUpload,
        CancelUpload,
        CreateShortcut,
        DeleteShortcut,
        ListShortcuts,
        RestartSteam,
        GetSteamStatus,

        // Agent -> Hub responses
        Pong,
        InfoResponse,
        UploadResponse,
        ShortcutResponse,
        SteamResponse,
        Error,

        // Agent -> Hub events
        UploadProgress
    };

    enum class MessageKind : std::uint8_t
    {
        Request,
        Response,
        Event
    };

    std::string_view to_string(MessageType type) noexcept;
    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept;

    MessageKind kind_of(MessageType type) noexcept;

    // Response type mirrored by a request type. Throws INVALID_REQUEST for
    // anything that is not a request.
    MessageType response_type_for(MessageType request);

    struct Message
    {
        std::string id;
        MessageType type{MessageType::Ping};
        nlohmann::json payload{};
    };

    void to_json(nlohmann::json &json, const Message &message);
    void from_json(const nlohmann::json &json, Message &message);

    // Opaque id, unique per in-flight exchange.
    std::string new_correlation_id();

    Message make_request(MessageType type, nlohmann::json payload = nlohmann::json::object());
    Message make_response(const Message &request, nlohmann::json payload = nlohmann::json::object());
    Message make_event(MessageType type, nlohmann::json payload);
    Message make_error(const std::string &correlation_id, const ProtocolError &error);

    // Type-directed payload decoding. Malformed payloads surface as
    // INVALID_REQUEST rather than a json exception.
    template <typename T>
    T parse_payload(const Message &message)
    {
        try
        {
            if (message.payload.is_null())
            {
                return nlohmann::json::object().get<T>();
            }
            return message.payload.get<T>();
        }
        catch (const nlohmann::json::exception &)
        {
            throw ProtocolError(ErrorCode::InvalidRequest,
                                "malformed " + std::string(to_string(message.type)) + " payload",
                                std::current_exception());
        }
    }

    struct AgentInfo
    {
        std::string id;
        std::string name;
        std::string platform;
        std::string version;
        bool accept_connections{true};
    };

    void to_json(nlohmann::json &json, const AgentInfo &info);
    void from_json(const nlohmann::json &json, AgentInfo &info);

    struct InfoResponse
    {
        AgentInfo agent;
    };

    void to_json(nlohmann::json &json, const InfoResponse &response);
    void from_json(const nlohmann::json &json, InfoResponse &response);

    struct UploadConfig
    {
        std::string game_name;
        std::string install_path;
        std::string executable;
        std::string launch_options;
        std::vector<std::string> tags;
    };

    void to_json(nlohmann::json &json, const UploadConfig &config);
    void from_json(const nlohmann::json &json, UploadConfig &config);

    struct InitUploadRequest
    {
        UploadConfig config;
        std::uint64_t total_size{};
        std::uint64_t file_count{};
        std::optional<std::uint64_t> resume_from{};
    };

    void to_json(nlohmann::json &json, const InitUploadRequest &request);
    void from_json(const nlohmann::json &json, InitUploadRequest &request);

    struct InitUploadResponse
    {
        std::string upload_id;
        std::uint64_t resume_from{};
    };

    void to_json(nlohmann::json &json, const InitUploadResponse &response);
    void from_json(const nlohmann::json &json, InitUploadResponse &response);

    struct UploadChunkRequest
    {
        std::string upload_id;
        std::uint64_t offset{};
        std::string data_base64;
        std::string file_path;
        bool is_last{};
        std::optional<std::string> hash{};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadChunkResponse
    {
        std::string upload_id;
        std::uint64_t bytes_written{};
        std::uint64_t total_written{};
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);
    void from_json(const nlohmann::json &json, UploadChunkResponse &response);

    struct CompleteUploadRequest
    {
        std::string upload_id;
        bool create_shortcut{};
    };

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request);
    void from_json(const nlohmann::json &json, CompleteUploadRequest &request);

    struct CompleteUploadResponse
    {
        std::string upload_id;
        bool success{};
        std::optional<std::uint32_t> app_id{};
    };

    void to_json(nlohmann::json &json, const CompleteUploadResponse &response);
    void from_json(const nlohmann::json &json, CompleteUploadResponse &response);

    struct CancelUploadRequest
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const CancelUploadRequest &request);
    void from_json(const nlohmann::json &json, CancelUploadRequest &request);

    enum class UploadState : std::uint8_t
    {
        Initializing,
        Active,
        Completing,
        Completed,
        Cancelled,
        Failed
    };

    std::string_view to_string(UploadState state) noexcept;
    std::optional<UploadState> upload_state_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(UploadState state) noexcept
    {
        return state == UploadState::Completed || state == UploadState::Cancelled || state == UploadState::Failed;
    }

    struct UploadProgress
    {
        std::string upload_id;
        std::uint64_t bytes_written{};
        std::uint64_t total_size{};
        UploadState state{UploadState::Initializing};
    };

    void to_json(nlohmann::json &json, const UploadProgress &progress);
    void from_json(const nlohmann::json &json, UploadProgress &progress);

    struct ArtworkConfig
    {
        std::string grid_portrait;
        std::string grid_landscape;
        std::string hero_image;
        std::string logo_image;
        std::string icon_image;
    };

    void to_json(nlohmann::json &json, const ArtworkConfig &artwork);
    void from_json(const nlohmann::json &json, ArtworkConfig &artwork);

    struct ShortcutConfig
    {
        std::string name;
        std::string exe;
        std::string start_dir;
        std::string launch_options;
        std::vector<std::string> tags;
        std::optional<ArtworkConfig> artwork{};
    };

    void to_json(nlohmann::json &json, const ShortcutConfig &config);
    void from_json(const nlohmann::json &json, ShortcutConfig &config);

    struct ShortcutInfo
    {
        std::uint32_t app_id{};
        std::string name;
        std::string exe;
        std::string start_dir;
        std::string launch_options;
        std::vector<std::string> tags;
    };

    void to_json(nlohmann::json &json, const ShortcutInfo &info);
    void from_json(const nlohmann::json &json, ShortcutInfo &info);

    struct CreateShortcutRequest
    {
        std::uint32_t user_id{};
        ShortcutConfig shortcut;
    };

    void to_json(nlohmann::json &json, const CreateShortcutRequest &request);
    void from_json(const nlohmann::json &json, CreateShortcutRequest &request);

    struct DeleteShortcutRequest
    {
        std::uint32_t user_id{};
        std::optional<std::uint32_t> app_id{};
        std::optional<std::string> name{};
    };

    void to_json(nlohmann::json &json, const DeleteShortcutRequest &request);
    void from_json(const nlohmann::json &json, DeleteShortcutRequest &request);

    struct ListShortcutsRequest
    {
        std::uint32_t user_id{};
    };

    void to_json(nlohmann::json &json, const ListShortcutsRequest &request);
    void from_json(const nlohmann::json &json, ListShortcutsRequest &request);

    struct ShortcutResponse
    {
        bool success{};
        std::vector<ShortcutInfo> shortcuts;
        std::optional<std::uint32_t> app_id{};
    };

    void to_json(nlohmann::json &json, const ShortcutResponse &response);
    void from_json(const nlohmann::json &json, ShortcutResponse &response);

    struct SteamResponse
    {
        bool success{};
        bool running{};
        std::optional<std::string> path{};
    };

    void to_json(nlohmann::json &json, const SteamResponse &response);
    void from_json(const nlohmann::json &json, SteamResponse &response);

    // Only {code, message, details} crosses the wire.
    struct ErrorResponse
    {
        std::string code;
        std::string message;
        std::optional<std::string> details{};
    };

    void to_json(nlohmann::json &json, const ErrorResponse &response);
    void from_json(const nlohmann::json &json, ErrorResponse &response);

    ErrorResponse to_error_response(const ProtocolError &error);

    // Rebuilds a local error from a remote `error` payload. Unrecognized codes
    // map to UNKNOWN; remote details are not re-wrapped as a cause.
    ProtocolError from_error_response(const ErrorResponse &response);

} // namespace capydeploy::protocol
