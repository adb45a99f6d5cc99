#include <array>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "capydeploy/app_id.hpp"
#include "capydeploy/crypto.hpp"
#include "capydeploy/discovery.hpp"
#include "capydeploy/encoding/base64.hpp"
#include "capydeploy/event_queue.hpp"
#include "capydeploy/framing.hpp"
#include "capydeploy/protocol.hpp"

using namespace capydeploy;
using namespace capydeploy::protocol;

void run_agent_component_tests();
void run_hub_component_tests();

namespace
{

    template <typename Fn>
    std::optional<ErrorCode> error_code_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const ProtocolError &error)
        {
            return error.code();
        }
        return std::nullopt;
    }

    void test_envelope_roundtrip()
    {
        const auto request = make_request(MessageType::InitUpload,
                                          InitUploadRequest{
                                              .config = {.game_name = "Celeste", .install_path = "Games", .executable = "celeste.sh"},
                                              .total_size = 1000,
                                              .file_count = 1,
                                          });
        assert(!request.id.empty());

        const auto json = nlohmann::json(request);
        assert(json["type"] == "init_upload");
        assert(json["payload"]["config"]["gameName"] == "Celeste");
        assert(json["payload"]["totalSize"] == 1000);

        const auto decoded = json.get<Message>();
        assert(decoded.id == request.id);
        assert(decoded.type == MessageType::InitUpload);
        const auto payload = parse_payload<InitUploadRequest>(decoded);
        assert(payload.config.executable == "celeste.sh");
        assert(payload.file_count == 1);
        assert(!payload.resume_from);
    }

    void test_correlation_rules()
    {
        const auto ping = make_request(MessageType::Ping);
        const auto pong = make_response(ping);
        assert(pong.id == ping.id);
        assert(pong.type == MessageType::Pong);
        assert(!nlohmann::json(pong).contains("payload"));

        const auto chunk = make_request(MessageType::UploadChunk);
        assert(make_response(chunk).type == MessageType::UploadResponse);
        assert(make_request(MessageType::Ping).id != ping.id);

        const auto event = make_event(MessageType::UploadProgress,
                                      UploadProgress{.upload_id = "u1", .bytes_written = 5, .total_size = 10,
                                                     .state = UploadState::Active});
        assert(event.id != ping.id);
        assert(kind_of(event.type) == MessageKind::Event);
        assert(nlohmann::json(event)["payload"]["state"] == "active");

        const auto error = make_error(ping.id, ProtocolError::from_code(ErrorCode::UploadNotFound));
        assert(error.id == ping.id);
        assert(error.type == MessageType::Error);

        assert(error_code_of([]
                             { (void)make_request(MessageType::Pong); }) == ErrorCode::InvalidRequest);
        assert(error_code_of([]
                             { (void)response_type_for(MessageType::UploadProgress); }) == ErrorCode::InvalidRequest);
    }

    void test_malformed_messages()
    {
        assert(error_code_of([]
                             { (void)nlohmann::json{{"id", "1"}, {"type", "teleport"}}.get<Message>(); }) ==
               ErrorCode::InvalidRequest);
        assert(error_code_of([]
                             { (void)nlohmann::json::array().get<Message>(); }) == ErrorCode::InvalidRequest);
        assert(error_code_of([]
                             { (void)nlohmann::json{{"id", "1"}}.get<Message>(); }) == ErrorCode::InvalidRequest);

        Message chunk{.id = "c1", .type = MessageType::UploadChunk, .payload = {{"uploadId", "u"}, {"offset", "zero"}}};
        assert(error_code_of([&]
                             { (void)parse_payload<UploadChunkRequest>(chunk); }) == ErrorCode::InvalidRequest);

        Message empty{.id = "p1", .type = MessageType::ListShortcuts, .payload = nullptr};
        assert(error_code_of([&]
                             { (void)parse_payload<ListShortcutsRequest>(empty); }) == ErrorCode::InvalidRequest);
        empty.payload = {{"userId", 42}};
        assert(parse_payload<ListShortcutsRequest>(empty).user_id == 42);
    }

    void test_error_taxonomy()
    {
        constexpr std::array codes{ErrorCode::Unknown, ErrorCode::InvalidRequest, ErrorCode::UploadNotFound,
                                   ErrorCode::UploadFailed, ErrorCode::ShortcutNotFound, ErrorCode::ShortcutExists,
                                   ErrorCode::SteamNotRunning, ErrorCode::SteamNotFound, ErrorCode::PermissionDenied,
                                   ErrorCode::DiskFull, ErrorCode::Timeout, ErrorCode::AgentBusy};
        for (const auto code : codes)
        {
            assert(error_code_from_string(to_string(code)) == code);
            assert(!canonical_message(code).empty());
        }
        assert(to_string(ErrorCode::UploadNotFound) == "UPLOAD_NOT_FOUND");
        assert(canonical_message(ErrorCode::DiskFull) == "insufficient disk space");
        assert(!error_code_from_string("NOT_A_CODE"));

        const ProtocolError wrapped(ErrorCode::UploadFailed, "write failed",
                                    std::make_exception_ptr(std::runtime_error("short write")));
        assert(wrapped.details() == "short write");
        const auto wire = nlohmann::json(to_error_response(wrapped));
        assert(wire.size() == 3);
        assert(wire["code"] == "UPLOAD_FAILED");
        assert(wire["message"] == "write failed");
        assert(wire["details"] == "short write");

        const auto plain = nlohmann::json(to_error_response(ProtocolError::from_code(ErrorCode::Timeout)));
        assert(!plain.contains("details"));
        assert(plain["message"] == "operation timed out");

        const auto remote = from_error_response({.code = "FROM_THE_FUTURE", .message = "?"});
        assert(remote.code() == ErrorCode::Unknown);
        assert(!remote.cause());
    }

    void test_error_classification()
    {
        const auto disk = to_protocol_error(std::make_exception_ptr(std::filesystem::filesystem_error(
            "write", std::make_error_code(std::errc::no_space_on_device))));
        assert(disk.code() == ErrorCode::DiskFull);
        assert(disk.cause());

        const auto denied = to_protocol_error(std::make_exception_ptr(std::filesystem::filesystem_error(
                                                  "open", std::make_error_code(std::errc::permission_denied))),
                                              ErrorCode::UploadFailed);
        assert(denied.code() == ErrorCode::PermissionDenied);

        const auto other = to_protocol_error(std::make_exception_ptr(std::runtime_error("boom")), ErrorCode::UploadFailed);
        assert(other.code() == ErrorCode::UploadFailed);
        assert(other.details() == "boom");

        const auto passthrough = to_protocol_error(std::make_exception_ptr(ProtocolError::from_code(ErrorCode::AgentBusy)));
        assert(passthrough.code() == ErrorCode::AgentBusy);

        assert(to_protocol_error(nullptr).code() == ErrorCode::Unknown);
    }

    void test_framing()
    {
        const nlohmann::json message = {{"id", "abc"}, {"type", "ping"}};
        const auto frame = encode_frame(message);
        const auto text = message.dump();
        assert(frame.size() == kFrameHeaderSize + text.size());
        assert(frame[0] == 0 && frame[1] == 0 && frame[2] == 0);
        assert(frame[3] == text.size());

        const std::span<const std::uint8_t> all(frame);
        assert(!try_decode_frame(all.first(3)));
        assert(!try_decode_frame(all.first(frame.size() - 1)));
        const auto decoded = try_decode_frame(all);
        assert(decoded);
        assert(decoded->bytes_consumed == frame.size());
        assert(decoded->message == message);

        const std::array<std::uint8_t, kFrameHeaderSize> oversized{0x10, 0x00, 0x00, 0x01};
        assert(error_code_of([&]
                             { (void)decode_frame_length(oversized); }) == ErrorCode::InvalidRequest);

        const std::vector<std::uint8_t> garbage{0, 0, 0, 2, '{', '{'};
        assert(error_code_of([&]
                             { (void)try_decode_frame(garbage); }) == ErrorCode::InvalidRequest);
    }

    void test_base64()
    {
        const std::string text = "hello";
        const auto encoded = encoding::encode_base64(std::as_bytes(std::span(text.data(), text.size())));
        assert(encoded == "aGVsbG8=");
        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded);
        assert(std::string(reinterpret_cast<const char *>(decoded->data()), decoded->size()) == text);
        assert(encoding::decode_base64("")->empty());
        assert(!encoding::decode_base64("aGV$bG8="));
    }

    void test_app_id()
    {
        assert(crc32(std::string_view("123456789")) == 0xCBF43926u);
        assert(quote_path("/games/celeste") == "\"/games/celeste\"");
        assert(quote_path("\"/games/celeste\"") == "\"/games/celeste\"");

        const ShortcutConfig shortcut{.name = "Celeste", .exe = "/games/Celeste/celeste.sh"};
        const auto first = app_id_for(shortcut);
        const auto second = compute_app_id("\"/games/Celeste/celeste.sh\"", "Celeste");
        assert(first == second);
        assert((first & 0x80000000u) != 0);
        assert(first == (crc32(std::string_view("\"/games/Celeste/celeste.sh\"Celeste")) | 0x80000000u));
        assert(app_id_for({.name = "Celeste 2", .exe = shortcut.exe}) != first);

        const auto grid = compute_grid_id(first);
        assert((grid >> 32) == first);
        assert((grid & 0xFFFFFFFFu) == 0x02000000u);
    }

    void test_discovery_codec()
    {
        assert(discovery::is_query(discovery::encode_query()));
        assert(!discovery::is_query("CAPYDEPLOY_QUERY _other._tcp\n"));

        const discovery::Announcement announcement{
            .instance_name = "deck",
            .host = "steamdeck.local",
            .port = 9999,
            .addresses = {"192.168.1.40"},
            .info_fields = {"id=abc123", "name=Living Room Deck", "platform=steamdeck", "version=0.1.0"},
        };
        const auto decoded = discovery::decode_announcement(discovery::encode_announcement(announcement));
        assert(decoded);
        assert(decoded->instance_name == "deck");
        assert(decoded->port == 9999);
        assert(decoded->addresses == announcement.addresses);
        assert(discovery::find_info_field(*decoded, "name") == "Living Room Deck");
        assert(!discovery::find_info_field(*decoded, "nam"));

        assert(!discovery::decode_announcement("CAPYDEPLOY_ANNOUNCE _capydeploy._tcp\ninstance=x\n"));
        assert(!discovery::decode_announcement("CAPYDEPLOY_ANNOUNCE _capydeploy._tcp\ninstance=x\nport=abc\n"));
        assert(!discovery::decode_announcement(discovery::encode_query()));
    }

    void test_event_queue()
    {
        BoundedEventQueue<int> queue(2);
        assert(queue.try_push(1));
        assert(queue.try_push(2));
        assert(!queue.try_push(3));
        assert(queue.dropped() == 1);
        assert(queue.size() == 2);
        assert(queue.try_pop() == 1);
        assert(queue.try_push(4));
        assert(queue.try_pop() == 2);
        assert(queue.try_pop() == 4);
        assert(!queue.pop_for(std::chrono::milliseconds{1}));

        queue.close();
        assert(!queue.try_push(5));
        assert(queue.closed());
    }

    void test_crypto()
    {
        const std::vector<std::byte> data{std::byte{0xDE}, std::byte{0xAD}, std::byte{0xBE}, std::byte{0xEF}};
        const auto digest = crypto::hash_bytes(data);
        assert(digest.size() == 64);
        assert(digest == crypto::hash_bytes(data));
        assert(digest != crypto::hash_bytes(std::span(data).first(3)));

        const auto id = crypto::random_hex(8);
        assert(id.size() == 16);
        assert(id != crypto::random_hex(8));
    }

} // namespace

int main()
{
    try
    {
        test_envelope_roundtrip();
        test_correlation_rules();
        test_malformed_messages();
        test_error_taxonomy();
        test_error_classification();
        test_framing();
        test_base64();
        test_app_id();
        test_discovery_codec();
        test_event_queue();
        test_crypto();
        run_agent_component_tests();
        run_hub_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
