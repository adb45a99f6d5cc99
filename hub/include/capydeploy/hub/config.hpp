#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "capydeploy/protocol.hpp"

namespace capydeploy::hub
{

    struct Endpoint
    {
        std::string host;
        std::uint16_t port{protocol::kDefaultAgentPort};
    };

    // Largest chunk whose base64 form still fits one frame with room to spare.
    constexpr std::size_t kMaxChunkSize = 16 * 1024 * 1024;

    // "host" or "host:port".
    Endpoint parse_endpoint(const std::string &text);

    struct HubConfig
    {
        std::string command;
        std::vector<std::string> args;

        std::chrono::milliseconds timeout{std::chrono::seconds{3}};
        std::chrono::milliseconds interval{std::chrono::seconds{10}};
        std::chrono::milliseconds stale_timeout{std::chrono::seconds{30}};
        std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
        std::size_t chunk_size{1024 * 1024};
        std::optional<std::filesystem::path> log_path;

        std::uint16_t port{protocol::kDefaultAgentPort};
        std::optional<std::string> subnet;

        protocol::UploadConfig upload;
        bool create_shortcut{false};

        std::optional<std::uint32_t> app_id;
        std::optional<std::string> shortcut_name;
    };

    std::string usage();

    // Throws std::runtime_error with a user-facing message on bad input.
    HubConfig parse_arguments(int argc, char *argv[]);

} // namespace capydeploy::hub
