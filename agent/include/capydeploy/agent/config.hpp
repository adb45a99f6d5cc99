#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "capydeploy/protocol.hpp"

namespace capydeploy::agent
{

    struct AgentConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{protocol::kDefaultAgentPort};
        std::filesystem::path root;
        std::optional<std::filesystem::path> steam_root;
        std::optional<std::uint32_t> steam_user;
        std::size_t worker_threads{0};
        std::chrono::seconds upload_timeout{std::chrono::seconds{3600}};
        std::optional<std::filesystem::path> log_file;
        std::string agent_id;
        std::string agent_name;
        bool announce{true};
    };

} // namespace capydeploy::agent
