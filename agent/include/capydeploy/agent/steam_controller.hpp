#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "capydeploy/agent/capabilities.hpp"

namespace capydeploy::agent
{

    // Launches a command without waiting for it to finish.
    using CommandRunner = std::function<void(const std::vector<std::string> &argv)>;

    void run_detached(const std::vector<std::string> &argv);

    struct SteamLocation
    {
        std::filesystem::path home;
        std::optional<std::filesystem::path> steam_root;
    };

    // Steam controller for a locally installed client.
    class LocalSteamController : public SteamController
    {
    public:
        explicit LocalSteamController(SteamLocation location, CommandRunner runner = run_detached);

        void restart_steam() override;

        bool get_steam_status() const override;

        // Throws STEAM_NOT_FOUND when no candidate directory exists.
        std::filesystem::path get_steam_path() const override;

        std::vector<std::uint32_t> list_users() const override;

        std::vector<std::filesystem::path> candidate_paths() const;

    private:
        SteamLocation location_;
        CommandRunner runner_;
    };

} // namespace capydeploy::agent
