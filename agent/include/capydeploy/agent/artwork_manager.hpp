#pragma once

#include <filesystem>

#include "capydeploy/agent/capabilities.hpp"

namespace capydeploy::agent
{

    // Stores shortcut artwork in the Steam grid directory of each user,
    // named after the shortcut AppId.
    class FileArtworkManager : public ArtworkManager
    {
    public:
        explicit FileArtworkManager(const SteamController &steam);

        void set_artwork(std::uint32_t user_id, std::uint32_t app_id, const protocol::ArtworkConfig &artwork) override;

        protocol::ArtworkConfig get_artwork(std::uint32_t user_id, std::uint32_t app_id) const override;

        void delete_artwork(std::uint32_t user_id, std::uint32_t app_id) override;

        std::filesystem::path grid_directory(std::uint32_t user_id) const;

    private:
        const SteamController &steam_;
    };

} // namespace capydeploy::agent
