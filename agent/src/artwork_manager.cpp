#include "capydeploy/agent/artwork_manager.hpp"

#include <array>
#include <string>

#include <spdlog/spdlog.h>

namespace capydeploy::agent
{

    namespace
    {

        struct ArtworkSlot
        {
            std::string protocol::ArtworkConfig::*field;
            std::string_view suffix;
        };

        constexpr std::array<ArtworkSlot, 5> kSlots{{
            {&protocol::ArtworkConfig::grid_portrait, "p.png"},
            {&protocol::ArtworkConfig::grid_landscape, ".png"},
            {&protocol::ArtworkConfig::hero_image, "_hero.png"},
            {&protocol::ArtworkConfig::logo_image, "_logo.png"},
            {&protocol::ArtworkConfig::icon_image, "_icon.png"},
        }};

        std::string file_name(std::uint32_t app_id, const ArtworkSlot &slot)
        {
            return std::to_string(app_id) + std::string(slot.suffix);
        }

    } // namespace

    FileArtworkManager::FileArtworkManager(const SteamController &steam) : steam_(steam) {}

    std::filesystem::path FileArtworkManager::grid_directory(std::uint32_t user_id) const
    {
        return steam_.get_steam_path() / "userdata" / std::to_string(user_id) / "config" / "grid";
    }

    void FileArtworkManager::set_artwork(std::uint32_t user_id, std::uint32_t app_id,
                                         const protocol::ArtworkConfig &artwork)
    {
        const auto grid = grid_directory(user_id);
        for (const auto &slot : kSlots)
        {
            const auto &source = artwork.*slot.field;
            if (!source.empty() && !std::filesystem::is_regular_file(source))
            {
                throw ProtocolError(ErrorCode::InvalidRequest, "artwork file not found: " + source);
            }
        }

        std::filesystem::create_directories(grid);
        for (const auto &slot : kSlots)
        {
            const auto &source = artwork.*slot.field;
            if (source.empty())
            {
                continue;
            }
            const auto target = grid / file_name(app_id, slot);
            std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing);
            spdlog::debug("Artwork {} -> {}", source, target.string());
        }
    }

    protocol::ArtworkConfig FileArtworkManager::get_artwork(std::uint32_t user_id, std::uint32_t app_id) const
    {
        const auto grid = grid_directory(user_id);
        protocol::ArtworkConfig artwork;
        for (const auto &slot : kSlots)
        {
            const auto path = grid / file_name(app_id, slot);
            std::error_code ec;
            if (std::filesystem::is_regular_file(path, ec))
            {
                artwork.*slot.field = path.string();
            }
        }
        return artwork;
    }

    void FileArtworkManager::delete_artwork(std::uint32_t user_id, std::uint32_t app_id)
    {
        const auto grid = grid_directory(user_id);
        for (const auto &slot : kSlots)
        {
            std::filesystem::remove(grid / file_name(app_id, slot));
        }
    }

} // namespace capydeploy::agent
