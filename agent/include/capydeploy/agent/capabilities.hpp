#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "capydeploy/protocol.hpp"

// Operations a conforming Agent exposes. The Hub only ever reaches these
// through the message envelope; every failure is reported as a
// capydeploy::ProtocolError.
namespace capydeploy::agent
{

    class BaseAgent
    {
    public:
        virtual ~BaseAgent() = default;

        virtual protocol::AgentInfo get_info() const = 0;
        virtual void ping() = 0;
    };

    struct InitUploadResult
    {
        std::string upload_id;
        std::uint64_t resume_from{};
    };

    struct ChunkResult
    {
        std::uint64_t bytes_accepted{};
        std::uint64_t total_written{};
    };

    struct CompleteUploadResult
    {
        std::optional<std::uint32_t> app_id;
    };

    class FileReceiver
    {
    public:
        virtual ~FileReceiver() = default;

        // Reuses a matching interrupted session when one exists; resume_from
        // is then its durable byte count, otherwise 0.
        virtual InitUploadResult init_upload(const protocol::UploadConfig &config, std::uint64_t total_size,
                                             std::uint64_t file_count) = 0;

        virtual ChunkResult upload_chunk(const std::string &upload_id, const std::string &file_path,
                                         std::span<const std::byte> data, std::uint64_t offset) = 0;

        virtual CompleteUploadResult complete_upload(const std::string &upload_id, bool create_shortcut) = 0;

        // No-op on sessions that already reached a terminal state.
        virtual void cancel_upload(const std::string &upload_id) = 0;

        virtual protocol::UploadProgress get_upload_progress(const std::string &upload_id) const = 0;
    };

    class ShortcutManager
    {
    public:
        virtual ~ShortcutManager() = default;

        // Upserts by name and returns the derived AppId.
        virtual std::uint32_t create_shortcut(std::uint32_t user_id, const protocol::ShortcutConfig &config) = 0;

        virtual void delete_shortcut(std::uint32_t user_id, std::optional<std::uint32_t> app_id,
                                     const std::optional<std::string> &name) = 0;

        virtual std::vector<protocol::ShortcutInfo> list_shortcuts(std::uint32_t user_id) const = 0;

        virtual std::uint32_t update_shortcut(std::uint32_t user_id, std::uint32_t app_id,
                                              const protocol::ShortcutConfig &config) = 0;
    };

    class SteamController
    {
    public:
        virtual ~SteamController() = default;

        // Fires a soft restart and returns without waiting for Steam.
        virtual void restart_steam() = 0;

        virtual bool get_steam_status() const = 0;

        virtual std::filesystem::path get_steam_path() const = 0;

        virtual std::vector<std::uint32_t> list_users() const = 0;
    };

    class ArtworkManager
    {
    public:
        virtual ~ArtworkManager() = default;

        virtual void set_artwork(std::uint32_t user_id, std::uint32_t app_id, const protocol::ArtworkConfig &artwork) = 0;

        virtual protocol::ArtworkConfig get_artwork(std::uint32_t user_id, std::uint32_t app_id) const = 0;

        virtual void delete_artwork(std::uint32_t user_id, std::uint32_t app_id) = 0;
    };

} // namespace capydeploy::agent
