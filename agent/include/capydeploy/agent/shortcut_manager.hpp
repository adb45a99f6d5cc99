#pragma once

#include <mutex>

#include "capydeploy/agent/capabilities.hpp"
#include "capydeploy/agent/shortcut_store.hpp"

namespace capydeploy::agent
{

    // Shortcut manager over a ShortcutStore.
    //
    // Create and update both upsert by name: an existing entry with the same
    // name is replaced in place, so repeating a create with identical input
    // yields the same AppId and a single entry. Every write is followed by a
    // reload that must show the expected collection, otherwise the call fails
    // with UNKNOWN "shortcut verification failed".
    class SteamShortcutManager : public ShortcutManager
    {
    public:
        explicit SteamShortcutManager(ShortcutStore &store, ArtworkManager *artwork = nullptr);

        std::uint32_t create_shortcut(std::uint32_t user_id, const protocol::ShortcutConfig &config) override;

        void delete_shortcut(std::uint32_t user_id, std::optional<std::uint32_t> app_id,
                             const std::optional<std::string> &name) override;

        std::vector<protocol::ShortcutInfo> list_shortcuts(std::uint32_t user_id) const override;

        std::uint32_t update_shortcut(std::uint32_t user_id, std::uint32_t app_id,
                                      const protocol::ShortcutConfig &config) override;

    private:
        std::uint32_t upsert(std::uint32_t user_id, std::optional<std::uint32_t> replaced,
                             const protocol::ShortcutConfig &config);
        void save_verified(std::uint32_t user_id, const std::vector<protocol::ShortcutInfo> &shortcuts);
        void drop_artwork(std::uint32_t user_id, std::uint32_t app_id);

        ShortcutStore &store_;
        ArtworkManager *artwork_;
        mutable std::mutex mutex_;
    };

} // namespace capydeploy::agent
