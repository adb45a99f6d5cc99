#include "capydeploy/agent/shortcut_manager.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

#include "capydeploy/app_id.hpp"

namespace capydeploy::agent
{

    namespace
    {

        void validate(const protocol::ShortcutConfig &config)
        {
            if (config.name.empty())
            {
                throw ProtocolError(ErrorCode::InvalidRequest, "shortcut name is required");
            }
            if (config.exe.empty())
            {
                throw ProtocolError(ErrorCode::InvalidRequest, "shortcut executable is required");
            }
        }

        protocol::ShortcutInfo make_info(const protocol::ShortcutConfig &config)
        {
            return {
                .app_id = app_id_for(config),
                .name = config.name,
                .exe = quote_path(config.exe),
                .start_dir = config.start_dir.empty() ? std::string{} : quote_path(config.start_dir),
                .launch_options = config.launch_options,
                .tags = config.tags,
            };
        }

        bool same_entry(const protocol::ShortcutInfo &lhs, const protocol::ShortcutInfo &rhs)
        {
            return lhs.app_id == rhs.app_id && lhs.name == rhs.name && lhs.exe == rhs.exe &&
                   lhs.start_dir == rhs.start_dir && lhs.launch_options == rhs.launch_options && lhs.tags == rhs.tags;
        }

    } // namespace

    SteamShortcutManager::SteamShortcutManager(ShortcutStore &store, ArtworkManager *artwork)
        : store_(store), artwork_(artwork)
    {
    }

    std::uint32_t SteamShortcutManager::create_shortcut(std::uint32_t user_id, const protocol::ShortcutConfig &config)
    {
        validate(config);
        return upsert(user_id, std::nullopt, config);
    }

    std::uint32_t SteamShortcutManager::update_shortcut(std::uint32_t user_id, std::uint32_t app_id,
                                                        const protocol::ShortcutConfig &config)
    {
        validate(config);
        return upsert(user_id, app_id, config);
    }

    std::uint32_t SteamShortcutManager::upsert(std::uint32_t user_id, std::optional<std::uint32_t> replaced,
                                               const protocol::ShortcutConfig &config)
    {
        const auto entry = make_info(config);
        std::set<std::uint32_t> stale_artwork;
        {
            std::lock_guard lock(mutex_);
            auto shortcuts = store_.load(user_id);
            if (replaced && std::none_of(shortcuts.begin(), shortcuts.end(), [&](const auto &item)
                                         { return item.app_id == *replaced; }))
            {
                throw ProtocolError(ErrorCode::ShortcutNotFound,
                                    "shortcut " + std::to_string(*replaced) + " not found");
            }

            // The first matching slot keeps its position; later duplicates go.
            std::vector<protocol::ShortcutInfo> updated;
            updated.reserve(shortcuts.size() + 1);
            bool placed = false;
            for (auto &item : shortcuts)
            {
                const bool matches = item.name == entry.name || (replaced && item.app_id == *replaced);
                if (!matches)
                {
                    updated.push_back(std::move(item));
                    continue;
                }
                if (item.app_id != entry.app_id)
                {
                    stale_artwork.insert(item.app_id);
                }
                if (!placed)
                {
                    updated.push_back(entry);
                    placed = true;
                }
            }
            if (!placed)
            {
                updated.push_back(entry);
            }

            save_verified(user_id, updated);
        }

        for (const auto old_id : stale_artwork)
        {
            drop_artwork(user_id, old_id);
        }
        if (config.artwork && artwork_ != nullptr)
        {
            artwork_->set_artwork(user_id, entry.app_id, *config.artwork);
        }

        spdlog::info("Shortcut '{}' ({}) saved for user {}", entry.name, entry.app_id, user_id);
        return entry.app_id;
    }

    void SteamShortcutManager::delete_shortcut(std::uint32_t user_id, std::optional<std::uint32_t> app_id,
                                               const std::optional<std::string> &name)
    {
        if (!app_id && (!name || name->empty()))
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "delete needs an app id or a name");
        }

        std::vector<std::uint32_t> removed;
        {
            std::lock_guard lock(mutex_);
            auto shortcuts = store_.load(user_id);
            std::vector<protocol::ShortcutInfo> kept;
            kept.reserve(shortcuts.size());
            for (auto &item : shortcuts)
            {
                const bool matches = app_id ? item.app_id == *app_id : item.name == *name;
                if (matches)
                {
                    removed.push_back(item.app_id);
                }
                else
                {
                    kept.push_back(std::move(item));
                }
            }
            if (removed.empty())
            {
                throw ProtocolError::from_code(ErrorCode::ShortcutNotFound);
            }
            save_verified(user_id, kept);
        }

        for (const auto id : removed)
        {
            drop_artwork(user_id, id);
        }
        spdlog::info("Removed {} shortcut(s) for user {}", removed.size(), user_id);
    }

    std::vector<protocol::ShortcutInfo> SteamShortcutManager::list_shortcuts(std::uint32_t user_id) const
    {
        std::lock_guard lock(mutex_);
        return store_.load(user_id);
    }

    void SteamShortcutManager::save_verified(std::uint32_t user_id, const std::vector<protocol::ShortcutInfo> &shortcuts)
    {
        store_.save(user_id, shortcuts);
        const auto reloaded = store_.load(user_id);
        if (!std::equal(shortcuts.begin(), shortcuts.end(), reloaded.begin(), reloaded.end(), same_entry))
        {
            throw ProtocolError(ErrorCode::Unknown, "shortcut verification failed");
        }
    }

    void SteamShortcutManager::drop_artwork(std::uint32_t user_id, std::uint32_t app_id)
    {
        if (artwork_ == nullptr)
        {
            return;
        }
        try
        {
            artwork_->delete_artwork(user_id, app_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Failed to remove artwork for shortcut {}: {}", app_id, ex.what());
        }
    }

} // namespace capydeploy::agent
