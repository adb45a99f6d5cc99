#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "capydeploy/agent/capabilities.hpp"

namespace capydeploy::agent
{

    // Persistence seam for a user's shortcut collection. `save` replaces the
    // whole collection at once.
    class ShortcutStore
    {
    public:
        virtual ~ShortcutStore() = default;

        virtual std::vector<protocol::ShortcutInfo> load(std::uint32_t user_id) const = 0;

        virtual void save(std::uint32_t user_id, const std::vector<protocol::ShortcutInfo> &shortcuts) = 0;
    };

    // JSON rendition of the collection under userdata/<id>/config/.
    class JsonShortcutStore : public ShortcutStore
    {
    public:
        explicit JsonShortcutStore(const SteamController &steam);

        std::vector<protocol::ShortcutInfo> load(std::uint32_t user_id) const override;

        void save(std::uint32_t user_id, const std::vector<protocol::ShortcutInfo> &shortcuts) override;

        std::filesystem::path path_for(std::uint32_t user_id) const;

    private:
        const SteamController &steam_;
    };

} // namespace capydeploy::agent
