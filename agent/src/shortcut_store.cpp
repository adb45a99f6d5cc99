#include "capydeploy/agent/shortcut_store.hpp"

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace capydeploy::agent
{

    JsonShortcutStore::JsonShortcutStore(const SteamController &steam) : steam_(steam) {}

    std::filesystem::path JsonShortcutStore::path_for(std::uint32_t user_id) const
    {
        return steam_.get_steam_path() / "userdata" / std::to_string(user_id) / "config" / "shortcuts.json";
    }

    std::vector<protocol::ShortcutInfo> JsonShortcutStore::load(std::uint32_t user_id) const
    {
        const auto path = path_for(user_id);
        if (!std::filesystem::exists(path))
        {
            return {};
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ProtocolError(ErrorCode::PermissionDenied, "cannot read " + path.string());
        }
        try
        {
            nlohmann::json json;
            in >> json;
            return json.at("shortcuts").get<std::vector<protocol::ShortcutInfo>>();
        }
        catch (const nlohmann::json::exception &)
        {
            throw ProtocolError(ErrorCode::Unknown, "corrupt shortcut store " + path.string(), std::current_exception());
        }
    }

    void JsonShortcutStore::save(std::uint32_t user_id, const std::vector<protocol::ShortcutInfo> &shortcuts)
    {
        const auto path = path_for(user_id);
        std::filesystem::create_directories(path.parent_path());

        auto temp = path;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            out << nlohmann::json{{"shortcuts", shortcuts}}.dump(2);
            out.flush();
            if (!out)
            {
                throw ProtocolError(ErrorCode::PermissionDenied, "cannot write " + temp.string());
            }
        }
        std::filesystem::rename(temp, path);
    }

} // namespace capydeploy::agent
