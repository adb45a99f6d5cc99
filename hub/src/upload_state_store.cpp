#include "capydeploy/hub/upload_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace capydeploy::hub
{

    UploadStateStore::UploadStateStore(std::optional<std::filesystem::path> state_path)
        : state_path_(state_path ? *state_path : default_state_path())
    {
        load();
    }

    std::vector<UploadStateStore::Entry> UploadStateStore::pending_for_agent(const std::string &agent_id) const
    {
        std::vector<Entry> result;
        std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result), [&](const Entry &entry)
                     { return entry.agent_id == agent_id; });
        return result;
    }

    std::optional<UploadStateStore::Entry> UploadStateStore::find(const std::string &agent_id,
                                                                  const std::filesystem::path &local_path,
                                                                  const std::string &destination) const
    {
        const auto normalized = normalize_path(local_path);
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                               { return entry.agent_id == agent_id && entry.local_path == normalized &&
                                        entry.destination == destination; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void UploadStateStore::upsert(Entry entry)
    {
        entry.local_path = normalize_path(entry.local_path);
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &existing)
                               { return existing.agent_id == entry.agent_id && existing.local_path == entry.local_path &&
                                        existing.destination == entry.destination; });
        if (it == entries_.end())
        {
            entries_.push_back(std::move(entry));
        }
        else
        {
            *it = std::move(entry);
        }
        save();
    }

    void UploadStateStore::update_progress(const std::string &agent_id, const std::string &upload_id,
                                           std::uint64_t bytes_transferred)
    {
        auto it = find_upload(agent_id, upload_id);
        if (it != entries_.end())
        {
            it->bytes_transferred = bytes_transferred;
            save();
        }
    }

    void UploadStateStore::remove(const std::string &agent_id, const std::string &upload_id)
    {
        auto it = find_upload(agent_id, upload_id);
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    std::filesystem::path UploadStateStore::default_state_path()
    {
        if (const char *state_home = std::getenv("XDG_STATE_HOME"); state_home != nullptr && *state_home != '\0')
        {
            return std::filesystem::path(state_home) / "capydeploy" / "transfers.json";
        }
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".local" / "state" / "capydeploy" / "transfers.json";
        }
        return std::filesystem::path(".capydeploy") / "transfers.json";
    }

    void UploadStateStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::warn("Ignoring corrupt upload ledger {}: {}", state_path_.string(), ex.what());
            return;
        }
        if (!json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            Entry entry;
            entry.agent_id = item.value("agentId", std::string{});
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.destination = item.value("destination", std::string{});
            entry.upload_id = item.value("uploadId", std::string{});
            entry.total_size = item.value("total", 0ULL);
            entry.bytes_transferred = item.value("bytes", 0ULL);
            if (!entry.agent_id.empty() && !entry.upload_id.empty())
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void UploadStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"agentId", entry.agent_id},
                            {"local", entry.local_path.generic_string()},
                            {"destination", entry.destination},
                            {"uploadId", entry.upload_id},
                            {"total", entry.total_size},
                            {"bytes", entry.bytes_transferred}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (!out.is_open())
        {
            spdlog::warn("Cannot write upload ledger {}", state_path_.string());
            return;
        }
        out << json.dump(2);
    }

    std::vector<UploadStateStore::Entry>::iterator UploadStateStore::find_upload(const std::string &agent_id,
                                                                                 const std::string &upload_id)
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.agent_id == agent_id && entry.upload_id == upload_id; });
    }

    std::filesystem::path UploadStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace capydeploy::hub
