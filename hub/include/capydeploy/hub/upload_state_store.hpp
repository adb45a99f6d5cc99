#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace capydeploy::hub
{

    // Hub-side ledger of uploads that have not finished, so an interrupted
    // upload can be offered for resumption.
    class UploadStateStore
    {
    public:
        struct Entry
        {
            std::string agent_id;
            std::filesystem::path local_path;
            std::string destination;
            std::string upload_id;
            std::uint64_t total_size{};
            std::uint64_t bytes_transferred{};
        };

        explicit UploadStateStore(std::optional<std::filesystem::path> state_path = std::nullopt);

        std::vector<Entry> pending_for_agent(const std::string &agent_id) const;

        std::optional<Entry> find(const std::string &agent_id, const std::filesystem::path &local_path,
                                  const std::string &destination) const;

        void upsert(Entry entry);

        void update_progress(const std::string &agent_id, const std::string &upload_id, std::uint64_t bytes_transferred);

        void remove(const std::string &agent_id, const std::string &upload_id);

        const std::filesystem::path &state_path() const noexcept { return state_path_; }

        static std::filesystem::path default_state_path();

    private:
        void load();
        void save() const;
        std::vector<Entry>::iterator find_upload(const std::string &agent_id, const std::string &upload_id);
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace capydeploy::hub
