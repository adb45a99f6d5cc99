#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "capydeploy/hub/agent_client.hpp"
#include "capydeploy/hub/upload_state_store.hpp"

namespace capydeploy::hub
{

    struct LocalFile
    {
        std::string relative_path;
        std::filesystem::path absolute_path;
        std::uint64_t size{};
    };

    struct UploadPlan
    {
        std::vector<LocalFile> files;
        std::uint64_t total_size{};
    };

    // Regular files under `source_dir`, sorted by relative path.
    UploadPlan plan_upload(const std::filesystem::path &source_dir);

    struct UploadOptions
    {
        static constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

        std::size_t chunk_size{kDefaultChunkSize};
        bool create_shortcut{false};
        std::function<bool()> cancelled;
        std::function<void(std::uint64_t sent, std::uint64_t total)> on_progress;
    };

    struct UploadOutcome
    {
        std::string upload_id;
        std::uint64_t resumed_from{};
        std::uint64_t total_size{};
        std::optional<std::uint32_t> app_id;
        bool cancelled{false};
    };

    // Drives one game directory through init / chunk / complete against an
    // Agent, skipping the prefix the Agent already holds.
    class Uploader
    {
    public:
        Uploader(AgentClient &client, std::string agent_id, UploadStateStore *ledger = nullptr);

        UploadOutcome upload(const std::filesystem::path &source_dir, const protocol::UploadConfig &config,
                             const UploadOptions &options = {});

    private:
        // Returns false when cancelled midway.
        bool send_files(const UploadPlan &plan, const std::string &upload_id, std::uint64_t skip,
                        const UploadOptions &options);

        AgentClient &client_;
        std::string agent_id_;
        UploadStateStore *ledger_;
    };

} // namespace capydeploy::hub
