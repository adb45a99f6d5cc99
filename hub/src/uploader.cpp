#include "capydeploy/hub/uploader.hpp"

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

#include "capydeploy/crypto.hpp"
#include "capydeploy/encoding/base64.hpp"

namespace capydeploy::hub
{

    namespace
    {
        std::string destination_key(const protocol::UploadConfig &config)
        {
            return (std::filesystem::path(config.install_path) / config.game_name).generic_string();
        }
    } // namespace

    UploadPlan plan_upload(const std::filesystem::path &source_dir)
    {
        if (!std::filesystem::is_directory(source_dir))
        {
            throw ProtocolError(ErrorCode::InvalidRequest, source_dir.string() + " is not a directory");
        }
        UploadPlan plan;
        for (const auto &entry : std::filesystem::recursive_directory_iterator(source_dir))
        {
            if (!entry.is_regular_file())
            {
                continue;
            }
            LocalFile file{
                .relative_path = entry.path().lexically_relative(source_dir).generic_string(),
                .absolute_path = entry.path(),
                .size = entry.file_size(),
            };
            plan.total_size += file.size;
            plan.files.push_back(std::move(file));
        }
        std::sort(plan.files.begin(), plan.files.end(), [](const LocalFile &lhs, const LocalFile &rhs)
                  { return lhs.relative_path < rhs.relative_path; });
        return plan;
    }

    Uploader::Uploader(AgentClient &client, std::string agent_id, UploadStateStore *ledger)
        : client_(client), agent_id_(std::move(agent_id)), ledger_(ledger)
    {
    }

    UploadOutcome Uploader::upload(const std::filesystem::path &source_dir, const protocol::UploadConfig &config,
                                   const UploadOptions &options)
    {
        const auto plan = plan_upload(source_dir);
        const auto destination = destination_key(config);

        protocol::InitUploadRequest init{
            .config = config,
            .total_size = plan.total_size,
            .file_count = plan.files.size(),
        };
        if (ledger_ != nullptr)
        {
            if (auto previous = ledger_->find(agent_id_, source_dir, destination))
            {
                init.resume_from = previous->bytes_transferred;
            }
        }

        const auto session = client_.init_upload(init);
        UploadOutcome outcome{
            .upload_id = session.upload_id,
            .resumed_from = session.resume_from,
            .total_size = plan.total_size,
        };
        if (session.resume_from > 0)
        {
            spdlog::info("Resuming upload {} at {} / {} bytes", session.upload_id, session.resume_from, plan.total_size);
        }
        if (ledger_ != nullptr)
        {
            ledger_->upsert({
                .agent_id = agent_id_,
                .local_path = source_dir,
                .destination = destination,
                .upload_id = session.upload_id,
                .total_size = plan.total_size,
                .bytes_transferred = session.resume_from,
            });
        }

        if (!send_files(plan, session.upload_id, session.resume_from, options))
        {
            client_.cancel_upload(session.upload_id);
            if (ledger_ != nullptr)
            {
                ledger_->remove(agent_id_, session.upload_id);
            }
            outcome.cancelled = true;
            return outcome;
        }

        protocol::CompleteUploadResponse completed;
        try
        {
            completed = client_.complete_upload(session.upload_id, options.create_shortcut);
        }
        catch (const ProtocolError &error)
        {
            // The resumed prefix may have had holes; a full pass is idempotent.
            if (error.code() != ErrorCode::UploadFailed || session.resume_from == 0)
            {
                throw;
            }
            spdlog::warn("Upload {} incomplete after resume, resending everything", session.upload_id);
            if (!send_files(plan, session.upload_id, 0, options))
            {
                client_.cancel_upload(session.upload_id);
                if (ledger_ != nullptr)
                {
                    ledger_->remove(agent_id_, session.upload_id);
                }
                outcome.cancelled = true;
                return outcome;
            }
            completed = client_.complete_upload(session.upload_id, options.create_shortcut);
        }

        if (ledger_ != nullptr)
        {
            ledger_->remove(agent_id_, session.upload_id);
        }
        outcome.app_id = completed.app_id;
        return outcome;
    }

    bool Uploader::send_files(const UploadPlan &plan, const std::string &upload_id, std::uint64_t skip,
                              const UploadOptions &options)
    {
        const auto chunk_size = std::max<std::size_t>(options.chunk_size, 1);
        std::vector<std::byte> buffer(chunk_size);
        std::uint64_t position = 0;

        for (const auto &file : plan.files)
        {
            const auto file_start = position;
            position += file.size;
            // Empty files are always announced so the Agent creates them.
            if (position <= skip && file.size > 0)
            {
                continue;
            }

            std::ifstream in(file.absolute_path, std::ios::binary);
            if (!in.is_open())
            {
                throw ProtocolError(ErrorCode::PermissionDenied, "cannot read " + file.absolute_path.string());
            }
            std::uint64_t offset = skip > file_start ? skip - file_start : 0;
            in.seekg(static_cast<std::streamoff>(offset));

            do
            {
                if (options.cancelled && options.cancelled())
                {
                    return false;
                }
                const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, file.size - offset));
                in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(wanted));
                if (static_cast<std::size_t>(in.gcount()) != wanted)
                {
                    throw ProtocolError(ErrorCode::UploadFailed, file.absolute_path.string() + " changed during upload");
                }
                const std::span<const std::byte> chunk(buffer.data(), wanted);
                const auto response = client_.upload_chunk({
                    .upload_id = upload_id,
                    .offset = offset,
                    .data_base64 = encoding::encode_base64(chunk),
                    .file_path = file.relative_path,
                    .is_last = offset + wanted == file.size,
                    .hash = crypto::hash_bytes(chunk),
                });
                offset += wanted;

                if (ledger_ != nullptr)
                {
                    ledger_->update_progress(agent_id_, upload_id, response.total_written);
                }
                if (options.on_progress)
                {
                    options.on_progress(response.total_written, plan.total_size);
                }
            } while (offset < file.size);
        }
        return true;
    }

} // namespace capydeploy::hub
