#include "capydeploy/error_codes.hpp"

#include <array>

namespace capydeploy
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view label;
            std::string_view message;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Unknown, "UNKNOWN", "unknown error"},
            {ErrorCode::InvalidRequest, "INVALID_REQUEST", "invalid request"},
            {ErrorCode::UploadNotFound, "UPLOAD_NOT_FOUND", "upload not found"},
            {ErrorCode::UploadFailed, "UPLOAD_FAILED", "upload failed"},
            {ErrorCode::ShortcutNotFound, "SHORTCUT_NOT_FOUND", "shortcut not found"},
            {ErrorCode::ShortcutExists, "SHORTCUT_EXISTS", "shortcut already exists"},
            {ErrorCode::SteamNotRunning, "STEAM_NOT_RUNNING", "steam is not running"},
            {ErrorCode::SteamNotFound, "STEAM_NOT_FOUND", "steam installation not found"},
            {ErrorCode::PermissionDenied, "PERMISSION_DENIED", "permission denied"},
            {ErrorCode::DiskFull, "DISK_FULL", "insufficient disk space"},
            {ErrorCode::Timeout, "TIMEOUT", "operation timed out"},
            {ErrorCode::AgentBusy, "AGENT_BUSY", "agent is busy with another operation"},
        }};

        const ErrorCodeDescription &describe(ErrorCode code) noexcept
        {
            for (const auto &entry : kDescriptions)
            {
                if (entry.code == code)
                {
                    return entry;
                }
            }
            return kDescriptions.front();
        }
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        return describe(code).label;
    }

    std::string_view canonical_message(ErrorCode code) noexcept
    {
        return describe(code).message;
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.label == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace capydeploy
