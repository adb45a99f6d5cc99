/**
 * CapyDeploy - Closed error taxonomy shared by the Hub and the Agent.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace capydeploy
{

    enum class ErrorCode : std::uint8_t
    {
        Unknown,
        InvalidRequest,
        UploadNotFound,
        UploadFailed,
        ShortcutNotFound,
        ShortcutExists,
        SteamNotRunning,
        SteamNotFound,
        PermissionDenied,
        DiskFull,
        Timeout,
        AgentBusy
    };

    // Stable wire label, e.g. "UPLOAD_NOT_FOUND".
    std::string_view to_string(ErrorCode code) noexcept;

    // Locale-independent canonical message for a code.
    std::string_view canonical_message(ErrorCode code) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

} // namespace capydeploy
