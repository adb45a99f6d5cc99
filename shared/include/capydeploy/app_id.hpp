/**
 * CapyDeploy - Deterministic shortcut AppId derivation.
 *
 * Mirrors the hash the Steam shortcut store uses internally: CRC-32 (IEEE)
 * over the quoted executable path followed by the shortcut name, with the
 * high bit forced on.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "capydeploy/protocol.hpp"

namespace capydeploy
{

    std::uint32_t crc32(std::span<const std::byte> data) noexcept;
    std::uint32_t crc32(std::string_view text) noexcept;

    // Wraps a path in double quotes unless it already is.
    std::string quote_path(std::string_view path);

    std::uint32_t compute_app_id(std::string_view quoted_exe, std::string_view name) noexcept;

    // 64-bit id used for grid artwork and big-picture launches.
    constexpr std::uint64_t compute_grid_id(std::uint32_t app_id) noexcept
    {
        return (static_cast<std::uint64_t>(app_id) << 32) | 0x02000000ULL;
    }

    std::uint32_t app_id_for(const protocol::ShortcutConfig &shortcut);

} // namespace capydeploy
