#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

namespace capydeploy::agent::fs
{

    // Joins a client-supplied relative path onto `base`, rejecting traversal
    // outside of it with INVALID_REQUEST.
    std::filesystem::path resolve_within(const std::filesystem::path &base, std::string_view requested);

    // Validates a single path component such as a game name.
    void require_plain_name(std::string_view name, std::string_view what);

    // Writes `data` at `offset`, creating the file and its parents when
    // needed, and flushes before returning. Failures surface as classified
    // ProtocolErrors (DISK_FULL, PERMISSION_DENIED, ...).
    void write_at(const std::filesystem::path &path, std::uint64_t offset, std::span<const std::byte> data);

    // Moves `from` to `to`, replacing any existing tree at `to`.
    void replace_tree(const std::filesystem::path &from, const std::filesystem::path &to);

    // Best-effort removal; returns false and leaves the error in `ec`.
    bool remove_tree(const std::filesystem::path &path, std::error_code &ec) noexcept;

} // namespace capydeploy::agent::fs
