#include "capydeploy/app_id.hpp"

#include <array>

namespace capydeploy
{

    namespace
    {
        constexpr std::uint32_t kPolynomial = 0xEDB88320u;

        constexpr std::array<std::uint32_t, 256> make_crc_table()
        {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t i = 0; i < table.size(); ++i)
            {
                std::uint32_t value = i;
                for (int bit = 0; bit < 8; ++bit)
                {
                    value = (value & 1u) ? (kPolynomial ^ (value >> 1)) : (value >> 1);
                }
                table[i] = value;
            }
            return table;
        }

        constexpr auto kCrcTable = make_crc_table();

        std::uint32_t crc32_update(std::uint32_t crc, std::span<const std::byte> data) noexcept
        {
            for (const auto byte : data)
            {
                crc = kCrcTable[(crc ^ std::to_integer<std::uint32_t>(byte)) & 0xFFu] ^ (crc >> 8);
            }
            return crc;
        }
    } // namespace

    std::uint32_t crc32(std::span<const std::byte> data) noexcept
    {
        return crc32_update(0xFFFFFFFFu, data) ^ 0xFFFFFFFFu;
    }

    std::uint32_t crc32(std::string_view text) noexcept
    {
        return crc32(std::as_bytes(std::span(text.data(), text.size())));
    }

    std::string quote_path(std::string_view path)
    {
        if (path.size() >= 2 && path.front() == '"' && path.back() == '"')
        {
            return std::string(path);
        }
        std::string quoted;
        quoted.reserve(path.size() + 2);
        quoted.push_back('"');
        quoted.append(path);
        quoted.push_back('"');
        return quoted;
    }

    std::uint32_t compute_app_id(std::string_view quoted_exe, std::string_view name) noexcept
    {
        auto crc = crc32_update(0xFFFFFFFFu, std::as_bytes(std::span(quoted_exe.data(), quoted_exe.size())));
        crc = crc32_update(crc, std::as_bytes(std::span(name.data(), name.size())));
        return (crc ^ 0xFFFFFFFFu) | 0x80000000u;
    }

    std::uint32_t app_id_for(const protocol::ShortcutConfig &shortcut)
    {
        return compute_app_id(quote_path(shortcut.exe), shortcut.name);
    }

} // namespace capydeploy
