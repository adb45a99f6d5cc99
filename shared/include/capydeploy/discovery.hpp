/**
 * CapyDeploy - LAN service announcement codec.
 *
 * The Hub multicasts a query datagram; every Agent answers with an
 * announcement carrying its instance name, host, port and TXT-style
 * `key=value` info fields (id, name, platform, version).
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace capydeploy::discovery
{

    constexpr std::string_view kServiceName = "_capydeploy._tcp";
    constexpr std::string_view kMulticastGroup = "239.255.42.99";
    constexpr std::uint16_t kDiscoveryPort = 9998;
    constexpr std::size_t kMaxDatagramSize = 1472;

    struct Announcement
    {
        std::string instance_name;
        std::string host;
        std::uint16_t port{};
        std::vector<std::string> addresses;
        std::vector<std::string> info_fields;
    };

    std::string encode_query(std::string_view service = kServiceName);
    bool is_query(std::string_view datagram, std::string_view service = kServiceName);

    std::string encode_announcement(const Announcement &announcement, std::string_view service = kServiceName);

    // std::nullopt for anything that is not a well-formed announcement.
    std::optional<Announcement> decode_announcement(std::string_view datagram,
                                                    std::string_view service = kServiceName);

    std::optional<std::string> find_info_field(const Announcement &announcement, std::string_view key);

} // namespace capydeploy::discovery
