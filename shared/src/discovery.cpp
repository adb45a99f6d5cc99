#include "capydeploy/discovery.hpp"

#include <charconv>

namespace capydeploy::discovery
{

    namespace
    {
        constexpr std::string_view kQueryTag = "CAPYDEPLOY_QUERY";
        constexpr std::string_view kAnnounceTag = "CAPYDEPLOY_ANNOUNCE";

        std::vector<std::string_view> split_lines(std::string_view text)
        {
            std::vector<std::string_view> lines;
            while (!text.empty())
            {
                const auto end = text.find('\n');
                auto line = text.substr(0, end);
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }
                if (!line.empty())
                {
                    lines.push_back(line);
                }
                if (end == std::string_view::npos)
                {
                    break;
                }
                text.remove_prefix(end + 1);
            }
            return lines;
        }

        std::string header(std::string_view tag, std::string_view service)
        {
            std::string line(tag);
            line.push_back(' ');
            line.append(service);
            return line;
        }
    } // namespace

    std::string encode_query(std::string_view service)
    {
        return header(kQueryTag, service) + "\n";
    }

    bool is_query(std::string_view datagram, std::string_view service)
    {
        const auto lines = split_lines(datagram);
        return !lines.empty() && lines.front() == header(kQueryTag, service);
    }

    std::string encode_announcement(const Announcement &announcement, std::string_view service)
    {
        std::string text = header(kAnnounceTag, service);
        text += "\ninstance=" + announcement.instance_name;
        text += "\nhost=" + announcement.host;
        text += "\nport=" + std::to_string(announcement.port);
        for (const auto &address : announcement.addresses)
        {
            text += "\naddr=" + address;
        }
        for (const auto &field : announcement.info_fields)
        {
            text += "\ntxt=" + field;
        }
        text.push_back('\n');
        return text;
    }

    std::optional<Announcement> decode_announcement(std::string_view datagram, std::string_view service)
    {
        const auto lines = split_lines(datagram);
        if (lines.empty() || lines.front() != header(kAnnounceTag, service))
        {
            return std::nullopt;
        }

        Announcement announcement;
        bool has_port = false;
        for (std::size_t i = 1; i < lines.size(); ++i)
        {
            const auto line = lines[i];
            const auto eq = line.find('=');
            if (eq == std::string_view::npos)
            {
                continue;
            }
            const auto key = line.substr(0, eq);
            const auto value = line.substr(eq + 1);
            if (key == "instance")
            {
                announcement.instance_name = std::string(value);
            }
            else if (key == "host")
            {
                announcement.host = std::string(value);
            }
            else if (key == "port")
            {
                std::uint16_t port = 0;
                const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
                if (ec != std::errc{} || ptr != value.data() + value.size())
                {
                    return std::nullopt;
                }
                announcement.port = port;
                has_port = true;
            }
            else if (key == "addr")
            {
                announcement.addresses.emplace_back(value);
            }
            else if (key == "txt")
            {
                announcement.info_fields.emplace_back(value);
            }
        }

        if (!has_port || (announcement.instance_name.empty() && announcement.host.empty()))
        {
            return std::nullopt;
        }
        return announcement;
    }

    std::optional<std::string> find_info_field(const Announcement &announcement, std::string_view key)
    {
        for (const auto &field : announcement.info_fields)
        {
            const std::string_view view(field);
            if (view.size() > key.size() && view.substr(0, key.size()) == key && view[key.size()] == '=')
            {
                return std::string(view.substr(key.size() + 1));
            }
        }
        return std::nullopt;
    }

} // namespace capydeploy::discovery
