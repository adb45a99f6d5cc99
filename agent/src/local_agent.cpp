#include "capydeploy/agent/local_agent.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <sys/utsname.h>

namespace capydeploy::agent
{

    std::string detect_platform()
    {
        std::ifstream os_release("/etc/os-release");
        std::string line;
        while (std::getline(os_release, line))
        {
            if (line == "ID=steamos" || line == "ID=\"steamos\"")
            {
                return "steamdeck";
            }
        }

        utsname info{};
        if (::uname(&info) != 0)
        {
            return "unknown";
        }
        std::string platform = info.sysname;
        std::transform(platform.begin(), platform.end(), platform.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return platform;
    }

    LocalAgent::LocalAgent(protocol::AgentInfo info) : info_(std::move(info)) {}

    protocol::AgentInfo LocalAgent::get_info() const
    {
        return info_;
    }

} // namespace capydeploy::agent
