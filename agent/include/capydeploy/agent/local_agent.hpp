#pragma once

#include <string>

#include "capydeploy/agent/capabilities.hpp"

namespace capydeploy::agent
{

    // "steamdeck" on SteamOS, otherwise the lower-case kernel name.
    std::string detect_platform();

    class LocalAgent : public BaseAgent
    {
    public:
        explicit LocalAgent(protocol::AgentInfo info);

        protocol::AgentInfo get_info() const override;

        void ping() override {}

    private:
        protocol::AgentInfo info_;
    };

} // namespace capydeploy::agent
