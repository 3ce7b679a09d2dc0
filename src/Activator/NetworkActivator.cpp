#include "NetAct/Activator/NetworkActivator.hpp"
#include "NetAct/Activator/Command.hpp"

#include <algorithm>
#include <format>

using tl::unexpected;

namespace NetAct
{
    NetworkActivator::NetworkActivator(const ActivatorType type, System& system, xtr::logger& log)
        : system_(system), s(log.get_sink(std::format("NetAct {}", to_string(type)))), type_(type)
    {
    }

    void NetworkActivator::set_log_level(const xtr::log_level_t level)
    {
        s.set_level(level);
    }

    void NetworkActivator::flush_log()
    {
        s.sync();
    }

    bool NetworkActivator::bring_up_interfaces(const std::vector<std::string>& interface_names)
    {
        return std::ranges::all_of(interface_names, [this](const std::string& interface_name)
        {
            return bring_up_interface(interface_name);
        });
    }

    bool NetworkActivator::bring_up_all_interfaces(const NetworkState& network_state)
    {
        std::vector<std::string> interface_names;
        for (const auto& interface : network_state.iter_interfaces())
        {
            interface_names.push_back(interface.name);
        }
        return bring_up_interfaces(interface_names);
    }

    tl::expected<void, Error> NetworkActivator::wait_for_network()
    {
        return unexpected(Error{
            ErrorCode::WaitNotSupported,
            std::format("Activator {} does not support waiting for the network", name())
        });
    }

    bool NetworkActivator::alter(const Command& command, const bool warn_on_stderr)
    {
        return alter_interface(system_, s, command, warn_on_stderr);
    }
}
