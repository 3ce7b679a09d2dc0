#include "NetAct/Activator/IfConfigActivator.hpp"

#include <string>

namespace NetAct
{
    IfConfigActivator::IfConfigActivator(System& system, xtr::logger& log)
        : NetworkActivator(ActivatorType::IfConfig, system, log)
    {
    }

    bool IfConfigActivator::available()
    {
        return system_.which("ifconfig", {"/sbin"}).has_value();
    }

    bool IfConfigActivator::bring_up_interface(const std::string_view interface_name)
    {
        return alter({"ifconfig", std::string(interface_name), "up"});
    }

    bool IfConfigActivator::bring_down_interface(const std::string_view interface_name)
    {
        return alter({"ifconfig", std::string(interface_name), "down"});
    }
}
