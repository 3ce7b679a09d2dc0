#ifndef NETACT_IFCONFIG_ACTIVATOR_HPP
#define NETACT_IFCONFIG_ACTIVATOR_HPP

#include "NetAct/Activator/NetworkActivator.hpp"

namespace NetAct
{
    /**
     * @brief Raw interface control with ifconfig <dev> up|down
     */
    class IfConfigActivator : public NetworkActivator
    {
    public:
        IfConfigActivator(System& system, xtr::logger& log);

        bool available() override;
        bool bring_up_interface(std::string_view interface_name) override;
        bool bring_down_interface(std::string_view interface_name) override;
    };
}

#endif //NETACT_IFCONFIG_ACTIVATOR_HPP
