#ifndef NETACT_IFUPDOWN_ACTIVATOR_HPP
#define NETACT_IFUPDOWN_ACTIVATOR_HPP

#include "NetAct/Activator/NetworkActivator.hpp"

namespace NetAct
{
    /**
     * @brief Legacy /etc/network/interfaces scripts (ifup/ifdown)
     *
     * No "ifup --all": some ifupdown plugins need the name of a specific
     * connection, so interfaces are always brought up one by one.
     */
    class IfUpDownActivator : public NetworkActivator
    {
    public:
        IfUpDownActivator(System& system, xtr::logger& log);

        bool available() override;
        bool bring_up_interface(std::string_view interface_name) override;
        bool bring_down_interface(std::string_view interface_name) override;
    };
}

#endif //NETACT_IFUPDOWN_ACTIVATOR_HPP
