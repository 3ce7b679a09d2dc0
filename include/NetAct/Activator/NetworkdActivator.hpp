#ifndef NETACT_NETWORKD_ACTIVATOR_HPP
#define NETACT_NETWORKD_ACTIVATOR_HPP

#include "NetAct/Activator/NetworkActivator.hpp"

namespace NetAct
{
    /**
     * @brief systemd-networkd
     *
     * Single interfaces are toggled directly over rtnetlink; networkd itself
     * is only restarted when every interface is brought up.
     */
    class NetworkdActivator : public NetworkActivator
    {
    public:
        NetworkdActivator(System& system, xtr::logger& log);

        bool available() override;
        bool bring_up_interface(std::string_view interface_name) override;
        bool bring_down_interface(std::string_view interface_name) override;
        bool bring_up_all_interfaces(const NetworkState& network_state) override;

        /**
         * @brief Start systemd-networkd-wait-online.service and block until it finishes
         */
        tl::expected<void, Error> wait_for_network() override;

    private:
        bool set_link_state(std::string_view interface_name, bool up);
    };
}

#endif //NETACT_NETWORKD_ACTIVATOR_HPP
