#ifndef NETACT_NETPLAN_ACTIVATOR_HPP
#define NETACT_NETPLAN_ACTIVATOR_HPP

#include "NetAct/Activator/NetworkActivator.hpp"

namespace NetAct
{
    class NetworkManagerActivator;
    class NetworkdActivator;

    /**
     * @brief netplan
     *
     * netplan only knows how to apply the whole configuration, so every
     * operation, whatever interface it names, runs the same `netplan apply`.
     */
    class NetplanActivator : public NetworkActivator
    {
    public:
        inline static const Command NETPLAN_CMD{"netplan", "apply"};

        /**
         * @param network_manager Consulted before waiting, see wait_for_network()
         * @param networkd Performs the actual wait
         */
        NetplanActivator(System& system, xtr::logger& log, NetworkManagerActivator& network_manager,
                         NetworkdActivator& networkd);

        bool available() override;
        bool bring_up_interface(std::string_view interface_name) override;
        bool bring_down_interface(std::string_view interface_name) override;
        bool bring_up_interfaces(const std::vector<std::string>& interface_names) override;
        bool bring_up_all_interfaces(const NetworkState& network_state) override;

        /**
         * @brief Wait through systemd-networkd, unless NetworkManager is the renderer in charge
         */
        tl::expected<void, Error> wait_for_network() override;

    private:
        bool apply(bool announce);

        NetworkManagerActivator& network_manager_;
        NetworkdActivator& networkd_;
    };
}

#endif //NETACT_NETPLAN_ACTIVATOR_HPP
