#include "NetAct/Activator/NetplanActivator.hpp"
#include "NetAct/Activator/NetworkManagerActivator.hpp"
#include "NetAct/Activator/NetworkdActivator.hpp"

namespace NetAct
{
    NetplanActivator::NetplanActivator(System& system, xtr::logger& log, NetworkManagerActivator& network_manager,
                                       NetworkdActivator& networkd)
        : NetworkActivator(ActivatorType::Netplan, system, log), network_manager_(network_manager),
          networkd_(networkd)
    {
    }

    bool NetplanActivator::available()
    {
        return system_.which("netplan", {"/usr/sbin", "/sbin"}).has_value();
    }

    bool NetplanActivator::apply(const bool announce)
    {
        if (announce)
        {
            XTR_LOGL(debug, s, "Calling 'netplan apply' rather than altering individual interfaces");
        }
        // netplan apply writes progress to stderr on success
        return alter(NETPLAN_CMD, false);
    }

    bool NetplanActivator::bring_up_interface(std::string_view)
    {
        return apply(true);
    }

    bool NetplanActivator::bring_down_interface(std::string_view)
    {
        return apply(true);
    }

    bool NetplanActivator::bring_up_interfaces(const std::vector<std::string>&)
    {
        return apply(true);
    }

    bool NetplanActivator::bring_up_all_interfaces(const NetworkState&)
    {
        return apply(false);
    }

    tl::expected<void, Error> NetplanActivator::wait_for_network()
    {
        // At the moment waiting is only supported with the networkd renderer
        if (network_manager_.available())
        {
            XTR_LOGL(debug, s, "NetworkManager is enabled, skipping networkd wait");
            return {};
        }
        return networkd_.wait_for_network();
    }
}
