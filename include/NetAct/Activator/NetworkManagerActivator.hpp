#ifndef NETACT_NETWORK_MANAGER_ACTIVATOR_HPP
#define NETACT_NETWORK_MANAGER_ACTIVATOR_HPP

#include <optional>
#include <string>

#include "NetAct/Activator/NetworkActivator.hpp"

namespace NetAct
{
    /**
     * @brief NetworkManager driven through nmcli
     *
     * Bringing an interface up loads its cloud-init keyfile first and
     * activates it by filename. If the load fails, all connections are
     * reloaded and the interface is activated by name instead.
     */
    class NetworkManagerActivator : public NetworkActivator
    {
    public:
        static constexpr const char* CONNECTIONS_DIR = "/etc/NetworkManager/system-connections";
        static constexpr const char* CONFIG_FILE = "/etc/NetworkManager/NetworkManager.conf";
        static constexpr const char* SERVICE = "NetworkManager.service";

        NetworkManagerActivator(System& system, xtr::logger& log);

        /**
         * @brief Keyfile rendered for an interface
         * @return Nothing when the name cannot form a file name
         */
        static std::optional<std::string> conn_filename(std::string_view interface_name);

        bool available() override;
        bool bring_up_interface(std::string_view interface_name) override;
        bool bring_down_interface(std::string_view interface_name) override;

        /**
         * @brief Reload NetworkManager, then bring up each interface
         *
         * A service that is not running only produces a warning. Stops at the
         * first failure, including a failed reload.
         */
        bool bring_up_interfaces(const std::vector<std::string>& interface_names) override;
    };
}

#endif //NETACT_NETWORK_MANAGER_ACTIVATOR_HPP
