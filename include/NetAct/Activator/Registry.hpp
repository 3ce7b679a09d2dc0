#ifndef NETACT_ACTIVATOR_REGISTRY_HPP
#define NETACT_ACTIVATOR_REGISTRY_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "NetAct/Activator/IfConfigActivator.hpp"
#include "NetAct/Activator/IfUpDownActivator.hpp"
#include "NetAct/Activator/NetplanActivator.hpp"
#include "NetAct/Activator/NetworkManagerActivator.hpp"
#include "NetAct/Activator/NetworkdActivator.hpp"
#include "NetAct/Util/Error.hpp"

namespace NetAct
{
    /**
     * @brief Owns one activator per ActivatorType and picks the one to use
     *
     * The activators and the type mapping are built in the constructor and
     * never change afterwards.
     */
    class ActivatorRegistry
    {
    public:
        ActivatorRegistry(System& system, xtr::logger& log, xtr::log_level_t level = xtr::log_level_t::info);

        /**
         * @brief Registry bound to the running host, the NetAct logger and Config
         */
        static ActivatorRegistry& instance();

        [[nodiscard]] NetworkActivator& get(ActivatorType type) const;

        /**
         * @brief First available activator in priority order
         * @return nullptr when none is available, UnknownActivator when the
         *         list names something that is not an activator
         */
        tl::expected<NetworkActivator*, Error> search_activator(const std::vector<std::string>& priority);

        /**
         * @brief search_activator() over priority, or over default_priority() when omitted
         * @return Never nullptr; NoActivatorAvailable when the search comes back empty
         */
        tl::expected<NetworkActivator*, Error> select_activator(
            const std::optional<std::vector<std::string>>& priority = std::nullopt);

        ActivatorRegistry(const ActivatorRegistry&) = delete;
        ActivatorRegistry& operator=(const ActivatorRegistry&) = delete;

    private:
        IfUpDownActivator eni_;
        NetworkManagerActivator network_manager_;
        NetworkdActivator networkd_;
        NetplanActivator netplan_;
        IfConfigActivator ifconfig_;
        const std::map<ActivatorType, NetworkActivator*> activators_;
        xtr::sink s;
    };

    tl::expected<NetworkActivator*, Error> search_activator(const std::vector<std::string>& priority);
    tl::expected<NetworkActivator*, Error> select_activator(
        const std::optional<std::vector<std::string>>& priority = std::nullopt);
}

#endif //NETACT_ACTIVATOR_REGISTRY_HPP
