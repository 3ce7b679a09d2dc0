#ifndef NETACT_NETWORK_ACTIVATOR_HPP
#define NETACT_NETWORK_ACTIVATOR_HPP

#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "NetAct/Activator/ActivatorType.hpp"
#include "NetAct/NetworkState.hpp"
#include "NetAct/System/System.hpp"
#include "NetAct/Util/Error.hpp"

namespace NetAct
{
    /**
     * @brief Brings interfaces up and down through one network-management backend
     *
     * Every operation returns false on an expected command failure instead of
     * raising; the failure is logged through the activator's sink.
     */
    class NetworkActivator
    {
    public:
        NetworkActivator(ActivatorType type, System& system, xtr::logger& log);
        virtual ~NetworkActivator() = default;

        [[nodiscard]] ActivatorType type() const { return type_; }
        [[nodiscard]] std::string_view name() const { return to_string(type_); }

        void set_log_level(xtr::log_level_t level);

        // Blocks until everything logged so far has reached the log file
        void flush_log();

        /**
         * @brief Whether the backend can be used on this host
         *
         * May run diagnostic commands but never changes interface state.
         */
        virtual bool available() = 0;

        virtual bool bring_up_interface(std::string_view interface_name) = 0;
        virtual bool bring_down_interface(std::string_view interface_name) = 0;

        /**
         * @brief Bring up each interface in order
         *
         * Stops at the first failure; the remaining interfaces are not attempted.
         */
        virtual bool bring_up_interfaces(const std::vector<std::string>& interface_names);

        /**
         * @brief Bring up every interface of the network state
         */
        virtual bool bring_up_all_interfaces(const NetworkState& network_state);

        /**
         * @brief Block until the backend reports the network online
         * @return WaitNotSupported unless the backend overrides it
         */
        virtual tl::expected<void, Error> wait_for_network();

        NetworkActivator(const NetworkActivator&) = delete;
        NetworkActivator& operator=(const NetworkActivator&) = delete;

    protected:
        bool alter(const Command& command, bool warn_on_stderr = true);

        System& system_;
        xtr::sink s;

    private:
        ActivatorType type_;
    };
}

#endif //NETACT_NETWORK_ACTIVATOR_HPP
