#include "NetAct/Activator/NetworkdActivator.hpp"
#include "NetAct/Activator/Command.hpp"

#include <string>

using tl::unexpected;

namespace NetAct
{
    namespace
    {
        const std::vector<std::string> SYSTEMCTL_SEARCH{"/usr/sbin", "/bin", "/usr/bin"};
        const std::vector<std::string> NETWORKD_BINARIES{
            "/lib/systemd/systemd-networkd",
            "/usr/lib/systemd/systemd-networkd",
        };
    }

    NetworkdActivator::NetworkdActivator(System& system, xtr::logger& log)
        : NetworkActivator(ActivatorType::Networkd, system, log)
    {
    }

    bool NetworkdActivator::available()
    {
        if (!system_.which("systemctl", SYSTEMCTL_SEARCH))
        {
            return false;
        }
        for (const auto& binary : NETWORKD_BINARIES)
        {
            if (system_.which(binary, {}))
            {
                return true;
            }
        }
        return false;
    }

    bool NetworkdActivator::set_link_state(const std::string_view interface_name, const bool up)
    {
        return alter_interface_callable(s, [&]() -> tl::expected<CommandOutput, Error>
        {
            if (auto result = system_.set_link_state(interface_name, up); !result)
            {
                return unexpected(result.error());
            }
            return CommandOutput{};
        });
    }

    bool NetworkdActivator::bring_up_interface(const std::string_view interface_name)
    {
        return set_link_state(interface_name, true);
    }

    bool NetworkdActivator::bring_down_interface(const std::string_view interface_name)
    {
        return set_link_state(interface_name, false);
    }

    bool NetworkdActivator::bring_up_all_interfaces(const NetworkState&)
    {
        return alter({"systemctl", "restart", "systemd-networkd", "systemd-resolved"});
    }

    tl::expected<void, Error> NetworkdActivator::wait_for_network()
    {
        XTR_LOGL(debug, s, "Waiting for systemd-networkd-wait-online.service");
        if (auto result = system_.run({"systemctl", "start", "systemd-networkd-wait-online.service"}); !result)
        {
            return unexpected(result.error());
        }
        return {};
    }
}
