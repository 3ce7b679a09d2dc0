#include "NetAct/Activator/NetworkManagerActivator.hpp"

#include <algorithm>
#include <format>

namespace NetAct
{
    namespace
    {
        constexpr std::string_view SYSTEMD_RUN_DIR = "/run/systemd/system";
        constexpr std::string_view RUNNING_SUBSTATE = "SubState=running";

        std::string rstrip(std::string value)
        {
            while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ' ||
                value.back() == '\t'))
            {
                value.pop_back();
            }
            return value;
        }
    }

    NetworkManagerActivator::NetworkManagerActivator(System& system, xtr::logger& log)
        : NetworkActivator(ActivatorType::NetworkManager, system, log)
    {
    }

    std::optional<std::string> NetworkManagerActivator::conn_filename(const std::string_view interface_name)
    {
        if (interface_name.empty() || interface_name == "." || interface_name == ".." ||
            interface_name.find('/') != std::string_view::npos)
        {
            return std::nullopt;
        }
        return std::format("{}/cloud-init-{}.nmconnection", CONNECTIONS_DIR, interface_name);
    }

    bool NetworkManagerActivator::available()
    {
        const bool config_present = system_.is_file(CONFIG_FILE);
        const bool nmcli_present = system_.which("nmcli", {}).has_value();

        bool service_active = true;
        if (system_.is_dir(SYSTEMD_RUN_DIR))
        {
            if (auto result = system_.run({"systemctl", "is-enabled", SERVICE}); !result)
            {
                XTR_LOGL(debug, s, "{} is not enabled: {}", SERVICE, result.error().message);
                service_active = false;
            }
        }
        return config_present && nmcli_present && service_active;
    }

    bool NetworkManagerActivator::bring_up_interface(const std::string_view interface_name)
    {
        const auto filename = conn_filename(interface_name);
        if (!filename)
        {
            XTR_LOGL(warning, s, "Unable to find an interface config file. Unable to bring up interface.");
            return false;
        }

        Command command;
        if (alter({"nmcli", "connection", "load", *filename}))
        {
            command = {"nmcli", "connection", "up", "filename", *filename};
        }
        else
        {
            // Reload result is ignored, activating by name decides the outcome
            alter({"nmcli", "connection", "reload"});
            command = {"nmcli", "connection", "up", "ifname", std::string(interface_name)};
        }
        return alter(command);
    }

    bool NetworkManagerActivator::bring_down_interface(const std::string_view interface_name)
    {
        return alter({"nmcli", "device", "disconnect", std::string(interface_name)});
    }

    bool NetworkManagerActivator::bring_up_interfaces(const std::vector<std::string>& interface_names)
    {
        const auto state = system_.run({"systemctl", "show", "--property=SubState", SERVICE});
        if (!state)
        {
            XTR_LOGL(warning, s, "Unable to query {} SubState: {}", SERVICE, state.error().message);
        }
        else if (const std::string sub_state = rstrip(state->out); sub_state != RUNNING_SUBSTATE)
        {
            XTR_LOGL(warning, s, "Expected NetworkManager SubState=running, but detected: {}", sub_state);
        }

        if (!alter({"systemctl", "try-reload-or-restart", SERVICE}))
        {
            return false;
        }
        return std::ranges::all_of(interface_names, [this](const std::string& interface_name)
        {
            return bring_up_interface(interface_name);
        });
    }
}
