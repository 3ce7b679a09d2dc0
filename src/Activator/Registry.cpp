#include "NetAct/Activator/Registry.hpp"
#include "NetAct/Config.hpp"
#include "NetAct/System/LinuxSystem.hpp"
#include "NetAct/Util/Format.hpp"
#include "NetAct/Util/Logger.hpp"

#include <format>

using tl::unexpected;

namespace NetAct
{
    ActivatorRegistry::ActivatorRegistry(System& system, xtr::logger& log, const xtr::log_level_t level)
        : eni_(system, log),
          network_manager_(system, log),
          networkd_(system, log),
          netplan_(system, log, network_manager_, networkd_),
          ifconfig_(system, log),
          activators_{
              {ActivatorType::Eni, &eni_},
              {ActivatorType::Netplan, &netplan_},
              {ActivatorType::NetworkManager, &network_manager_},
              {ActivatorType::Networkd, &networkd_},
              {ActivatorType::IfConfig, &ifconfig_},
          },
          s(log.get_sink("NetAct Registry"))
    {
        s.set_level(level);
        for (const auto& [type, activator] : activators_)
        {
            activator->set_log_level(level);
        }
    }

    ActivatorRegistry& ActivatorRegistry::instance()
    {
        static LinuxSystem system{Config::get_target_root()};
        static ActivatorRegistry registry{
            system, netact_logger(), parse_log_level(Config::get_log_level()).value_or(xtr::log_level_t::info)
        };
        return registry;
    }

    NetworkActivator& ActivatorRegistry::get(const ActivatorType type) const
    {
        return *activators_.at(type);
    }

    tl::expected<NetworkActivator*, Error> ActivatorRegistry::search_activator(
        const std::vector<std::string>& priority)
    {
        std::vector<std::string> unknown;
        for (const auto& name : priority)
        {
            if (!activator_type_from_string(name))
            {
                unknown.push_back(name);
            }
        }
        if (!unknown.empty())
        {
            return unexpected(Error{
                ErrorCode::UnknownActivator,
                std::format("Unknown activators provided in priority list: {}", format_list(unknown))
            });
        }

        for (const auto& name : priority)
        {
            NetworkActivator& activator = get(*activator_type_from_string(name));
            if (activator.available())
            {
                return &activator;
            }
        }
        return nullptr;
    }

    tl::expected<NetworkActivator*, Error> ActivatorRegistry::select_activator(
        const std::optional<std::vector<std::string>>& priority)
    {
        const std::vector<std::string> searched = priority.value_or(default_priority());
        auto selected = search_activator(searched);
        if (!selected)
        {
            return selected;
        }
        if (!*selected)
        {
            return unexpected(Error{
                ErrorCode::NoActivatorAvailable,
                std::format("No available network activators found. Searched through list: {}",
                            format_list(searched))
            });
        }
        XTR_LOGL(debug, s, "Using selected activator: {} from priority: {}", std::string((*selected)->name()),
                 format_list(searched));
        return selected;
    }

    tl::expected<NetworkActivator*, Error> search_activator(const std::vector<std::string>& priority)
    {
        return ActivatorRegistry::instance().search_activator(priority);
    }

    tl::expected<NetworkActivator*, Error> select_activator(const std::optional<std::vector<std::string>>& priority)
    {
        return ActivatorRegistry::instance().select_activator(priority);
    }
}
