#include "NetAct/Activator/ActivatorType.hpp"

namespace NetAct
{
    std::string_view to_string(const ActivatorType type)
    {
        switch (type)
        {
            case ActivatorType::Eni:
                return "eni";
            case ActivatorType::Netplan:
                return "netplan";
            case ActivatorType::NetworkManager:
                return "network-manager";
            case ActivatorType::Networkd:
                return "networkd";
            case ActivatorType::IfConfig:
                return "ifconfig";
        }
        return "unknown";
    }

    std::optional<ActivatorType> activator_type_from_string(const std::string_view name)
    {
        for (const auto type : ALL_ACTIVATOR_TYPES)
        {
            if (to_string(type) == name)
            {
                return type;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> default_priority()
    {
        std::vector<std::string> priority;
        priority.reserve(ALL_ACTIVATOR_TYPES.size());
        for (const auto type : ALL_ACTIVATOR_TYPES)
        {
            priority.emplace_back(to_string(type));
        }
        return priority;
    }
}
