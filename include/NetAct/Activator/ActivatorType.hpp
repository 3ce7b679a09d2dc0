#ifndef NETACT_ACTIVATOR_TYPE_HPP
#define NETACT_ACTIVATOR_TYPE_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace NetAct
{
    enum class ActivatorType
    {
        Eni,
        Netplan,
        NetworkManager,
        Networkd,
        IfConfig
    };

    inline constexpr std::array ALL_ACTIVATOR_TYPES{
        ActivatorType::Eni,
        ActivatorType::Netplan,
        ActivatorType::NetworkManager,
        ActivatorType::Networkd,
        ActivatorType::IfConfig,
    };

    std::string_view to_string(ActivatorType type);
    std::optional<ActivatorType> activator_type_from_string(std::string_view name);

    // Search order used when the caller does not supply one
    std::vector<std::string> default_priority();
}

#endif //NETACT_ACTIVATOR_TYPE_HPP
