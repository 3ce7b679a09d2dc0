#ifndef NETACT_NETWORK_STATE_HPP
#define NETACT_NETWORK_STATE_HPP

#include <span>
#include <string>
#include <vector>

namespace NetAct
{
    struct InterfaceDescriptor
    {
        std::string name;
        std::string type{"physical"};
        std::string mac_address;
    };

    /**
     * @brief The rendered network configuration as seen by activators
     *
     * Activators only read interface names; the rest is carried for callers.
     */
    class NetworkState
    {
    public:
        NetworkState() = default;
        explicit NetworkState(std::vector<InterfaceDescriptor> interfaces) : interfaces_(std::move(interfaces))
        {
        }

        void add_interface(InterfaceDescriptor descriptor)
        {
            interfaces_.push_back(std::move(descriptor));
        }

        [[nodiscard]] std::span<const InterfaceDescriptor> iter_interfaces() const
        {
            return interfaces_;
        }

    private:
        std::vector<InterfaceDescriptor> interfaces_;
    };
}

#endif //NETACT_NETWORK_STATE_HPP
