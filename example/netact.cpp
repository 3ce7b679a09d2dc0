#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "NetAct/Activator/Registry.hpp"
#include "NetAct/Config.hpp"

using NetAct::ActivatorRegistry, NetAct::NetworkState, NetAct::InterfaceDescriptor;

namespace
{
    void print_usage(const char* program)
    {
        std::cerr << "Usage: " << program << " <select|up|down|up-all|wait> [interface...]\n"
            << "Activator priority is read from " << NetAct::Config::PRIORITY_ENV
            << " (comma separated), the default order is used otherwise." << std::endl;
    }
}

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 2;
    }

    const std::string_view operation = argv[1];
    const std::vector<std::string> interfaces(argv + 2, argv + argc);

    try
    {
        auto selected = ActivatorRegistry::instance().select_activator(NetAct::Config::get_priority());
        if (!selected)
        {
            std::cerr << "Failed to select activator: " << selected.error().message << std::endl;
            return 2;
        }
        auto& activator = **selected;
        std::cout << "Selected activator: " << activator.name() << std::endl;

        bool ok = true;
        if (operation == "select")
        {
            // Selection only
        }
        else if (operation == "up")
        {
            ok = activator.bring_up_interfaces(interfaces);
        }
        else if (operation == "down")
        {
            for (const auto& interface : interfaces)
            {
                ok = activator.bring_down_interface(interface) && ok;
            }
        }
        else if (operation == "up-all")
        {
            NetworkState network_state;
            for (const auto& interface : interfaces)
            {
                network_state.add_interface(InterfaceDescriptor{.name = interface});
            }
            ok = activator.bring_up_all_interfaces(network_state);
        }
        else if (operation == "wait")
        {
            if (auto result = activator.wait_for_network(); !result)
            {
                std::cerr << "Failed to wait for network: " << result.error().message << std::endl;
                ok = false;
            }
        }
        else
        {
            print_usage(argv[0]);
            return 2;
        }

        activator.flush_log();
        std::cout << operation << (ok ? " succeeded" : " failed") << std::endl;
        return ok ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Exception in netact: " << e.what() << std::endl;
        return 1;
    }
}
