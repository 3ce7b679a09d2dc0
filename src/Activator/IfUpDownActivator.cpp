#include "NetAct/Activator/IfUpDownActivator.hpp"

#include <string>

namespace NetAct
{
    namespace
    {
        const std::vector<std::string> ENI_PROGRAMS{"ifquery", "ifup", "ifdown"};
        const std::vector<std::string> ENI_SEARCH{"/sbin", "/usr/sbin"};
        constexpr const char* ENI_CONFIG = "/etc/network/interfaces";
    }

    IfUpDownActivator::IfUpDownActivator(System& system, xtr::logger& log)
        : NetworkActivator(ActivatorType::Eni, system, log)
    {
    }

    bool IfUpDownActivator::available()
    {
        for (const auto& program : ENI_PROGRAMS)
        {
            if (!system_.which(program, ENI_SEARCH))
            {
                XTR_LOGL(debug, s, "eni not available: {} not found", program);
                return false;
            }
        }
        if (!system_.is_file(ENI_CONFIG))
        {
            XTR_LOGL(debug, s, "eni not available: {} is missing", ENI_CONFIG);
            return false;
        }
        return true;
    }

    bool IfUpDownActivator::bring_up_interface(const std::string_view interface_name)
    {
        return alter({"ifup", std::string(interface_name)});
    }

    bool IfUpDownActivator::bring_down_interface(const std::string_view interface_name)
    {
        return alter({"ifdown", std::string(interface_name)});
    }
}
