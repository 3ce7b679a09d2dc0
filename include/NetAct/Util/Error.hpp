#ifndef NETACT_ERROR_HPP
#define NETACT_ERROR_HPP

#include <string>
#include <utility>

namespace NetAct
{
    enum class ErrorCode
    {
        // Selection
        UnknownActivator,
        NoActivatorAvailable,

        // Activator contract
        WaitNotSupported,

        // Subprocess
        ProcessExecutionError,

        // Netlink
        NlSocketAllocError,
        NlConnectError,
        LinkCacheError,
        InterfaceNotFound,
        LinkStateError,
    };

    struct Error
    {
        Error(const ErrorCode c, std::string msg) : code(c), message(std::move(msg))
        {
        }

        ErrorCode code;
        std::string message;
    };
}
#endif //NETACT_ERROR_HPP
