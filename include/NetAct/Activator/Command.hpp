#ifndef NETACT_ACTIVATOR_COMMAND_HPP
#define NETACT_ACTIVATOR_COMMAND_HPP

#include <functional>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "NetAct/System/System.hpp"
#include "NetAct/Util/Error.hpp"

namespace NetAct
{
    using CommandCallable = std::function<tl::expected<CommandOutput, Error>()>;

    /**
     * @brief Run an operation that alters an interface and reduce its outcome to a bool
     *
     * Non-empty stderr from a successful run is logged at warning, or at debug
     * when warn_on_stderr is false. A returned Error is logged at warning and
     * becomes false. Exceptions thrown by the callable are not caught.
     */
    bool alter_interface_callable(xtr::sink& s, const CommandCallable& callable, bool warn_on_stderr = true);

    /**
     * @brief alter_interface_callable() for a command run through the given System; failures
     *        are logged together with the command line
     */
    bool alter_interface(System& system, xtr::sink& s, const Command& command, bool warn_on_stderr = true);
}

#endif //NETACT_ACTIVATOR_COMMAND_HPP
