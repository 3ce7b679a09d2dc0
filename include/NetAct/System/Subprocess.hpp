#ifndef NETACT_SUBPROCESS_HPP
#define NETACT_SUBPROCESS_HPP

#include <tl/expected.hpp>

#include "NetAct/System/System.hpp"
#include "NetAct/Util/Error.hpp"

namespace NetAct
{
    /**
     * @brief Spawn a command, wait for it and capture stdout and stderr separately
     *
     * The program is looked up on $PATH and inherits the caller's environment.
     * Blocks until the child exits; there is no timeout.
     *
     * @return The captured output when the command exits with status 0,
     *         ProcessExecutionError otherwise (spawn failure, signal, non-zero exit)
     */
    tl::expected<CommandOutput, Error> run_subprocess(const Command& command);
}

#endif //NETACT_SUBPROCESS_HPP
