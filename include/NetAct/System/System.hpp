#ifndef NETACT_SYSTEM_HPP
#define NETACT_SYSTEM_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "NetAct/Util/Error.hpp"

namespace NetAct
{
    using Command = std::vector<std::string>;

    struct CommandOutput
    {
        std::string out;
        std::string err;
    };

    /**
     * @brief Everything an activator needs from the host it runs on
     *
     * Activators never touch processes, files or links directly; they go
     * through this interface so that a probe or an activation can be
     * replayed against a scripted host.
     */
    class System
    {
    public:
        virtual ~System() = default;

        /**
         * @brief Run a command to completion and capture its output
         * @return Captured stdout/stderr, or ProcessExecutionError on a
         *         launch failure, a signal or a non-zero exit status
         */
        virtual tl::expected<CommandOutput, Error> run(const Command& command) = 0;

        /**
         * @brief Locate an executable
         * @param program Bare name, or a path checked as is
         * @param search Directories to try; empty means $PATH
         * @return Full path of the first executable match
         */
        virtual std::optional<std::string> which(std::string_view program,
                                                 const std::vector<std::string>& search) = 0;

        virtual bool is_file(std::string_view path) = 0;
        virtual bool is_dir(std::string_view path) = 0;

        /**
         * @brief Set or clear IFF_UP on a link without touching its configuration
         */
        virtual tl::expected<void, Error> set_link_state(std::string_view interface_name, bool up) = 0;
    };
}

#endif //NETACT_SYSTEM_HPP
