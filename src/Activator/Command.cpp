#include "NetAct/Activator/Command.hpp"
#include "NetAct/Util/Format.hpp"

#include <string>

namespace NetAct
{
    namespace
    {
        bool report_outcome(xtr::sink& s, const tl::expected<CommandOutput, Error>& result,
                            const std::string& what, const bool warn_on_stderr)
        {
            if (!result)
            {
                XTR_LOGL(warning, s, "Running interface command {} failed: {}", what, result.error().message);
                return false;
            }

            if (const std::string& err = result->err; !err.empty())
            {
                if (warn_on_stderr)
                {
                    XTR_LOGL(warning, s, "Received stderr output: {}", err);
                }
                else
                {
                    XTR_LOGL(debug, s, "Received stderr output: {}", err);
                }
            }
            return true;
        }
    }

    bool alter_interface_callable(xtr::sink& s, const CommandCallable& callable, const bool warn_on_stderr)
    {
        return report_outcome(s, callable(), "<callable>", warn_on_stderr);
    }

    bool alter_interface(System& system, xtr::sink& s, const Command& command, const bool warn_on_stderr)
    {
        return report_outcome(s, system.run(command), format_list(command), warn_on_stderr);
    }
}
