#include "NetAct/Util/Logger.hpp"
#include "NetAct/Config.hpp"

namespace NetAct
{
    namespace
    {
        xtr::logger make_logger()
        {
            if (const auto path = Config::get_log_file())
            {
                return xtr::logger(path->c_str());
            }
            return xtr::logger();
        }
    }

    xtr::logger& netact_logger()
    {
        static xtr::logger log = make_logger();
        return log;
    }

    std::optional<xtr::log_level_t> parse_log_level(const std::string_view name)
    {
        using enum xtr::log_level_t;
        if (name == "none")
        {
            return none;
        }
        if (name == "fatal")
        {
            return fatal;
        }
        if (name == "error")
        {
            return error;
        }
        if (name == "warning" || name == "warn")
        {
            return warning;
        }
        if (name == "info")
        {
            return info;
        }
        if (name == "debug")
        {
            return debug;
        }
        return std::nullopt;
    }
}
