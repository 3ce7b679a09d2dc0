#ifndef NETACT_LOGGER_HPP
#define NETACT_LOGGER_HPP

#include <optional>
#include <string_view>

#include <xtr/logger.hpp>

namespace NetAct
{
    /**
     * @brief Process-wide logger shared by every NetAct component
     *
     * Created on first use. Writes to the file named by NETACT_LOG_FILE when
     * it is set, to stderr otherwise.
     */
    xtr::logger& netact_logger();

    std::optional<xtr::log_level_t> parse_log_level(std::string_view name);
}

#endif //NETACT_LOGGER_HPP
