#ifndef NETACT_CONFIG_HPP
#define NETACT_CONFIG_HPP

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace NetAct
{
    namespace Config
    {
        constexpr const char* PRIORITY_ENV = "NETACT_PRIORITY";
        constexpr const char* LOG_LEVEL_ENV = "NETACT_LOG_LEVEL";
        constexpr const char* LOG_FILE_ENV = "NETACT_LOG_FILE";
        constexpr const char* TARGET_ROOT_ENV = "NETACT_TARGET_ROOT";

        constexpr const char* DEFAULT_LOG_LEVEL = "info";

        // Splits "a, b,,c" into {"a", "b", "c"}
        inline std::vector<std::string> split_priority(std::string_view value)
        {
            std::vector<std::string> result;
            while (!value.empty())
            {
                const auto comma = value.find(',');
                auto item = value.substr(0, comma);
                while (!item.empty() && (item.front() == ' ' || item.front() == '\t'))
                {
                    item.remove_prefix(1);
                }
                while (!item.empty() && (item.back() == ' ' || item.back() == '\t'))
                {
                    item.remove_suffix(1);
                }
                if (!item.empty())
                {
                    result.emplace_back(item);
                }
                if (comma == std::string_view::npos)
                {
                    break;
                }
                value.remove_prefix(comma + 1);
            }
            return result;
        }

        // Activator priority requested by the environment, if any
        inline std::optional<std::vector<std::string>> get_priority()
        {
            const char* env_value = getenv(PRIORITY_ENV);
            if (!env_value)
            {
                return std::nullopt;
            }
            return split_priority(env_value);
        }

        inline std::string get_log_level()
        {
            if (const char* env_value = getenv(LOG_LEVEL_ENV); env_value && *env_value)
            {
                return std::string(env_value);
            }
            return std::string(DEFAULT_LOG_LEVEL);
        }

        inline std::optional<std::string> get_log_file()
        {
            if (const char* env_value = getenv(LOG_FILE_ENV); env_value && *env_value)
            {
                return std::string(env_value);
            }
            return std::nullopt;
        }

        // Root prepended to every probed path, empty for the running system
        inline std::string get_target_root()
        {
            if (const char* env_value = getenv(TARGET_ROOT_ENV))
            {
                std::string root(env_value);
                while (root.size() > 1 && root.back() == '/')
                {
                    root.pop_back();
                }
                return root == "/" ? std::string() : root;
            }
            return {};
        }
    }
}

#endif //NETACT_CONFIG_HPP
