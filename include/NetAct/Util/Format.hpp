#ifndef NETACT_FORMAT_HPP
#define NETACT_FORMAT_HPP

#include <string>
#include <vector>

namespace NetAct
{
    // Renders a list of strings as ['ifup', 'eth0'] for log and error messages
    inline std::string format_list(const std::vector<std::string>& items)
    {
        std::string result = "[";
        for (size_t i = 0; i < items.size(); ++i)
        {
            if (i)
            {
                result += ", ";
            }
            result += '\'';
            result += items[i];
            result += '\'';
        }
        result += ']';
        return result;
    }
}

#endif //NETACT_FORMAT_HPP
