#ifndef NETACT_LINK_MANAGER_HPP
#define NETACT_LINK_MANAGER_HPP

#include <string_view>

#include <tl/expected.hpp>

#include "NetAct/Util/Error.hpp"

struct nl_sock;
struct nl_cache;

namespace NetAct
{
    /**
     * @brief Toggles link administrative state over rtnetlink (libnl-route)
     *
     * Only IFF_UP is changed; addresses, routes and other link attributes
     * are left alone. Requires CAP_NET_ADMIN for state changes.
     */
    class LinkManager
    {
    private:
        nl_sock* nl_socket_{nullptr};
        nl_cache* link_cache_{nullptr};

    public:
        LinkManager() = default;
        ~LinkManager();

        tl::expected<void, Error> initialize();
        void cleanup();
        [[nodiscard]] bool initialized() const { return nl_socket_ != nullptr; }

        tl::expected<void, Error> set_link_state(std::string_view interface_name, bool up) const;
        tl::expected<bool, Error> is_up(std::string_view interface_name) const;

        LinkManager(const LinkManager&) = delete;
        LinkManager& operator=(const LinkManager&) = delete;
        LinkManager(LinkManager&&) = delete;
        LinkManager& operator=(LinkManager&&) = delete;
    };
}

#endif //NETACT_LINK_MANAGER_HPP
