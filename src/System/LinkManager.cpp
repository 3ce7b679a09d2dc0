#include "NetAct/System/LinkManager.hpp"

#include <format>
#include <string>
#include <net/if.h>

#include <netlink/cache.h>
#include <netlink/errno.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/route/link.h>

using tl::unexpected;

namespace NetAct
{
    LinkManager::~LinkManager()
    {
        cleanup();
    }

    tl::expected<void, Error> LinkManager::initialize()
    {
        if (nl_socket_)
        {
            return {};
        }

        nl_socket_ = nl_socket_alloc();
        if (!nl_socket_)
        {
            return unexpected(Error{ErrorCode::NlSocketAllocError, "Failed to allocate netlink socket"});
        }

        if (const int err = nl_connect(nl_socket_, NETLINK_ROUTE); err < 0)
        {
            nl_socket_free(nl_socket_);
            nl_socket_ = nullptr;
            return unexpected(Error{
                ErrorCode::NlConnectError, std::format("Failed to connect to netlink: {}", nl_geterror(err))
            });
        }

        if (const int err = rtnl_link_alloc_cache(nl_socket_, AF_UNSPEC, &link_cache_); err < 0)
        {
            nl_close(nl_socket_);
            nl_socket_free(nl_socket_);
            nl_socket_ = nullptr;
            return unexpected(Error{
                ErrorCode::LinkCacheError, std::format("Failed to allocate link cache: {}", nl_geterror(err))
            });
        }

        return {};
    }

    void LinkManager::cleanup()
    {
        if (link_cache_)
        {
            nl_cache_free(link_cache_);
            link_cache_ = nullptr;
        }
        if (nl_socket_)
        {
            nl_close(nl_socket_);
            nl_socket_free(nl_socket_);
            nl_socket_ = nullptr;
        }
    }

    tl::expected<void, Error> LinkManager::set_link_state(const std::string_view interface_name, const bool up) const
    {
        if (!nl_socket_)
        {
            return unexpected(Error{ErrorCode::NlConnectError, "Netlink socket is not initialized"});
        }

        // Refill so the lookup sees links created after initialize()
        if (nl_cache_refill(nl_socket_, link_cache_) < 0)
        {
            return unexpected(Error{ErrorCode::LinkCacheError, "Failed to refresh link cache"});
        }

        rtnl_link* link = rtnl_link_get_by_name(link_cache_, std::string(interface_name).c_str());
        if (!link)
        {
            return unexpected(Error{
                ErrorCode::InterfaceNotFound, std::format("Interface {} not found", interface_name)
            });
        }

        rtnl_link* change = rtnl_link_alloc();
        if (!change)
        {
            rtnl_link_put(link);
            return unexpected(Error{ErrorCode::LinkStateError, "Failed to allocate change link object"});
        }

        if (up)
        {
            rtnl_link_set_flags(change, IFF_UP);
        }
        else
        {
            rtnl_link_unset_flags(change, IFF_UP);
        }

        const int result = rtnl_link_change(nl_socket_, link, change, 0);

        rtnl_link_put(change);
        rtnl_link_put(link);

        if (result < 0)
        {
            return unexpected(Error{
                ErrorCode::LinkStateError,
                std::format("Failed to bring {} interface {}: {}", up ? "up" : "down", interface_name,
                            nl_geterror(result))
            });
        }

        return {};
    }

    tl::expected<bool, Error> LinkManager::is_up(const std::string_view interface_name) const
    {
        if (!nl_socket_)
        {
            return unexpected(Error{ErrorCode::NlConnectError, "Netlink socket is not initialized"});
        }

        if (nl_cache_refill(nl_socket_, link_cache_) < 0)
        {
            return unexpected(Error{ErrorCode::LinkCacheError, "Failed to refresh link cache"});
        }

        rtnl_link* link = rtnl_link_get_by_name(link_cache_, std::string(interface_name).c_str());
        if (!link)
        {
            return unexpected(Error{
                ErrorCode::InterfaceNotFound, std::format("Interface {} not found", interface_name)
            });
        }

        const bool is_up = (rtnl_link_get_flags(link) & IFF_UP) != 0;
        rtnl_link_put(link);
        return is_up;
    }
}
