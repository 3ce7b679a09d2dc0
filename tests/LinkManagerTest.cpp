#include <iostream>
#include <string>
#include <net/if.h>
#include <unistd.h>

#include <netlink/errno.h>
#include <netlink/netlink.h>
#include <netlink/route/link.h>

#include "NetAct/System/LinkManager.hpp"
#include "NetAct/System/LinuxSystem.hpp"
#include "TestSupport.hpp"

using NetAct::LinkManager, NetAct::ErrorCode;
using NetAct::Test::TestReport;

namespace
{
    constexpr int SKIP_RETURN_CODE = 77;

    // Reads IFF_UP from a fresh kernel query, independent of any link cache
    bool kernel_link_up(const std::string& name)
    {
        nl_sock* sock = nl_socket_alloc();
        if (!sock)
        {
            return false;
        }
        bool up = false;
        if (nl_connect(sock, NETLINK_ROUTE) >= 0)
        {
            rtnl_link* link = nullptr;
            if (rtnl_link_get_kernel(sock, 0, name.c_str(), &link) >= 0)
            {
                up = (rtnl_link_get_flags(link) & IFF_UP) != 0;
                rtnl_link_put(link);
            }
            nl_close(sock);
        }
        nl_socket_free(sock);
        return up;
    }

    // Adds (add == true) or removes a dummy link; returns the libnl error code
    int change_dummy_link(const std::string& name, const bool add)
    {
        nl_sock* sock = nl_socket_alloc();
        if (!sock)
        {
            return -NLE_NOMEM;
        }
        if (const int err = nl_connect(sock, NETLINK_ROUTE); err < 0)
        {
            nl_socket_free(sock);
            return err;
        }
        rtnl_link* link = rtnl_link_alloc();
        if (!link)
        {
            nl_close(sock);
            nl_socket_free(sock);
            return -NLE_NOMEM;
        }
        rtnl_link_set_name(link, name.c_str());
        int result;
        if (add)
        {
            rtnl_link_set_type(link, "dummy");
            result = rtnl_link_add(sock, link, NLM_F_CREATE);
        }
        else
        {
            result = rtnl_link_delete(sock, link);
        }
        rtnl_link_put(link);
        nl_close(sock);
        nl_socket_free(sock);
        return result;
    }
}

int main()
{
    const std::string test_interface_name = "netact_test0";

    std::cout << "--- NetAct Link Manager Test ---" << std::endl;
    std::cout << "INFO: This test requires CAP_NET_ADMIN or root privileges." << std::endl;
    if (geteuid() != 0)
    {
        std::cout << "SKIP: not running as root." << std::endl;
        return SKIP_RETURN_CODE;
    }
    if (const int err = change_dummy_link(test_interface_name, true); err < 0)
    {
        std::cout << "SKIP: cannot create dummy interface: " << nl_geterror(err) << std::endl;
        return SKIP_RETURN_CODE;
    }
    std::cout << "INFO: Using test interface: " << test_interface_name << std::endl;

    TestReport report;
    {
        LinkManager link_manager;
        report.check(link_manager.initialize().has_value(), "netlink socket and link cache are set up");

        // --- Test 1: Set interface UP ---
        std::cout << "\nTEST 1: Bringing UP interface '" << test_interface_name << "'..." << std::endl;
        report.check(link_manager.set_link_state(test_interface_name, true).has_value(), "set_link_state(up)");
        report.check(kernel_link_up(test_interface_name), "interface is flagged UP");
        const auto up = link_manager.is_up(test_interface_name);
        report.check(up && *up, "is_up() agrees");

        // --- Test 2: Set interface DOWN ---
        std::cout << "\nTEST 2: Bringing DOWN interface '" << test_interface_name << "'..." << std::endl;
        report.check(link_manager.set_link_state(test_interface_name, false).has_value(), "set_link_state(down)");
        report.check(!kernel_link_up(test_interface_name), "interface is no longer UP");

        // --- Test 3: Unknown interface ---
        std::cout << "\nTEST 3: Unknown interface..." << std::endl;
        const auto missing = link_manager.set_link_state("netact_missing0", true);
        report.check(!missing && missing.error().code == ErrorCode::InterfaceNotFound,
                     "unknown interface is reported as not found");

        // --- Test 4: LinuxSystem goes through the same path ---
        std::cout << "\nTEST 4: LinuxSystem::set_link_state..." << std::endl;
        NetAct::LinuxSystem system;
        report.check(system.set_link_state(test_interface_name, true).has_value() &&
                     kernel_link_up(test_interface_name), "LinuxSystem brings the link up");
    }

    (void)change_dummy_link(test_interface_name, false);
    std::cout << "\n--- NetAct Link Manager Test Finished ---" << std::endl;
    return report.result();
}
