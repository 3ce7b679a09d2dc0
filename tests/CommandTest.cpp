#include <iostream>
#include <stdexcept>
#include <string>

#include <xtr/logger.hpp>

#include "NetAct/Activator/Command.hpp"
#include "TestSupport.hpp"

using NetAct::alter_interface, NetAct::alter_interface_callable, NetAct::CommandOutput, NetAct::Error;
using NetAct::ErrorCode;
using namespace NetAct::Test;

int main()
{
    TestReport report;
    const std::string log_path = make_log_path("command");

    std::cout << "--- NetAct Command Bridge Test ---" << std::endl;

    {
        xtr::logger log(log_path.c_str());
        xtr::sink s = log.get_sink("CommandTest");
        s.set_level(xtr::log_level_t::debug);
        FakeSystem system;

        // --- Test 1: Clean success ---
        std::cout << "\nTEST 1: Command succeeding without stderr..." << std::endl;
        system.respond({"ifup", "eth0"}, "", "");
        report.check(alter_interface(system, s, {"ifup", "eth0"}), "clean command returns true");
        report.check(system.commands.size() == 1 && system.commands[0] == NetAct::Command{"ifup", "eth0"},
                     "command is run exactly once as given");

        // --- Test 2: stderr on success is a warning by default ---
        std::cout << "\nTEST 2: Command succeeding with stderr..." << std::endl;
        system.respond({"ifup", "eth1"}, "", "eth1: link is not ready");
        report.check(alter_interface(system, s, {"ifup", "eth1"}), "command with stderr still returns true");

        // --- Test 3: expected stderr is only debug ---
        std::cout << "\nTEST 3: Command succeeding with expected stderr..." << std::endl;
        system.respond({"netplan", "apply"}, "", "netplan generated progress");
        report.check(alter_interface(system, s, {"netplan", "apply"}, false),
                     "command with expected stderr returns true");

        // --- Test 4: execution failure becomes false ---
        std::cout << "\nTEST 4: Command exiting non-zero..." << std::endl;
        system.fail({"ifdown", "eth9"}, "unknown interface eth9");
        bool raised = false;
        bool result = true;
        try
        {
            result = alter_interface(system, s, {"ifdown", "eth9"});
        }
        catch (const std::exception&)
        {
            raised = true;
        }
        report.check(!raised && !result, "failed command returns false without raising");

        // --- Test 5: callable reporting an error ---
        std::cout << "\nTEST 5: Callable returning an error..." << std::endl;
        const bool callable_result = alter_interface_callable(s, []() -> tl::expected<CommandOutput, Error>
        {
            return tl::unexpected(Error{ErrorCode::LinkStateError, "link eth5 refused to change"});
        });
        report.check(!callable_result, "failing callable returns false");

        // --- Test 6: callable output ---
        std::cout << "\nTEST 6: Callable succeeding with stderr..." << std::endl;
        int calls = 0;
        const bool ok = alter_interface_callable(s, [&]() -> tl::expected<CommandOutput, Error>
        {
            ++calls;
            return CommandOutput{"", "callable noise"};
        });
        report.check(ok && calls == 1, "callable is invoked once and succeeds");

        // --- Test 7: anything thrown propagates unchanged ---
        std::cout << "\nTEST 7: Callable throwing..." << std::endl;
        std::string propagated;
        try
        {
            (void)alter_interface_callable(s, []() -> tl::expected<CommandOutput, Error>
            {
                throw std::logic_error("malformed command");
            });
        }
        catch (const std::logic_error& e)
        {
            propagated = e.what();
        }
        report.check(propagated == "malformed command", "unclassified exception propagates unchanged");

        // --- Test 8: a throwing runner propagates through alter_interface ---
        std::cout << "\nTEST 8: Command runner throwing..." << std::endl;
        system.throwing.insert(NetAct::Command{"ifup", "bad0"});
        std::string runner_error;
        try
        {
            (void)alter_interface(system, s, {"ifup", "bad0"});
        }
        catch (const std::logic_error& e)
        {
            runner_error = e.what();
        }
        report.check(runner_error == "runner rejected ['ifup', 'bad0']",
                     "exception from the runner propagates unchanged");
        report.check(system.commands.back() == NetAct::Command{"ifup", "bad0"}, "command reached the runner");

        s.sync();
        const std::string contents = read_file(log_path);

        report.check(!mentions(contents, "ifup', 'eth0"), "clean success logs nothing");
        report.check(has_log_line(contents, 'W', "Received stderr output: eth1: link is not ready"),
                     "stderr is logged at warning by default");
        report.check(has_log_line(contents, 'D', "Received stderr output: netplan generated progress") &&
                     !has_log_line(contents, 'W', "netplan generated progress"),
                     "expected stderr is logged at debug only");
        report.check(has_log_line(contents, 'W', "Running interface command ['ifdown', 'eth9'] failed"),
                     "failure is logged at warning with the command");
        report.check(has_log_line(contents, 'W', "link eth5 refused to change"),
                     "callable failure is logged at warning");
        report.check(has_log_line(contents, 'W', "Received stderr output: callable noise"),
                     "callable stderr is logged at warning");
        report.check(!mentions(contents, "bad0"), "propagated exception is not logged as a failure");
    }

    unlink(log_path.c_str());
    std::cout << "\n--- NetAct Command Bridge Test Finished ---" << std::endl;
    return report.result();
}
