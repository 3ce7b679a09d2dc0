#ifndef NETACT_TEST_SUPPORT_HPP
#define NETACT_TEST_SUPPORT_HPP

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "NetAct/System/System.hpp"
#include "NetAct/Util/Format.hpp"

namespace NetAct::Test
{
    // Scripted host: every command succeeds with empty output unless told otherwise
    class FakeSystem : public System
    {
    public:
        std::vector<Command> commands;
        std::vector<std::pair<std::string, bool>> link_changes;

        std::map<Command, tl::expected<CommandOutput, Error>> responses;
        std::set<std::string> executables;
        std::set<std::string> files;
        std::set<std::string> dirs;
        std::set<std::string> failing_links;
        std::set<Command> throwing;
        std::vector<std::string> path{"/usr/sbin", "/usr/bin", "/sbin", "/bin"};

        void respond(const Command& command, std::string out, std::string err = {})
        {
            responses.insert_or_assign(command, CommandOutput{std::move(out), std::move(err)});
        }

        void fail(const Command& command, const std::string& err = "failure")
        {
            responses.insert_or_assign(command, tl::unexpected(Error{
                                           ErrorCode::ProcessExecutionError,
                                           "Unexpected error while running command.\nCommand: " +
                                           format_list(command) + "\nExit code: 1\nStderr: " + err
                                       }));
        }

        tl::expected<CommandOutput, Error> run(const Command& command) override
        {
            commands.push_back(command);
            if (throwing.contains(command))
            {
                throw std::logic_error("runner rejected " + format_list(command));
            }
            if (const auto it = responses.find(command); it != responses.end())
            {
                return it->second;
            }
            return CommandOutput{};
        }

        std::optional<std::string> which(const std::string_view program,
                                         const std::vector<std::string>& search) override
        {
            if (program.find('/') != std::string_view::npos)
            {
                if (executables.contains(std::string(program)))
                {
                    return std::string(program);
                }
                return std::nullopt;
            }
            for (const auto& directory : search.empty() ? path : search)
            {
                std::string candidate = directory + "/" + std::string(program);
                if (executables.contains(candidate))
                {
                    return candidate;
                }
            }
            return std::nullopt;
        }

        bool is_file(const std::string_view file) override
        {
            return files.contains(std::string(file));
        }

        bool is_dir(const std::string_view dir) override
        {
            return dirs.contains(std::string(dir));
        }

        tl::expected<void, Error> set_link_state(const std::string_view interface_name, const bool up) override
        {
            link_changes.emplace_back(std::string(interface_name), up);
            if (failing_links.contains(std::string(interface_name)))
            {
                return tl::unexpected(Error{
                    ErrorCode::LinkStateError, "Failed to change link state of " + std::string(interface_name)
                });
            }
            return {};
        }
    };

    // Temporary file the logger under test writes to
    inline std::string make_log_path(const std::string_view name)
    {
        std::string pattern = "/tmp/netact_" + std::string(name) + "_XXXXXX";
        const int fd = mkstemp(pattern.data());
        if (fd >= 0)
        {
            close(fd);
        }
        return pattern;
    }

    inline std::string read_file(const std::string& path)
    {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    // Whether a line logged at the given level ('W', 'D', ...) contains text
    inline bool has_log_line(const std::string& log, const char level, const std::string_view text)
    {
        std::istringstream lines(log);
        std::string line;
        while (std::getline(lines, line))
        {
            if (!line.empty() && line.front() == level && line.find(text) != std::string::npos)
            {
                return true;
            }
        }
        return false;
    }

    inline bool mentions(const std::string& log, const std::string_view text)
    {
        return log.find(text) != std::string::npos;
    }

    class TestReport
    {
    public:
        void check(const bool condition, const std::string_view what)
        {
            if (condition)
            {
                std::cout << "PASS: " << what << std::endl;
            }
            else
            {
                std::cerr << "FAIL: " << what << std::endl;
                ++failures_;
            }
        }

        [[nodiscard]] int result() const
        {
            return failures_ == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
        }

    private:
        int failures_{0};
    };
}

#endif //NETACT_TEST_SUPPORT_HPP
