#include "NetAct/System/Subprocess.hpp"
#include "NetAct/Util/Format.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

using tl::unexpected;

namespace NetAct
{
    namespace
    {
        Error execution_error(const Command& command, const std::string& exit_code, const std::string& reason,
                              const std::string& out, const std::string& err)
        {
            return Error{
                ErrorCode::ProcessExecutionError,
                std::format("Unexpected error while running command.\n"
                            "Command: {}\n"
                            "Exit code: {}\n"
                            "Reason: {}\n"
                            "Stdout: {}\n"
                            "Stderr: {}",
                            format_list(command), exit_code, reason, out, err)
            };
        }

        void close_fd(int& fd)
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }

        // Owns both ends of a pipe; the child's ends are closed after spawning
        struct Pipe
        {
            int read_fd{-1};
            int write_fd{-1};

            ~Pipe()
            {
                close_fd(read_fd);
                close_fd(write_fd);
            }

            bool open()
            {
                int fds[2];
                if (pipe2(fds, O_CLOEXEC) < 0)
                {
                    return false;
                }
                read_fd = fds[0];
                write_fd = fds[1];
                return true;
            }
        };

        // Reads both pipes until the child closes them, so neither can fill up and block it
        void drain(Pipe& out_pipe, Pipe& err_pipe, std::string& out, std::string& err)
        {
            std::array<char, 4096> buffer{};
            std::array<pollfd, 2> fds{
                pollfd{out_pipe.read_fd, POLLIN, 0},
                pollfd{err_pipe.read_fd, POLLIN, 0}
            };
            std::array<std::string*, 2> sinks{&out, &err};
            int open_count = 2;

            while (open_count > 0)
            {
                if (poll(fds.data(), fds.size(), -1) < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    break;
                }
                for (size_t i = 0; i < fds.size(); ++i)
                {
                    if (fds[i].fd < 0 || fds[i].revents == 0)
                    {
                        continue;
                    }
                    const ssize_t len = ::read(fds[i].fd, buffer.data(), buffer.size());
                    if (len > 0)
                    {
                        sinks[i]->append(buffer.data(), static_cast<size_t>(len));
                        continue;
                    }
                    if (len < 0 && errno == EINTR)
                    {
                        continue;
                    }
                    // EOF or a hard error: stop watching this stream
                    fds[i].fd = -1;
                    --open_count;
                }
            }
            close_fd(out_pipe.read_fd);
            close_fd(err_pipe.read_fd);
        }
    }

    tl::expected<CommandOutput, Error> run_subprocess(const Command& command)
    {
        if (command.empty())
        {
            return unexpected(execution_error(command, "-", "empty command", "", ""));
        }

        Pipe out_pipe;
        Pipe err_pipe;
        if (!out_pipe.open() || !err_pipe.open())
        {
            return unexpected(execution_error(command, "-", std::format("pipe2 failed: {}", strerror(errno)), "",
                                              ""));
        }

        posix_spawn_file_actions_t actions;
        if (const int rc = posix_spawn_file_actions_init(&actions); rc != 0)
        {
            return unexpected(execution_error(command, "-", std::format("posix_spawn_file_actions_init: {}",
                                                                        strerror(rc)), "", ""));
        }
        int action_rc = posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        if (action_rc == 0)
        {
            action_rc = posix_spawn_file_actions_adddup2(&actions, out_pipe.write_fd, STDOUT_FILENO);
        }
        if (action_rc == 0)
        {
            action_rc = posix_spawn_file_actions_adddup2(&actions, err_pipe.write_fd, STDERR_FILENO);
        }
        if (action_rc != 0)
        {
            posix_spawn_file_actions_destroy(&actions);
            return unexpected(execution_error(command, "-", std::format("posix_spawn_file_actions: {}",
                                                                        strerror(action_rc)), "", ""));
        }

        std::vector<char*> argv;
        argv.reserve(command.size() + 1);
        for (const auto& arg : command)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        pid_t pid = -1;
        const int spawn_rc = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        close_fd(out_pipe.write_fd);
        close_fd(err_pipe.write_fd);

        if (spawn_rc != 0)
        {
            return unexpected(execution_error(command, "-", std::format("[Errno {}] {}: '{}'", spawn_rc,
                                                                        strerror(spawn_rc), command.front()), "",
                                              ""));
        }

        CommandOutput output;
        drain(out_pipe, err_pipe, output.out, output.err);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
            {
                return unexpected(execution_error(command, "-", std::format("waitpid failed: {}", strerror(errno)),
                                                  output.out, output.err));
            }
        }

        if (WIFSIGNALED(status))
        {
            return unexpected(execution_error(command, "-", std::format("terminated by signal {}",
                                                                        WTERMSIG(status)), output.out,
                                              output.err));
        }
        if (WIFEXITED(status) && WEXITSTATUS(status) != 0)
        {
            return unexpected(execution_error(command, std::to_string(WEXITSTATUS(status)), "-", output.out,
                                              output.err));
        }

        return output;
    }
}
