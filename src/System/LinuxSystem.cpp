#include "NetAct/System/LinuxSystem.hpp"
#include "NetAct/System/Subprocess.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace NetAct
{
    LinuxSystem::LinuxSystem(std::string target_root) : target_root_(std::move(target_root))
    {
    }

    std::string LinuxSystem::target_path(const std::string_view path) const
    {
        if (target_root_.empty())
        {
            return std::string(path);
        }
        std::string relative(path);
        while (!relative.empty() && relative.front() == '/')
        {
            relative.erase(0, 1);
        }
        return (fs::path(target_root_) / relative).string();
    }

    bool LinuxSystem::is_executable(const std::string_view path) const
    {
        const std::string full = target_path(path);
        std::error_code ec;
        return fs::is_regular_file(full, ec) && access(full.c_str(), X_OK) == 0;
    }

    tl::expected<CommandOutput, Error> LinuxSystem::run(const Command& command)
    {
        return run_subprocess(command);
    }

    std::optional<std::string> LinuxSystem::which(const std::string_view program,
                                                  const std::vector<std::string>& search)
    {
        if (program.find('/') != std::string_view::npos)
        {
            if (is_executable(program))
            {
                return std::string(program);
            }
            return std::nullopt;
        }

        std::vector<std::string> directories;
        if (search.empty())
        {
            const char* env_path = getenv("PATH");
            std::string_view remaining = env_path ? env_path : "";
            while (!remaining.empty())
            {
                const auto colon = remaining.find(':');
                std::string entry(remaining.substr(0, colon));
                if (entry.size() >= 2 && entry.front() == '"' && entry.back() == '"')
                {
                    entry = entry.substr(1, entry.size() - 2);
                }
                // Relative PATH entries are ignored
                if (fs::path(entry).is_absolute())
                {
                    directories.push_back(std::move(entry));
                }
                if (colon == std::string_view::npos)
                {
                    break;
                }
                remaining.remove_prefix(colon + 1);
            }
        }
        else
        {
            for (const auto& directory : search)
            {
                directories.push_back(fs::absolute(directory).lexically_normal().string());
            }
        }

        for (const auto& directory : directories)
        {
            std::string candidate = (fs::path(directory) / program).string();
            if (is_executable(candidate))
            {
                return candidate;
            }
        }
        return std::nullopt;
    }

    bool LinuxSystem::is_file(const std::string_view path)
    {
        std::error_code ec;
        return fs::is_regular_file(target_path(path), ec);
    }

    bool LinuxSystem::is_dir(const std::string_view path)
    {
        std::error_code ec;
        return fs::is_directory(target_path(path), ec);
    }

    tl::expected<void, Error> LinuxSystem::set_link_state(const std::string_view interface_name, const bool up)
    {
        if (!link_manager_.initialized())
        {
            if (auto result = link_manager_.initialize(); !result)
            {
                return result;
            }
        }
        return link_manager_.set_link_state(interface_name, up);
    }
}
