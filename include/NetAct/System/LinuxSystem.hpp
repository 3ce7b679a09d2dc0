#ifndef NETACT_LINUX_SYSTEM_HPP
#define NETACT_LINUX_SYSTEM_HPP

#include <string>

#include "NetAct/System/LinkManager.hpp"
#include "NetAct/System/System.hpp"

namespace NetAct
{
    /**
     * @brief System backed by the running Linux host
     *
     * File probes and executable lookups are resolved below target_root
     * (empty for "/"); commands and link changes always act on the host.
     */
    class LinuxSystem : public System
    {
    public:
        explicit LinuxSystem(std::string target_root = {});

        tl::expected<CommandOutput, Error> run(const Command& command) override;
        std::optional<std::string> which(std::string_view program,
                                         const std::vector<std::string>& search) override;
        bool is_file(std::string_view path) override;
        bool is_dir(std::string_view path) override;
        tl::expected<void, Error> set_link_state(std::string_view interface_name, bool up) override;

    private:
        std::string target_path(std::string_view path) const;
        bool is_executable(std::string_view path) const;

        std::string target_root_;
        LinkManager link_manager_;
    };
}

#endif //NETACT_LINUX_SYSTEM_HPP
