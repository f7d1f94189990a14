#include "system_utils.hpp"
#include "command_executor.hpp"
#include <cstdlib>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace ipam {

bool SystemUtils::isRunningAsRoot() {
    // Effective, not real, user ID decides what the packet filter allows
    return geteuid() == 0;
}

std::string SystemUtils::getCurrentUser() {
    struct passwd* pw = getpwuid(geteuid());
    if (pw) {
        return std::string(pw->pw_name);
    }
    return "unknown";
}

std::vector<std::string> SystemUtils::validateSystemRequirements(const FirewallConfig& firewall) {
    std::vector<std::string> errors;

    if (firewall.use_sudo) {
        if (!CommandExecutor::isAvailable("sudo")) {
            errors.push_back("sudo command not found in system PATH, but firewall.use_sudo is enabled");
        }
    } else if (!isRunningAsRoot()) {
        errors.push_back("Modifying iptables rules without sudo requires root privileges");
        errors.push_back("Debug: Current user is " + getCurrentUser() + " (effective UID " +
                         std::to_string(geteuid()) + ")");
        errors.push_back("Debug: Run as root or set firewall.use_sudo to true");
    }

    const std::vector<std::string> programs = {firewall.iptables, firewall.iptables_save};
    for (const auto& program : programs) {
        if (!CommandExecutor::isAvailable(program)) {
            errors.push_back(program + " command not found in system PATH");
        }
    }
    if (!errors.empty()) {
        const char* path = std::getenv("PATH");
        if (path) {
            errors.push_back("Debug: Current PATH: " + std::string(path));
        }
    }

    return errors;
}

} // namespace ipam
