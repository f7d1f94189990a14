/**
 * @file system_utils.hpp
 * @brief System utilities and validation for ipam-portmap
 * @author ipam-portmap Development Team
 * @date 2024
 *
 * This file contains the SystemUtils class responsible for checking that the
 * host can run the packet filter commands a port mapping needs.
 */

#pragma once

#include "config.hpp"
#include <string>
#include <vector>

namespace ipam {

/**
 * @class SystemUtils
 * @brief System validation helper class
 *
 * Mutating commands call validateSystemRequirements() before touching the
 * packet filter, so a missing binary or privilege is reported up front
 * instead of half way through a port mapping.
 */
class SystemUtils {
public:
    /**
     * @brief Check if the current process is running with root privileges
     * @return true if the effective user ID is 0
     */
    static bool isRunningAsRoot();

    /**
     * @brief Get the name of the effective user
     * @return Username, or "unknown" if it cannot be resolved
     */
    static std::string getCurrentUser();

    /**
     * @brief Validate all system requirements for packet filter operations
     * @param firewall Firewall settings naming the binaries and the sudo mode
     * @return Vector of error messages, empty if all requirements are met
     *
     * Without sudo the process itself must be root. The iptables and
     * iptables-save binaries (and sudo when enabled) must be on the PATH.
     */
    static std::vector<std::string> validateSystemRequirements(const FirewallConfig& firewall);
};

} // namespace ipam
