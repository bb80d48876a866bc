#include "execai/security/policy.hpp"

#include "execai/common/fs.hpp"

#include <algorithm>

namespace execai::security {

const std::vector<std::string_view> &dangerous_command_patterns() {
  static const std::vector<std::string_view> patterns = {
      // removal and secure wipe
      "rm ", "rmdir", "unlink ", "shred", "srm ", "wipe ",
      // disks and filesystems
      "mkfs", "format ", "fdisk", "parted", "dd if=", "mkswap",
      // privilege escalation
      "sudo", "su -", "su root", "doas ", "passwd", "visudo",
      // permissions and ownership
      "chmod 777", "chmod -r", "chown", "chgrp",
      // services and processes
      "systemctl", "service ", "kill ", "killall", "pkill", "shutdown", "reboot", "halt",
      "poweroff", "init 0", "init 6",
      // firewall and network
      "iptables", "ip6tables", "nft ", "ufw ", "ifconfig", "ip link", "route ",
      // history and logs
      "history -c", "/var/log", "truncate ",
      // misc
      "mount ", "umount", "crontab", ":(){", "> /dev/",
  };
  return patterns;
}

std::optional<std::string> find_dangerous_pattern(const std::string &command) {
  const std::string lowered = common::to_lower(command);
  for (const auto pattern : dangerous_command_patterns()) {
    if (lowered.find(pattern) != std::string::npos) {
      return std::string(pattern);
    }
  }
  return std::nullopt;
}

bool is_safe_command(const std::string &command) {
  return !find_dangerous_pattern(command).has_value();
}

std::string base_command(const std::string &command) {
  const std::string trimmed = common::trim(command);
  if (trimmed.empty()) {
    return "";
  }

  const auto space = trimmed.find_first_of(" \t");
  std::string first = space == std::string::npos ? trimmed : trimmed.substr(0, space);

  const auto slash = first.find_last_of('/');
  if (slash != std::string::npos) {
    first = first.substr(slash + 1);
  }

  return common::to_lower(first);
}

bool is_command_allowlisted(const std::string &command,
                            const std::vector<std::string> &allowed_commands) {
  const std::string base = base_command(command);
  if (base.empty()) {
    return false;
  }

  return std::any_of(allowed_commands.begin(), allowed_commands.end(),
                     [&](const std::string &allowed) {
                       return common::to_lower(common::trim(allowed)) == base;
                     });
}

} // namespace execai::security
