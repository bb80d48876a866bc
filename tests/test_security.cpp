#include "test_framework.hpp"

#include "execai/security/policy.hpp"

void register_security_tests(std::vector<execai::tests::TestCase> &tests) {
  using execai::tests::require;
  namespace sec = execai::security;

  tests.push_back({"security_benign_commands_are_safe", [] {
                     for (const std::string command :
                          {"ls -la", "echo hello", "date", "pwd", "cat README.md", "uname -a"}) {
                       require(sec::is_safe_command(command), "should be safe: " + command);
                     }
                   }});

  tests.push_back({"security_dangerous_commands_are_flagged", [] {
                     for (const std::string command :
                          {"rm -rf /tmp/x", "sudo ls", "mkfs.ext4 /dev/sda1", "dd if=/dev/zero of=x",
                           "chmod 777 file", "shutdown -h now", "systemctl stop nginx",
                           "iptables -F", "history -c", "crontab -r", ":(){ :|:& };:"}) {
                       require(!sec::is_safe_command(command), "should be dangerous: " + command);
                     }
                   }});

  tests.push_back({"security_matching_is_case_insensitive_substring", [] {
                     require(!sec::is_safe_command("echo ok && SUDO reboot"), "uppercase caught");
                     const auto pattern = sec::find_dangerous_pattern("ls; RM -r dir");
                     require(pattern.has_value() && *pattern == "rm ", "pattern reported");
                     require(!sec::find_dangerous_pattern("echo fine").has_value(), "no pattern");
                   }});

  tests.push_back({"security_base_command_and_allowlist", [] {
                     require(sec::base_command("  /usr/bin/LS -l") == "ls", "path stripped");
                     require(sec::base_command("").empty(), "empty command");
                     const std::vector<std::string> allowed = {"ls", " Echo "};
                     require(sec::is_command_allowlisted("/bin/ls /tmp", allowed), "ls allowed");
                     require(sec::is_command_allowlisted("echo hi", allowed), "echo allowed");
                     require(!sec::is_command_allowlisted("cat file", allowed), "cat not allowed");
                     require(!sec::is_command_allowlisted("   ", allowed), "blank not allowed");
                   }});
}
