#include "test_framework.hpp"

#include "execai/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <fstream>

void register_config_tests(std::vector<execai::tests::TestCase> &tests) {
  using execai::tests::require;
  namespace cfg = execai::config;
  namespace t = execai::testing;

  tests.push_back({"config_defaults", [] {
                     const cfg::Config config;
                     require(config.executor.default_timeout_secs == 300, "default timeout");
                     require(config.executor.shell == "/bin/sh", "default shell");
                     require(config.safety.safe_mode, "safe mode on by default");
                     require(config.scheduler.enabled, "scheduler enabled by default");
                     require(config.scheduler.default_max_retries == 3, "default retries");
                     require(config.observability.backend == "log", "default backend");
                   }});

  tests.push_back({"config_parse_overrides_defaults", [] {
                     auto parsed = cfg::parse_config("[executor]\n"
                                                     "default_timeout_secs = 42\n"
                                                     "max_output_bytes = 4096\n"
                                                     "[safety]\n"
                                                     "safe_mode = false\n"
                                                     "allowed_commands = [\"git\"]\n"
                                                     "[scheduler]\n"
                                                     "enabled = false\n"
                                                     "poll_interval_ms = 250\n"
                                                     "[observability]\n"
                                                     "backend = \"none\"\n"
                                                     "level = \"debug\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.executor.default_timeout_secs == 42, "timeout");
                     require(config.executor.max_output_bytes == 4096, "output cap");
                     require(!config.safety.safe_mode, "safe mode");
                     require(config.safety.allowed_commands.size() == 1 &&
                                 config.safety.allowed_commands[0] == "git",
                             "allow-list");
                     require(!config.scheduler.enabled, "scheduler disabled");
                     require(config.scheduler.poll_interval_ms == 250, "poll interval");
                     require(config.scheduler.error_backoff_ms == 5000, "untouched key keeps default");
                     require(config.observability.backend == "none", "backend");
                     require(config.observability.level == "debug", "level");
                   }});

  tests.push_back({"config_parse_reports_syntax_errors", [] {
                     auto parsed = cfg::parse_config("[executor]\nbroken line\n");
                     require(!parsed.ok(), "malformed toml should fail");
                     require(parsed.code() == execai::common::ErrorCode::Validation,
                             "syntax errors are validation errors");
                   }});

  tests.push_back({"config_validate_hard_errors_and_warnings", [] {
                     cfg::Config config;
                     auto ok = cfg::validate_config(config);
                     require(ok.ok(), ok.error());

                     config.safety.safe_mode = false;
                     auto warned = cfg::validate_config(config);
                     require(warned.ok(), warned.error());
                     require(!warned.value().empty(), "disabled safe mode should warn");

                     cfg::Config bad_timeout;
                     bad_timeout.executor.default_timeout_secs = 0;
                     require(!cfg::validate_config(bad_timeout).ok(), "zero timeout rejected");

                     cfg::Config bad_backend;
                     bad_backend.observability.backend = "prometheus";
                     require(!cfg::validate_config(bad_backend).ok(), "unknown backend rejected");

                     cfg::Config bad_level;
                     bad_level.observability.level = "chatty";
                     require(!cfg::validate_config(bad_level).ok(), "unknown level rejected");

                     cfg::Config bad_poll;
                     bad_poll.scheduler.poll_interval_ms = 0;
                     require(!cfg::validate_config(bad_poll).ok(), "zero poll interval rejected");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     t::EnvGuard safe("EXECAI_SAFE_MODE", "off");
                     t::EnvGuard enabled("EXECAI_SCHEDULER_ENABLED", "0");
                     t::EnvGuard timeout("EXECAI_DEFAULT_TIMEOUT", "15");
                     t::EnvGuard level("EXECAI_LOG_LEVEL", " WARN ");

                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(!config.safety.safe_mode, "safe mode override");
                     require(!config.scheduler.enabled, "scheduler override");
                     require(config.executor.default_timeout_secs == 15, "timeout override");
                     require(config.observability.level == "warn", "level override");
                   }});

  tests.push_back({"config_env_overrides_ignore_garbage", [] {
                     t::EnvGuard safe("EXECAI_SAFE_MODE", "maybe");
                     t::EnvGuard timeout("EXECAI_DEFAULT_TIMEOUT", "ten");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.safety.safe_mode, "unparseable bool keeps value");
                     require(config.executor.default_timeout_secs == 300,
                             "unparseable int keeps value");
                   }});

  tests.push_back({"config_save_and_load_round_trip", [] {
                     t::TempWorkspace workspace;
                     t::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     t::EnvGuard safe("EXECAI_SAFE_MODE", std::nullopt);
                     t::EnvGuard timeout("EXECAI_DEFAULT_TIMEOUT", std::nullopt);
                     t::EnvGuard level("EXECAI_LOG_LEVEL", std::nullopt);
                     t::EnvGuard enabled("EXECAI_SCHEDULER_ENABLED", std::nullopt);

                     require(!cfg::config_exists(), "fresh workspace has no config");
                     auto defaults = cfg::load_config();
                     require(defaults.ok(), defaults.error());
                     require(defaults.value().executor.default_timeout_secs == 300,
                             "missing file yields defaults");

                     cfg::Config config;
                     config.executor.default_timeout_secs = 77;
                     config.safety.allowed_commands = {"ls", "cat"};
                     config.observability.level = "error";
                     auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "config should exist after save");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().executor.default_timeout_secs == 77, "timeout");
                     require(loaded.value().safety.allowed_commands.size() == 2, "allow-list");
                     require(loaded.value().observability.level == "error", "level");
                   }});

  tests.push_back({"config_path_honours_directory_override", [] {
                     t::TempWorkspace workspace;
                     t::ConfigOverrideGuard guard(workspace.path());
                     auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == workspace.path() / "config.toml",
                             "directory override should resolve to config.toml inside it");
                   }});

  tests.push_back({"config_dotenv_fills_missing_variables_only", [] {
                     t::TempWorkspace workspace;
                     t::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     t::EnvGuard env_file("EXECAI_ENV_FILE", std::nullopt);
                     t::EnvGuard timeout("EXECAI_DEFAULT_TIMEOUT", std::nullopt);
                     t::EnvGuard level("EXECAI_LOG_LEVEL", "info");
                     t::EnvGuard safe("EXECAI_SAFE_MODE", std::nullopt);
                     t::EnvGuard enabled("EXECAI_SCHEDULER_ENABLED", std::nullopt);
                     workspace.create_file(".env", "# comment\n"
                                                   "export EXECAI_DEFAULT_TIMEOUT=\"33\"\n"
                                                   "EXECAI_LOG_LEVEL=debug\n");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().executor.default_timeout_secs == 33,
                             "dotenv value should apply");
                     require(loaded.value().observability.level == "info",
                             "existing environment should win over dotenv");
                   }});
}
