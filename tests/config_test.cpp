#include "ciforge/config/config.hpp"

#include "test_utils.hpp"

#include <cstdlib>

#include "gtest/gtest.h"

using namespace ciforge;

namespace {

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }
  ScopedEnv(const ScopedEnv &) = delete;
  auto operator=(const ScopedEnv &) -> ScopedEnv & = delete;

private:
  const char *name_;
};

} // namespace

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
  auto cfg = ConfigLoader::load_from_string("");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(*cfg, SystemConfig{});
  EXPECT_EQ(cfg->scheduler.max_runs_per_branch, 2);
  EXPECT_EQ(cfg->runners.count, 4);
  EXPECT_EQ(cfg->intake.port, 8090);
  EXPECT_EQ(cfg->log.level, "info");
}

TEST(ConfigTest, ReadsEveryTable) {
  auto cfg = ConfigLoader::load_from_string(R"(
[scheduler]
max_concurrent_runs = 8
max_runs_per_branch = 1
retention = 10
infra_max_retries = 0
infra_retry_backoff_ms = 50
runner_acquire_timeout_sec = 5
threads = 2

[runners]
count = 3
workspace_root = "/tmp/ciforge-ws"

[intake]
enabled = false
host = "0.0.0.0"
port = 9000
definitions_dir = "/etc/ciforge/pipelines"
max_body_bytes = 4096

[status]
log_updates = false
log_output = true
json_lines_file = "/var/log/ciforge/status.jsonl"
max_step_output_bytes = 1000

[log]
level = "debug"
file = "/var/log/ciforge/ciforge.log"
)");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->scheduler.max_concurrent_runs, 8);
  EXPECT_EQ(cfg->scheduler.max_runs_per_branch, 1);
  EXPECT_EQ(cfg->scheduler.retention, 10);
  EXPECT_EQ(cfg->scheduler.infra_max_retries, 0);
  EXPECT_EQ(cfg->scheduler.infra_retry_backoff, std::chrono::milliseconds{50});
  EXPECT_EQ(cfg->scheduler.runner_acquire_timeout, std::chrono::seconds{5});
  EXPECT_EQ(cfg->scheduler.threads, 2);
  EXPECT_EQ(cfg->runners.count, 3);
  EXPECT_EQ(cfg->runners.workspace_root, "/tmp/ciforge-ws");
  EXPECT_FALSE(cfg->intake.enabled);
  EXPECT_EQ(cfg->intake.host, "0.0.0.0");
  EXPECT_EQ(cfg->intake.port, 9000);
  EXPECT_EQ(cfg->intake.max_body_bytes, 4096u);
  EXPECT_FALSE(cfg->status.log_updates);
  EXPECT_TRUE(cfg->status.log_output);
  EXPECT_EQ(cfg->status.max_step_output_bytes, 1000u);
  EXPECT_EQ(cfg->log.level, "debug");
}

TEST(ConfigTest, UnknownKeysIgnored) {
  auto cfg = ConfigLoader::load_from_string(R"(
[scheduler]
max_concurrent_runs = 2
future_knob = true
)");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->scheduler.max_concurrent_runs, 2);
}

TEST(ConfigTest, MalformedTomlIsParseError) {
  auto cfg = ConfigLoader::load_from_string("[scheduler\nmax = ");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, OutOfRangeValuesRejected) {
  for (const char *doc : {"[scheduler]\nmax_concurrent_runs = 0\n",
                          "[scheduler]\nmax_runs_per_branch = -1\n",
                          "[scheduler]\nretention = 0\n",
                          "[scheduler]\ninfra_retry_backoff_ms = 3600001\n",
                          "[scheduler]\nrunner_acquire_timeout_sec = 2592001\n",
                          "[scheduler]\nrunner_acquire_timeout_sec = "
                          "9223372036854775807\n",
                          "[runners]\ncount = 0\n",
                          "[intake]\nmax_body_bytes = 0\n"}) {
    auto cfg = ConfigLoader::load_from_string(doc);
    ASSERT_FALSE(cfg.has_value()) << doc;
    EXPECT_EQ(cfg.error(), make_error_code(Error::ParseError)) << doc;
  }
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  ScopedEnv runs("CIFORGE_MAX_RUNS_PER_BRANCH", "5");
  ScopedEnv intake("CIFORGE_INTAKE_ENABLED", "no");
  ScopedEnv level("CIFORGE_LOG_LEVEL", "trace");
  auto cfg = ConfigLoader::load_from_string(
      "[scheduler]\nmax_runs_per_branch = 1\n");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->scheduler.max_runs_per_branch, 5);
  EXPECT_FALSE(cfg->intake.enabled);
  EXPECT_EQ(cfg->log.level, "trace");
}

TEST(ConfigTest, BadEnvironmentNumberIsParseError) {
  ScopedEnv port("CIFORGE_INTAKE_PORT", "eighty");
  auto cfg = ConfigLoader::load_from_string("");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error(), make_error_code(Error::ParseError));
  EXPECT_FALSE(ConfigLoader::load_defaults().has_value());
}

TEST(ConfigTest, LoadDefaultsAppliesEnvironment) {
  ScopedEnv count("CIFORGE_RUNNER_COUNT", "7");
  auto cfg = ConfigLoader::load_defaults();
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->runners.count, 7);
}

TEST(ConfigTest, LoadFromFile) {
  test::TempDir dir;
  auto path = dir.write("ciforge.toml", "[runners]\ncount = 2\n");
  auto cfg = ConfigLoader::load_from_file(path);
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->runners.count, 2);

  auto missing = ConfigLoader::load_from_file(dir.path() / "missing.toml");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::FileNotFound));
}
