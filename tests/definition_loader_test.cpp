#include "ciforge/pipeline/definition_loader.hpp"

#include "test_utils.hpp"

#include <string>

#include "gtest/gtest.h"

using namespace ciforge;

namespace {

constexpr auto kPipeline = R"(
name = "widgets"

[env]
GLOBAL = "1"

[triggers]
events = ["push", "pr"]
branches = ["main", "release/**", "!release/old/**"]
repositories = ["acme/widgets"]

[[jobs]]
name = "build"
timeout_minutes = 5

[jobs.env]
CC = "clang"

[[jobs.steps]]
name = "compile"
run = "make -j4"

[[jobs.steps]]
type = "exec"
run = "ctest --output-on-failure"

[[jobs]]
name = "test"
needs = ["build"]
timeout = 30

[[jobs.steps]]
run = "echo test"

[[jobs]]
name = "deploy"
needs = ["test"]
branches = ["main"]

[[jobs.steps]]
run = "echo deploy"
working_dir = "dist"
)";

auto load_error(std::string_view toml, std::string *diag = nullptr)
    -> std::error_code {
  auto r = DefinitionLoader::load(toml, diag);
  EXPECT_FALSE(r.has_value());
  return r ? std::error_code{} : r.error();
}

} // namespace

TEST(DefinitionLoaderTest, LoadsFullDefinition) {
  std::string diagnostic;
  auto def = DefinitionLoader::load(kPipeline, &diagnostic);
  ASSERT_TRUE(def.has_value()) << diagnostic;

  EXPECT_EQ(def->name, "widgets");
  EXPECT_EQ(def->env.at("GLOBAL"), "1");
  ASSERT_EQ(def->triggers.events.size(), 2u);
  EXPECT_EQ(def->triggers.events[1], EventType::PullRequest);
  ASSERT_EQ(def->triggers.repositories.size(), 1u);

  ASSERT_EQ(def->jobs.size(), 3u);
  const auto &build = def->jobs[0];
  EXPECT_EQ(build.timeout, std::chrono::minutes{5});
  EXPECT_EQ(build.env.at("CC"), "clang");
  ASSERT_EQ(build.steps.size(), 2u);
  EXPECT_EQ(build.steps[0].name, "compile");
  EXPECT_EQ(build.steps[0].type, StepType::Shell);
  EXPECT_EQ(build.steps[1].name, "step-2");
  EXPECT_EQ(build.steps[1].type, StepType::Exec);

  const auto *test = def->find_job("test");
  ASSERT_NE(test, nullptr);
  EXPECT_EQ(test->timeout, std::chrono::seconds{30});
  EXPECT_EQ(def->find_job("deploy")->timeout, pipeline_defaults::kJobTimeout);
  EXPECT_EQ(def->find_job("deploy")->steps[0].working_dir, "dist");

  ASSERT_EQ(def->graph.size(), 3u);
  auto deps = def->graph.deps(def->graph.index_of("deploy"));
  ASSERT_EQ(deps.size(), 1u);
  EXPECT_EQ(def->graph.name_of(deps[0]), "test");
}

TEST(DefinitionLoaderTest, TriggerFilterMatchesEvents) {
  auto def = DefinitionLoader::load(kPipeline);
  ASSERT_TRUE(def.has_value());

  EXPECT_TRUE(def->matches(test::make_event("main")));
  EXPECT_TRUE(def->matches(test::make_event("release/2.0", EventType::PullRequest)));
  EXPECT_FALSE(def->matches(test::make_event("release/old/1.0")));
  EXPECT_FALSE(def->matches(test::make_event("feature/x")));
  EXPECT_FALSE(
      def->matches(test::make_event("main", EventType::Push, "acme/gadgets")));
}

TEST(DefinitionLoaderTest, AdmittedJobsFollowBranchFilters) {
  auto def = DefinitionLoader::load(kPipeline);
  ASSERT_TRUE(def.has_value());

  auto on_main = def->admitted_jobs("main");
  EXPECT_EQ(on_main.size(), 3u);

  auto on_release = def->admitted_jobs("release/2.0");
  ASSERT_EQ(on_release.size(), 2u);
  EXPECT_EQ(def->jobs[on_release[0]].name, "build");
  EXPECT_EQ(def->jobs[on_release[1]].name, "test");
}

TEST(DefinitionLoaderTest, JobNeedingExcludedJobIsNotAdmitted) {
  auto def = DefinitionLoader::load(R"(
name = "p"

[[jobs]]
name = "package"
branches = ["main"]

[[jobs.steps]]
run = "true"

[[jobs]]
name = "publish"
needs = ["package"]

[[jobs.steps]]
run = "true"
)");
  ASSERT_TRUE(def.has_value());
  EXPECT_TRUE(def->admitted_jobs("feature/x").empty());
  EXPECT_EQ(def->admitted_jobs("main").size(), 2u);
}

TEST(DefinitionLoaderTest, MalformedTomlIsParseError) {
  std::string diag;
  EXPECT_EQ(load_error("name = \"x\"\n[[jobs]\nname = ", &diag),
            make_error_code(Error::ParseError));
  EXPECT_FALSE(diag.empty());
}

TEST(DefinitionLoaderTest, ZeroJobsIsValidationError) {
  std::string diag;
  EXPECT_EQ(load_error("name = \"empty\"\n", &diag),
            make_error_code(Error::ValidationError));
  EXPECT_NE(diag.find("at least one job"), std::string::npos);
}

TEST(DefinitionLoaderTest, JobWithoutStepsRejected) {
  EXPECT_EQ(load_error(R"(
name = "p"
[[jobs]]
name = "lonely"
)"),
            make_error_code(Error::ValidationError));
}

TEST(DefinitionLoaderTest, DependencyErrorsRejected) {
  std::string diag;
  EXPECT_EQ(load_error(R"(
name = "p"
[[jobs]]
name = "a"
needs = ["ghost"]
[[jobs.steps]]
run = "true"
)",
                       &diag),
            make_error_code(Error::ValidationError));
  EXPECT_NE(diag.find("unknown job 'ghost'"), std::string::npos);

  EXPECT_EQ(load_error(R"(
name = "p"
[[jobs]]
name = "a"
needs = ["a"]
[[jobs.steps]]
run = "true"
)"),
            make_error_code(Error::ValidationError));
}

TEST(DefinitionLoaderTest, CycleReportedWithPath) {
  std::string diag;
  EXPECT_EQ(load_error(R"(
name = "p"
[[jobs]]
name = "a"
needs = ["b"]
[[jobs.steps]]
run = "true"
[[jobs]]
name = "b"
needs = ["a"]
[[jobs.steps]]
run = "true"
)",
                       &diag),
            make_error_code(Error::ValidationError));
  EXPECT_NE(diag.find("dependency cycle"), std::string::npos);
}

TEST(DefinitionLoaderTest, DuplicateNamesRejected) {
  std::string diag;
  EXPECT_EQ(load_error(R"(
name = "p"
[[jobs]]
name = "a"
[[jobs.steps]]
name = "s"
run = "true"
[[jobs.steps]]
name = "s"
run = "false"
[[jobs]]
name = "a"
[[jobs.steps]]
run = "true"
)",
                       &diag),
            make_error_code(Error::ValidationError));
  EXPECT_NE(diag.find("duplicate step name 's'"), std::string::npos);
  EXPECT_NE(diag.find("duplicate job name 'a'"), std::string::npos);
}

TEST(DefinitionLoaderTest, FieldLevelErrorsCollected) {
  std::string diag;
  EXPECT_EQ(load_error(R"(
name = "p"
[triggers]
events = ["tag"]
branches = ["bad branch"]
[[jobs]]
name = "a"
timeout = 0
[jobs.env]
BAD-KEY = "x"
[[jobs.steps]]
type = "docker"
run = "  "
[[jobs.steps]]
type = "exec"
run = "echo 'unterminated"
)",
                       &diag),
            make_error_code(Error::ValidationError));
  for (const char *needle :
       {"unknown event type 'tag'", "invalid branch pattern",
        "timeout must be positive", "invalid environment key 'BAD-KEY'",
        "unknown step type 'docker'", "'run' command is empty",
        "cannot split exec command"}) {
    EXPECT_NE(diag.find(needle), std::string::npos) << needle;
  }
}

TEST(DefinitionLoaderTest, BothTimeoutFormsRejected) {
  EXPECT_EQ(load_error(R"(
name = "p"
[[jobs]]
name = "a"
timeout = 10
timeout_minutes = 1
[[jobs.steps]]
run = "true"
)"),
            make_error_code(Error::ValidationError));
}

TEST(DefinitionLoaderTest, OversizedTimeoutsRejected) {
  std::string diag;
  EXPECT_EQ(load_error(R"(
name = "p"
[[jobs]]
name = "minutes"
timeout_minutes = 200000000
[[jobs.steps]]
run = "true"
[[jobs]]
name = "seconds"
timeout = 2592001
[[jobs.steps]]
run = "true"
)",
                       &diag),
            make_error_code(Error::ValidationError));
  EXPECT_NE(diag.find("job 'minutes': timeout must not exceed 30 days"),
            std::string::npos)
      << diag;
  EXPECT_NE(diag.find("job 'seconds': timeout must not exceed 30 days"),
            std::string::npos)
      << diag;
}

TEST(DefinitionLoaderTest, ThirtyDayTimeoutAccepted) {
  auto def = DefinitionLoader::load(R"(
name = "p"
[[jobs]]
name = "long"
timeout_minutes = 43200
[[jobs.steps]]
run = "true"
)");
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->find_job("long")->timeout, pipeline_defaults::kMaxJobTimeout);
}

TEST(DefinitionLoaderTest, FileStemIsDefaultName) {
  test::TempDir dir;
  auto path = dir.write("nightly.toml", R"(
[[jobs]]
name = "a"
[[jobs.steps]]
run = "true"
)");
  auto def = DefinitionLoader::load_from_file(path);
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->name, "nightly");
  EXPECT_EQ(def->source_path, path.string());
}

TEST(DefinitionLoaderTest, MissingFileReported) {
  auto def = DefinitionLoader::load_from_file("/nonexistent/ciforge/p.toml");
  ASSERT_FALSE(def.has_value());
  EXPECT_EQ(def.error(), make_error_code(Error::FileNotFound));
}

TEST(DefinitionLoaderTest, LoadSharedWrapsDefinition) {
  auto def = DefinitionLoader::load_shared(kPipeline);
  ASSERT_TRUE(def.has_value());
  ASSERT_NE(*def, nullptr);
  EXPECT_EQ((*def)->jobs.size(), 3u);
}
