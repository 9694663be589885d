#include "ciforge/run/run.hpp"

#include "ciforge/pipeline/definition_loader.hpp"

#include "test_utils.hpp"

#include <memory>

#include "gtest/gtest.h"

using namespace ciforge;

class RunTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto def = DefinitionLoader::load_shared(R"(
name = "ci"
[[jobs]]
name = "build"
[[jobs.steps]]
run = "make"
[[jobs]]
name = "test"
needs = ["build"]
[[jobs.steps]]
run = "make test"
)");
    ASSERT_TRUE(def.has_value());
    definition_ = *def;
  }

  auto make_run() -> Run {
    return Run(generate_run_id(), definition_, test::make_event(),
               definition_->admitted_jobs("main"));
  }

  static auto finished(std::string name, JobStatus status,
                       FailureReason reason = FailureReason::None)
      -> JobExecution {
    return JobExecution{.job_name = std::move(name),
                        .status = status,
                        .reason = reason,
                        .finished_at = std::chrono::system_clock::now()};
  }

  std::shared_ptr<const PipelineDefinition> definition_;
};

TEST_F(RunTest, NewRunIsQueuedWithPendingJobs) {
  auto run = make_run();
  EXPECT_EQ(run.status(), RunStatus::Queued);
  EXPECT_EQ(run.pipeline_name(), "ci");
  ASSERT_EQ(run.jobs().size(), 2u);
  EXPECT_EQ(run.jobs()[0].status, JobStatus::Pending);
  EXPECT_EQ(run.job_slot("test"), 1u);
  EXPECT_FALSE(run.job_slot("deploy").has_value());
  EXPECT_EQ(run.job_index(1), definition_->graph.index_of("test"));
  EXPECT_FALSE(run.try_finalize());
}

TEST_F(RunTest, MarkRunningOnlyFromQueued) {
  auto run = make_run();
  ASSERT_TRUE(run.mark_running().has_value());
  EXPECT_EQ(run.status(), RunStatus::Running);
  auto again = run.mark_running();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::InvalidState));
}

TEST_F(RunTest, AllJobsSucceededFinalizesSucceeded) {
  auto run = make_run();
  ASSERT_TRUE(run.mark_running().has_value());
  ASSERT_TRUE(run.mark_job_running(0, RunnerId{"runner-0"}).has_value());
  EXPECT_EQ(run.jobs()[0].status, JobStatus::Running);
  EXPECT_EQ(run.jobs()[0].runner, RunnerId{"runner-0"});

  ASSERT_TRUE(run.update_job(0, finished("build", JobStatus::Succeeded)).has_value());
  EXPECT_FALSE(run.try_finalize());
  ASSERT_TRUE(run.update_job(1, finished("test", JobStatus::Succeeded)).has_value());
  EXPECT_TRUE(run.try_finalize());
  EXPECT_EQ(run.status(), RunStatus::Succeeded);
  EXPECT_EQ(run.reason(), FailureReason::None);
  EXPECT_NE(run.finished_at(), std::chrono::system_clock::time_point{});
  EXPECT_FALSE(run.try_finalize());
}

TEST_F(RunTest, FailedJobFailsRunWithItsReason) {
  auto run = make_run();
  ASSERT_TRUE(run.mark_running().has_value());
  ASSERT_TRUE(run.update_job(0, finished("build", JobStatus::Failed,
                                         FailureReason::Timeout))
                  .has_value());
  ASSERT_TRUE(run.skip_job(1).has_value());
  EXPECT_EQ(run.jobs()[1].status, JobStatus::Skipped);
  EXPECT_EQ(run.jobs()[1].reason, FailureReason::UpstreamFailed);

  EXPECT_TRUE(run.try_finalize());
  EXPECT_EQ(run.status(), RunStatus::Failed);
  EXPECT_EQ(run.reason(), FailureReason::Timeout);
}

TEST_F(RunTest, TerminalJobsAreImmutable) {
  auto run = make_run();
  ASSERT_TRUE(run.update_job(0, finished("build", JobStatus::Failed,
                                         FailureReason::StepFailure))
                  .has_value());
  EXPECT_FALSE(run.update_job(0, finished("build", JobStatus::Succeeded))
                   .has_value());
  EXPECT_FALSE(run.mark_job_running(0, RunnerId{"runner-1"}).has_value());
  EXPECT_FALSE(run.skip_job(0).has_value());
  // Name mismatch and out-of-range slots.
  EXPECT_FALSE(run.update_job(1, finished("build", JobStatus::Succeeded))
                   .has_value());
  EXPECT_FALSE(run.update_job(9, finished("x", JobStatus::Succeeded))
                   .has_value());
}

TEST_F(RunTest, CancelRequestCancelsPendingJobs) {
  auto run = make_run();
  ASSERT_TRUE(run.mark_running().has_value());
  ASSERT_TRUE(run.mark_job_running(0, RunnerId{"runner-0"}).has_value());

  run.request_cancel(FailureReason::Superseded);
  EXPECT_TRUE(run.cancel_requested());
  EXPECT_EQ(run.cancel_reason(), FailureReason::Superseded);
  EXPECT_EQ(run.jobs()[0].status, JobStatus::Running);
  EXPECT_EQ(run.jobs()[1].status, JobStatus::Cancelled);
  EXPECT_EQ(run.jobs()[1].reason, FailureReason::Superseded);
  EXPECT_FALSE(run.try_finalize());

  // A later reason does not replace the first.
  run.request_cancel(FailureReason::ShuttingDown);
  EXPECT_EQ(run.cancel_reason(), FailureReason::Superseded);

  ASSERT_TRUE(run.update_job(0, finished("build", JobStatus::Cancelled,
                                         FailureReason::Superseded))
                  .has_value());
  EXPECT_TRUE(run.try_finalize());
  EXPECT_EQ(run.status(), RunStatus::Cancelled);
  EXPECT_EQ(run.reason(), FailureReason::Superseded);
}

TEST_F(RunTest, CancelWinsOverCompletedJobs) {
  auto run = make_run();
  ASSERT_TRUE(run.mark_running().has_value());
  ASSERT_TRUE(run.update_job(0, finished("build", JobStatus::Succeeded)).has_value());
  run.request_cancel(FailureReason::Cancelled);
  EXPECT_TRUE(run.try_finalize());
  EXPECT_EQ(run.status(), RunStatus::Cancelled);
}

TEST_F(RunTest, SummaryMirrorsRun) {
  auto run = make_run();
  auto s = run.summary();
  EXPECT_EQ(s.id, run.id());
  EXPECT_EQ(s.pipeline, "ci");
  EXPECT_EQ(s.event, test::make_event());
  EXPECT_EQ(s.status, RunStatus::Queued);
}

TEST(RunStatusTest, EnumNamesAreSnakeCase) {
  EXPECT_EQ(to_string_view(RunStatus::Succeeded), "succeeded");
  EXPECT_EQ(to_string_view(FailureReason::InfrastructureError),
            "infrastructure_error");
  EXPECT_EQ(to_string_view(FailureReason::UpstreamFailed), "upstream_failed");
  EXPECT_EQ(to_string_view(StepStatus::TimedOut), "timed_out");
  EXPECT_EQ(parse<JobStatus>("skipped"), JobStatus::Skipped);
  EXPECT_EQ(parse<JobStatus>("bogus"), JobStatus::Pending);
  EXPECT_FALSE(try_parse<RunStatus>("bogus").has_value());
  EXPECT_TRUE(is_terminal(JobStatus::Skipped));
  EXPECT_FALSE(is_terminal(RunStatus::Running));
}

TEST(RunIdTest, LaterIdsSortLater) {
  auto a = generate_run_id();
  auto b = generate_run_id();
  EXPECT_NE(a, b);
  EXPECT_LT(a, b);
}
