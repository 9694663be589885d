#include "ciforge/intake/webhook_server.hpp"

#include "ciforge/core/runtime.hpp"
#include "ciforge/intake/event_intake.hpp"
#include "ciforge/pipeline/definition_loader.hpp"
#include "ciforge/pipeline/definition_store.hpp"
#include "ciforge/scheduler/scheduler.hpp"
#include "ciforge/status/status_reporter.hpp"
#include "ciforge/util/json.hpp"

#include "test_utils.hpp"

#include <format>
#include <memory>
#include <string>

#include "gtest/gtest.h"

using namespace ciforge;
using namespace ciforge::http;
using namespace std::chrono_literals;

namespace {

constexpr auto kSha = "0123456789abcdef0123456789abcdef01234567";

auto event_body(std::string_view branch, std::string_view type = "push",
                std::string_view sha = kSha) -> std::string {
  return std::format(R"({{"repository":"acme/widgets","branch":"{}",)"
                     R"("commit_sha":"{}","event_type":"{}"}})",
                     branch, sha, type);
}

auto request(HttpMethod method, std::string path, std::string body = {})
    -> HttpRequest {
  HttpRequest req;
  req.method = method;
  req.path = std::move(path);
  req.body = std::move(body);
  return req;
}

} // namespace

class WebhookServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(runtime_.start().has_value());
    SchedulerOptions options;
    options.runners.runner_count = 2;
    options.max_runs_per_branch = 1;
    scheduler_ = std::make_unique<Scheduler>(runtime_, reporter_, options);
    intake_ = std::make_unique<intake::EventIntake>(store_, *scheduler_);
    server_ = std::make_unique<WebhookServer>(
        runtime_, *intake_, *scheduler_,
        WebhookServerOptions{.max_body_bytes = 4096});
  }

  void TearDown() override {
    server_->stop();
    server_.reset();
    intake_.reset();
    scheduler_->shutdown(5s);
    scheduler_.reset();
    runtime_.stop();
  }

  auto add(std::string_view name, std::string_view command,
           std::string_view branches = "") -> void {
    auto def = DefinitionLoader::load_shared(std::format(R"(
name = "{}"
[triggers]
branches = [{}]
[[jobs]]
name = "build"
[[jobs.steps]]
run = "{}"
)",
                                                         name, branches,
                                                         command));
    ASSERT_TRUE(def.has_value());
    store_.put(*def);
  }

  auto send(HttpRequest req) -> HttpResponse {
    return block_on(runtime_.executor(), server_->handle(std::move(req)));
  }

  auto send_json(HttpRequest req) -> std::pair<HttpStatus, JsonValue> {
    auto resp = send(std::move(req));
    auto doc = parse_json(resp.body);
    EXPECT_TRUE(doc.has_value()) << resp.body;
    return {resp.status, doc ? std::move(*doc) : JsonValue{}};
  }

  // Posts an event and returns the run id of the single accepted run.
  auto post_run(std::string_view branch, std::string_view type = "push")
      -> RunId {
    auto [status, doc] = send_json(
        request(HttpMethod::POST, "/events", event_body(branch, type)));
    EXPECT_EQ(status, HttpStatus::Accepted);
    auto &runs = doc["runs"].get_array();
    if (runs.empty()) {
      ADD_FAILURE() << "no run accepted";
      return RunId{};
    }
    return RunId{runs[0]["run_id"].get<std::string>()};
  }

  Runtime runtime_{2};
  StatusReporter reporter_;
  DefinitionStore store_;
  std::unique_ptr<Scheduler> scheduler_;
  std::unique_ptr<intake::EventIntake> intake_;
  std::unique_ptr<WebhookServer> server_;
};

TEST_F(WebhookServerTest, Health) {
  auto [status, doc] = send_json(request(HttpMethod::GET, "/health"));
  EXPECT_EQ(status, HttpStatus::Ok);
  EXPECT_EQ(doc["status"].get<std::string>(), "healthy");
}

TEST_F(WebhookServerTest, PostEventStartsRuns) {
  add("ci", "true");
  add("docs", "true", R"("main")");

  auto [status, doc] = send_json(
      request(HttpMethod::POST, "/events", event_body("refs/heads/main")));
  ASSERT_EQ(status, HttpStatus::Accepted);
  auto &runs = doc["runs"].get_array();
  ASSERT_EQ(runs.size(), 2u);
  for (auto &entry : runs) {
    ASSERT_TRUE(entry.contains("run_id"));
    auto run = scheduler_->wait(RunId{entry["run_id"].get<std::string>()}, 10s);
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->status(), RunStatus::Succeeded);
    EXPECT_EQ(run->event().branch, "main");
  }
}

TEST_F(WebhookServerTest, MalformedEventsAreBadRequests) {
  add("ci", "true");

  auto bad_json = send(request(HttpMethod::POST, "/events", "{not json"));
  EXPECT_EQ(bad_json.status, HttpStatus::BadRequest);

  auto bad_sha = send_json(request(HttpMethod::POST, "/events",
                                   event_body("main", "push", "xyz")));
  EXPECT_EQ(bad_sha.first, HttpStatus::BadRequest);
  EXPECT_NE(bad_sha.second["error"].get<std::string>().find("commit_sha"),
            std::string::npos);

  auto bad_type = send(request(HttpMethod::POST, "/events",
                               event_body("main", "release")));
  EXPECT_EQ(bad_type.status, HttpStatus::BadRequest);
  EXPECT_TRUE(scheduler_->list_runs().empty());
}

TEST_F(WebhookServerTest, OversizedBodyRejected) {
  add("ci", "true");
  auto resp = send(request(HttpMethod::POST, "/events", std::string(5000, ' ')));
  EXPECT_EQ(resp.status, HttpStatus::PayloadTooLarge);
}

TEST_F(WebhookServerTest, UnmatchedEventIsUnprocessable) {
  add("docs", "true", R"("main")");
  auto resp = send(request(HttpMethod::POST, "/events", event_body("dev")));
  EXPECT_EQ(resp.status, HttpStatus::UnprocessableEntity);
}

TEST_F(WebhookServerTest, BranchLimitIsConflict) {
  add("ci", "sleep 5");
  post_run("feature/x", "pull_request");
  auto [status, doc] = send_json(request(
      HttpMethod::POST, "/events", event_body("feature/x", "pull_request")));
  EXPECT_EQ(status, HttpStatus::Conflict);
  auto &runs = doc["runs"].get_array();
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_FALSE(runs[0].contains("run_id"));
  EXPECT_TRUE(runs[0].contains("error"));
}

TEST_F(WebhookServerTest, QueriesRuns) {
  add("ci", "echo built");
  auto id = post_run("main");
  ASSERT_TRUE(scheduler_->wait(id, 10s).has_value());

  auto [list_status, list] = send_json(request(HttpMethod::GET, "/runs"));
  EXPECT_EQ(list_status, HttpStatus::Ok);
  auto &runs = list["runs"].get_array();
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0]["id"].get<std::string>(), id.str());
  EXPECT_EQ(runs[0]["status"].get<std::string>(), "succeeded");

  auto [get_status, run] =
      send_json(request(HttpMethod::GET, "/runs/" + id.str()));
  EXPECT_EQ(get_status, HttpStatus::Ok);
  EXPECT_EQ(run["pipeline"].get<std::string>(), "ci");
  auto &jobs = run["jobs"].get_array();
  ASSERT_EQ(jobs.size(), 1u);
  EXPECT_EQ(jobs[0]["steps"][0]["output"].get<std::string>(), "built\n");

  auto missing = send(request(HttpMethod::GET, "/runs/nope"));
  EXPECT_EQ(missing.status, HttpStatus::NotFound);
}

TEST_F(WebhookServerTest, DeleteCancelsRun) {
  add("ci", "sleep 10");
  auto id = post_run("main");

  auto [status, doc] =
      send_json(request(HttpMethod::DELETE, "/runs/" + id.str()));
  EXPECT_EQ(status, HttpStatus::Accepted);
  EXPECT_EQ(doc["run_id"].get<std::string>(), id.str());
  auto run = scheduler_->wait(id, 5s);
  ASSERT_TRUE(run.has_value());
  EXPECT_EQ(run->status(), RunStatus::Cancelled);

  auto missing = send(request(HttpMethod::DELETE, "/runs/nope"));
  EXPECT_EQ(missing.status, HttpStatus::NotFound);
}

TEST_F(WebhookServerTest, RoutingErrors) {
  EXPECT_EQ(send(request(HttpMethod::PUT, "/health")).status,
            HttpStatus::MethodNotAllowed);
  EXPECT_EQ(send(request(HttpMethod::GET, "/events")).status,
            HttpStatus::MethodNotAllowed);
  EXPECT_EQ(send(request(HttpMethod::POST, "/runs")).status,
            HttpStatus::MethodNotAllowed);
  EXPECT_EQ(send(request(HttpMethod::POST, "/runs/abc")).status,
            HttpStatus::MethodNotAllowed);
  EXPECT_EQ(send(request(HttpMethod::GET, "/nope")).status,
            HttpStatus::NotFound);
  EXPECT_EQ(send(request(HttpMethod::GET, "/runs/a/b")).status,
            HttpStatus::NotFound);
}

TEST_F(WebhookServerTest, ServesOverTcp) {
  add("ci", "true");
  ASSERT_TRUE(server_->start("127.0.0.1", 0).has_value());
  ASSERT_TRUE(server_->is_running());
  const auto port = server_->port();
  ASSERT_NE(port, 0);

  auto [health_status, health_body] = test::http_request(port, "GET", "/health");
  EXPECT_EQ(health_status, 200);
  EXPECT_NE(health_body.find("healthy"), std::string::npos);

  auto [post_status, post_body] =
      test::http_request(port, "POST", "/events", event_body("main"));
  EXPECT_EQ(post_status, 202);
  EXPECT_NE(post_body.find("run_id"), std::string::npos);

  EXPECT_FALSE(server_->start("127.0.0.1", 0).has_value());
  server_->stop();
  EXPECT_FALSE(server_->is_running());
}
