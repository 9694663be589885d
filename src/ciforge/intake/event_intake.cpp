#include "ciforge/intake/event_intake.hpp"

#include "ciforge/pipeline/definition_store.hpp"
#include "ciforge/scheduler/scheduler.hpp"
#include "ciforge/util/json.hpp"
#include "ciforge/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace ciforge::intake::detail {

// Wire shape of an incoming event; both spellings of the compound keys are
// accepted.
struct RawEventJson {
  std::string repository;
  std::string branch;
  std::string commit_sha;
  std::string commitSHA;
  std::string event_type;
  std::string eventType;
};

} // namespace ciforge::intake::detail

template <> struct glz::meta<ciforge::intake::detail::RawEventJson> {
  using T = ciforge::intake::detail::RawEventJson;
  static constexpr auto value =
      object("repository", &T::repository, "branch", &T::branch,
             "commit_sha", &T::commit_sha, "commitSHA", &T::commitSHA,
             "event_type", &T::event_type, "eventType", &T::eventType);
};

namespace ciforge::intake {

namespace {

constexpr std::string_view kBranchRefPrefix = "refs/heads/";

[[nodiscard]] auto trim(std::string_view s) -> std::string_view {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

auto reject(std::string *diagnostic, std::string_view message)
    -> std::unexpected<std::error_code> {
  if (diagnostic) {
    *diagnostic = message;
  }
  return fail(Error::InvalidArgument);
}

} // namespace

auto is_valid_commit_sha(std::string_view sha) noexcept -> bool {
  return sha.size() >= 7 && sha.size() <= 40 &&
         std::ranges::all_of(sha, [](unsigned char c) {
           return std::isxdigit(c) != 0;
         });
}

auto normalize(const RawEvent &raw, std::string *diagnostic)
    -> Result<TriggerEvent> {
  TriggerEvent event;
  event.repository = trim(raw.repository);
  if (event.repository.empty()) {
    return reject(diagnostic, "repository is required");
  }

  auto branch = trim(raw.branch);
  if (branch.starts_with(kBranchRefPrefix)) {
    branch.remove_prefix(kBranchRefPrefix.size());
  }
  if (branch.empty()) {
    return reject(diagnostic, "branch is required");
  }
  event.branch = branch;

  auto sha = trim(raw.commit_sha);
  if (!is_valid_commit_sha(sha)) {
    return reject(diagnostic,
                  "commit_sha must be 7 to 40 hexadecimal characters");
  }
  event.commit_sha.reserve(sha.size());
  std::ranges::transform(sha, std::back_inserter(event.commit_sha),
                         [](unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                         });

  auto type_text = trim(raw.event_type);
  if (type_text.empty()) {
    return reject(diagnostic, "event_type is required");
  }
  auto type = parse_event_alias(type_text);
  if (!type) {
    return reject(diagnostic,
                  "event_type must be push or pull_request");
  }
  event.event_type = *type;
  return event;
}

auto parse_event_json(std::string_view text) -> Result<RawEvent> {
  auto parsed = read_json_struct<detail::RawEventJson>(text);
  if (!parsed) {
    return fail(parsed.error());
  }
  auto &j = *parsed;
  return RawEvent{
      .repository = std::move(j.repository),
      .branch = std::move(j.branch),
      .commit_sha = j.commit_sha.empty() ? std::move(j.commitSHA)
                                         : std::move(j.commit_sha),
      .event_type = j.event_type.empty() ? std::move(j.eventType)
                                         : std::move(j.event_type),
  };
}

auto EventIntake::ingest(const RawEvent &raw)
    -> Result<std::vector<IntakeOutcome>> {
  std::string diagnostic;
  auto event = normalize(raw, &diagnostic);
  if (!event) {
    log::warn("Rejected event: {}", diagnostic);
    return fail(event.error());
  }
  return ingest(*event);
}

auto EventIntake::ingest(const TriggerEvent &event)
    -> Result<std::vector<IntakeOutcome>> {
  auto definitions = store_.matching(event);
  if (definitions.empty()) {
    log::info("No pipeline matches {} to {}@{}",
              to_string_view(event.event_type), event.repository,
              event.branch);
    return fail(Error::NoMatchingPipeline);
  }

  std::vector<IntakeOutcome> outcomes;
  outcomes.reserve(definitions.size());
  for (auto &def : definitions) {
    IntakeOutcome outcome{.pipeline = def->name};
    if (auto id = scheduler_.submit(event, def); id) {
      outcome.run_id = std::move(*id);
    } else {
      outcome.error = id.error();
    }
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

auto EventIntake::async_ingest(TriggerEvent event)
    -> task<Result<std::vector<IntakeOutcome>>> {
  auto definitions = store_.matching(event);
  if (definitions.empty()) {
    log::info("No pipeline matches {} to {}@{}",
              to_string_view(event.event_type), event.repository,
              event.branch);
    co_return fail(Error::NoMatchingPipeline);
  }

  std::vector<IntakeOutcome> outcomes;
  outcomes.reserve(definitions.size());
  for (auto &def : definitions) {
    IntakeOutcome outcome{.pipeline = def->name};
    if (auto id = co_await scheduler_.async_submit(event, def); id) {
      outcome.run_id = std::move(*id);
    } else {
      outcome.error = id.error();
    }
    outcomes.push_back(std::move(outcome));
  }
  co_return outcomes;
}

} // namespace ciforge::intake
