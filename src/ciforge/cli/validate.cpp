#include "ciforge/cli/commands.hpp"
#include "ciforge/cli/formatting.hpp"
#include "ciforge/pipeline/definition_loader.hpp"
#include "ciforge/util/json.hpp"
#include "ciforge/util/log.hpp"

#include <algorithm>
#include <filesystem>
#include <print>
#include <vector>

namespace ciforge::cli {

namespace {

struct ValidationResult {
  std::string pipeline;
  std::string file_path;
  bool valid{false};
  std::size_t jobs{0};
  std::string error;
};

auto validate_single_file(const std::filesystem::path &path)
    -> ValidationResult {
  ValidationResult vr{.pipeline = path.stem().string(),
                      .file_path = path.string()};

  std::string diagnostic;
  auto res = DefinitionLoader::load_from_file(path, &diagnostic);
  vr.valid = res.has_value();
  if (vr.valid) {
    vr.pipeline = res->name;
    vr.jobs = res->jobs.size();
  } else {
    vr.error = diagnostic.empty() ? res.error().message() : diagnostic;
  }
  return vr;
}

// Expands directories to their *.toml files, sorted for stable output.
auto collect_files(const std::vector<std::string> &inputs,
                   std::vector<std::string> &missing)
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> files;
  for (const auto &input : inputs) {
    std::error_code ec;
    if (std::filesystem::is_directory(input, ec)) {
      std::vector<std::filesystem::path> dir_files;
      for (const auto &entry :
           std::filesystem::directory_iterator(input, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".toml") {
          dir_files.push_back(entry.path());
        }
      }
      std::ranges::sort(dir_files);
      files.insert(files.end(), dir_files.begin(), dir_files.end());
    } else if (std::filesystem::exists(input, ec)) {
      files.emplace_back(input);
    } else {
      missing.push_back(input);
    }
  }
  return files;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();

  std::vector<std::string> missing;
  auto files = collect_files(opts.files, missing);
  for (const auto &m : missing) {
    std::println(stderr, "Error: File does not exist: {}", m);
  }
  if (!missing.empty()) {
    return 1;
  }

  std::vector<ValidationResult> results;
  results.reserve(files.size());
  for (const auto &f : files) {
    results.push_back(validate_single_file(f));
  }
  const auto invalid_count = static_cast<std::int64_t>(
      std::ranges::count(results, false, &ValidationResult::valid));
  const auto valid_count =
      static_cast<std::int64_t>(results.size()) - invalid_count;

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &vr : results) {
      JsonValue obj{
          {"pipeline", vr.pipeline},
          {"file", vr.file_path},
          {"valid", vr.valid},
      };
      if (vr.valid) {
        obj.get_object().emplace("jobs", static_cast<std::int64_t>(vr.jobs));
      } else {
        obj.get_object().emplace("error", vr.error);
      }
      arr.get_array().emplace_back(std::move(obj));
    }
    JsonValue output{
        {"results", std::move(arr)},
        {"summary",
         JsonValue{
             {"valid", valid_count},
             {"invalid", invalid_count},
             {"total", static_cast<std::int64_t>(results.size())},
         }},
    };
    std::println("{}", dump_json(output));
  } else {
    for (const auto &vr : results) {
      if (vr.valid) {
        std::println("{} {} ({} jobs) - {}", fmt::ansi::green("✓"),
                     vr.pipeline, vr.jobs, fmt::ansi::green("Valid"));
      } else {
        std::println("{} {}", fmt::ansi::red("✗"), vr.file_path);
        std::println("{}", fmt::ansi::red(vr.error));
      }
    }
    std::println("\n{} valid, {} invalid", valid_count, invalid_count);
  }

  return invalid_count == 0 ? 0 : 1;
}

} // namespace ciforge::cli
