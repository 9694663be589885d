#include "ciforge/pipeline/definition_store.hpp"

#include "test_utils.hpp"

#include <memory>

#include "gtest/gtest.h"

using namespace ciforge;

namespace {

auto pipeline_toml(std::string_view name, std::string_view branches)
    -> std::string {
  return std::format(R"(
name = "{}"

[triggers]
branches = [{}]

[[jobs]]
name = "build"

[[jobs.steps]]
run = "true"
)",
                     name, branches);
}

} // namespace

class DefinitionStoreTest : public ::testing::Test {
protected:
  test::TempDir dir_;
  DefinitionStore store_;
};

TEST_F(DefinitionStoreTest, LoadsEveryTomlFile) {
  dir_.write("a.toml", pipeline_toml("alpha", R"("main")"));
  dir_.write("b.toml", pipeline_toml("beta", R"("feature/*")"));
  dir_.write("notes.txt", "not a pipeline");

  auto count = store_.load_directory(dir_.path());
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 2u);
  EXPECT_EQ(store_.size(), 2u);
  EXPECT_TRUE(store_.failures().empty());

  auto alpha = store_.get("alpha");
  ASSERT_TRUE(alpha.has_value());
  EXPECT_EQ((*alpha)->name, "alpha");
  EXPECT_EQ(store_.get("gamma").error(), make_error_code(Error::NotFound));

  auto all = store_.all();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0]->name, "alpha");
  EXPECT_EQ(all[1]->name, "beta");
}

TEST_F(DefinitionStoreTest, InvalidFilesRecordedAsFailures) {
  dir_.write("good.toml", pipeline_toml("good", R"("main")"));
  dir_.write("broken.toml", "name = \"broken\"\n");
  dir_.write("dup.toml", pipeline_toml("good", R"("dev")"));

  auto count = store_.load_directory(dir_.path());
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 1u);

  auto failures = store_.failures();
  ASSERT_EQ(failures.size(), 2u);
  // Files load in sorted order: broken, dup, good.
  EXPECT_EQ(failures[0].error, make_error_code(Error::ValidationError));
  EXPECT_NE(failures[0].file.find("broken.toml"), std::string::npos);
  EXPECT_FALSE(failures[0].diagnostic.empty());
}

TEST_F(DefinitionStoreTest, MissingDirectory) {
  auto r = store_.load_directory(dir_.path() / "nope");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::FileNotFound));
}

TEST_F(DefinitionStoreTest, ReloadReplacesContents) {
  dir_.write("a.toml", pipeline_toml("alpha", R"("main")"));
  ASSERT_TRUE(store_.load_directory(dir_.path()).has_value());
  std::filesystem::remove(dir_.path() / "a.toml");
  dir_.write("b.toml", pipeline_toml("beta", R"("main")"));
  ASSERT_TRUE(store_.load_directory(dir_.path()).has_value());

  EXPECT_FALSE(store_.get("alpha").has_value());
  EXPECT_TRUE(store_.get("beta").has_value());
}

TEST_F(DefinitionStoreTest, MatchingFiltersByTrigger) {
  dir_.write("a.toml", pipeline_toml("alpha", R"("main")"));
  dir_.write("b.toml", pipeline_toml("beta", R"("feature/*")"));
  dir_.write("c.toml", pipeline_toml("gamma", R"("**")"));
  ASSERT_TRUE(store_.load_directory(dir_.path()).has_value());

  auto on_main = store_.matching(test::make_event("main"));
  ASSERT_EQ(on_main.size(), 2u);
  EXPECT_EQ(on_main[0]->name, "alpha");
  EXPECT_EQ(on_main[1]->name, "gamma");

  auto on_feature = store_.matching(test::make_event("feature/x"));
  ASSERT_EQ(on_feature.size(), 2u);
  EXPECT_EQ(on_feature[0]->name, "beta");

  EXPECT_EQ(store_.matching(test::make_event("feature/x/y")).size(), 1u);
}

TEST_F(DefinitionStoreTest, PutOverwritesByName) {
  auto def = std::make_shared<PipelineDefinition>();
  def->name = "manual";
  store_.put(def);
  auto other = std::make_shared<PipelineDefinition>();
  other->name = "manual";
  other->source_path = "second";
  store_.put(other);

  EXPECT_EQ(store_.size(), 1u);
  EXPECT_EQ((*store_.get("manual"))->source_path, "second");
}
