#include "taskforge/streaming/workbench.hpp"

#include <gtest/gtest.h>

namespace taskforge::streaming {
namespace {

auto delta(std::string_view text) -> WorkbenchDelta {
  auto parsed = parse_json(text);
  EXPECT_TRUE(parsed.has_value()) << text;
  auto d = parse_workbench_delta(*parsed);
  EXPECT_TRUE(d.has_value()) << text;
  return std::move(*d);
}

auto paths(const Workbench &wb) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto &f : wb.file_changes()) {
    out.push_back(json::string_at(f, "path").value_or(""));
  }
  return out;
}

TEST(WorkbenchTest, FreshWorkbenchIsEmpty) {
  Workbench wb;
  EXPECT_TRUE(wb.empty());
  EXPECT_TRUE(wb.to_json().is_object());
  EXPECT_TRUE(wb.to_json().get_object().empty());
}

TEST(WorkbenchTest, AddThenRemoveLeavesEmptyList) {
  Workbench wb;
  wb.apply(delta(R"({"file_changes":{"add":[{"path":"a.txt","status":"added"}]}})"));
  EXPECT_EQ(paths(wb), std::vector<std::string>{"a.txt"});

  wb.apply(delta(R"({"file_changes":{"remove":["a.txt"]}})"));
  EXPECT_TRUE(wb.file_changes().empty());
  // the section was touched, so it is still reported
  EXPECT_FALSE(wb.empty());
  auto out = wb.to_json();
  const auto *files = json::find(out, "file_changes");
  ASSERT_NE(files, nullptr);
  ASSERT_TRUE(files->is_array());
  EXPECT_TRUE(files->get_array().empty());
}

TEST(WorkbenchTest, RemoveAcceptsObjectsWithKey) {
  Workbench wb;
  wb.apply(delta(R"({"file_changes":{"add":[{"path":"a"},{"path":"b"},{"path":"c"}]}})"));
  wb.apply(delta(R"({"file_changes":{"remove":[{"path":"b"}]}})"));
  EXPECT_EQ(paths(wb), (std::vector<std::string>{"a", "c"}));
}

TEST(WorkbenchTest, GitInfoMergesFieldsAndCommits) {
  Workbench wb;
  wb.apply(delta(R"({"git_info":{"branch":"feature/x","task_commits":{"add":[{"commit_id":"c1"},{"commit_id":"c2"}]}}})"));
  wb.apply(delta(R"({"git_info":{"source_branch":"main","task_commits":{"remove":["c1"]}}})"));

  auto out = wb.to_json();
  EXPECT_EQ(json::string_at(out, "git_info.branch"), "feature/x");
  EXPECT_EQ(json::string_at(out, "git_info.source_branch"), "main");
  const auto *commits = json::find_path(out, "git_info.task_commits");
  ASSERT_NE(commits, nullptr);
  ASSERT_EQ(commits->get_array().size(), 1u);
  EXPECT_EQ(json::string_at(commits->get_array()[0], "commit_id"), "c2");
}

TEST(WorkbenchTest, ScalarFieldsAreReplaced) {
  Workbench wb;
  wb.apply(delta(R"({"status":"running","summary":"first"})"));
  wb.apply(delta(R"({"status":"completed","error":null})"));
  auto out = wb.to_json();
  EXPECT_EQ(json::string_at(out, "status"), "completed");
  EXPECT_EQ(json::string_at(out, "summary"), "first");
  ASSERT_NE(json::find(out, "error"), nullptr);
}

TEST(WorkbenchTest, MalformedDeltasAreRejected) {
  for (std::string_view text : {
           R"([1,2])",
           R"({"file_changes":[{"path":"a"}]})",
           R"({"file_changes":{"add":{"path":"a"}}})",
           R"({"file_changes":{"add":[{"name":"a"}]}})",
           R"({"file_changes":{"remove":[7]}})",
           R"({"git_info":"main"})",
           R"({"git_info":{"task_commits":{"add":[{"sha":"x"}]}}})",
       }) {
    auto parsed = parse_json(text);
    ASSERT_TRUE(parsed.has_value()) << text;
    auto d = parse_workbench_delta(*parsed);
    ASSERT_FALSE(d.has_value()) << text;
    EXPECT_TRUE(is(d.error(), Error::InvalidArgument)) << text;
  }
}

TEST(WorkbenchTest, NullSectionsAreIgnored) {
  Workbench wb;
  wb.apply(delta(R"({"file_changes":null,"git_info":null})"));
  EXPECT_TRUE(wb.empty());
}

} // namespace
} // namespace taskforge::streaming
