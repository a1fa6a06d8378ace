#include <stubgate/project_root_resolver.h>

#include <string>

#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace stubgate {
namespace {

std::string Canonical(const std::filesystem::path &path) {
  return std::filesystem::weakly_canonical(path).string();
}

TEST(FindProjectRootTest, FindsMarkerInStartingDirectory) {
  test::TemporaryProject project;
  project.AddFile("Cargo.toml", "[package]\n");
  const auto file = project.AddFile("main.rs", "fn main() {}\n");

  const auto root = FindProjectRoot(file, {"Cargo.toml"});

  ASSERT_TRUE(root.has_value());
  EXPECT_EQ(Canonical(project.root()), Canonical(*root));
}

TEST(FindProjectRootTest, ReturnsNearestAncestorWithAnyMarker) {
  test::TemporaryProject project;
  project.AddFile("package.json", "{}");
  project.AddFile("web/.eslintrc.json", "{}");
  const auto file = project.AddFile("web/src/components/app.tsx");

  const auto root =
      FindProjectRoot(file, {"package.json", ".eslintrc.json"});

  ASSERT_TRUE(root.has_value());
  EXPECT_EQ(Canonical(project.root() / "web"), Canonical(*root));
}

TEST(FindProjectRootTest, ResolvesDotDotBeforeAscending) {
  test::TemporaryProject project;
  project.AddFile("Cargo.toml", "[package]\n");
  project.AddFile("a/b/Cargo.toml", "[package]\n");
  project.AddFile("a/c/main.rs", "fn main() {}\n");

  const auto root =
      FindProjectRoot(project.root() / "a/b/../c/main.rs", {"Cargo.toml"});

  ASSERT_TRUE(root.has_value());
  EXPECT_EQ(Canonical(project.root()), Canonical(*root));
}

TEST(FindProjectRootTest, StopsAfterTenAscents) {
  test::TemporaryProject project;
  project.AddFile("go.mod", "module demo\n");
  std::filesystem::path nested;
  for (int depth = 0; depth < 11; ++depth) {
    nested /= "d" + std::to_string(depth);
  }
  const auto deep_file = project.AddFile(nested / "main.go");
  const auto reachable_file = project.AddFile(nested.parent_path() / "main.go");

  EXPECT_FALSE(FindProjectRoot(deep_file, {"go.mod"}).has_value());
  const auto root = FindProjectRoot(reachable_file, {"go.mod"});
  ASSERT_TRUE(root.has_value());
  EXPECT_EQ(Canonical(project.root()), Canonical(*root));
}

TEST(FindProjectRootTest, NoMarkersMeansNoRoot) {
  test::TemporaryProject project;
  const auto file = project.AddFile("a/b/script.py");

  EXPECT_FALSE(FindProjectRoot(file, {}).has_value());
  EXPECT_FALSE(
      FindProjectRoot(file, {"stubgate-marker-that-does-not-exist"})
          .has_value());
}

TEST(IsWithinTest, ComparesWholePathComponents) {
  test::TemporaryProject project;
  const auto hooks = project.AddDirectory("hooks");
  project.AddDirectory("hooks-extra");

  EXPECT_TRUE(IsWithin(project.root() / "hooks" / "gate.py", hooks));
  EXPECT_TRUE(IsWithin(project.root() / "hooks" / ".." / "hooks" / "x.py",
                       hooks));
  EXPECT_FALSE(IsWithin(project.root() / "hooks-extra" / "x.py", hooks));
  EXPECT_FALSE(IsWithin(project.root() / "src" / "x.py", hooks));
  EXPECT_FALSE(IsWithin(project.root() / "x.py", std::filesystem::path{}));
}

} // namespace
} // namespace stubgate
