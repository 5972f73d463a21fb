#include "press/part_filter.hpp"
#include "press/path_resolver.hpp"
#include "press/workspace_scanner.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace press;
using press::test::TempDirTest;

static ChunkedFile make_file(const std::string& path, std::size_t parts) {
    ChunkedFile f;
    f.file_path = path;
    for (std::size_t i = 1; i <= parts; ++i) f.parts.push_back({i, path + "#" + std::to_string(i)});
    return f;
}

TEST(PartFilter, KeepsOnlySelectedParts) {
    std::vector<ChunkedFile> chunks = {make_file("a.rs", 3), make_file("b.rs", 2)};
    PartSelection sel = {{"a.rs", {3, 1}}};

    auto out = filter_parts(chunks, sel);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].file_path, "a.rs");
    ASSERT_EQ(out[0].parts.size(), 2u);
    EXPECT_EQ(out[0].parts[0].part_id, 1u);
    EXPECT_EQ(out[0].parts[1].part_id, 3u);
    EXPECT_EQ(out[0].parts[1].content, "a.rs#3");
}

TEST(PartFilter, EmptySelectionEntryDropsFile) {
    std::vector<ChunkedFile> chunks = {make_file("a.rs", 2), make_file("b.rs", 2)};
    PartSelection sel = {{"a.rs", {}}, {"b.rs", {2}}};

    auto out = filter_parts(chunks, sel);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].file_path, "b.rs");
}

TEST(PartFilter, UnknownIdsSelectNothing) {
    std::vector<ChunkedFile> chunks = {make_file("a.rs", 2)};
    EXPECT_TRUE(filter_parts(chunks, {{"a.rs", {7}}}).empty());
    EXPECT_TRUE(filter_parts(chunks, {}).empty());
}

TEST(PartFilter, PreservesFileOrder) {
    std::vector<ChunkedFile> chunks = {make_file("z.rs", 1), make_file("a.rs", 1)};
    auto out = filter_parts(chunks, {{"a.rs", {1}}, {"z.rs", {1}}});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].file_path, "z.rs");
    EXPECT_EQ(out[1].file_path, "a.rs");
}

TEST(PathResolver, ExactMatchWins) {
    PathResolver r({"src/lib/a.rs", "a.rs"});
    EXPECT_EQ(r.resolve("a.rs").value(), "a.rs");
    EXPECT_EQ(r.resolve("./src/lib/a.rs").value(), "src/lib/a.rs");
}

TEST(PathResolver, SuffixFallback) {
    PathResolver r({"project/src/main.rs", "project/src/util.rs"});
    EXPECT_EQ(r.resolve("src/util.rs").value(), "project/src/util.rs");
    EXPECT_EQ(r.resolve("main.rs").value(), "project/src/main.rs");
    EXPECT_FALSE(r.resolve("other.rs").has_value());
    EXPECT_FALSE(r.resolve("").has_value());
}

TEST(PathResolver, AmbiguousSuffixTakesFirstInInputOrder) {
    PathResolver r({"b/mod.rs", "a/mod.rs"});
    EXPECT_EQ(r.resolve("mod.rs").value(), "b/mod.rs");
}

TEST(PathResolver, BackslashesCompareAsSlashes) {
    PathResolver r({"src/win/file.cpp"});
    EXPECT_EQ(r.resolve("src\\win\\file.cpp").value(), "src/win/file.cpp");
}

TEST(PathResolver, IsInsidePathIsSegmentWise) {
    EXPECT_TRUE(is_inside_path("out/press.output/x", "out/press.output"));
    EXPECT_TRUE(is_inside_path("out/press.output", "out/press.output/"));
    EXPECT_FALSE(is_inside_path("out/press.output2/x", "out/press.output"));
    EXPECT_FALSE(is_inside_path("src", "src/lib"));
}

class WorkspaceScannerTest : public TempDirTest {};

TEST_F(WorkspaceScannerTest, CollectsTextFilesRecursively) {
    write("src/main.rs", "fn main() {}\n");
    write("src/nested/util.PY", "pass\n");
    write("src/image.png", "\x89PNG");
    write("README.md", "# readme\n");

    auto files = collect_files({root_.string()}, {});
    std::sort(files.begin(), files.end());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], path("README.md"));
    EXPECT_EQ(files[1], path("src/main.rs"));
    EXPECT_EQ(files[2], path("src/nested/util.PY"));
}

TEST_F(WorkspaceScannerTest, IgnoredDirectoriesAreSkipped) {
    write("src/main.rs", "x\n");
    write("target/debug/build.rs", "x\n");

    auto files = collect_files({root_.string()}, {path("target")});
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], path("src/main.rs"));
}

TEST_F(WorkspaceScannerTest, ExplicitFilesKeptWhateverExtension) {
    auto p = write("Makefile", "all:\n");
    auto files = collect_files({p, path("missing.rs")}, {});
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], p);
}

TEST_F(WorkspaceScannerTest, OutputDirectoryIsNeverCollected) {
    write("src/a.rs", "x\n");
    write("press.output/code/src/a.rs", "staged\n");
    write("press.output/.rollback/rollback_files/00000_a.rs", "backup\n");
    auto backup = path("press.output/.rollback/rollback_files/00000_a.rs");

    auto files = collect_files({root_.string(), backup}, {}, root_ / "press.output");
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], path("src/a.rs"));
}
