#include "press/errors.hpp"
#include "press/patch/JsonDecoder.hpp"
#include <gtest/gtest.h>

using namespace press;

TEST(JsonDecoder, DecodesFullDocument) {
    JsonDecoder d;
    auto r = d.decode_patch(R"({
        "updated_files": [
            {"file_path": "src/a.rs", "parts": [{"part_id": 2, "content": "fn b() {}"},
                                                {"part_id": "3", "content": "x"}]}
        ],
        "new_files": [{"file_path": "src/new.rs", "content": "// new\n"}],
        "response": "Refactored b."
    })");

    ASSERT_EQ(r.updated.size(), 1u);
    EXPECT_EQ(r.updated[0].file_path, "src/a.rs");
    ASSERT_EQ(r.updated[0].parts.size(), 2u);
    EXPECT_EQ(r.updated[0].parts[0].part_id, 2u);
    EXPECT_EQ(r.updated[0].parts[0].content, "fn b() {}");
    EXPECT_EQ(r.updated[0].parts[1].part_id, 3u);

    ASSERT_EQ(r.created.size(), 1u);
    EXPECT_EQ(r.created[0].content, "// new\n");
    EXPECT_EQ(r.free_text, "Refactored b.");
}

TEST(JsonDecoder, AcceptsMarkdownFenceAndProse) {
    JsonDecoder d;
    auto fenced = d.decode_patch("Here:\n```json\n{\"response\": \"ok\"}\n```\nbye");
    EXPECT_EQ(fenced.free_text, "ok");

    auto prose = d.decode_patch("Result follows {\"new_files\": [{\"file_path\": \"a\", \"content\": \"b\"}]} done");
    ASSERT_EQ(prose.created.size(), 1u);
}

TEST(JsonDecoder, FenceInsideContentDoesNotEndTheBlock) {
    JsonDecoder d;
    auto r = d.decode_patch(R"(Here you go:
```json
{"new_files": [{"file_path": "BUILD.md", "content": "Run:\n```sh\nmake\n```\n"}]}
```
Note: {braces} in prose.)");
    ASSERT_EQ(r.created.size(), 1u);
    EXPECT_EQ(r.created[0].content, "Run:\n```sh\nmake\n```\n");

    auto bare = d.decode_patch("  {\"response\": \"```json\\n{}\\n```\"}\n");
    EXPECT_EQ(bare.free_text, "```json\n{}\n```");
}

TEST(JsonDecoder, BadIdsBecomeZero) {
    JsonDecoder d;
    auto r = d.decode_patch(R"({"updated_files": [{"file_path": "a.rs", "parts": [
        {"part_id": -1, "content": "a"}, {"part_id": "two", "content": "b"}, {"content": "c"}]}]})");
    ASSERT_EQ(r.updated.size(), 1u);
    for (const auto& p : r.updated[0].parts) EXPECT_EQ(p.part_id, 0u);
}

TEST(JsonDecoder, SkipsEntriesWithoutPath) {
    JsonDecoder d;
    auto r = d.decode_patch(R"({"updated_files": [{"parts": [{"part_id": 1, "content": "a"}]}, 5],
                               "new_files": [{"content": "orphan"}]})");
    EXPECT_TRUE(r.updated.empty());
    EXPECT_TRUE(r.created.empty());
    EXPECT_TRUE(r.free_text.empty());
}

TEST(JsonDecoder, MalformedDocumentThrows) {
    JsonDecoder d;
    EXPECT_THROW(d.decode_patch("{\"updated_files\": [}"), PatchFormatError);
    EXPECT_THROW(d.decode_patch("no json here"), PatchFormatError);
    EXPECT_THROW(d.decode_patch("[1, 2]"), PatchFormatError);
}

TEST(JsonDecoder, DecodesSelection) {
    JsonDecoder d;
    auto r = d.decode_selection(R"({"parts_to_edit": [{"file_path": "a.rs", "parts": [1, "3", 0]},
                                                      {"file_path": "b.rs", "parts": []}],
                                   "preprocessor_prompt": "a.rs only"})");
    EXPECT_EQ(r.selection.at("a.rs"), (std::set<std::size_t>{1, 3}));
    EXPECT_TRUE(r.selection.at("b.rs").empty());
    EXPECT_EQ(r.preprocessor_prompt, "a.rs only");
}

TEST(ResponseFormat, ParsesNames) {
    EXPECT_EQ(parse_response_format("xml"), ResponseFormat::Tag);
    EXPECT_EQ(parse_response_format("TAG"), ResponseFormat::Tag);
    EXPECT_EQ(parse_response_format("json"), ResponseFormat::Json);
    EXPECT_THROW(parse_response_format("yaml"), ConfigError);
    EXPECT_EQ(to_string(ResponseFormat::Json), "json");
}

TEST(ResponseFormat, FactoryPicksDecoder) {
    auto tag = make_decoder(ResponseFormat::Tag);
    auto r = tag->decode_patch("<response>hi</response>");
    EXPECT_EQ(r.free_text, "hi");

    auto json = make_decoder(ResponseFormat::Json);
    EXPECT_EQ(json->decode_patch("{\"response\": \"hi\"}").free_text, "hi");
}

TEST(PartId, ParsesPlainNumbersOnly) {
    EXPECT_EQ(parse_part_id("12"), 12u);
    EXPECT_EQ(parse_part_id(" 7 "), 7u);
    EXPECT_EQ(parse_part_id("1a"), 0u);
    EXPECT_EQ(parse_part_id("-3"), 0u);
    EXPECT_EQ(parse_part_id(""), 0u);
    EXPECT_EQ(parse_part_id("99999999999999999999999"), 0u);
}
