#include "press/PressRunner.hpp"
#include "press/errors.hpp"
#include "test_support.hpp"
#include <deque>

using namespace press;
using press::test::numbered_lines;
using press::test::TempDirTest;

// Replies from a script, in order; an empty script entry simulates a failed request.
class ScriptedService : public CompletionService {
public:
    explicit ScriptedService(std::deque<std::string> replies) : replies_(std::move(replies)) {}

    std::string complete(const std::string& system_prompt, const std::string& user_prompt) override {
        systems.push_back(system_prompt);
        users.push_back(user_prompt);
        if (replies_.empty()) throw ApiError("script exhausted");
        std::string r = replies_.front();
        replies_.pop_front();
        if (r.empty()) throw RequestError("connection reset");
        return r;
    }

    std::vector<std::string> systems;
    std::vector<std::string> users;

private:
    std::deque<std::string> replies_;
};

class PressRunnerTest : public TempDirTest {
protected:
    Config config_;

    void SetUp() override {
        TempDirTest::SetUp();
        config_.output_directory = root_.string();
        config_.retries = 0;
        config_.retry_delay_ms = 0;
        config_.use_preprocessor = false;
    }

    fs::path out() const { return root_ / "press.output"; }

    std::shared_ptr<ScriptedService> service(std::deque<std::string> replies) {
        return std::make_shared<ScriptedService>(std::move(replies));
    }

    RunRequest request(bool auto_mode = true) {
        RunRequest r;
        r.paths = {path("src")};
        r.prompt = "do it";
        r.auto_mode = auto_mode;
        return r;
    }
};

TEST_F(PressRunnerTest, AutoRunPatchesAndRollbackRestores) {
    std::string original = numbered_lines(120);
    write("src/a.rs", original);
    auto svc = service({
        "<file path='src/a.rs'><part id=\"2\"><![CDATA[patched]]></part></file>"
        "<new_file path='" + path("src/b.rs") + "'><![CDATA[fresh\n]]></new_file>"
        "<response>All done</response>"
    });

    PressRunner runner(config_, svc);
    auto outcome = runner.run(request());

    EXPECT_EQ(outcome.files_scanned, 1u);
    EXPECT_EQ(outcome.report.modified, 1u);
    EXPECT_EQ(outcome.report.created, 1u);
    EXPECT_TRUE(outcome.rollback_saved);
    EXPECT_EQ(outcome.free_text, "All done");
    EXPECT_NE(read("src/a.rs").find("line50\npatched\nline101\n"), std::string::npos);
    EXPECT_EQ(read("src/b.rs"), "fresh\n");
    EXPECT_EQ(read("press.output/response.txt"), "All done");
    EXPECT_TRUE(exists("press.output/raw_response.log"));

    // Chunks went out in tag form with the fixed directive.
    ASSERT_EQ(svc->users.size(), 1u);
    EXPECT_NE(svc->users[0].find("<part id=\"3\">"), std::string::npos);
    EXPECT_NE(svc->users[0].find("<user_prompt>do it</user_prompt>"), std::string::npos);

    auto summary = runner.rollback();
    EXPECT_EQ(summary.restored, 1u);
    EXPECT_EQ(read("src/a.rs"), original);
    EXPECT_FALSE(exists("src/b.rs"));
    EXPECT_THROW(runner.rollback(), NoChangesToRollback);
}

TEST_F(PressRunnerTest, StagedRunWritesUnderOutputCode) {
    std::string original = "fn a() {}\n";
    auto a = write("src/a.rs", original);
    PressRunner runner(config_, service({"<file path='a.rs'><part id='1'>fn a() { 1 }</part></file>"}));

    auto outcome = runner.run(request(false));
    EXPECT_EQ(outcome.report.modified, 1u);
    EXPECT_EQ(read("src/a.rs"), original);
    auto staged = out() / "code" / staging_relative_path(a);
    EXPECT_EQ(read_file_bytes(staged.string()), "fn a() { 1 }\n");

    runner.rollback();
    EXPECT_FALSE(fs::exists(staged));
}

TEST_F(PressRunnerTest, MalformedReplyWritesNothing) {
    write("src/a.rs", "keep\n");
    PressRunner runner(config_, service({"<file path='a.rs'><part id='1'><![CDATA[broken"}));

    EXPECT_THROW(runner.run(request()), PatchFormatError);
    EXPECT_EQ(read("src/a.rs"), "keep\n");
    EXPECT_FALSE(exists("press.output"));
}

TEST_F(PressRunnerTest, RetriesFailedRequests) {
    write("src/a.rs", "a\n");
    config_.retries = 2;
    auto svc = service({"", "", "<response>ok</response>"});
    PressRunner runner(config_, svc);

    auto outcome = runner.run(request());
    EXPECT_EQ(svc->users.size(), 3u);
    EXPECT_EQ(outcome.free_text, "ok");
    EXPECT_FALSE(outcome.rollback_saved);
}

TEST_F(PressRunnerTest, RetryBudgetExhaustedSurfacesError) {
    write("src/a.rs", "a\n");
    config_.retries = 1;
    PressRunner runner(config_, service({"", ""}));
    EXPECT_THROW(runner.run(request()), RequestError);
}

TEST_F(PressRunnerTest, PreprocessorNarrowsPayload) {
    write("src/a.rs", numbered_lines(6));
    write("src/b.rs", numbered_lines(6, "other"));
    config_.use_preprocessor = true;
    config_.chunk_size = 2;
    auto svc = service({
        "<parts_to_edit><file path='a.rs'>2</file></parts_to_edit>"
        "<preprocessor_prompt>only the middle of a.rs</preprocessor_prompt>",
        "<file path='a.rs'><part id='2'>X</part></file>"
    });
    PressRunner runner(config_, svc);
    auto outcome = runner.run(request());

    EXPECT_EQ(outcome.files_sent, 1u);
    ASSERT_EQ(svc->users.size(), 2u);
    const std::string& second = svc->users[1];
    EXPECT_NE(second.find("<part id=\"2\"><![CDATA[line3\nline4]]></part>"), std::string::npos);
    EXPECT_EQ(second.find("line1"), std::string::npos);
    EXPECT_EQ(second.find("other"), std::string::npos);
    EXPECT_NE(second.find("<preprocessor_prompt>only the middle of a.rs</preprocessor_prompt>"), std::string::npos);
    EXPECT_EQ(read("src/a.rs"), "line1\nline2\nX\nline5\nline6\n");
}

TEST_F(PressRunnerTest, EmptySelectionFallsBackToAllParts) {
    write("src/a.rs", "a\n");
    config_.use_preprocessor = true;
    auto svc = service({"<parts_to_edit></parts_to_edit>", "<response>none</response>"});
    PressRunner runner(config_, svc);
    auto outcome = runner.run(request());
    EXPECT_EQ(outcome.files_sent, 1u);
}

TEST_F(PressRunnerTest, JsonFormatEndToEnd) {
    write("src/a.rs", "one\ntwo\n");
    config_.response_format = "json";
    config_.chunk_size = 1;
    auto svc = service({R"(```json
{"updated_files": [{"file_path": "src/a.rs", "parts": [{"part_id": "2", "content": "TWO"}]}]}
```)"});
    PressRunner runner(config_, svc);
    runner.run(request());
    EXPECT_EQ(read("src/a.rs"), "one\nTWO\n");
    EXPECT_NE(svc->users[0].find("\"updated_files\""), std::string::npos);
}

TEST_F(PressRunnerTest, ClearsLooseFilesButKeepsRollbackArea) {
    write("src/a.rs", "a\n");
    write("press.output/stale.txt", "old");
    PressRunner runner(config_, service({"<file path='a.rs'><part id='1'>b</part></file>"}));
    runner.run(request());
    EXPECT_FALSE(exists("press.output/stale.txt"));
    EXPECT_TRUE(exists("press.output/.rollback/rollback.json"));
}

TEST_F(PressRunnerTest, LaterRunsDoNotSendStagedCopiesOrBackups) {
    write("src/a.rs", "fn a() {}\n");
    auto svc = service({"<file path='a.rs'><part id='1'>fn a() { 1 }</part></file>", "<response>ok</response>"});
    PressRunner runner(config_, svc);
    runner.run(request(false));
    ASSERT_TRUE(exists("press.output/code"));

    RunRequest whole = request(false);
    whole.paths = {root_.string()};
    auto outcome = runner.run(whole);
    EXPECT_EQ(outcome.files_scanned, 1u);
    EXPECT_EQ(svc->users[1].find("press.output"), std::string::npos);
}

TEST_F(PressRunnerTest, NoInputFilesIsAnError) {
    fs::create_directories(root_ / "src");
    PressRunner runner(config_, service({}));
    EXPECT_THROW(runner.run(request()), PressError);
}

TEST_F(PressRunnerTest, CheckpointAndRevert) {
    write("src/a.rs", "v1\n");
    PressRunner runner(config_, nullptr);
    EXPECT_THROW(runner.revert(), NoCheckpointToRevert);
    EXPECT_EQ(runner.checkpoint({path("src")}), 1u);
    write("src/a.rs", "v2\n");
    runner.revert();
    EXPECT_EQ(read("src/a.rs"), "v1\n");
}

TEST(NormalizeSelection, MapsShortPathsOntoKnownFiles) {
    PartSelection sel = {{"a.rs", {1}}, {"/abs/proj/a.rs", {2}}, {"ghost.rs", {3}}};
    auto out = PressRunner::normalize_selection(sel, {"/abs/proj/a.rs"});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out.at("/abs/proj/a.rs"), (std::set<std::size_t>{1, 2}));
}
