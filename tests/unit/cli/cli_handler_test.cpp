#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rentwise_cli/cli_handler.hpp"
#include "../../common/utilities_test.hpp"

namespace rentwise_cli {

namespace {

CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "rentwise");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return CliHandler::parse_arguments(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CliHandlerParseTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST(CliHandlerParseTest, AskWithIdentity) {
  CliOptions options = parse({"ask", "-q", "Can I rent a room?", "--identity", "Student Pass holder", "-v"});

  EXPECT_EQ(options.command, Command::Ask);
  EXPECT_EQ(options.question, "Can I rent a room?");
  EXPECT_EQ(options.identity, "Student Pass holder");
  EXPECT_TRUE(options.verbose);
}

TEST(CliHandlerParseTest, AskRequiresQuestion) {
  EXPECT_THROW(parse({"ask"}), CliError);
  EXPECT_THROW(parse({"ask", "--question"}), CliError);
}

TEST(CliHandlerParseTest, IngestAndEvaluate) {
  CliOptions ingest = parse({"ingest", "--manifest", "docs.json"});
  EXPECT_EQ(ingest.command, Command::Ingest);
  EXPECT_EQ(ingest.manifest_path, "docs.json");

  CliOptions evaluate = parse({"e", "-q", "questions.json"});
  EXPECT_EQ(evaluate.command, Command::Evaluate);
  EXPECT_EQ(evaluate.questions_path, "questions.json");
  EXPECT_EQ(evaluate.report_path, "./evaluation_report.md");

  CliOptions with_report = parse({"evaluate", "--questions", "q.json", "-r", "out.md"});
  EXPECT_EQ(with_report.report_path, "out.md");
}

TEST(CliHandlerParseTest, UnknownCommandOrOptionThrows) {
  EXPECT_THROW(parse({"frobnicate"}), CliError);
  EXPECT_THROW(parse({"ask", "-q", "x", "--loud"}), CliError);
  EXPECT_EQ(parse({"stats"}).command, Command::Stats);
}

class IngestManifestTest : public rentwise_tests::TempDirTestBase {};

TEST_F(IngestManifestTest, ReadsInlineAndFileContent) {
  rentwise_tests::TestUtilities::write_file(temp_dir_ / "page.txt", "Content from a file.");
  const auto manifest = temp_dir_ / "manifest.json";
  rentwise_tests::TestUtilities::write_file(manifest, R"([
    {"url": "https://www.hdb.gov.sg/a", "title": "A", "content": "Inline content."},
    {"url": "https://www.ura.gov.sg/b", "category": "ura", "content_file": "page.txt"}
  ])");

  nlohmann::json documents = CliHandler::load_ingest_manifest(manifest.string());

  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[0]["content"], "Inline content.");
  EXPECT_EQ(documents[0]["title"], "A");
  EXPECT_EQ(documents[1]["content"], "Content from a file.");
  EXPECT_EQ(documents[1]["category"], "ura");
  EXPECT_EQ(documents[1]["title"], "");
}

TEST_F(IngestManifestTest, EntryWithoutContentThrows) {
  const auto manifest = temp_dir_ / "manifest.json";
  rentwise_tests::TestUtilities::write_file(manifest, R"([{"url": "https://www.hdb.gov.sg/a"}])");

  EXPECT_THROW(CliHandler::load_ingest_manifest(manifest.string()), CliError);
}

}  // namespace rentwise_cli
