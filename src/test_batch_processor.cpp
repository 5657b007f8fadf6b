#include <catch2/catch.hpp>

#include "BatchProcessor.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using outline::BatchProcessor;
using outline::BatchSummary;
using outline::EventLevel;
using outline::testing::CapturingRecorder;

namespace {

// Fresh scratch directory under the system temp dir, removed on scope exit
class ScratchDir {
public:
  explicit ScratchDir(const std::string &name)
      : m_path(fs::temp_directory_path() / name) {
    fs::remove_all(m_path);
    fs::create_directories(m_path);
  }
  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
  }

  const fs::path &path() const { return m_path; }

  void touch(const std::string &name) const {
    std::ofstream(m_path / name).close();
  }

private:
  fs::path m_path;
};

std::vector<std::string> startedFiles(const CapturingRecorder &recorder) {
  const std::string prefix = "--- Starting processing for: ";
  std::vector<std::string> names;
  for (const auto &event : recorder.events) {
    if (event.second.compare(0, prefix.size(), prefix) == 0)
      names.push_back(event.second.substr(prefix.size(), event.second.size() -
                                                             prefix.size() - 4));
  }
  return names;
}

} // anonymous namespace

TEST_CASE("directory runs count unreadable PDFs and keep going", "[batch]") {
  ScratchDir input("pdf_outline_batch_input");
  input.touch("bad.PDF");
  input.touch("notes.txt");
  fs::path output = input.path() / "out" / "nested";

  CapturingRecorder recorder;
  BatchProcessor processor(outline::OutlineConfig(), &recorder);
  BatchSummary summary =
      processor.processDirectory(input.path().string(), output.string());

  CHECK(summary.found == 1);
  CHECK(summary.succeeded == 0);
  CHECK(summary.failed == 1);
  CHECK(fs::is_directory(output));
  CHECK_FALSE(fs::exists(output / "bad.json"));
  CHECK_FALSE(fs::exists(output / "notes.json"));
  CHECK(recorder.contains(EventLevel::Error));

  const std::vector<std::string> expected = {"bad.PDF"};
  CHECK(startedFiles(recorder) == expected);
}

TEST_CASE("directory runs visit PDFs in sorted order", "[batch]") {
  ScratchDir input("pdf_outline_batch_sorted");
  input.touch("c.pdf");
  input.touch("a.pdf");
  input.touch("b.Pdf");
  input.touch("readme.md");

  CapturingRecorder recorder;
  BatchProcessor processor(outline::OutlineConfig(), &recorder);
  BatchSummary summary = processor.processDirectory(
      input.path().string(), (input.path() / "json").string());

  CHECK(summary.found == 3);
  CHECK(summary.failed == 3);

  const std::vector<std::string> expected = {"a.pdf", "b.Pdf", "c.pdf"};
  CHECK(startedFiles(recorder) == expected);
}

TEST_CASE("a missing input directory finds nothing", "[batch]") {
  CapturingRecorder recorder;
  BatchProcessor processor(outline::OutlineConfig(), &recorder);
  BatchSummary summary = processor.processDirectory(
      "/nonexistent/pdf_outline_input", "/nonexistent/pdf_outline_output");

  CHECK(summary.found == 0);
  CHECK(summary.succeeded == 0);
  CHECK(summary.failed == 0);
  CHECK(recorder.contains(EventLevel::Error));
}

TEST_CASE("a single unreadable PDF writes no output", "[batch]") {
  ScratchDir dir("pdf_outline_batch_single");
  dir.touch("empty.pdf");
  fs::path output = dir.path() / "empty.json";

  BatchProcessor processor;
  CHECK_FALSE(
      processor.processFile((dir.path() / "empty.pdf").string(), output.string()));
  CHECK_FALSE(fs::exists(output));

  outline::OutlineResult result;
  CHECK_FALSE(processor.outlinePdf((dir.path() / "missing.pdf").string(), result));
}
