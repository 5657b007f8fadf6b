#include "BatchProcessor.hpp"

#include "EventRecorder.hpp"
#include "OutlineJson.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace outline {

namespace {

bool hasPdfExtension(const std::filesystem::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext == ".pdf";
}

} // anonymous namespace

BatchProcessor::BatchProcessor(const OutlineConfig &config,
                               EventRecorder *recorder)
    : m_extractor(recorder), m_outliner(config, recorder),
      m_recorder(recorder) {}

void BatchProcessor::log(EventLevel level, const std::string &message) const {
  if (m_recorder)
    m_recorder->recordEvent(level, message);
}

bool BatchProcessor::outlinePdf(const std::string &pdfPath,
                                OutlineResult &result) const {
  PDFExtractionResult extraction = m_extractor.extract(pdfPath);
  if (!extraction.success) {
    log(EventLevel::Error, extraction.errorMessage);
    return false;
  }
  if (extraction.pages.empty()) {
    log(EventLevel::Error, "Could not extract any data from PDF: " + pdfPath);
    return false;
  }

  result = m_outliner.process(extraction.pages);
  return true;
}

bool BatchProcessor::processFile(const std::string &pdfPath,
                                 const std::string &outputPath) const {
  std::string name = std::filesystem::path(pdfPath).filename().string();
  log(EventLevel::Info, "--- Starting processing for: " + name + " ---");
  auto startTime = std::chrono::high_resolution_clock::now();

  OutlineResult result;
  if (!outlinePdf(pdfPath, result))
    return false;

  if (!writeOutlineJson(result, outputPath)) {
    log(EventLevel::Error, "Failed to write output file: " + outputPath);
    return false;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  double seconds =
      std::chrono::duration<double>(endTime - startTime).count();
  std::ostringstream msg;
  msg << "Successfully processed " << name << " in " << std::fixed
      << std::setprecision(2) << seconds << " seconds.";
  log(EventLevel::Info, msg.str());
  return true;
}

BatchSummary BatchProcessor::processDirectory(
    const std::string &inputDir, const std::string &outputDir) const {
  namespace fs = std::filesystem;
  BatchSummary summary;

  std::error_code ec;
  if (!fs::is_directory(inputDir, ec)) {
    log(EventLevel::Error, "Input directory not found: " + inputDir);
    return summary;
  }

  fs::create_directories(outputDir, ec);
  if (ec) {
    log(EventLevel::Error, "Failed to create output directory '" + outputDir +
                               "': " + ec.message());
    return summary;
  }

  std::vector<fs::path> pdfFiles;
  for (const auto &entry : fs::directory_iterator(inputDir, ec)) {
    if (entry.is_regular_file(ec) && hasPdfExtension(entry.path()))
      pdfFiles.push_back(entry.path());
  }
  if (ec) {
    log(EventLevel::Error,
        "Failed to list '" + inputDir + "': " + ec.message());
  }
  // Directory iteration order is unspecified
  std::sort(pdfFiles.begin(), pdfFiles.end());

  summary.found = static_cast<int>(pdfFiles.size());
  log(EventLevel::Info, "Found " + std::to_string(summary.found) +
                            " PDF(s) to process in '" + inputDir + "'.");

  for (const auto &pdfFile : pdfFiles) {
    fs::path outputFile =
        fs::path(outputDir) / (pdfFile.stem().string() + ".json");
    if (processFile(pdfFile.string(), outputFile.string()))
      summary.succeeded++;
    else
      summary.failed++;
  }

  log(EventLevel::Info, "--- All processing complete ---");
  return summary;
}

} // namespace outline
