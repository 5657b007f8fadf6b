#include "BatchProcessor.hpp"
#include "DocumentOutliner.hpp"
#include "EventRecorder.hpp"
#include "OutlineJson.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " [options] <input.pdf | input_dir>\n"
      << "       " << programName << " [options] --words <words.json>\n"
      << "\nOptions:\n"
      << "  -o, --output <path>        Output JSON file, or output directory\n"
      << "                             when the input is a directory\n"
      << "                             (default: stdout / \"output\")\n"
      << "      --words <file>         Read extracted words from a JSON dump\n"
      << "                             instead of a PDF\n"
      << "      --algorithm <name>     Level clustering: kmeans (default) or "
         "gap\n"
      << "      --header-ratio <r>     Header/footer band height, fraction of\n"
      << "                             the page (default: 0.08)\n"
      << "      --center-tolerance <r> Centering tolerance, fraction of the\n"
      << "                             page width (default: 0.15)\n"
      << "      --title-max-top <y>    Lowest title position in points\n"
      << "                             (default: 400)\n"
      << "  -v, --verbose              Log debug messages\n"
      << "  -q, --quiet                Log warnings and errors only\n"
      << "  -h, --help                 Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " report.pdf\n"
      << "  " << programName << " report.pdf -o report.json\n"
      << "  " << programName << " input/ -o output/\n";
}

bool parseNumber(const std::string &text, double &value) {
  try {
    size_t consumed = 0;
    value = std::stod(text, &consumed);
    return consumed == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 2;
  }

  std::string inputPath;
  std::string outputPath;
  std::string wordsPath;
  outline::OutlineConfig config;
  outline::EventLevel logLevel = outline::EventLevel::Info;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto requireValue = [&](std::string &value) {
      if (i + 1 < argc) {
        value = argv[++i];
        return true;
      }
      std::cerr << "Error: " << arg << " requires an argument\n";
      return false;
    };

    auto requireNumber = [&](double &number) {
      std::string value;
      if (!requireValue(value))
        return false;
      if (!parseNumber(value, number)) {
        std::cerr << "Error: " << arg << " expects a number, got '" << value
                  << "'\n";
        return false;
      }
      return true;
    };

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-o" || arg == "--output") {
      if (!requireValue(outputPath))
        return 2;
    } else if (arg == "--words") {
      if (!requireValue(wordsPath))
        return 2;
    } else if (arg == "--algorithm") {
      std::string name;
      if (!requireValue(name))
        return 2;
      if (!outline::parseLevelAlgorithm(name,
                                        config.classifier.levelAlgorithm)) {
        std::cerr << "Error: unknown algorithm '" << name
                  << "' (expected kmeans or gap)\n";
        return 2;
      }
    } else if (arg == "--header-ratio") {
      if (!requireNumber(config.classifier.headerFooterRatio))
        return 2;
    } else if (arg == "--center-tolerance") {
      if (!requireNumber(config.classifier.centerToleranceRatio))
        return 2;
    } else if (arg == "--title-max-top") {
      if (!requireNumber(config.classifier.titleMaxTop))
        return 2;
    } else if (arg == "-v" || arg == "--verbose") {
      logLevel = outline::EventLevel::Debug;
    } else if (arg == "-q" || arg == "--quiet") {
      logLevel = outline::EventLevel::Warning;
    } else if (!arg.empty() && arg[0] != '-') {
      inputPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 2;
    }
  }

  outline::StreamEventRecorder recorder(std::cerr, logLevel);

  if (!wordsPath.empty()) {
    std::vector<outline::PageContent> pages;
    try {
      pages = outline::loadPagesFromFile(wordsPath);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }

    outline::DocumentOutliner outliner(config, &recorder);
    outline::OutlineResult result = outliner.process(pages);

    if (outputPath.empty()) {
      std::cout << outline::dumpOutline(result) << std::endl;
    } else if (!outline::writeOutlineJson(result, outputPath)) {
      std::cerr << "Error: failed to write " << outputPath << "\n";
      return 1;
    }
    return 0;
  }

  if (inputPath.empty()) {
    std::cerr << "Error: No input path provided\n";
    printUsage(argv[0]);
    return 2;
  }

  if (!std::filesystem::exists(inputPath)) {
    std::cerr << "Input not found: " << inputPath << "\n";
    return 2;
  }

  outline::BatchProcessor processor(config, &recorder);

  if (std::filesystem::is_directory(inputPath)) {
    std::string outputDir = outputPath.empty() ? "output" : outputPath;
    outline::BatchSummary summary =
        processor.processDirectory(inputPath, outputDir);
    std::cerr << "Processed " << summary.succeeded << " of " << summary.found
              << " PDF(s), " << summary.failed << " failed\n";
    return summary.failed > 0 ? 1 : 0;
  }

  if (!outputPath.empty()) {
    return processor.processFile(inputPath, outputPath) ? 0 : 1;
  }

  outline::OutlineResult result;
  if (!processor.outlinePdf(inputPath, result))
    return 1;
  std::cout << outline::dumpOutline(result) << std::endl;
  return 0;
}
