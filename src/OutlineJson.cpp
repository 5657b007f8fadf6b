#include "OutlineJson.hpp"

#include <fstream>
#include <stdexcept>

namespace outline {

namespace {

double requireNumber(const nlohmann::json &word, const char *key) {
  auto it = word.find(key);
  if (it == word.end() || !it->is_number()) {
    throw std::runtime_error(std::string("word is missing numeric field \"") +
                             key + "\"");
  }
  return it->get<double>();
}

WordFragment wordFromJson(const nlohmann::json &word, int pageNumber) {
  if (!word.is_object())
    throw std::runtime_error("word entry is not an object");

  WordFragment fragment;
  fragment.text = word.value("text", std::string());
  double x0 = requireNumber(word, "x0");
  double top = requireNumber(word, "top");
  double x1 = requireNumber(word, "x1");
  double bottom = requireNumber(word, "bottom");
  fragment.boundingBox = cv::Rect2d(x0, top, x1 - x0, bottom - top);

  if (word.contains("fontname"))
    fragment.fontName = word.value("fontname", std::string());
  else
    fragment.fontName = word.value("font_name", std::string());

  if (word.contains("size"))
    fragment.fontSize = requireNumber(word, "size");
  else if (word.contains("font_size"))
    fragment.fontSize = requireNumber(word, "font_size");
  else
    fragment.fontSize = bottom - top;

  fragment.pageNumber = pageNumber;
  return fragment;
}

} // anonymous namespace

nlohmann::ordered_json toJson(const OutlineResult &result) {
  nlohmann::ordered_json entries = nlohmann::ordered_json::array();
  for (const auto &entry : result.outline) {
    nlohmann::ordered_json item;
    item["level"] = toString(entry.level);
    item["text"] = entry.text;
    item["page"] = entry.page;
    entries.push_back(std::move(item));
  }

  nlohmann::ordered_json document;
  document["title"] = result.title;
  document["outline"] = std::move(entries);
  return document;
}

std::string dumpOutline(const OutlineResult &result) {
  // ensure_ascii = false keeps UTF-8; invalid sequences are replaced
  return toJson(result).dump(4, ' ', false,
                             nlohmann::ordered_json::error_handler_t::replace);
}

bool writeOutlineJson(const OutlineResult &result,
                      const std::string &outputPath) {
  std::ofstream ofs(outputPath, std::ios::binary | std::ios::trunc);
  if (!ofs)
    return false;
  ofs << dumpOutline(result) << "\n";
  ofs.close();
  return !ofs.fail();
}

std::vector<PageContent> pagesFromJson(const nlohmann::json &document) {
  const nlohmann::json *pageArray = &document;
  if (document.is_object()) {
    auto it = document.find("pages");
    if (it == document.end())
      throw std::runtime_error("word dump object has no \"pages\" array");
    pageArray = &*it;
  }
  if (!pageArray->is_array())
    throw std::runtime_error("word dump pages are not an array");

  std::vector<PageContent> pages;
  pages.reserve(pageArray->size());

  try {
    int position = 1;
    for (const auto &pageJson : *pageArray) {
      if (!pageJson.is_object())
        throw std::runtime_error("page entry is not an object");

      PageContent page;
      page.pageNumber = pageJson.value("page", position);
      page.width = pageJson.value("width", kDefaultPageWidth);
      page.height = pageJson.value("height", kDefaultPageHeight);

      auto words = pageJson.find("words");
      if (words != pageJson.end()) {
        if (!words->is_array())
          throw std::runtime_error("page \"words\" is not an array");
        for (const auto &word : *words) {
          WordFragment fragment = wordFromJson(word, page.pageNumber);
          if (!fragment.text.empty())
            page.words.push_back(std::move(fragment));
        }
      }

      pages.push_back(std::move(page));
      position++;
    }
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("malformed word dump: ") + e.what());
  }

  return pages;
}

std::vector<PageContent> loadPagesFromFile(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    throw std::runtime_error("Failed to open word dump: " + path);

  nlohmann::json document;
  try {
    ifs >> document;
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Failed to parse word dump " + path + ": " +
                             e.what());
  }
  return pagesFromJson(document);
}

} // namespace outline
