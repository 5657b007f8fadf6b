#ifndef OUTLINE_JSON_HPP
#define OUTLINE_JSON_HPP

#include "OutlineTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace outline {

/**
 * @brief Convert an outline to {"title": ..., "outline": [...]}
 *
 * Keys keep their insertion order.
 */
nlohmann::ordered_json toJson(const OutlineResult &result);

/**
 * @brief Serialize an outline with 4-space indentation
 *
 * Non-ASCII characters are written as UTF-8, not as \u escapes.
 */
std::string dumpOutline(const OutlineResult &result);

/**
 * @brief Write an outline to a JSON file
 * @param result Outline to write
 * @param outputPath Destination file, overwritten if present
 * @return true if the file was written completely
 */
bool writeOutlineJson(const OutlineResult &result,
                      const std::string &outputPath);

/**
 * @brief Read pages of words from a word dump
 *
 * Expected layout:
 * @code
 * [{"page": 1, "width": 595, "height": 842,
 *   "words": [{"text": "Title", "x0": 10, "top": 20, "x1": 60,
 *              "bottom": 34, "fontname": "Arial-Bold", "size": 14}]}]
 * @endcode
 * A top-level object with a "pages" array is accepted as well. "width" and
 * "height" default to A4; "page" defaults to the position in the array.
 *
 * @throws std::runtime_error if the document does not have this shape
 */
std::vector<PageContent> pagesFromJson(const nlohmann::json &document);

/**
 * @brief Load a word dump from disk
 * @throws std::runtime_error if the file cannot be read or parsed
 */
std::vector<PageContent> loadPagesFromFile(const std::string &path);

} // namespace outline

#endif // OUTLINE_JSON_HPP
