#include "OutlineTypes.hpp"

namespace outline {

const char *const kUntitledDocument = "Untitled Document";
const char *const kNoContentFound = "No Content Found";

std::string TextLine::text() const {
  std::string joined;
  for (const auto &word : words) {
    if (!joined.empty())
      joined += ' ';
    joined += word.text;
  }
  return joined;
}

std::string toString(HeadingLevel level) {
  switch (level) {
  case HeadingLevel::H1:
    return "H1";
  case HeadingLevel::H2:
    return "H2";
  case HeadingLevel::H3:
  default:
    return "H3";
  }
}

HeadingLevel levelFromRank(int rank) {
  if (rank <= 0)
    return HeadingLevel::H1;
  if (rank == 1)
    return HeadingLevel::H2;
  return HeadingLevel::H3;
}

} // namespace outline
