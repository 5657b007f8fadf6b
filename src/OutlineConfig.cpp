#include "OutlineConfig.hpp"

#include <algorithm>
#include <cctype>

namespace outline {

bool parseLevelAlgorithm(const std::string &name, LevelAlgorithm &algorithm) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lower == "kmeans" || lower == "k-means") {
    algorithm = LevelAlgorithm::KMeans;
    return true;
  }
  if (lower == "gap" || lower == "largest-gap") {
    algorithm = LevelAlgorithm::LargestGap;
    return true;
  }
  return false;
}

} // namespace outline
