#ifndef OUTLINE_LEVEL_ASSIGNER_HPP
#define OUTLINE_LEVEL_ASSIGNER_HPP

#include "OutlineConfig.hpp"

#include <memory>
#include <vector>

namespace outline {

/**
 * @brief Result of a 1-D clustering of font sizes
 */
struct ClusterAssignment {
  std::vector<int> labels;     ///< Cluster index for every input size
  std::vector<double> centers; ///< Center of every cluster, by index
};

/**
 * @brief Deterministic 1-D clustering of heading font sizes
 *
 * Implementations must return identical assignments for identical input.
 * The caller ranks the returned centers to derive heading levels.
 */
class LevelAssigner {
public:
  virtual ~LevelAssigner() = default;

  /**
   * @brief Cluster sizes into at most k groups
   * @param sizes Font sizes, one per heading candidate
   * @param k Requested number of clusters; clamped to the number of distinct
   * sizes
   * @return Labels and centers; empty when sizes is empty or k < 1
   */
  virtual ClusterAssignment assign(const std::vector<double> &sizes,
                                   int k) const = 0;
};

/**
 * @brief k-means clustering with cv::kmeans
 *
 * The initial labels come from a rank partition of the distinct sizes and a
 * single attempt is run, so the random generator is never consulted.
 */
class KMeansLevelAssigner : public LevelAssigner {
public:
  /**
   * @brief Constructor
   * @param maxIterations Iteration cap for cv::kmeans
   * @param epsilon Center movement below which iteration stops
   */
  explicit KMeansLevelAssigner(int maxIterations = 100, double epsilon = 1e-4);

  ClusterAssignment assign(const std::vector<double> &sizes,
                           int k) const override;

private:
  int m_maxIterations;
  double m_epsilon;
};

/**
 * @brief Jump-based binning: splits sorted sizes at the k-1 largest gaps
 */
class GapLevelAssigner : public LevelAssigner {
public:
  ClusterAssignment assign(const std::vector<double> &sizes,
                           int k) const override;
};

/// Create the assigner for the configured algorithm
std::unique_ptr<LevelAssigner> createLevelAssigner(LevelAlgorithm algorithm);

/// Number of distinct values in sizes
int countDistinct(const std::vector<double> &sizes);

} // namespace outline

#endif // OUTLINE_LEVEL_ASSIGNER_HPP
