#include "LevelAssigner.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <numeric>

namespace outline {

namespace {

std::vector<double> sortedDistinct(const std::vector<double> &sizes) {
  std::vector<double> distinct(sizes);
  std::sort(distinct.begin(), distinct.end());
  distinct.erase(std::unique(distinct.begin(), distinct.end()),
                 distinct.end());
  return distinct;
}

int distinctIndex(const std::vector<double> &distinct, double size) {
  return static_cast<int>(
      std::lower_bound(distinct.begin(), distinct.end(), size) -
      distinct.begin());
}

/**
 * @brief Mean of the sizes carrying each label
 */
std::vector<double> clusterMeans(const std::vector<double> &sizes,
                                 const std::vector<int> &labels, int k) {
  std::vector<double> sums(static_cast<size_t>(k), 0.0);
  std::vector<int> counts(static_cast<size_t>(k), 0);
  for (size_t i = 0; i < sizes.size(); ++i) {
    sums[static_cast<size_t>(labels[i])] += sizes[i];
    counts[static_cast<size_t>(labels[i])]++;
  }

  std::vector<double> centers(static_cast<size_t>(k), 0.0);
  for (size_t c = 0; c < centers.size(); ++c) {
    if (counts[c] > 0)
      centers[c] = sums[c] / counts[c];
  }
  return centers;
}

/**
 * @brief Split the distinct sizes into k equal-rank buckets, smallest first
 *
 * Every bucket is non-empty as long as k does not exceed the number of
 * distinct sizes.
 */
ClusterAssignment rankPartition(const std::vector<double> &sizes,
                                const std::vector<double> &distinct, int k) {
  ClusterAssignment result;
  const int d = static_cast<int>(distinct.size());
  result.labels.reserve(sizes.size());
  for (double size : sizes) {
    result.labels.push_back(distinctIndex(distinct, size) * k / d);
  }
  result.centers = clusterMeans(sizes, result.labels, k);
  return result;
}

ClusterAssignment singleCluster(const std::vector<double> &sizes) {
  ClusterAssignment result;
  result.labels.assign(sizes.size(), 0);
  result.centers = clusterMeans(sizes, result.labels, 1);
  return result;
}

} // anonymous namespace

int countDistinct(const std::vector<double> &sizes) {
  return static_cast<int>(sortedDistinct(sizes).size());
}

KMeansLevelAssigner::KMeansLevelAssigner(int maxIterations, double epsilon)
    : m_maxIterations(maxIterations), m_epsilon(epsilon) {}

ClusterAssignment KMeansLevelAssigner::assign(const std::vector<double> &sizes,
                                              int k) const {
  if (sizes.empty() || k < 1)
    return ClusterAssignment();

  std::vector<double> distinct = sortedDistinct(sizes);
  k = std::min(k, static_cast<int>(distinct.size()));
  if (k == 1)
    return singleCluster(sizes);

  ClusterAssignment initial = rankPartition(sizes, distinct, k);

  const int n = static_cast<int>(sizes.size());
  cv::Mat samples(n, 1, CV_32F);
  cv::Mat labels(n, 1, CV_32S);
  for (int i = 0; i < n; ++i) {
    samples.at<float>(i, 0) = static_cast<float>(sizes[static_cast<size_t>(i)]);
    labels.at<int>(i, 0) = initial.labels[static_cast<size_t>(i)];
  }

  cv::Mat centers;
  const cv::TermCriteria criteria(cv::TermCriteria::EPS +
                                      cv::TermCriteria::MAX_ITER,
                                  m_maxIterations, m_epsilon);
  try {
    // One attempt from the given labels: no random initialisation
    cv::kmeans(samples, k, labels, criteria, 1, cv::KMEANS_USE_INITIAL_LABELS,
               centers);
  } catch (const cv::Exception &) {
    return initial;
  }

  if (centers.rows != k || labels.rows != n)
    return initial;

  ClusterAssignment result;
  result.labels.reserve(sizes.size());
  for (int i = 0; i < n; ++i) {
    int label = labels.at<int>(i, 0);
    if (label < 0 || label >= k)
      return initial;
    result.labels.push_back(label);
  }
  for (int c = 0; c < k; ++c) {
    result.centers.push_back(static_cast<double>(centers.at<float>(c, 0)));
  }
  return result;
}

ClusterAssignment GapLevelAssigner::assign(const std::vector<double> &sizes,
                                           int k) const {
  if (sizes.empty() || k < 1)
    return ClusterAssignment();

  std::vector<double> distinct = sortedDistinct(sizes);
  k = std::min(k, static_cast<int>(distinct.size()));
  if (k == 1)
    return singleCluster(sizes);

  // Gap i lies between distinct[i] and distinct[i + 1]
  std::vector<size_t> gapOrder(distinct.size() - 1);
  std::iota(gapOrder.begin(), gapOrder.end(), 0);
  std::stable_sort(gapOrder.begin(), gapOrder.end(),
                   [&distinct](size_t a, size_t b) {
                     return (distinct[a + 1] - distinct[a]) >
                            (distinct[b + 1] - distinct[b]);
                   });

  std::vector<size_t> splits(gapOrder.begin(), gapOrder.begin() + (k - 1));
  std::sort(splits.begin(), splits.end());

  ClusterAssignment result;
  result.labels.reserve(sizes.size());
  for (double size : sizes) {
    size_t index = static_cast<size_t>(distinctIndex(distinct, size));
    // Label = number of splits strictly below this value
    int label = static_cast<int>(
        std::lower_bound(splits.begin(), splits.end(), index) -
        splits.begin());
    result.labels.push_back(label);
  }
  result.centers = clusterMeans(sizes, result.labels, k);
  return result;
}

std::unique_ptr<LevelAssigner> createLevelAssigner(LevelAlgorithm algorithm) {
  switch (algorithm) {
  case LevelAlgorithm::LargestGap:
    return std::make_unique<GapLevelAssigner>();
  case LevelAlgorithm::KMeans:
  default:
    return std::make_unique<KMeansLevelAssigner>();
  }
}

} // namespace outline
