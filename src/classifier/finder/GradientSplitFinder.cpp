#include "classifier/finder/GradientSplitFinder.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

constexpr double kValueEps = 1e-12;

// Strict ordering of candidates: higher gain, then lower feature index.
bool isBetter(const SplitCandidate& a, const SplitCandidate& b) {
    if (!a.found()) return false;
    if (!b.found()) return true;
    if (a.gain != b.gain) return a.gain > b.gain;
    return a.feature < b.feature;
}

// Walks the node's rows of one feature in ascending value order and scores
// every boundary between distinct values.
SplitCandidate scanFeature(const ColumnData& columnData,
                           int feature,
                           const std::vector<int>& nodeRows,
                           const std::vector<double>& gradients,
                           const std::vector<double>& hessians,
                           const GradientSums& node,
                           const GainCriterion& criterion) {
    SplitCandidate best;
    GradientSums left;

    for (size_t pos = 0; pos + 1 < nodeRows.size(); ++pos) {
        const int row = nodeRows[pos];
        left.add(gradients[row], hessians[row]);

        const double value = columnData.at(row, feature);
        const double nextValue = columnData.at(nodeRows[pos + 1], feature);
        if (std::abs(nextValue - value) < kValueEps) continue;

        if (!criterion.admitsChild(left) || !criterion.admitsChild(node - left)) continue;

        const double gain = criterion.splitGain(left, node);
        if (!best.found() || gain > best.gain) {
            best.feature = feature;
            best.threshold = 0.5 * (value + nextValue);
            best.gain = gain;
        }
    }
    return best;
}

} // namespace

ColumnData::ColumnData(const std::vector<double>& data, int features, size_t samples)
    : values(data), numFeatures(features), numSamples(samples) {
    sortedIndices.resize(features);

    #pragma omp parallel for schedule(dynamic) if(features > 4)
    for (int f = 0; f < features; ++f) {
        auto& idx = sortedIndices[f];
        idx.resize(samples);
        std::iota(idx.begin(), idx.end(), 0);
        std::stable_sort(idx.begin(), idx.end(),
                         [&](int a, int b) { return at(a, f) < at(b, f); });
    }
}

GradientSums GradientSplitFinder::sumNode(const std::vector<double>& gradients,
                                          const std::vector<double>& hessians,
                                          const std::vector<char>& nodeMask) {
    GradientSums sums;
    for (size_t i = 0; i < nodeMask.size(); ++i) {
        if (nodeMask[i]) sums.add(gradients[i], hessians[i]);
    }
    return sums;
}

SplitCandidate GradientSplitFinder::findBestSplit(const ColumnData& columnData,
                                                  const std::vector<double>& gradients,
                                                  const std::vector<double>& hessians,
                                                  const std::vector<char>& nodeMask,
                                                  const std::vector<char>& featureMask,
                                                  const GradientSums& node,
                                                  const GainCriterion& criterion) const {
    SplitCandidate best;
    if (!criterion.mayHaveChildren(node)) return best;

    #pragma omp parallel if(columnData.numFeatures > 4)
    {
        SplitCandidate localBest;
        std::vector<int> nodeRows;
        nodeRows.reserve(node.count);

        #pragma omp for schedule(dynamic) nowait
        for (int f = 0; f < columnData.numFeatures; ++f) {
            if (!featureMask[f]) continue;

            nodeRows.clear();
            for (const int row : columnData.sortedIndices[f]) {
                if (nodeMask[row]) nodeRows.push_back(row);
            }

            const SplitCandidate candidate =
                scanFeature(columnData, f, nodeRows, gradients, hessians, node, criterion);
            if (isBetter(candidate, localBest)) localBest = candidate;
        }

        #pragma omp critical
        {
            if (isBetter(localBest, best)) best = localBest;
        }
    }

    return best;
}
