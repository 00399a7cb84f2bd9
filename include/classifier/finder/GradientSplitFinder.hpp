#pragma once

#include "classifier/criterion/GainCriterion.hpp"
#include <cstddef>
#include <vector>

// Row-major feature matrix plus, per feature, the row indices sorted by value.
struct ColumnData {
    std::vector<std::vector<int>> sortedIndices;
    std::vector<double> values;
    int numFeatures;
    size_t numSamples;

    ColumnData(const std::vector<double>& data, int features, size_t samples);

    double at(int row, int feature) const { return values[static_cast<size_t>(row) * numFeatures + feature]; }
};

struct SplitCandidate {
    int feature = -1;
    double threshold = 0.0;
    double gain = 0.0;

    bool found() const { return feature >= 0; }
};

class GradientSplitFinder {
public:
    // Sums the rows selected by nodeMask in row order, so the totals do not
    // depend on the thread count.
    static GradientSums sumNode(const std::vector<double>& gradients,
                                const std::vector<double>& hessians,
                                const std::vector<char>& nodeMask);

    /**
     * Exact greedy search over every distinct threshold of every active feature.
     * Ties on gain go to the lower feature index, then the lower threshold.
     * @param node Totals of the node, as returned by sumNode
     * @return The best admissible split; found() is false when none exists
     */
    SplitCandidate findBestSplit(const ColumnData& columnData,
                                 const std::vector<double>& gradients,
                                 const std::vector<double>& hessians,
                                 const std::vector<char>& nodeMask,
                                 const std::vector<char>& featureMask,
                                 const GradientSums& node,
                                 const GainCriterion& criterion) const;
};
