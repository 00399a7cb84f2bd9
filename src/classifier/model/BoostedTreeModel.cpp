#include "classifier/model/BoostedTreeModel.hpp"
#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

void addTreeImportance(const Node* node, std::vector<double>& importance) {
    if (!node || node->isLeaf) return;

    const int feature = node->getFeatureIndex();
    if (feature >= 0 && feature < static_cast<int>(importance.size())) {
        importance[feature] += 1.0;
    }
    addTreeImportance(node->getLeft(), importance);
    addTreeImportance(node->getRight(), importance);
}

void calculateTreeStats(const Node* node, int depth, int& maxDepth, int& leaves) {
    if (!node) return;
    maxDepth = std::max(maxDepth, depth);
    if (node->isLeaf) {
        ++leaves;
        return;
    }
    calculateTreeStats(node->getLeft(), depth + 1, maxDepth, leaves);
    calculateTreeStats(node->getRight(), depth + 1, maxDepth, leaves);
}

} // namespace

std::vector<double> BoostedTreeModel::predictMarginBatch(const std::vector<double>& X,
                                                         int rowLength) const {
    const long long n = rowLength > 0 ? static_cast<long long>(X.size() / rowLength) : 0;
    std::vector<double> margins(n, baseScore_);

    #pragma omp parallel for schedule(static, 256) if(n > 1000)
    for (long long i = 0; i < n; ++i) {
        margins[i] = predictMargin(&X[i * rowLength]);
    }
    return margins;
}

std::vector<double> BoostedTreeModel::getFeatureImportance(int numFeatures) const {
    std::vector<double> importance(numFeatures, 0.0);
    for (const auto& t : trees_) {
        addTreeImportance(t.tree.get(), importance);
    }

    double total = 0.0;
    for (double imp : importance) total += imp;
    if (total > 0) {
        for (double& imp : importance) imp /= total;
    }
    return importance;
}

void BoostedTreeModel::getModelStats(int& maxDepth, int& totalLeaves) const {
    maxDepth = 0;
    totalLeaves = 0;
    for (const auto& t : trees_) {
        int depth = 0, leaves = 0;
        calculateTreeStats(t.tree.get(), 0, depth, leaves);
        maxDepth = std::max(maxDepth, depth);
        totalLeaves += leaves;
    }
}
