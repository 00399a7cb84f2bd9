#pragma once

#include "tree/Node.hpp"
#include <algorithm>
#include <memory>
#include <vector>

class BoostedTreeModel {
public:
    struct WeightedTree {
        std::unique_ptr<Node> tree;
        double weight;

        WeightedTree(std::unique_ptr<Node> t, double w)
            : tree(std::move(t)), weight(w) {}
    };

    BoostedTreeModel() : baseScore_(0.0) {
        trees_.reserve(200);
    }

    BoostedTreeModel(BoostedTreeModel&&) noexcept = default;
    BoostedTreeModel& operator=(BoostedTreeModel&&) noexcept = default;

    void addTree(std::unique_ptr<Node> tree, double weight) {
        trees_.emplace_back(std::move(tree), weight);
    }

    // Raw ensemble output for one row
    double predictMargin(const double* sample) const {
        double margin = baseScore_;
        for (const auto& t : trees_) {
            margin += t.weight * predictSingleTree(t.tree.get(), sample);
        }
        return margin;
    }

    std::vector<double> predictMarginBatch(const std::vector<double>& X, int rowLength) const;

    size_t getTreeCount() const { return trees_.size(); }
    void setBaseScore(double score) { baseScore_ = score; }

    // Split-count importance normalized to sum to 1
    std::vector<double> getFeatureImportance(int numFeatures) const;

    void getModelStats(int& maxDepth, int& totalLeaves) const;

    void clear() {
        trees_.clear();
        baseScore_ = 0.0;
    }

    static double predictSingleTree(const Node* tree, const double* sample) {
        const Node* cur = tree;
        while (cur && !cur->isLeaf) {
            const double value = sample[cur->getFeatureIndex()];
            cur = (value <= cur->getThreshold()) ? cur->getLeft() : cur->getRight();
        }
        return cur ? cur->getPrediction() : 0.0;
    }

private:
    std::vector<WeightedTree> trees_;
    double baseScore_;
};
