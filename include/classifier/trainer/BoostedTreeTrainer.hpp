#pragma once

#include "classifier/core/BoostedTreeConfig.hpp"
#include "classifier/criterion/GainCriterion.hpp"
#include "classifier/finder/GradientSplitFinder.hpp"
#include "classifier/loss/LossFactory.hpp"
#include "classifier/model/BoostedTreeModel.hpp"
#include <memory>
#include <random>
#include <vector>

// Gradient-boosted decision trees for binary classification.
class BoostedTreeTrainer {
public:
    explicit BoostedTreeTrainer(const BoostedTreeConfig& config);

    /**
     * Fit the ensemble. Labels must be 0.0 or 1.0.
     * @param data Row-major feature matrix
     * @param rowLength Number of features per row
     * @param labels One label per row
     */
    void train(const std::vector<double>& data, int rowLength, const std::vector<double>& labels);

    double predictMargin(const double* sample, int rowLength) const;
    double predictProbability(const double* sample, int rowLength) const;
    std::vector<double> predictMarginBatch(const std::vector<double>& X, int rowLength) const;
    std::vector<double> predictProbabilityBatch(const std::vector<double>& X, int rowLength) const;

    bool isTrained() const { return trained_; }
    const BoostedTreeModel& getModel() const { return model_; }
    const IBinaryLoss& getLoss() const { return *lossFunction_; }
    const std::vector<double>& getTrainingLoss() const { return trainingLoss_; }
    std::vector<double> getFeatureImportance() const { return model_.getFeatureImportance(rowLength_); }

private:
    BoostedTreeConfig config_;
    BoostedTreeModel model_;
    std::unique_ptr<IBinaryLoss> lossFunction_;
    GainCriterion criterion_;
    GradientSplitFinder finder_;
    std::mt19937 gen_;

    std::vector<double> trainingLoss_;
    int rowLength_ = 0;
    bool trained_ = false;

    std::unique_ptr<Node> trainSingleTree(const ColumnData& columnData,
                                          const std::vector<double>& gradients,
                                          const std::vector<double>& hessians,
                                          const std::vector<char>& rootMask,
                                          const std::vector<char>& featureMask) const;

    void buildNode(Node* node,
                   const ColumnData& columnData,
                   const std::vector<double>& gradients,
                   const std::vector<double>& hessians,
                   const std::vector<char>& nodeMask,
                   const std::vector<char>& featureMask,
                   int depth) const;

    void sampleRows(std::vector<char>& rootMask);
    void sampleFeatures(std::vector<char>& featureMask);
    void updatePredictions(const ColumnData& columnData, const Node* tree,
                           std::vector<double>& margins) const;
    void checkInput(const std::vector<double>& data, int rowLength,
                    const std::vector<double>& labels) const;
    void checkTrained(int rowLength) const;
};
