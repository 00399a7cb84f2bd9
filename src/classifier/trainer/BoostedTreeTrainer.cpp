#include "classifier/trainer/BoostedTreeTrainer.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#ifdef _OPENMP
#include <omp.h>
#endif

BoostedTreeTrainer::BoostedTreeTrainer(const BoostedTreeConfig& config)
    : config_(config),
      lossFunction_(LossFactory::create(config.objective)),
      criterion_(config.lambda, config.gamma, config.minChildWeight, config.minSamplesLeaf),
      gen_(config.seed) {

    if (config_.numRounds < 0) throw std::invalid_argument("numRounds must be >= 0");
    if (config_.eta <= 0.0) throw std::invalid_argument("eta must be > 0");
    if (config_.maxDepth < 0) throw std::invalid_argument("maxDepth must be >= 0");
    if (config_.minSamplesLeaf < 1) throw std::invalid_argument("minSamplesLeaf must be >= 1");
    if (config_.lambda < 0.0) throw std::invalid_argument("lambda must be >= 0");
    if (!(config_.subsample > 0.0 && config_.subsample <= 1.0)) {
        throw std::invalid_argument("subsample must be in (0, 1]");
    }
    if (!(config_.colsampleByTree > 0.0 && config_.colsampleByTree <= 1.0)) {
        throw std::invalid_argument("colsampleByTree must be in (0, 1]");
    }
    trainingLoss_.reserve(config_.numRounds);
}

void BoostedTreeTrainer::checkInput(const std::vector<double>& data, int rowLength,
                                    const std::vector<double>& labels) const {
    if (rowLength <= 0 || data.empty()) {
        throw std::invalid_argument("Feature column is empty");
    }
    if (labels.empty()) {
        throw std::invalid_argument("Label column is empty");
    }
    if (data.size() != labels.size() * static_cast<size_t>(rowLength)) {
        throw std::invalid_argument("Feature matrix has " + std::to_string(data.size()) +
                                    " values, expected " + std::to_string(labels.size()) +
                                    " rows x " + std::to_string(rowLength));
    }
    for (double y : labels) {
        if (y != 0.0 && y != 1.0) {
            throw std::invalid_argument("Binary labels must be 0 or 1, got " + std::to_string(y));
        }
    }
}

void BoostedTreeTrainer::train(const std::vector<double>& data, int rowLength,
                               const std::vector<double>& labels) {
    checkInput(data, rowLength, labels);

    auto trainStart = std::chrono::high_resolution_clock::now();
    const size_t n = labels.size();

    model_.clear();
    trainingLoss_.clear();
    gen_.seed(config_.seed);
    rowLength_ = rowLength;

    ColumnData columnData(data, rowLength, n);

    const double baseScore = lossFunction_->initialMargin(labels);
    model_.setBaseScore(baseScore);

    std::vector<double> margins(n, baseScore);
    std::vector<double> gradients(n), hessians(n);
    std::vector<char> rootMask(n, 1);
    std::vector<char> featureMask(rowLength, 1);

    if (config_.verbose) {
        std::cout << "Training boosted trees: " << n << " rows, " << rowLength
                  << " features, " << config_.numRounds << " rounds" << std::endl;
    }

    for (int round = 0; round < config_.numRounds; ++round) {
        const double currentLoss = lossFunction_->computeBatchLoss(labels, margins);
        trainingLoss_.push_back(currentLoss);

        lossFunction_->computeGradientsHessians(labels, margins, gradients, hessians);

        sampleRows(rootMask);
        sampleFeatures(featureMask);

        auto tree = trainSingleTree(columnData, gradients, hessians, rootMask, featureMask);
        updatePredictions(columnData, tree.get(), margins);
        model_.addTree(std::move(tree), config_.eta);

        if (config_.verbose && config_.logEvery > 0 && round % config_.logEvery == 0) {
            std::cout << "Round " << round
                      << " | LogLoss: " << std::fixed << std::setprecision(6) << currentLoss
                      << std::endl;
        }
    }

    trained_ = true;

    if (config_.verbose) {
        auto trainEnd = std::chrono::high_resolution_clock::now();
        auto trainTime = std::chrono::duration_cast<std::chrono::milliseconds>(trainEnd - trainStart);
        std::cout << "Training completed in " << trainTime.count() << "ms with "
                  << model_.getTreeCount() << " trees" << std::endl;
    }
}

void BoostedTreeTrainer::sampleRows(std::vector<char>& rootMask) {
    if (config_.subsample >= 1.0) {
        std::fill(rootMask.begin(), rootMask.end(), 1);
        return;
    }
    const size_t n = rootMask.size();
    const size_t sampleSize = std::max<size_t>(1, static_cast<size_t>(n * config_.subsample));

    std::vector<int> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    std::shuffle(indices.begin(), indices.end(), gen_);

    std::fill(rootMask.begin(), rootMask.end(), 0);
    for (size_t i = 0; i < sampleSize; ++i) {
        rootMask[indices[i]] = 1;
    }
}

void BoostedTreeTrainer::sampleFeatures(std::vector<char>& featureMask) {
    if (config_.colsampleByTree >= 1.0) {
        std::fill(featureMask.begin(), featureMask.end(), 1);
        return;
    }
    const size_t f = featureMask.size();
    const size_t keep = std::max<size_t>(1, static_cast<size_t>(f * config_.colsampleByTree));

    std::vector<int> indices(f);
    std::iota(indices.begin(), indices.end(), 0);
    std::shuffle(indices.begin(), indices.end(), gen_);

    std::fill(featureMask.begin(), featureMask.end(), 0);
    for (size_t i = 0; i < keep; ++i) {
        featureMask[indices[i]] = 1;
    }
}

std::unique_ptr<Node> BoostedTreeTrainer::trainSingleTree(const ColumnData& columnData,
                                                          const std::vector<double>& gradients,
                                                          const std::vector<double>& hessians,
                                                          const std::vector<char>& rootMask,
                                                          const std::vector<char>& featureMask) const {
    auto root = std::make_unique<Node>();
    buildNode(root.get(), columnData, gradients, hessians, rootMask, featureMask, 0);
    return root;
}

void BoostedTreeTrainer::buildNode(Node* node,
                                   const ColumnData& columnData,
                                   const std::vector<double>& gradients,
                                   const std::vector<double>& hessians,
                                   const std::vector<char>& nodeMask,
                                   const std::vector<char>& featureMask,
                                   int depth) const {
    const GradientSums sums = GradientSplitFinder::sumNode(gradients, hessians, nodeMask);
    node->samples = sums.count;
    const double leafWeight = criterion_.leafWeight(sums);

    if (depth >= config_.maxDepth) {
        node->makeLeaf(leafWeight);
        return;
    }

    const SplitCandidate split =
        finder_.findBestSplit(columnData, gradients, hessians, nodeMask, featureMask, sums, criterion_);

    if (!split.found() || !criterion_.keepsSplit(split.gain)) {
        node->makeLeaf(leafWeight);
        return;
    }

    node->makeInternal(split.feature, split.threshold, split.gain);

    const long long n = static_cast<long long>(nodeMask.size());
    std::vector<char> leftMask(nodeMask.size(), 0), rightMask(nodeMask.size(), 0);

    #pragma omp parallel for schedule(static) if(n > 1000)
    for (long long i = 0; i < n; ++i) {
        if (!nodeMask[i]) continue;
        if (columnData.at(static_cast<int>(i), split.feature) <= split.threshold) {
            leftMask[i] = 1;
        } else {
            rightMask[i] = 1;
        }
    }

    node->leftChild = std::make_unique<Node>();
    node->rightChild = std::make_unique<Node>();
    buildNode(node->leftChild.get(), columnData, gradients, hessians, leftMask, featureMask, depth + 1);
    buildNode(node->rightChild.get(), columnData, gradients, hessians, rightMask, featureMask, depth + 1);
}

void BoostedTreeTrainer::updatePredictions(const ColumnData& columnData, const Node* tree,
                                           std::vector<double>& margins) const {
    const long long n = static_cast<long long>(margins.size());

    #pragma omp parallel for schedule(static, 256) if(n > 1000)
    for (long long i = 0; i < n; ++i) {
        const double* sample = &columnData.values[i * columnData.numFeatures];
        margins[i] += config_.eta * BoostedTreeModel::predictSingleTree(tree, sample);
    }
}

void BoostedTreeTrainer::checkTrained(int rowLength) const {
    if (!trained_) {
        throw std::logic_error("BoostedTreeTrainer: predict called before train");
    }
    if (rowLength != rowLength_) {
        throw std::invalid_argument("Expected " + std::to_string(rowLength_) +
                                    " features per row, got " + std::to_string(rowLength));
    }
}

double BoostedTreeTrainer::predictMargin(const double* sample, int rowLength) const {
    checkTrained(rowLength);
    return model_.predictMargin(sample);
}

double BoostedTreeTrainer::predictProbability(const double* sample, int rowLength) const {
    return lossFunction_->transformMargin(predictMargin(sample, rowLength));
}

std::vector<double> BoostedTreeTrainer::predictMarginBatch(const std::vector<double>& X,
                                                           int rowLength) const {
    checkTrained(rowLength);
    return model_.predictMarginBatch(X, rowLength);
}

std::vector<double> BoostedTreeTrainer::predictProbabilityBatch(const std::vector<double>& X,
                                                                int rowLength) const {
    auto probs = predictMarginBatch(X, rowLength);
    for (double& p : probs) {
        p = lossFunction_->transformMargin(p);
    }
    return probs;
}
