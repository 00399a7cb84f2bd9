#include "classifier/trainer/BoostedTreeTrainer.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <cstring>
#include <random>
#include <stdexcept>

namespace {

// Two features: x0 decides the label, x1 is noise.
void makeThresholdProblem(size_t n, std::vector<double>& X, std::vector<double>& y) {
    std::mt19937 gen(11);
    std::uniform_real_distribution<double> u(0.0, 1.0);
    X.clear();
    y.clear();
    for (size_t i = 0; i < n; ++i) {
        const double x0 = u(gen);
        X.push_back(x0);
        X.push_back(u(gen));
        y.push_back(x0 > 0.6 ? 1.0 : 0.0);
    }
}

BoostedTreeConfig quietConfig() {
    BoostedTreeConfig c;
    c.numRounds = 30;
    c.maxDepth = 3;
    c.verbose = false;
    return c;
}

} // namespace

TEST(LogisticLossTest, GradientAndHessianAtZeroMargin) {
    LogisticLoss loss;
    EXPECT_DOUBLE_EQ(loss.transformMargin(0.0), 0.5);
    EXPECT_DOUBLE_EQ(loss.gradient(1.0, 0.0), -0.5);
    EXPECT_DOUBLE_EQ(loss.gradient(0.0, 0.0), 0.5);
    EXPECT_DOUBLE_EQ(loss.hessian(1.0, 0.0), 0.25);
    EXPECT_NEAR(loss.loss(1.0, 0.0), std::log(2.0), 1e-12);
}

TEST(LogisticLossTest, InitialMarginIsLogOdds) {
    LogisticLoss loss;
    EXPECT_NEAR(loss.initialMargin({1, 0, 0, 0}), std::log(0.25 / 0.75), 1e-12);
    // A single class still yields a finite prior
    EXPECT_TRUE(std::isfinite(loss.initialMargin({1, 1, 1})));
    EXPECT_GT(loss.initialMargin({1, 1, 1}), 10.0);
}

TEST(LossFactoryTest, RejectsUnknownObjective) {
    EXPECT_NO_THROW(LossFactory::create("binary:logistic"));
    EXPECT_THROW(LossFactory::create("reg:logistic"), std::invalid_argument);
    EXPECT_THROW(LossFactory::create("reg:squarederror"), std::invalid_argument);
}

TEST(GainCriterionTest, LeafWeightAndGain) {
    GainCriterion c(1.0, 0.0, 1.0, 1);
    GradientSums node;
    node.G = -4.0;
    node.H = 3.0;
    EXPECT_DOUBLE_EQ(c.leafWeight(node), 1.0);

    // Separating opposite gradients gains
    GradientSums parent, left;
    parent.add(-5.0, 5.0);
    parent.add(5.0, 5.0);
    left.add(-5.0, 5.0);
    EXPECT_GT(c.splitGain(left, parent), 0.0);
    EXPECT_TRUE(c.keepsSplit(c.splitGain(left, parent)));

    // gamma is subtracted from the gain
    GainCriterion penalized(1.0, 0.5, 1.0, 1);
    EXPECT_DOUBLE_EQ(penalized.splitGain(left, parent), c.splitGain(left, parent) - 0.5);
}

TEST(GainCriterionTest, ChildConstraints) {
    GainCriterion c(1.0, 0.0, 1.0, 2);
    GradientSums child;
    child.add(0.1, 0.6);
    EXPECT_FALSE(c.admitsChild(child));  // one row, hessian 0.6
    child.add(0.1, 0.6);
    EXPECT_TRUE(c.admitsChild(child));

    GradientSums node = child;
    node.add(0.1, 0.6);
    EXPECT_FALSE(c.mayHaveChildren(node));  // three rows cannot fill two leaves of two
    node.add(0.1, 0.6);
    EXPECT_TRUE(c.mayHaveChildren(node));
}

TEST(GradientSplitFinderTest, SumsOnlyMaskedRows) {
    const std::vector<double> g = {1.0, 2.0, 4.0};
    const std::vector<double> h = {0.5, 0.25, 0.125};
    const GradientSums sums = GradientSplitFinder::sumNode(g, h, {1, 0, 1});
    EXPECT_DOUBLE_EQ(sums.G, 5.0);
    EXPECT_DOUBLE_EQ(sums.H, 0.625);
    EXPECT_EQ(sums.count, 2);
}

TEST(GradientSplitFinderTest, FindsTheSeparatingThreshold) {
    // Feature 0 separates the gradients at 0.5, feature 1 is constant.
    const std::vector<double> data = {0.1, 7.0, 0.2, 7.0, 0.3, 7.0, 0.7, 7.0, 0.8, 7.0, 0.9, 7.0};
    const ColumnData columns(data, 2, 6);
    const std::vector<double> g = {-1, -1, -1, 1, 1, 1};
    const std::vector<double> h(6, 0.25);
    const std::vector<char> rows(6, 1);
    const std::vector<char> features(2, 1);
    const GainCriterion criterion(1.0, 0.0, 0.0, 1);

    GradientSplitFinder finder;
    const SplitCandidate split = finder.findBestSplit(
        columns, g, h, rows, features, GradientSplitFinder::sumNode(g, h, rows), criterion);
    ASSERT_TRUE(split.found());
    EXPECT_EQ(split.feature, 0);
    EXPECT_DOUBLE_EQ(split.threshold, 0.5);

    // With feature 0 masked out nothing separates the rows
    const SplitCandidate none = finder.findBestSplit(
        columns, g, h, rows, {0, 1}, GradientSplitFinder::sumNode(g, h, rows), criterion);
    EXPECT_FALSE(none.found());
}

TEST(BoostedTreeTrainerTest, LearnsAThreshold) {
    std::vector<double> X, y;
    makeThresholdProblem(400, X, y);

    BoostedTreeTrainer trainer(quietConfig());
    trainer.train(X, 2, y);

    const double high[] = {0.9, 0.5};
    const double low[] = {0.1, 0.5};
    EXPECT_GT(trainer.predictProbability(high, 2), 0.8);
    EXPECT_LT(trainer.predictProbability(low, 2), 0.2);
    EXPECT_EQ(trainer.getModel().getTreeCount(), 30u);

    const auto importance = trainer.getFeatureImportance();
    ASSERT_EQ(importance.size(), 2u);
    EXPECT_NEAR(importance[0] + importance[1], 1.0, 1e-9);
    EXPECT_GT(importance[0], importance[1]);
}

TEST(BoostedTreeTrainerTest, TrainingLossDecreases) {
    std::vector<double> X, y;
    makeThresholdProblem(300, X, y);

    BoostedTreeTrainer trainer(quietConfig());
    trainer.train(X, 2, y);

    const auto& losses = trainer.getTrainingLoss();
    ASSERT_EQ(losses.size(), 30u);
    EXPECT_LT(losses.back(), losses.front());
}

TEST(BoostedTreeTrainerTest, SameSeedSameModel) {
    std::vector<double> X, y;
    makeThresholdProblem(300, X, y);

    BoostedTreeConfig c = quietConfig();
    c.subsample = 0.7;
    c.colsampleByTree = 0.5;
    c.seed = 42;

    BoostedTreeTrainer a(c), b(c);
    a.train(X, 2, y);
    b.train(X, 2, y);
    EXPECT_EQ(a.predictMarginBatch(X, 2), b.predictMarginBatch(X, 2));

    // Retraining the same instance restarts from the seed
    const auto before = a.predictMarginBatch(X, 2);
    a.train(X, 2, y);
    EXPECT_EQ(a.predictMarginBatch(X, 2), before);
}

TEST(BoostedTreeTrainerTest, LargeInputIsBitReproducible) {
    // Large enough for the parallel loops to run
    std::vector<double> X, y;
    makeThresholdProblem(5000, X, y);

    BoostedTreeConfig c = quietConfig();
    c.maxDepth = 5;
    BoostedTreeTrainer a(c), b(c);
    a.train(X, 2, y);
    b.train(X, 2, y);

    const auto ma = a.predictMarginBatch(X, 2);
    const auto mb = b.predictMarginBatch(X, 2);
    ASSERT_EQ(ma.size(), mb.size());
    EXPECT_EQ(std::memcmp(ma.data(), mb.data(), ma.size() * sizeof(double)), 0);
    EXPECT_EQ(a.getTrainingLoss(), b.getTrainingLoss());
}

TEST(BoostedTreeTrainerTest, BatchAndSinglePredictionsAgree) {
    std::vector<double> X, y;
    makeThresholdProblem(100, X, y);

    BoostedTreeTrainer trainer(quietConfig());
    trainer.train(X, 2, y);

    const auto probs = trainer.predictProbabilityBatch(X, 2);
    ASSERT_EQ(probs.size(), y.size());
    for (size_t i = 0; i < y.size(); ++i) {
        EXPECT_DOUBLE_EQ(probs[i], trainer.predictProbability(&X[i * 2], 2));
        EXPECT_GE(probs[i], 0.0);
        EXPECT_LE(probs[i], 1.0);
    }
}

TEST(BoostedTreeTrainerTest, SingleClassStillTrains) {
    std::vector<double> X = {0.1, 0.2, 0.3, 0.4, 0.5, 0.6};
    std::vector<double> y = {1, 1, 1, 1, 1, 1};

    BoostedTreeConfig c = quietConfig();
    c.minSamplesLeaf = 1;
    BoostedTreeTrainer trainer(c);
    trainer.train(X, 1, y);

    const double sample[] = {0.35};
    const double p = trainer.predictProbability(sample, 1);
    EXPECT_TRUE(std::isfinite(p));
    EXPECT_GT(p, 0.5);
}

TEST(BoostedTreeTrainerTest, RejectsBadInput) {
    BoostedTreeTrainer trainer(quietConfig());
    EXPECT_THROW(trainer.train({}, 2, {}), std::invalid_argument);
    EXPECT_THROW(trainer.train({1, 2, 3}, 2, {1, 0}), std::invalid_argument);
    EXPECT_THROW(trainer.train({1, 2}, 1, {1, 2}), std::invalid_argument);
    EXPECT_THROW(trainer.train({1, 2}, 0, {1, 0}), std::invalid_argument);

    const double sample[] = {0.5, 0.5};
    EXPECT_THROW(trainer.predictProbability(sample, 2), std::logic_error);
}

TEST(BoostedTreeTrainerTest, RejectsWrongRowLengthAtPrediction) {
    std::vector<double> X, y;
    makeThresholdProblem(50, X, y);
    BoostedTreeTrainer trainer(quietConfig());
    trainer.train(X, 2, y);

    const double sample[] = {0.5, 0.5, 0.5};
    EXPECT_THROW(trainer.predictMargin(sample, 3), std::invalid_argument);
}

TEST(BoostedTreeTrainerTest, RejectsInvalidConfig) {
    BoostedTreeConfig c = quietConfig();
    c.eta = 0.0;
    EXPECT_THROW(BoostedTreeTrainer{c}, std::invalid_argument);

    c = quietConfig();
    c.subsample = 1.5;
    EXPECT_THROW(BoostedTreeTrainer{c}, std::invalid_argument);

    c = quietConfig();
    c.objective = "multi:softmax";
    EXPECT_THROW(BoostedTreeTrainer{c}, std::invalid_argument);
}
