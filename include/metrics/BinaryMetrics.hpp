#pragma once

#include <cstddef>
#include <iosfwd>
#include <vector>

struct ConfusionMatrix {
    size_t truePositive  = 0;
    size_t falsePositive = 0;
    size_t trueNegative  = 0;
    size_t falseNegative = 0;
};

struct BinaryClassificationMetrics {
    double auc               = 0.5;
    double f1Score           = 0.0;
    double accuracy          = 0.0;
    double positivePrecision = 0.0;
    double positiveRecall    = 0.0;
    double logLoss           = 0.0;
    bool   aucDefined        = false;  // false when the labels hold a single class
    ConfusionMatrix confusion;
};

/**
 * Area under the ROC curve as the normalized Mann-Whitney statistic,
 * with average ranks for tied scores. Returns 0.5 and sets *defined to
 * false when either class is absent.
 */
double computeAuc(const std::vector<double>& scores,
                  const std::vector<double>& labels,
                  bool* defined = nullptr);

// Harmonic mean of precision and recall; 0 when there are no true positives.
double computeF1(const ConfusionMatrix& cm);

/**
 * Score predicted probabilities against 0/1 labels.
 * Throws std::invalid_argument on empty input or a size mismatch.
 * @param probabilities P(label = 1) per row
 * @param labels True labels, 0.0 or 1.0
 * @param threshold Probabilities at or above it count as positive
 */
BinaryClassificationMetrics evaluateBinary(const std::vector<double>& probabilities,
                                           const std::vector<double>& labels,
                                           double threshold = 0.5);

void printBinaryMetrics(const BinaryClassificationMetrics& metrics, std::ostream& out);
