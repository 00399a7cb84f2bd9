#include "metrics/BinaryMetrics.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <ostream>
#include <stdexcept>

double computeAuc(const std::vector<double>& scores,
                  const std::vector<double>& labels,
                  bool* defined) {
    if (scores.size() != labels.size()) {
        throw std::invalid_argument("computeAuc: scores and labels differ in size");
    }
    const size_t n = scores.size();

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&](size_t a, size_t b) { return scores[a] < scores[b]; });

    double positiveRankSum = 0.0;
    size_t positives = 0;
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && scores[order[j + 1]] == scores[order[i]]) ++j;
        // 1-based ranks i+1 .. j+1 share their average
        const double avgRank = 0.5 * static_cast<double>(i + j + 2);
        for (size_t k = i; k <= j; ++k) {
            if (labels[order[k]] > 0.5) {
                positiveRankSum += avgRank;
                ++positives;
            }
        }
        i = j + 1;
    }

    const size_t negatives = n - positives;
    if (positives == 0 || negatives == 0) {
        if (defined) *defined = false;
        return 0.5;
    }
    if (defined) *defined = true;

    const double p = static_cast<double>(positives);
    const double u = positiveRankSum - p * (p + 1.0) / 2.0;
    return u / (p * static_cast<double>(negatives));
}

double computeF1(const ConfusionMatrix& cm) {
    if (cm.truePositive == 0) return 0.0;
    const double tp = static_cast<double>(cm.truePositive);
    const double precision = tp / (tp + cm.falsePositive);
    const double recall = tp / (tp + cm.falseNegative);
    return 2.0 * precision * recall / (precision + recall);
}

BinaryClassificationMetrics evaluateBinary(const std::vector<double>& probabilities,
                                           const std::vector<double>& labels,
                                           double threshold) {
    if (probabilities.empty()) {
        throw std::invalid_argument("evaluateBinary: no predictions to score");
    }
    if (probabilities.size() != labels.size()) {
        throw std::invalid_argument("evaluateBinary: predictions and labels differ in size");
    }

    BinaryClassificationMetrics m;
    constexpr double EPS = 1e-15;
    double logLoss = 0.0;

    for (size_t i = 0; i < probabilities.size(); ++i) {
        const bool actual = labels[i] > 0.5;
        const bool predicted = probabilities[i] >= threshold;

        if (actual && predicted)        ++m.confusion.truePositive;
        else if (!actual && predicted)  ++m.confusion.falsePositive;
        else if (!actual && !predicted) ++m.confusion.trueNegative;
        else                            ++m.confusion.falseNegative;

        const double p = std::min(1.0 - EPS, std::max(EPS, probabilities[i]));
        logLoss -= actual ? std::log(p) : std::log(1.0 - p);
    }

    const double n = static_cast<double>(probabilities.size());
    const ConfusionMatrix& cm = m.confusion;
    m.accuracy = (cm.truePositive + cm.trueNegative) / n;
    m.positivePrecision = (cm.truePositive + cm.falsePositive) > 0
        ? static_cast<double>(cm.truePositive) / (cm.truePositive + cm.falsePositive) : 0.0;
    m.positiveRecall = (cm.truePositive + cm.falseNegative) > 0
        ? static_cast<double>(cm.truePositive) / (cm.truePositive + cm.falseNegative) : 0.0;
    m.f1Score = computeF1(cm);
    m.logLoss = logLoss / n;
    m.auc = computeAuc(probabilities, labels, &m.aucDefined);
    return m;
}

void printBinaryMetrics(const BinaryClassificationMetrics& m, std::ostream& out) {
    out << std::fixed << std::setprecision(2);
    out << "AUC: " << m.auc << std::endl;
    out << "F1 Score: " << m.f1Score << std::endl;
    out << "Accuracy: " << m.accuracy
        << " | Precision: " << m.positivePrecision
        << " | Recall: " << m.positiveRecall
        << " | LogLoss: " << std::setprecision(4) << m.logLoss << std::endl;
    out << "Confusion: TP=" << m.confusion.truePositive
        << " FP=" << m.confusion.falsePositive
        << " TN=" << m.confusion.trueNegative
        << " FN=" << m.confusion.falseNegative << std::endl;
}
