#include "classifier/loss/LossFactory.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::unique_ptr<IBinaryLoss> LossFactory::create(const std::string& objective) {
    if (objective == "binary:logistic") {
        return std::make_unique<LogisticLoss>();
    }
    throw std::invalid_argument("Unsupported objective: " + objective);
}

double LogisticLoss::sigmoid(double z) {
    // Prevent numerical overflow
    z = std::max(-250.0, std::min(250.0, z));
    return 1.0 / (1.0 + std::exp(-z));
}

double LogisticLoss::loss(double y_true, double margin) const {
    const double z = std::max(-250.0, std::min(250.0, margin));
    return y_true * std::log1p(std::exp(-z)) + (1.0 - y_true) * std::log1p(std::exp(z));
}

double LogisticLoss::gradient(double y_true, double margin) const {
    return sigmoid(margin) - y_true;
}

double LogisticLoss::hessian(double /* y_true */, double margin) const {
    const double prob = sigmoid(margin);
    return std::max(prob * (1.0 - prob), 1e-16);
}

double LogisticLoss::transformMargin(double margin) const {
    return sigmoid(margin);
}

double LogisticLoss::initialMargin(const std::vector<double>& y_true) const {
    if (y_true.empty()) return 0.0;
    double positives = 0.0;
    for (double y : y_true) positives += y;
    // Clamp so a single-class training set still yields a finite prior
    const double p = std::min(1.0 - 1e-6, std::max(1e-6, positives / y_true.size()));
    return std::log(p / (1.0 - p));
}
