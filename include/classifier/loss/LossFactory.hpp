#pragma once

#include "classifier/loss/IBinaryLoss.hpp"
#include <memory>
#include <string>

class LossFactory {
public:
    // Throws std::invalid_argument for an unsupported objective.
    static std::unique_ptr<IBinaryLoss> create(const std::string& objective);
};

class LogisticLoss : public IBinaryLoss {
public:
    double loss(double y_true, double margin) const override;
    double gradient(double y_true, double margin) const override;
    double hessian(double y_true, double margin) const override;
    double transformMargin(double margin) const override;
    double initialMargin(const std::vector<double>& y_true) const override;
    std::string name() const override { return "binary:logistic"; }

    static double sigmoid(double z);
};
