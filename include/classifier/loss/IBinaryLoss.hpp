#pragma once

#include <string>
#include <vector>

// Second-order loss over raw margins. Labels are 0.0 or 1.0.
class IBinaryLoss {
public:
    virtual ~IBinaryLoss() = default;

    virtual double loss(double y_true, double margin) const = 0;
    virtual double gradient(double y_true, double margin) const = 0;
    virtual double hessian(double y_true, double margin) const = 0;

    // Maps a raw margin to P(label = 1).
    virtual double transformMargin(double margin) const = 0;

    // Margin the ensemble starts from, given the training labels.
    virtual double initialMargin(const std::vector<double>& y_true) const = 0;

    virtual std::string name() const = 0;

    virtual void computeGradientsHessians(
        const std::vector<double>& y_true,
        const std::vector<double>& margins,
        std::vector<double>& gradients,
        std::vector<double>& hessians) const;

    // Mean loss over the batch.
    virtual double computeBatchLoss(
        const std::vector<double>& y_true,
        const std::vector<double>& margins) const;
};
