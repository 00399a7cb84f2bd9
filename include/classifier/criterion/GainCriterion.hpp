#pragma once

// Gradient and hessian totals over a set of rows.
struct GradientSums {
    double G = 0.0;
    double H = 0.0;
    int count = 0;

    void add(double g, double h) {
        G += g;
        H += h;
        ++count;
    }

    GradientSums operator-(const GradientSums& other) const {
        GradientSums diff;
        diff.G = G - other.G;
        diff.H = H - other.H;
        diff.count = count - other.count;
        return diff;
    }
};

/**
 * Second-order split scoring for the logistic objective, together with the
 * rules a split must satisfy.
 *  - lambda: L2 penalty on leaf weights
 *  - gamma: cost of adding one leaf, subtracted from every gain
 *  - minChildWeight / minSamplesLeaf: lower bounds on each child's hessian
 *    sum and row count
 */
class GainCriterion {
public:
    GainCriterion(double lambda, double gamma, double minChildWeight, int minSamplesLeaf)
        : lambda_(lambda), gamma_(gamma),
          minChildWeight_(minChildWeight), minSamplesLeaf_(minSamplesLeaf) {}

    bool admitsChild(const GradientSums& child) const {
        return child.count >= minSamplesLeaf_ && child.H >= minChildWeight_;
    }

    // False when no partition of the node could admit both children.
    bool mayHaveChildren(const GradientSums& node) const {
        return node.count >= 2 * minSamplesLeaf_ && node.count >= 2 &&
               node.H >= 2.0 * minChildWeight_;
    }

    // Reduction in regularized loss from splitting parent into left and the
    // remainder, net of gamma.
    double splitGain(const GradientSums& left, const GradientSums& parent) const {
        const GradientSums right = parent - left;
        return 0.5 * (similarity(left) + similarity(right) - similarity(parent)) - gamma_;
    }

    bool keepsSplit(double gain) const { return gain > 0.0; }

    double leafWeight(const GradientSums& node) const {
        return -node.G / (node.H + lambda_);
    }

private:
    double similarity(const GradientSums& s) const {
        return s.G * s.G / (s.H + lambda_);
    }

    double lambda_;
    double gamma_;
    double minChildWeight_;
    int minSamplesLeaf_;
};
