#pragma once

#include "preprocessing/IColumnTransform.hpp"

namespace preprocessing {

// Rescales a column with (x - min) / (max - min) using the training bounds.
// A constant training column maps every value to 0. Values outside the
// training range are not clamped.
class MinMaxNormalizer : public IColumnTransform {
public:
    void fit(const std::vector<double>& values) override;
    bool isFitted() const override { return fitted_; }
    void transform(double value, std::vector<double>& out) const override;
    std::vector<std::string> outputNames(const std::string& column) const override { return {column}; }
    std::string name() const override { return "NormalizeMinMax"; }

    double normalize(double value) const;
    double getMin() const { return min_; }
    double getMax() const { return max_; }

private:
    double min_ = 0.0;
    double max_ = 0.0;
    bool fitted_ = false;
};

} // namespace preprocessing
