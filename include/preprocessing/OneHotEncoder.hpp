#pragma once

#include "preprocessing/IColumnTransform.hpp"

namespace preprocessing {

/**
 * One-hot encoding of a categorical numeric column.
 * Categories are the distinct training values in ascending order; a value
 * never seen during fit encodes as an all-zero block.
 */
class OneHotEncoder : public IColumnTransform {
public:
    void fit(const std::vector<double>& values) override;
    bool isFitted() const override { return fitted_; }
    void transform(double value, std::vector<double>& out) const override;
    std::vector<std::string> outputNames(const std::string& column) const override;
    std::string name() const override { return "OneHotEncoding"; }

    const std::vector<double>& getCategories() const { return categories_; }

    // Position of value among the categories, -1 if unseen.
    int categoryIndex(double value) const;

private:
    std::vector<double> categories_;
    bool fitted_ = false;
};

} // namespace preprocessing
