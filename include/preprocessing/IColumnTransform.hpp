#pragma once

#include <memory>
#include <string>
#include <vector>

namespace preprocessing {

// A per-column transform that learns its parameters from training values
// and then maps any value into a fixed-width block of features.
class IColumnTransform {
public:
    virtual ~IColumnTransform() = default;

    virtual void fit(const std::vector<double>& values) = 0;
    virtual bool isFitted() const = 0;

    // Appends this column's block of features to out. The block has the
    // same width for every value once fitted.
    virtual void transform(double value, std::vector<double>& out) const = 0;

    virtual std::vector<std::string> outputNames(const std::string& column) const = 0;
    virtual std::string name() const = 0;
};

} // namespace preprocessing
