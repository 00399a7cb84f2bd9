#include "preprocessing/MinMaxNormalizer.hpp"
#include <algorithm>
#include <stdexcept>

namespace preprocessing {

void MinMaxNormalizer::fit(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::invalid_argument("MinMaxNormalizer: cannot fit on an empty column");
    }
    auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    min_ = *minIt;
    max_ = *maxIt;
    fitted_ = true;
}

double MinMaxNormalizer::normalize(double value) const {
    if (!fitted_) {
        throw std::logic_error("MinMaxNormalizer: transform called before fit");
    }
    const double range = max_ - min_;
    return range > 0.0 ? (value - min_) / range : 0.0;
}

void MinMaxNormalizer::transform(double value, std::vector<double>& out) const {
    out.push_back(normalize(value));
}

} // namespace preprocessing
