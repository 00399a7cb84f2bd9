#include "preprocessing/OneHotEncoder.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace preprocessing {

void OneHotEncoder::fit(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::invalid_argument("OneHotEncoder: cannot fit on an empty column");
    }
    categories_ = values;
    std::sort(categories_.begin(), categories_.end());
    categories_.erase(std::unique(categories_.begin(), categories_.end()), categories_.end());
    fitted_ = true;
}

int OneHotEncoder::categoryIndex(double value) const {
    auto it = std::lower_bound(categories_.begin(), categories_.end(), value);
    if (it == categories_.end() || *it != value) {
        return -1;
    }
    return static_cast<int>(it - categories_.begin());
}

void OneHotEncoder::transform(double value, std::vector<double>& out) const {
    if (!fitted_) {
        throw std::logic_error("OneHotEncoder: transform called before fit");
    }
    const size_t offset = out.size();
    out.resize(offset + categories_.size(), 0.0);
    const int idx = categoryIndex(value);
    if (idx >= 0) {
        out[offset + idx] = 1.0;
    }
}

std::vector<std::string> OneHotEncoder::outputNames(const std::string& column) const {
    std::vector<std::string> names;
    names.reserve(categories_.size());
    for (double c : categories_) {
        std::ostringstream os;
        os << column << '=';
        if (std::floor(c) == c) {
            os << static_cast<long long>(c);
        } else {
            os << c;
        }
        names.push_back(os.str());
    }
    return names;
}

} // namespace preprocessing
