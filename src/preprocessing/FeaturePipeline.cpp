#include "preprocessing/FeaturePipeline.hpp"
#include "preprocessing/MinMaxNormalizer.hpp"
#include "preprocessing/OneHotEncoder.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace preprocessing {

FeaturePipeline::FeaturePipeline() : concatOrder_(allFeatureColumns()) {}

FeaturePipeline& FeaturePipeline::oneHotEncoding(const std::string& column) {
    addTransform(column, std::make_unique<OneHotEncoder>());
    return *this;
}

FeaturePipeline& FeaturePipeline::normalizeMinMax(const std::string& column) {
    addTransform(column, std::make_unique<MinMaxNormalizer>());
    return *this;
}

FeaturePipeline& FeaturePipeline::concatenate(const std::vector<std::string>& columns) {
    if (columns.empty()) {
        throw std::invalid_argument("concatenate: no columns given");
    }
    std::vector<RentalColumn> order;
    order.reserve(columns.size());
    for (const auto& name : columns) {
        order.push_back(parseColumn(name));
    }
    concatOrder_ = std::move(order);
    fitted_ = false;
    return *this;
}

void FeaturePipeline::addTransform(const std::string& column,
                                   std::unique_ptr<IColumnTransform> transform) {
    const RentalColumn col = parseColumn(column);
    for (const auto& entry : transforms_) {
        if (entry.first == col) {
            throw std::invalid_argument("Column '" + column + "' already has a " +
                                        entry.second->name() + " transform");
        }
    }
    transforms_.emplace_back(col, std::move(transform));
    fitted_ = false;
}

const IColumnTransform* FeaturePipeline::getTransform(RentalColumn column) const {
    for (const auto& entry : transforms_) {
        if (entry.first == column) return entry.second.get();
    }
    return nullptr;
}

void FeaturePipeline::fit(const std::vector<RentalRecord>& records) {
    if (records.empty()) {
        throw std::invalid_argument("FeaturePipeline: cannot fit on an empty record set");
    }

    for (auto& entry : transforms_) {
        entry.second->fit(columnValues(records, entry.first));
    }

    featureNames_.clear();
    for (RentalColumn col : concatOrder_) {
        const IColumnTransform* t = getTransform(col);
        if (t) {
            auto names = t->outputNames(columnName(col));
            featureNames_.insert(featureNames_.end(), names.begin(), names.end());
        } else {
            featureNames_.emplace_back(columnName(col));
        }
    }
    fitted_ = true;
}

void FeaturePipeline::transformInto(const RentalRecord& record, std::vector<double>& out) const {
    if (!fitted_) {
        throw std::logic_error("FeaturePipeline: transform called before fit");
    }
    for (RentalColumn col : concatOrder_) {
        const double value = columnValue(record, col);
        const IColumnTransform* t = getTransform(col);
        if (t) {
            t->transform(value, out);
        } else {
            out.push_back(value);
        }
    }
}

std::vector<double> FeaturePipeline::transform(const RentalRecord& record) const {
    std::vector<double> out;
    out.reserve(featureNames_.size());
    transformInto(record, out);
    return out;
}

std::vector<double> FeaturePipeline::transformBatch(const std::vector<RentalRecord>& records,
                                                    int& rowLength) const {
    if (!fitted_) {
        throw std::logic_error("FeaturePipeline: transform called before fit");
    }
    const size_t width = featureNames_.size();
    const size_t n = records.size();
    rowLength = static_cast<int>(width);

    std::vector<double> matrix(n * width);

    #pragma omp parallel if(n > 2000)
    {
        std::vector<double> row;
        row.reserve(width);

        #pragma omp for schedule(static)
        for (long long i = 0; i < static_cast<long long>(n); ++i) {
            row.clear();
            transformInto(records[i], row);
            std::copy(row.begin(), row.end(), matrix.begin() + i * width);
        }
    }
    return matrix;
}

std::string FeaturePipeline::describe() const {
    std::ostringstream os;
    for (const auto& entry : transforms_) {
        os << entry.second->name() << "(" << columnName(entry.first) << ") -> ";
    }
    os << "Concatenate(Features:";
    for (size_t i = 0; i < concatOrder_.size(); ++i) {
        os << (i ? ", " : " ") << columnName(concatOrder_[i]);
    }
    os << ")";
    return os.str();
}

} // namespace preprocessing
