#pragma once

#include "data/RentalRecord.hpp"
#include "preprocessing/IColumnTransform.hpp"
#include "preprocessing/RentalColumns.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace preprocessing {

/**
 * Feature engineering stage: per-column transforms followed by a
 * concatenation of the listed columns into one feature vector.
 *
 * Configure with oneHotEncoding / normalizeMinMax / concatenate, call fit
 * on the training records, then transform any record. Columns without a
 * transform are passed through unchanged. Transform before fit throws
 * std::logic_error.
 */
class FeaturePipeline {
public:
    FeaturePipeline();

    FeaturePipeline(FeaturePipeline&&) noexcept = default;
    FeaturePipeline& operator=(FeaturePipeline&&) noexcept = default;
    FeaturePipeline(const FeaturePipeline&) = delete;
    FeaturePipeline& operator=(const FeaturePipeline&) = delete;

    FeaturePipeline& oneHotEncoding(const std::string& column);
    FeaturePipeline& normalizeMinMax(const std::string& column);

    // Output order of the feature vector. Defaults to all columns in file order.
    FeaturePipeline& concatenate(const std::vector<std::string>& columns);

    void fit(const std::vector<RentalRecord>& records);
    bool isFitted() const { return fitted_; }

    std::vector<double> transform(const RentalRecord& record) const;
    void transformInto(const RentalRecord& record, std::vector<double>& out) const;

    // Row-major matrix of all records. rowLength receives the feature count.
    std::vector<double> transformBatch(const std::vector<RentalRecord>& records,
                                       int& rowLength) const;

    size_t getFeatureCount() const { return featureNames_.size(); }
    const std::vector<std::string>& getFeatureNames() const { return featureNames_; }
    const IColumnTransform* getTransform(RentalColumn column) const;

    // Human-readable list of the configured steps.
    std::string describe() const;

private:
    std::vector<std::pair<RentalColumn, std::unique_ptr<IColumnTransform>>> transforms_;
    std::vector<RentalColumn> concatOrder_;
    std::vector<std::string> featureNames_;
    bool fitted_ = false;

    void addTransform(const std::string& column, std::unique_ptr<IColumnTransform> transform);
};

} // namespace preprocessing
