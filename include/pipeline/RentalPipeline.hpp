#pragma once

#include "classifier/core/BoostedTreeConfig.hpp"
#include "classifier/trainer/BoostedTreeTrainer.hpp"
#include "data/PredictionResult.hpp"
#include "data/RentalRecord.hpp"
#include "metrics/BinaryMetrics.hpp"
#include "preprocessing/FeaturePipeline.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Feature pipeline and tree ensemble after fitting. Immutable.
class FittedRentalPipeline {
public:
    FittedRentalPipeline(preprocessing::FeaturePipeline features,
                         std::unique_ptr<BoostedTreeTrainer> trainer,
                         double threshold);

    PredictionResult predict(const RentalRecord& record) const;
    std::vector<PredictionResult> transform(const std::vector<RentalRecord>& records) const;

    // Throws std::invalid_argument if a record carries no label.
    BinaryClassificationMetrics evaluate(const std::vector<RentalRecord>& records) const;

    // (feature name, importance), sorted by descending importance
    std::vector<std::pair<std::string, double>> getFeatureImportance() const;

    const preprocessing::FeaturePipeline& getFeatures() const { return features_; }
    const BoostedTreeTrainer& getTrainer() const { return *trainer_; }

private:
    preprocessing::FeaturePipeline features_;
    std::unique_ptr<BoostedTreeTrainer> trainer_;
    double threshold_;
};

/**
 * Declarative description of the whole workflow: per-column transforms,
 * the concatenated feature column, and the binary trainer. fit() builds a
 * fresh feature pipeline, fits it and the trainer on the training records
 * only, and returns the immutable result.
 */
class RentalPipeline {
public:
    static constexpr const char* kLabelColumn = "RentalType";

    RentalPipeline& oneHotEncoding(const std::string& column);
    RentalPipeline& normalizeMinMax(const std::string& column);
    RentalPipeline& concatenate(const std::string& outputColumn,
                                const std::vector<std::string>& columns);
    RentalPipeline& binaryTrainer(const BoostedTreeConfig& config,
                                  const std::string& labelColumn,
                                  const std::string& featureColumn);

    RentalPipeline& threshold(double value);

    std::shared_ptr<const FittedRentalPipeline> fit(const std::vector<RentalRecord>& records) const;

    std::string describe() const;

private:
    std::vector<std::string> oneHotColumns_;
    std::vector<std::string> minMaxColumns_;
    std::string featureColumn_;
    std::vector<std::string> concatColumns_;
    std::string trainerLabelColumn_;
    std::string trainerFeatureColumn_;
    BoostedTreeConfig config_;
    bool hasTrainer_ = false;
    double threshold_ = 0.5;

    preprocessing::FeaturePipeline buildFeatures() const;
};
