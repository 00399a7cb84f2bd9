#include "pipeline/RentalPipeline.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

FittedRentalPipeline::FittedRentalPipeline(preprocessing::FeaturePipeline features,
                                           std::unique_ptr<BoostedTreeTrainer> trainer,
                                           double threshold)
    : features_(std::move(features)), trainer_(std::move(trainer)), threshold_(threshold) {
    if (!features_.isFitted() || !trainer_ || !trainer_->isTrained()) {
        throw std::logic_error("FittedRentalPipeline requires a fitted feature pipeline and trainer");
    }
}

PredictionResult FittedRentalPipeline::predict(const RentalRecord& record) const {
    const std::vector<double> row = features_.transform(record);
    const int rowLength = static_cast<int>(row.size());

    PredictionResult result;
    result.score = trainer_->predictMargin(row.data(), rowLength);
    result.probability = trainer_->getLoss().transformMargin(result.score);
    result.predictedLabel = result.probability >= threshold_;
    return result;
}

std::vector<PredictionResult> FittedRentalPipeline::transform(const std::vector<RentalRecord>& records) const {
    int rowLength = 0;
    const std::vector<double> X = features_.transformBatch(records, rowLength);
    const std::vector<double> margins = trainer_->predictMarginBatch(X, rowLength);

    std::vector<PredictionResult> results(margins.size());
    for (size_t i = 0; i < margins.size(); ++i) {
        results[i].score = margins[i];
        results[i].probability = trainer_->getLoss().transformMargin(margins[i]);
        results[i].predictedLabel = results[i].probability >= threshold_;
    }
    return results;
}

BinaryClassificationMetrics FittedRentalPipeline::evaluate(const std::vector<RentalRecord>& records) const {
    std::vector<double> labels;
    labels.reserve(records.size());
    for (const auto& r : records) {
        if (!r.hasLabel) {
            throw std::invalid_argument("Cannot evaluate records without a RentalType label");
        }
        labels.push_back(r.rentalType ? 1.0 : 0.0);
    }

    const auto predictions = transform(records);
    std::vector<double> probabilities;
    probabilities.reserve(predictions.size());
    for (const auto& p : predictions) {
        probabilities.push_back(p.probability);
    }
    return evaluateBinary(probabilities, labels, threshold_);
}

std::vector<std::pair<std::string, double>> FittedRentalPipeline::getFeatureImportance() const {
    const auto importance = trainer_->getFeatureImportance();
    const auto& names = features_.getFeatureNames();

    std::vector<std::pair<std::string, double>> ranked;
    ranked.reserve(importance.size());
    for (size_t i = 0; i < importance.size() && i < names.size(); ++i) {
        ranked.emplace_back(names[i], importance[i]);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return ranked;
}

RentalPipeline& RentalPipeline::oneHotEncoding(const std::string& column) {
    preprocessing::parseColumn(column);
    oneHotColumns_.push_back(column);
    return *this;
}

RentalPipeline& RentalPipeline::normalizeMinMax(const std::string& column) {
    preprocessing::parseColumn(column);
    minMaxColumns_.push_back(column);
    return *this;
}

RentalPipeline& RentalPipeline::concatenate(const std::string& outputColumn,
                                            const std::vector<std::string>& columns) {
    if (outputColumn.empty()) {
        throw std::invalid_argument("concatenate: output column name is empty");
    }
    for (const auto& c : columns) {
        preprocessing::parseColumn(c);
    }
    featureColumn_ = outputColumn;
    concatColumns_ = columns;
    return *this;
}

RentalPipeline& RentalPipeline::binaryTrainer(const BoostedTreeConfig& config,
                                              const std::string& labelColumn,
                                              const std::string& featureColumn) {
    config_ = config;
    trainerLabelColumn_ = labelColumn;
    trainerFeatureColumn_ = featureColumn;
    hasTrainer_ = true;
    return *this;
}

RentalPipeline& RentalPipeline::threshold(double value) {
    if (!(value > 0.0 && value < 1.0)) {
        throw std::invalid_argument("Decision threshold must be in (0, 1)");
    }
    threshold_ = value;
    return *this;
}

preprocessing::FeaturePipeline RentalPipeline::buildFeatures() const {
    preprocessing::FeaturePipeline features;
    for (const auto& c : oneHotColumns_) features.oneHotEncoding(c);
    for (const auto& c : minMaxColumns_) features.normalizeMinMax(c);
    if (!concatColumns_.empty()) features.concatenate(concatColumns_);
    return features;
}

std::shared_ptr<const FittedRentalPipeline> RentalPipeline::fit(const std::vector<RentalRecord>& records) const {
    if (!hasTrainer_) {
        throw std::logic_error("RentalPipeline: no trainer configured");
    }
    if (trainerLabelColumn_ != kLabelColumn) {
        throw std::invalid_argument("Label column '" + trainerLabelColumn_ + "' not found, expected '" +
                                    kLabelColumn + "'");
    }
    if (featureColumn_.empty() || trainerFeatureColumn_ != featureColumn_) {
        throw std::invalid_argument("Feature column '" + trainerFeatureColumn_ +
                                    "' not found in the pipeline output");
    }

    preprocessing::FeaturePipeline features = buildFeatures();
    features.fit(records);

    int rowLength = 0;
    const std::vector<double> X = features.transformBatch(records, rowLength);

    std::vector<double> y;
    y.reserve(records.size());
    for (const auto& r : records) {
        if (!r.hasLabel) {
            throw std::invalid_argument("Training record without a RentalType label");
        }
        y.push_back(r.rentalType ? 1.0 : 0.0);
    }

    auto trainer = std::make_unique<BoostedTreeTrainer>(config_);
    trainer->train(X, rowLength, y);

    return std::make_shared<const FittedRentalPipeline>(std::move(features), std::move(trainer), threshold_);
}

std::string RentalPipeline::describe() const {
    std::ostringstream os;
    os << buildFeatures().describe();
    if (hasTrainer_) {
        os << " -> BoostedTrees(label: " << trainerLabelColumn_
           << ", features: " << trainerFeatureColumn_ << ")";
    }
    return os.str();
}
