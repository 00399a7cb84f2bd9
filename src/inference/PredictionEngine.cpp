#include "inference/PredictionEngine.hpp"
#include <stdexcept>

PredictionEngine::PredictionEngine(std::shared_ptr<const FittedRentalPipeline> pipeline)
    : pipeline_(std::move(pipeline)) {
    if (!pipeline_) {
        throw std::invalid_argument("PredictionEngine: pipeline is null");
    }
}

PredictionResult PredictionEngine::predict(const RentalRecord& record) const {
    return pipeline_->predict(record);
}
