#pragma once

#include "data/PredictionResult.hpp"
#include "data/RentalRecord.hpp"
#include "pipeline/RentalPipeline.hpp"
#include <memory>

// Single-record prediction over a shared fitted pipeline.
class PredictionEngine {
public:
    explicit PredictionEngine(std::shared_ptr<const FittedRentalPipeline> pipeline);

    PredictionResult predict(const RentalRecord& record) const;

private:
    std::shared_ptr<const FittedRentalPipeline> pipeline_;
};
