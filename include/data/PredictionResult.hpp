#pragma once

struct PredictionResult {
    bool   predictedLabel = false;
    double probability    = 0.0;  // P(RentalType = true)
    double score          = 0.0;  // raw ensemble margin
};
