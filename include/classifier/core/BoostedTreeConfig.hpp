#pragma once

#include <cstdint>
#include <string>

struct BoostedTreeConfig {
    // Basic parameters
    int numRounds = 100;
    double eta = 0.2;
    int maxDepth = 6;
    double minChildWeight = 1.0;
    int minSamplesLeaf = 10;

    // Regularization parameters
    double lambda = 1.0;
    double gamma = 0.0;

    // Sampling parameters
    double subsample = 1.0;
    double colsampleByTree = 1.0;
    uint32_t seed = 0;

    // Training control
    bool verbose = true;
    int logEvery = 10;

    // Objective function
    std::string objective = "binary:logistic";
};
