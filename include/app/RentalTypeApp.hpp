#pragma once

#include "classifier/core/BoostedTreeConfig.hpp"
#include "data/PredictionResult.hpp"
#include "data/RentalRecord.hpp"
#include "metrics/BinaryMetrics.hpp"
#include "pipeline/ClassBalance.hpp"
#include "pipeline/RentalPipeline.hpp"
#include <cstdint>
#include <exception>
#include <iosfwd>
#include <string>
#include <vector>

struct RentalTypeAppOptions {
    // Data settings
    std::string dataPath = "bike_sharing.csv";
    char delimiter = ',';
    bool hasHeader = true;

    // Split settings
    double testFraction = 0.1;
    uint32_t seed = 0;

    // Model parameters
    int numRounds = 100;
    double eta = 0.2;
    int maxDepth = 6;
    double minChildWeight = 1.0;
    int minSamplesLeaf = 10;
    double lambda = 1.0;
    double gamma = 0.0;
    double subsample = 1.0;
    double colsampleByTree = 1.0;

    // Run control
    bool verbose = false;
    bool waitForKey = true;
    int topFeatures = 10;
};

struct ExamplePrediction {
    RentalRecord input;
    PredictionResult result;
};

struct RentalTypeRunResult {
    ClassBalance balance;
    size_t trainSize = 0;
    size_t testSize = 0;
    BinaryClassificationMetrics metrics;
    std::vector<ExamplePrediction> examples;
};

/**
 * Load, report, split, fit, evaluate and predict the two examples.
 * Progress goes to out, warnings to err. Failures are rethrown nested
 * inside a std::runtime_error naming the stage that failed.
 */
RentalTypeRunResult runRentalTypeApp(const RentalTypeAppOptions& options,
                                     std::ostream& out,
                                     std::ostream& err);

BoostedTreeConfig createBoostedTreeConfig(const RentalTypeAppOptions& options);
RentalPipeline createRentalTypePipeline(const RentalTypeAppOptions& options);

// The two hand-written inputs: a mild June midday and a stormy December afternoon.
std::vector<RentalRecord> exampleRecords();

void printExamplePrediction(const ExamplePrediction& example, std::ostream& out);
void printRentalTypeModelSummary(const FittedRentalPipeline& pipeline,
                                 const RentalTypeAppOptions& options,
                                 std::ostream& out);

/**
 * Process entry point: runs the workflow behind a single catch boundary.
 * A failure prints "Ошибка:" and the nested exception chain to err. Both
 * paths then wait for a line on in when options.waitForKey is set.
 * @return Always 0; failures are reported on the console only
 */
int runRentalTypeMain(const RentalTypeAppOptions& options,
                      std::istream& in,
                      std::ostream& out,
                      std::ostream& err);

// Prints e and every exception nested inside it, outermost first.
void printExceptionChain(const std::exception& e, std::ostream& out);
