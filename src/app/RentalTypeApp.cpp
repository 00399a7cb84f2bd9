#include "app/RentalTypeApp.hpp"
#include "functions/io/RentalDataIO.hpp"
#include "inference/PredictionEngine.hpp"
#include "pipeline/DataSplit.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

template <typename F>
auto runStage(const std::string& stage, F&& body) -> decltype(body()) {
    try {
        return body();
    } catch (const std::exception&) {
        std::throw_with_nested(std::runtime_error("Stage '" + stage + "' failed"));
    }
}

void waitForKey(const RentalTypeAppOptions& opts, std::istream& in, std::ostream& out) {
    if (!opts.waitForKey) return;
    out << "\nНажмите любую клавишу для завершения..." << std::endl;
    std::string line;
    std::getline(in, line);
}

} // namespace

BoostedTreeConfig createBoostedTreeConfig(const RentalTypeAppOptions& opts) {
    BoostedTreeConfig config;
    config.numRounds = opts.numRounds;
    config.eta = opts.eta;
    config.maxDepth = opts.maxDepth;
    config.minChildWeight = opts.minChildWeight;
    config.minSamplesLeaf = opts.minSamplesLeaf;
    config.lambda = opts.lambda;
    config.gamma = opts.gamma;
    config.subsample = opts.subsample;
    config.colsampleByTree = opts.colsampleByTree;
    config.seed = opts.seed;
    config.verbose = opts.verbose;
    config.objective = "binary:logistic";
    return config;
}

RentalPipeline createRentalTypePipeline(const RentalTypeAppOptions& opts) {
    RentalPipeline pipeline;
    pipeline.oneHotEncoding("Season")
        .oneHotEncoding("WeatherCondition")
        .normalizeMinMax("Temperature")
        .normalizeMinMax("Humidity")
        .normalizeMinMax("Windspeed")
        .concatenate("Features", {"Season",
                                  "Month",
                                  "Hour",
                                  "Holiday",
                                  "Weekday",
                                  "WorkingDay",
                                  "WeatherCondition",
                                  "Temperature",
                                  "Humidity",
                                  "Windspeed"})
        .binaryTrainer(createBoostedTreeConfig(opts), RentalPipeline::kLabelColumn, "Features");
    return pipeline;
}

std::vector<RentalRecord> exampleRecords() {
    RentalRecord summer;
    summer.season = 1;
    summer.month = 6;
    summer.hour = 12;
    summer.holiday = 0;
    summer.weekday = 3;
    summer.workingDay = 1;
    summer.weatherCondition = 1;
    summer.temperature = 18.0;
    summer.humidity = 75.0;
    summer.windspeed = 8.0;

    RentalRecord storm;
    storm.season = 4;
    storm.month = 12;
    storm.hour = 16;
    storm.holiday = 0;
    storm.weekday = 5;
    storm.workingDay = 1;
    storm.weatherCondition = 4;
    storm.temperature = -2.0;
    storm.humidity = 90.0;
    storm.windspeed = 20.0;

    return {summer, storm};
}

void printExamplePrediction(const ExamplePrediction& example, std::ostream& out) {
    out << std::defaultfloat
        << "Пример: " << example.input.weatherCondition << " погода, темп "
        << example.input.temperature << ", предсказание: "
        << (example.result.predictedLabel ? "True" : "False")
        << " (вероятность: " << std::fixed << std::setprecision(2)
        << example.result.probability << ")" << std::endl;
    out << std::defaultfloat;
}

RentalTypeRunResult runRentalTypeApp(const RentalTypeAppOptions& opts,
                                     std::ostream& out,
                                     std::ostream& err) {
    auto totalStart = std::chrono::high_resolution_clock::now();
    RentalTypeRunResult run;

    out << "Предсказание типа аренды велосипеда с использованием градиентного бустинга" << std::endl;

    out << "Загрузка данных..." << std::endl;
    const std::vector<RentalRecord> records = runStage("load", [&] {
        RentalDataIO io;
        CsvReadOptions csv;
        csv.delimiter = opts.delimiter;
        csv.hasHeader = opts.hasHeader;
        csv.verbose = opts.verbose;
        auto loaded = io.readCSV(opts.dataPath, csv);
        RentalDataIO::validateRecords(loaded);
        return loaded;
    });

    run.balance = countClasses(records);
    reportClassBalance(run.balance, out, err);

    out << "Разделение данных..." << std::endl;
    DataParams dp = runStage("split", [&] {
        DataParams split;
        splitDataset(records, opts.testFraction, opts.seed, split);
        return split;
    });
    run.trainSize = dp.train.size();
    run.testSize = dp.test.size();
    if (opts.verbose) {
        out << "Train: " << run.trainSize << " | Test: " << run.testSize << std::endl;
    }

    out << "Создание пайплайна..." << std::endl;
    const RentalPipeline pipeline = runStage("build pipeline", [&] {
        return createRentalTypePipeline(opts);
    });
    if (opts.verbose) {
        out << pipeline.describe() << std::endl;
    }

    out << "Обучение модели..." << std::endl;
    auto trainStart = std::chrono::high_resolution_clock::now();
    const auto model = runStage("fit", [&] { return pipeline.fit(dp.train); });
    auto trainEnd = std::chrono::high_resolution_clock::now();

    out << "Выполняем оценку..." << std::endl;
    out << "Оценка качества модели..." << std::endl;
    run.metrics = runStage("evaluate", [&] { return model->evaluate(dp.test); });
    if (!run.metrics.aucDefined) {
        err << "Внимание: в тестовой выборке только один класс, AUC не определён" << std::endl;
    }

    out << "AUC: " << std::fixed << std::setprecision(2) << run.metrics.auc << std::endl;
    out << "F1 Score: " << run.metrics.f1Score << std::endl;
    out << std::defaultfloat;
    if (opts.verbose) {
        printBinaryMetrics(run.metrics, out);
        out << std::defaultfloat;
    }

    out << "Создаем движок предсказаний..." << std::endl;
    const PredictionEngine engine(model);
    for (const auto& input : exampleRecords()) {
        ExamplePrediction example;
        example.input = input;
        example.result = runStage("predict", [&] { return engine.predict(input); });
        printExamplePrediction(example, out);
        run.examples.push_back(example);
    }

    if (opts.verbose) {
        auto totalEnd = std::chrono::high_resolution_clock::now();
        auto trainTime = std::chrono::duration_cast<std::chrono::milliseconds>(trainEnd - trainStart);
        auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(totalEnd - totalStart);
        printRentalTypeModelSummary(*model, opts, out);
        out << "Train Time: " << trainTime.count() << "ms"
            << " | Total Time: " << totalTime.count() << "ms" << std::endl;
    }

    return run;
}

void printRentalTypeModelSummary(const FittedRentalPipeline& pipeline,
                                 const RentalTypeAppOptions& opts,
                                 std::ostream& out) {
    const BoostedTreeTrainer& trainer = pipeline.getTrainer();
    int maxDepth = 0, totalLeaves = 0;
    trainer.getModel().getModelStats(maxDepth, totalLeaves);

    out << "\n=== Model Summary ===" << std::endl;
    out << "Objective: " << trainer.getLoss().name() << std::endl;
    out << "Trees: " << trainer.getModel().getTreeCount()
        << " | Max Depth: " << maxDepth
        << " | Leaves: " << totalLeaves << std::endl;
    out << "Learning Rate: " << opts.eta << " | Lambda: " << opts.lambda
        << " | Gamma: " << opts.gamma << std::endl;

    const auto& losses = trainer.getTrainingLoss();
    if (!losses.empty()) {
        out << "Final Training LogLoss: " << std::fixed << std::setprecision(6)
            << losses.back() << std::endl;
    }

    const auto ranked = pipeline.getFeatureImportance();
    const int top = std::min(opts.topFeatures, static_cast<int>(ranked.size()));
    out << "\nTop " << top << " Feature Importances:" << std::endl;
    for (int i = 0; i < top; ++i) {
        out << ranked[i].first << ": " << std::fixed << std::setprecision(4)
            << ranked[i].second << std::endl;
    }
    out << std::defaultfloat;
}

int runRentalTypeMain(const RentalTypeAppOptions& opts,
                      std::istream& in,
                      std::ostream& out,
                      std::ostream& err) {
    try {
        runRentalTypeApp(opts, out, err);
    } catch (const std::exception& e) {
        err << "Ошибка: " << e.what() << std::endl;
        err << "Стек вызовов:" << std::endl;
        printExceptionChain(e, err);
    }

    waitForKey(opts, in, out);
    return 0;
}

void printExceptionChain(const std::exception& e, std::ostream& out) {
    out << "  " << e.what() << std::endl;
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        printExceptionChain(nested, out);
    }
}
