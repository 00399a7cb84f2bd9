#include "app/RentalTypeApp.hpp"
#include "TestData.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace {

RentalTypeAppOptions optionsFor(const std::string& path) {
    RentalTypeAppOptions o;
    o.dataPath = path;
    o.numRounds = 20;
    o.maxDepth = 4;
    o.verbose = false;
    o.waitForKey = false;
    return o;
}

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

TEST(RentalTypeAppTest, RunsTheWholeWorkflow) {
    const auto path = testdata::tempPath("bike_sharing.csv");
    testdata::writeCsv(path, testdata::makeRecords(1000));

    std::ostringstream out, err;
    const RentalTypeRunResult run = runRentalTypeApp(optionsFor(path), out, err);

    EXPECT_EQ(run.balance.total(), 1000u);
    EXPECT_EQ(run.testSize, 100u);
    EXPECT_EQ(run.trainSize + run.testSize, 1000u);
    EXPECT_GE(run.metrics.auc, 0.0);
    EXPECT_LE(run.metrics.auc, 1.0);
    EXPECT_GE(run.metrics.f1Score, 0.0);
    EXPECT_LE(run.metrics.f1Score, 1.0);

    ASSERT_EQ(run.examples.size(), 2u);
    for (const auto& ex : run.examples) {
        EXPECT_GE(ex.result.probability, 0.0);
        EXPECT_LE(ex.result.probability, 1.0);
    }

    const std::string text = out.str();
    EXPECT_NE(text.find("Загрузка данных..."), std::string::npos);
    EXPECT_NE(text.find("AUC: "), std::string::npos);
    EXPECT_NE(text.find("F1 Score: "), std::string::npos);
    EXPECT_EQ(countOccurrences(text, "Пример: "), 2u);
    EXPECT_NE(text.find("Пример: 1 погода, темп 18, предсказание: "), std::string::npos);
    EXPECT_NE(text.find("Пример: 4 погода, темп -2, предсказание: "), std::string::npos);
    EXPECT_TRUE(err.str().empty());
    std::remove(path.c_str());
}

TEST(RentalTypeAppTest, VerboseRunPrintsModelSummary) {
    const auto path = testdata::tempPath("verbose.csv");
    testdata::writeCsv(path, testdata::makeRecords(300));

    RentalTypeAppOptions o = optionsFor(path);
    o.verbose = true;
    std::ostringstream out, err;
    runRentalTypeApp(o, out, err);

    EXPECT_NE(out.str().find("=== Model Summary ==="), std::string::npos);
    EXPECT_NE(out.str().find("Feature Importances"), std::string::npos);
    std::remove(path.c_str());
}

TEST(RentalTypeAppTest, MissingFileFailsInTheLoadStage) {
    std::ostringstream out, err;
    try {
        runRentalTypeApp(optionsFor(testdata::tempPath("missing.csv")), out, err);
        FAIL() << "expected a load failure";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("load"), std::string::npos);

        std::ostringstream chain;
        printExceptionChain(e, chain);
        EXPECT_NE(chain.str().find("Unable to open file"), std::string::npos);
    }
}

TEST(RentalTypeAppTest, SingleClassDataWarnsButCompletes) {
    auto records = testdata::makeRecords(200);
    for (auto& r : records) r.rentalType = false;
    const auto path = testdata::tempPath("one_class.csv");
    testdata::writeCsv(path, records);

    std::ostringstream out, err;
    RentalTypeRunResult run;
    ASSERT_NO_THROW(run = runRentalTypeApp(optionsFor(path), out, err));

    EXPECT_EQ(run.balance.countTrue, 0u);
    EXPECT_NE(err.str().find("Внимание"), std::string::npos);
    EXPECT_FALSE(run.metrics.aucDefined);
    EXPECT_DOUBLE_EQ(run.metrics.auc, 0.5);
    EXPECT_EQ(run.examples.size(), 2u);
    std::remove(path.c_str());
}

TEST(RentalTypeAppTest, NineRowFileIsStillScored) {
    auto records = testdata::makeRecords(9);
    for (size_t i = 0; i < records.size(); ++i) records[i].rentalType = (i % 2 == 0);
    const auto path = testdata::tempPath("nine_rows.csv");
    testdata::writeCsv(path, records);

    std::ostringstream out, err;
    RentalTypeRunResult run;
    ASSERT_NO_THROW(run = runRentalTypeApp(optionsFor(path), out, err));

    EXPECT_EQ(run.testSize, 1u);
    EXPECT_EQ(run.trainSize, 8u);
    EXPECT_GE(run.metrics.auc, 0.0);
    EXPECT_LE(run.metrics.auc, 1.0);
    EXPECT_GE(run.metrics.f1Score, 0.0);
    EXPECT_LE(run.metrics.f1Score, 1.0);
    EXPECT_NE(out.str().find("AUC: "), std::string::npos);
    EXPECT_EQ(run.examples.size(), 2u);
    std::remove(path.c_str());
}

TEST(RentalTypeAppTest, MainReportsFailureAndExitsNormally) {
    RentalTypeAppOptions o = optionsFor(testdata::tempPath("absent.csv"));
    o.waitForKey = true;
    std::istringstream in("\n");
    std::ostringstream out, err;

    EXPECT_EQ(runRentalTypeMain(o, in, out, err), 0);

    const std::string text = err.str();
    EXPECT_NE(text.find("Ошибка: Stage 'load' failed"), std::string::npos);
    EXPECT_NE(text.find("Стек вызовов:"), std::string::npos);
    EXPECT_NE(text.find("Unable to open file"), std::string::npos);
    EXPECT_NE(out.str().find("Нажмите любую клавишу"), std::string::npos);
}

TEST(RentalTypeAppTest, MainReturnsZeroOnSuccess) {
    const auto path = testdata::tempPath("main_ok.csv");
    testdata::writeCsv(path, testdata::makeRecords(200));

    std::istringstream in;
    std::ostringstream out, err;
    EXPECT_EQ(runRentalTypeMain(optionsFor(path), in, out, err), 0);
    EXPECT_EQ(err.str().find("Ошибка"), std::string::npos);
    EXPECT_EQ(out.str().find("Нажмите любую клавишу"), std::string::npos);
    std::remove(path.c_str());
}

TEST(RentalTypeAppTest, ConfigMapsOptions) {
    RentalTypeAppOptions o;
    o.numRounds = 7;
    o.eta = 0.05;
    o.seed = 9;
    const BoostedTreeConfig c = createBoostedTreeConfig(o);
    EXPECT_EQ(c.numRounds, 7);
    EXPECT_DOUBLE_EQ(c.eta, 0.05);
    EXPECT_EQ(c.seed, 9u);
    EXPECT_EQ(c.objective, "binary:logistic");
}
