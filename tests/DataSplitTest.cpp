#include "pipeline/DataSplit.hpp"
#include "TestData.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace {

// Records are identified by an index stored in hour for these tests.
std::vector<RentalRecord> indexedRecords(size_t n) {
    std::vector<RentalRecord> records(n);
    for (size_t i = 0; i < n; ++i) {
        records[i].hour = static_cast<double>(i);
        records[i].rentalType = (i % 3 == 0);
        records[i].hasLabel = true;
    }
    return records;
}

std::vector<int> ids(const std::vector<RentalRecord>& records) {
    std::vector<int> out;
    for (const auto& r : records) out.push_back(static_cast<int>(r.hour));
    return out;
}

} // namespace

TEST(DataSplitTest, PreservesSizeWithoutOverlap) {
    const auto records = indexedRecords(1000);
    DataParams dp;
    splitDataset(records, 0.1, 0, dp);

    EXPECT_EQ(dp.test.size(), 100u);
    EXPECT_EQ(dp.train.size() + dp.test.size(), records.size());

    std::set<int> trainIds, testIds;
    for (int id : ids(dp.train)) trainIds.insert(id);
    for (int id : ids(dp.test)) testIds.insert(id);
    EXPECT_EQ(trainIds.size(), dp.train.size());
    for (int id : testIds) {
        EXPECT_EQ(trainIds.count(id), 0u);
    }
    EXPECT_EQ(trainIds.size() + testIds.size(), records.size());
}

TEST(DataSplitTest, SameSeedSameSplit) {
    const auto records = indexedRecords(300);
    DataParams a, b;
    splitDataset(records, 0.1, 0, a);
    splitDataset(records, 0.1, 0, b);
    EXPECT_EQ(ids(a.test), ids(b.test));
    EXPECT_EQ(ids(a.train), ids(b.train));
}

TEST(DataSplitTest, DifferentSeedsShuffleDifferently) {
    const auto records = indexedRecords(300);
    DataParams a, b;
    splitDataset(records, 0.1, 0, a);
    splitDataset(records, 0.1, 1, b);
    EXPECT_NE(ids(a.test), ids(b.test));
}

TEST(DataSplitTest, TestSetIsNotJustTheTail) {
    const auto records = indexedRecords(1000);
    DataParams dp;
    splitDataset(records, 0.1, 0, dp);
    int fromHead = 0;
    for (int id : ids(dp.test)) {
        if (id < 900) ++fromHead;
    }
    EXPECT_GT(fromHead, 0);
}

TEST(DataSplitTest, PartitionsKeepOriginalOrder) {
    const auto records = indexedRecords(200);
    DataParams dp;
    splitDataset(records, 0.25, 3, dp);
    const auto train = ids(dp.train);
    const auto test = ids(dp.test);
    EXPECT_TRUE(std::is_sorted(train.begin(), train.end()));
    EXPECT_TRUE(std::is_sorted(test.begin(), test.end()));
}

TEST(DataSplitTest, RejectsFractionOutOfRange) {
    const auto records = indexedRecords(10);
    DataParams dp;
    EXPECT_THROW(splitDataset(records, 1.0, 0, dp), std::invalid_argument);
    EXPECT_THROW(splitDataset(records, -0.1, 0, dp), std::invalid_argument);
}

TEST(DataSplitTest, ZeroFractionKeepsEverythingForTraining) {
    const auto records = testdata::makeRecords(50);
    DataParams dp;
    splitDataset(records, 0.0, 0, dp);
    EXPECT_EQ(dp.train.size(), 50u);
    EXPECT_TRUE(dp.test.empty());
}

TEST(DataSplitTest, SmallInputsStillHoldOneRowOut) {
    for (size_t n = 2; n < 10; ++n) {
        DataParams dp;
        splitDataset(indexedRecords(n), 0.1, 0, dp);
        EXPECT_EQ(dp.test.size(), 1u) << "n = " << n;
        EXPECT_EQ(dp.train.size(), n - 1) << "n = " << n;
    }

    DataParams single;
    splitDataset(indexedRecords(1), 0.1, 0, single);
    EXPECT_TRUE(single.test.empty());
    EXPECT_EQ(single.train.size(), 1u);
}
