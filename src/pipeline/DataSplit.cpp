#include "pipeline/DataSplit.hpp"
#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

void splitDataset(const std::vector<RentalRecord>& records,
                  double testFraction,
                  uint32_t seed,
                  DataParams& out) {

    if (!(testFraction >= 0.0 && testFraction < 1.0)) {
        throw std::invalid_argument("Test fraction must be in [0, 1), got " +
                                    std::to_string(testFraction));
    }

    const size_t totalRows = records.size();
    size_t testRows = static_cast<size_t>(totalRows * testFraction);
    // Small inputs still hold one row out so the model can be scored
    if (testRows == 0 && testFraction > 0.0 && totalRows >= 2) {
        testRows = 1;
    }

    std::vector<size_t> order(totalRows);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 gen(seed);
    std::shuffle(order.begin(), order.end(), gen);

    std::vector<char> inTest(totalRows, 0);
    for (size_t i = 0; i < testRows; ++i) {
        inTest[order[i]] = 1;
    }

    out.train.clear();
    out.test.clear();
    out.train.reserve(totalRows - testRows);
    out.test.reserve(testRows);

    for (size_t i = 0; i < totalRows; ++i) {
        if (inTest[i]) {
            out.test.push_back(records[i]);
        } else {
            out.train.push_back(records[i]);
        }
    }
}
