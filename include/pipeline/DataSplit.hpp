#pragma once

#include "data/RentalRecord.hpp"
#include <cstdint>
#include <vector>

struct DataParams {
    std::vector<RentalRecord> train;
    std::vector<RentalRecord> test;
};

/**
 * Randomly partition records into train and test sets.
 * The permutation comes from a std::mt19937 seeded with seed, so the same
 * input and seed always yield the same partition. Each partition keeps the
 * records' original relative order. The test set gets floor(N * testFraction)
 * rows, but at least one when N >= 2 and testFraction > 0.
 * @param records Full dataset
 * @param testFraction Share of rows sent to the test set, in [0, 1)
 * @param seed Generator seed
 * @param out Output train/test sets
 */
void splitDataset(const std::vector<RentalRecord>& records,
                  double testFraction,
                  uint32_t seed,
                  DataParams& out);
