#pragma once

#include "data/RentalRecord.hpp"
#include <cstddef>
#include <iosfwd>
#include <vector>

struct ClassBalance {
    size_t countFalse = 0;
    size_t countTrue  = 0;

    size_t total() const { return countFalse + countTrue; }
    bool hasBothClasses() const { return countFalse > 0 && countTrue > 0; }
};

ClassBalance countClasses(const std::vector<RentalRecord>& records);

// Prints the per-class counts to out. When a class is missing a warning goes
// to warn; the run continues either way. Returns hasBothClasses().
bool reportClassBalance(const ClassBalance& balance, std::ostream& out, std::ostream& warn);
