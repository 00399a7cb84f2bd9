#pragma once

#include <cstddef>

// One row of the bike sharing table. Column order matches the CSV file.
struct RentalRecord {
    double season           = 0.0;
    double month            = 0.0;
    double hour             = 0.0;
    double holiday          = 0.0;
    double weekday          = 0.0;
    double workingDay       = 0.0;
    double weatherCondition = 0.0;
    double temperature      = 0.0;
    double humidity         = 0.0;
    double windspeed        = 0.0;

    bool rentalType = false;
    bool hasLabel   = false;   // false for records built by hand for inference

    static constexpr std::size_t kFeatureColumns = 10;
    static constexpr std::size_t kTotalColumns   = 11;
};
