#pragma once

#include "data/RentalRecord.hpp"
#include <string>
#include <vector>

namespace preprocessing {

enum class RentalColumn {
    Season,
    Month,
    Hour,
    Holiday,
    Weekday,
    WorkingDay,
    WeatherCondition,
    Temperature,
    Humidity,
    Windspeed
};

// All feature columns in file order.
const std::vector<RentalColumn>& allFeatureColumns();

const char* columnName(RentalColumn column);

/**
 * Look up a feature column by its name ("Season", "WeatherCondition", ...).
 * Throws std::invalid_argument for an unknown name.
 */
RentalColumn parseColumn(const std::string& name);

double columnValue(const RentalRecord& record, RentalColumn column);

// Gathers one column over a record set.
std::vector<double> columnValues(const std::vector<RentalRecord>& records, RentalColumn column);

} // namespace preprocessing
