#include "preprocessing/RentalColumns.hpp"
#include <stdexcept>

namespace preprocessing {

const std::vector<RentalColumn>& allFeatureColumns() {
    static const std::vector<RentalColumn> columns = {
        RentalColumn::Season,      RentalColumn::Month,      RentalColumn::Hour,
        RentalColumn::Holiday,     RentalColumn::Weekday,    RentalColumn::WorkingDay,
        RentalColumn::WeatherCondition, RentalColumn::Temperature,
        RentalColumn::Humidity,    RentalColumn::Windspeed};
    return columns;
}

const char* columnName(RentalColumn column) {
    switch (column) {
        case RentalColumn::Season:           return "Season";
        case RentalColumn::Month:            return "Month";
        case RentalColumn::Hour:             return "Hour";
        case RentalColumn::Holiday:          return "Holiday";
        case RentalColumn::Weekday:          return "Weekday";
        case RentalColumn::WorkingDay:       return "WorkingDay";
        case RentalColumn::WeatherCondition: return "WeatherCondition";
        case RentalColumn::Temperature:      return "Temperature";
        case RentalColumn::Humidity:         return "Humidity";
        case RentalColumn::Windspeed:        return "Windspeed";
    }
    return "Unknown";
}

RentalColumn parseColumn(const std::string& name) {
    for (RentalColumn column : allFeatureColumns()) {
        if (name == columnName(column)) {
            return column;
        }
    }
    throw std::invalid_argument("Unknown column: '" + name + "'");
}

double columnValue(const RentalRecord& record, RentalColumn column) {
    switch (column) {
        case RentalColumn::Season:           return record.season;
        case RentalColumn::Month:            return record.month;
        case RentalColumn::Hour:             return record.hour;
        case RentalColumn::Holiday:          return record.holiday;
        case RentalColumn::Weekday:          return record.weekday;
        case RentalColumn::WorkingDay:       return record.workingDay;
        case RentalColumn::WeatherCondition: return record.weatherCondition;
        case RentalColumn::Temperature:      return record.temperature;
        case RentalColumn::Humidity:         return record.humidity;
        case RentalColumn::Windspeed:        return record.windspeed;
    }
    throw std::invalid_argument("Unknown column");
}

std::vector<double> columnValues(const std::vector<RentalRecord>& records, RentalColumn column) {
    std::vector<double> values;
    values.reserve(records.size());
    for (const auto& r : records) {
        values.push_back(columnValue(r, column));
    }
    return values;
}

} // namespace preprocessing
