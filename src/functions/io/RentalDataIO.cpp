// =============================================================================
// src/functions/io/RentalDataIO.cpp
// =============================================================================
#include "functions/io/RentalDataIO.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

double parseNumber(const std::string& cell, size_t lineNumber, size_t column) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (cell.empty() || consumed != cell.size()) {
        throw std::runtime_error("Failed to parse value at line " + std::to_string(lineNumber) +
                                 ", column " + std::to_string(column + 1) + ": '" + cell + "'");
    }
    return value;
}

} // namespace

std::vector<RentalRecord> RentalDataIO::readCSV(const std::string& filename,
                                                const CsvReadOptions& options) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    std::vector<RentalRecord> records;
    std::string line;
    size_t lineNumber = 0;

    if (options.hasHeader) {
        if (!std::getline(file, line)) {
            throw std::runtime_error("File is empty or cannot read header: " + filename);
        }
        ++lineNumber;

        std::stringstream ssHead(line);
        std::string col;
        size_t headerColumns = 0;
        while (std::getline(ssHead, col, options.delimiter)) {
            ++headerColumns;
        }
        if (headerColumns != RentalRecord::kTotalColumns) {
            throw std::runtime_error("Header of " + filename + " has " + std::to_string(headerColumns) +
                                     " columns, expected " +
                                     std::to_string(RentalRecord::kTotalColumns));
        }
    }

    while (std::getline(file, line)) {
        ++lineNumber;

        // Skip empty lines or lines with only whitespace
        if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        try {
            records.push_back(parseLine(line, options.delimiter, lineNumber));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(filename + ": " + e.what());
        }
    }

    if (options.verbose) {
        std::cout << "Loaded " << records.size() << " records with "
                  << RentalRecord::kFeatureColumns << " features each" << std::endl;
    }

    return records;
}

RentalRecord RentalDataIO::parseLine(const std::string& line,
                                     char delimiter,
                                     size_t lineNumber) {
    std::vector<std::string> cells;
    cells.reserve(RentalRecord::kTotalColumns);

    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, delimiter)) {
        trim(cell);
        cells.push_back(cell);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == delimiter) {
        cells.emplace_back();
    }

    if (cells.size() != RentalRecord::kTotalColumns) {
        throw std::runtime_error("Column count mismatch at line " + std::to_string(lineNumber) +
                                 " (expected " + std::to_string(RentalRecord::kTotalColumns) +
                                 ", actual " + std::to_string(cells.size()) + ")");
    }

    RentalRecord r;
    r.season           = parseNumber(cells[0], lineNumber, 0);
    r.month            = parseNumber(cells[1], lineNumber, 1);
    r.hour             = parseNumber(cells[2], lineNumber, 2);
    r.holiday          = parseNumber(cells[3], lineNumber, 3);
    r.weekday          = parseNumber(cells[4], lineNumber, 4);
    r.workingDay       = parseNumber(cells[5], lineNumber, 5);
    r.weatherCondition = parseNumber(cells[6], lineNumber, 6);
    r.temperature      = parseNumber(cells[7], lineNumber, 7);
    r.humidity         = parseNumber(cells[8], lineNumber, 8);
    r.windspeed        = parseNumber(cells[9], lineNumber, 9);

    try {
        r.rentalType = parseLabel(cells[10]);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Failed to parse label at line " + std::to_string(lineNumber) +
                                 ": " + e.what());
    }
    r.hasLabel = true;
    return r;
}

bool RentalDataIO::parseLabel(const std::string& cell) {
    std::string v = cell;
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (v == "1" || v == "true")  return true;
    if (v == "0" || v == "false") return false;

    // Numeric encodings such as "1.0"
    size_t consumed = 0;
    double d = 0.0;
    try {
        d = std::stod(v, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (!v.empty() && consumed == v.size() && (d == 0.0 || d == 1.0)) {
        return d == 1.0;
    }
    throw std::invalid_argument("'" + cell + "' is not a boolean label");
}

void RentalDataIO::validateRecords(const std::vector<RentalRecord>& records) {
    for (size_t i = 0; i < records.size(); ++i) {
        const RentalRecord& r = records[i];
        const double values[] = {r.season, r.month, r.hour, r.holiday, r.weekday,
                                 r.workingDay, r.weatherCondition, r.temperature,
                                 r.humidity, r.windspeed};
        for (double v : values) {
            if (!std::isfinite(v)) {
                throw std::runtime_error("Non-finite feature value in record " + std::to_string(i));
            }
        }
    }
}
