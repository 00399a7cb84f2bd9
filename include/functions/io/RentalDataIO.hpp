// =============================================================================
// include/functions/io/RentalDataIO.hpp
// =============================================================================
#pragma once

#include "data/RentalRecord.hpp"
#include <string>
#include <vector>

struct CsvReadOptions {
    char delimiter = ',';
    bool hasHeader = true;
    bool verbose   = true;
};

class RentalDataIO {
public:
    /**
     * Read rental records positionally from a delimited text file.
     * Throws std::runtime_error when the file cannot be opened, when a row
     * has the wrong column count, or when a cell does not parse.
     * @param filename Path to the CSV file
     * @param options Delimiter, header flag and verbosity
     * @return One record per non-empty data row, in file order
     */
    std::vector<RentalRecord> readCSV(const std::string& filename,
                                      const CsvReadOptions& options = CsvReadOptions()) const;

    // Parses a single data line. lineNumber is only used in error messages.
    static RentalRecord parseLine(const std::string& line,
                                  char delimiter,
                                  size_t lineNumber);

    // Parses a label cell: 0/1 or true/false in any case.
    static bool parseLabel(const std::string& cell);

    // Rejects records with non-finite feature values.
    static void validateRecords(const std::vector<RentalRecord>& records);
};
