#pragma once

#include "TripRecord.h"

#include <istream>
#include <string>
#include <vector>

class TripDataset {
public:
    explicit TripDataset(std::string filename, char delimiter = ',');

    /**
     * @brief Reads the delimited file into raw trip records.
     * @details Tokenization is delegated to CSVUtils. Rows whose column count
     *          differs from the header, or with an unterminated quote, are skipped
     *          and counted in malformedRowCount().
     * @pre file exists and is readable.
     * @throws Hackney::IOException when the file cannot be opened.
     * @throws Hackney::DatasetException when the header is missing or malformed.
     */
    void load();

    /**
     * @brief Same as load() but from an already-open stream.
     */
    void load(std::istream& in);

    // Prints a progress line every `rows` data rows while loading; 0 disables it.
    void setProgressInterval(size_t rows) noexcept { progressInterval_ = rows; }

    size_t rowCount() const noexcept { return records_.size(); }
    size_t malformedRowCount() const noexcept { return malformedRows_; }
    const std::string& filename() const noexcept { return filename_; }

    const std::vector<std::string>& header() const noexcept { return header_; }
    const std::vector<TripRecord>& records() const noexcept { return records_; }
    std::vector<TripRecord>& records() noexcept { return records_; }

    // Moves the records out; the dataset is empty afterwards.
    std::vector<TripRecord> takeRecords();

    /**
     * @brief Writes records as a delimited table with the given column order.
     * @details Fields a record lacks are written as empty cells.
     * @throws Hackney::IOException when the file cannot be created or written.
     */
    static void writeCSV(const std::string& path,
                         const std::vector<std::string>& columns,
                         const std::vector<TripRecord>& records,
                         char delimiter = ',');

private:
    std::string filename_;
    char delimiter_;
    std::vector<std::string> header_;
    std::vector<TripRecord> records_;
    size_t malformedRows_ = 0;
    size_t progressInterval_ = 0;
};
