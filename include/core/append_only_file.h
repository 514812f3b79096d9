#pragma once

#include <cstdint>
#include <fstream>
#include <string>

namespace tickagg {

// Append-only delimited text file with a fixed header row.
// Not synchronized: owners serialize access with their own lock.
class AppendOnlyFile {
private:
    std::string path_;
    std::string header_;
    std::ofstream stream_;
    uint64_t size_bytes_;

    void writeLine(const std::string& line);

public:
    // Opens or creates the file; throws StartupFailure when it cannot
    AppendOnlyFile(const std::string& path, const std::string& header);

    AppendOnlyFile(const AppendOnlyFile&) = delete;
    AppendOnlyFile& operator=(const AppendOnlyFile&) = delete;

    // Returns true if the header was written by this call
    bool writeHeaderIfEmpty();

    // Writes the header first on a fresh file, then the row, then flushes.
    // Throws IOFailure if the stream rejects the write.
    void appendRow(const std::string& row);

    bool empty() const { return size_bytes_ == 0; }
    uint64_t sizeBytes() const { return size_bytes_; }
    const std::string& path() const { return path_; }
    const std::string& header() const { return header_; }
};

} // namespace tickagg
