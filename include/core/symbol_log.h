#pragma once

#include "core/append_only_file.h"
#include "core/types.h"
#include <mutex>
#include <string>
#include <vector>

namespace tickagg {

// Durable, ordered tick log for one symbol.
//
// Every operation (append, header write, scan) holds the log's mutex for its
// whole duration, so rows never interleave at the byte level. Rows are kept in
// append order, which is non-decreasing in recorded_at.
class SymbolLog {
private:
    AppendOnlyFile file_;
    mutable std::mutex mutex_;
    uint64_t data_rows_;

    uint64_t countExistingRows() const;

public:
    explicit SymbolLog(const std::string& path);

    SymbolLog(const SymbolLog&) = delete;
    SymbolLog& operator=(const SymbolLog&) = delete;

    void append(const TickRecord& record);

    // Writes the header on an empty store; returns true if it did
    bool writeHeaderIfEmpty();

    // Re-reads the whole log and returns, in append order, every record with
    // floorToMinute(reference_time) <= recorded_at < that + window_minutes.
    // Throws IOFailure if the log cannot be read, MalformedRecord on a bad row.
    std::vector<TickRecord> scanWindow(Timestamp reference_time, int window_minutes) const;

    bool isEmpty() const;
    uint64_t rowCount() const;
    const std::string& path() const { return file_.path(); }
};

} // namespace tickagg
