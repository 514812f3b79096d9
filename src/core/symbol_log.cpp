#include "core/symbol_log.h"
#include "core/errors.h"
#include "core/record_codec.h"
#include <fstream>
#include <stdexcept>

namespace tickagg {

namespace {

void stripCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

SymbolLog::SymbolLog(const std::string& path)
    : file_(path, RecordCodec::tickHeader()), data_rows_(0) {
    // Rows left by a previous run stay visible to scans
    data_rows_ = countExistingRows();
}

uint64_t SymbolLog::countExistingRows() const {
    if (file_.empty()) {
        return 0;
    }

    std::ifstream in(file_.path());
    if (!in.is_open()) {
        throw StartupFailure("Cannot read " + file_.path());
    }

    uint64_t rows = 0;
    bool first = true;
    std::string line;
    while (std::getline(in, line)) {
        stripCarriageReturn(line);
        if (line.empty()) continue;
        if (first && line == file_.header()) {
            first = false;
            continue;
        }
        first = false;
        rows++;
    }
    return rows;
}

void SymbolLog::append(const TickRecord& record) {
    std::string row = RecordCodec::encodeTick(record);

    std::lock_guard<std::mutex> lock(mutex_);
    file_.appendRow(row);
    data_rows_++;
}

bool SymbolLog::writeHeaderIfEmpty() {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.writeHeaderIfEmpty();
}

std::vector<TickRecord> SymbolLog::scanWindow(Timestamp reference_time, int window_minutes) const {
    if (window_minutes <= 0) {
        throw std::invalid_argument("window_minutes must be positive");
    }

    const Timestamp window_start = floorToMinute(reference_time);
    const Timestamp window_end = window_start + std::chrono::minutes(window_minutes);

    std::vector<TickRecord> records;

    std::lock_guard<std::mutex> lock(mutex_);

    // Fresh reader per scan; the append stream's position is never touched
    std::ifstream in(file_.path());
    if (!in.is_open()) {
        throw IOFailure("Cannot open " + file_.path() + " for reading");
    }

    std::string line;
    size_t line_number = 0;
    bool first = true;
    while (std::getline(in, line)) {
        line_number++;
        stripCarriageReturn(line);
        if (line.empty()) continue;

        if (first) {
            first = false;
            if (line == file_.header()) continue;
        }

        TickRecord record;
        try {
            record = RecordCodec::decodeTick(line);
        } catch (const std::invalid_argument& e) {
            throw MalformedRecord(file_.path() + ": " + e.what(), line_number);
        }

        if (record.recorded_at >= window_start && record.recorded_at < window_end) {
            records.push_back(std::move(record));
        }
    }

    if (in.bad()) {
        throw IOFailure("Read from " + file_.path() + " failed");
    }

    return records;
}

bool SymbolLog::isEmpty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_rows_ == 0;
}

uint64_t SymbolLog::rowCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_rows_;
}

} // namespace tickagg
