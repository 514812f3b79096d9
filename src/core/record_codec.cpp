#include "core/record_codec.h"
#include <charconv>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace tickagg {

namespace {

int64_t parseMillis(const std::string& field, const char* name) {
    int64_t value = 0;
    auto result = std::from_chars(field.data(), field.data() + field.size(), value);
    if (result.ec != std::errc() || result.ptr != field.data() + field.size()) {
        throw std::invalid_argument(std::string("invalid ") + name + ": '" + field + "'");
    }
    return value;
}

Price parsePrice(const std::string& field) {
    if (field.empty()) {
        throw std::invalid_argument("empty price");
    }
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(field.c_str(), &end);
    if (errno == ERANGE || end != field.c_str() + field.size()) {
        throw std::invalid_argument("invalid price: '" + field + "'");
    }
    return value;
}

} // namespace

const std::string& RecordCodec::tickHeader() {
    static const std::string header = "Symbol,Price,Timestamp,WriteTimestamp";
    return header;
}

const std::string& RecordCodec::candlestickHeader() {
    static const std::string header =
        "Symbol,MinuteOfDay,OpenPrice,ClosePrice,HighestPrice,LowestPrice,Transactions";
    return header;
}

const std::string& RecordCodec::meanHeader() {
    static const std::string header = "Symbol,StartTime,EndTime,MeanPrice,Transactions";
    return header;
}

std::string RecordCodec::formatPrice(Price price) {
    // Shortest representation that reads back to the same double
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), price);
    return std::string(buffer, result.ptr);
}

std::string RecordCodec::encodeTick(const TickRecord& record) {
    std::stringstream ss;
    ss << record.symbol << kDelimiter
       << formatPrice(record.price) << kDelimiter
       << record.observed_at.count() << kDelimiter
       << record.recorded_at.count();
    return ss.str();
}

std::string RecordCodec::encodeCandlestick(const CandlestickSummary& summary) {
    std::stringstream ss;
    ss << summary.symbol << kDelimiter
       << formatTimestamp(summary.window_start) << kDelimiter
       << formatPrice(summary.open) << kDelimiter
       << formatPrice(summary.close) << kDelimiter
       << formatPrice(summary.high) << kDelimiter
       << formatPrice(summary.low) << kDelimiter
       << summary.count;
    return ss.str();
}

std::string RecordCodec::encodeMean(const MeanSummary& summary) {
    std::stringstream ss;
    ss << summary.symbol << kDelimiter
       << formatTimestamp(summary.start_time) << kDelimiter
       << formatTimestamp(summary.end_time) << kDelimiter
       << formatPrice(summary.mean_price) << kDelimiter
       << summary.count;
    return ss.str();
}

std::vector<std::string> RecordCodec::splitRow(const std::string& row) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(row);
    while (std::getline(iss, field, kDelimiter)) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!row.empty() && row.back() == kDelimiter) {
        fields.emplace_back();
    }
    return fields;
}

TickRecord RecordCodec::decodeTick(const std::string& row) {
    auto fields = splitRow(row);
    if (fields.size() != 4) {
        throw std::invalid_argument("expected 4 fields, got " + std::to_string(fields.size()));
    }
    if (fields[0].empty()) {
        throw std::invalid_argument("empty symbol");
    }

    TickRecord record;
    record.symbol = fields[0];
    record.price = parsePrice(fields[1]);
    record.observed_at = Timestamp(parseMillis(fields[2], "timestamp"));
    record.recorded_at = Timestamp(parseMillis(fields[3], "write timestamp"));
    return record;
}

} // namespace tickagg
