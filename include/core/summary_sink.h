#pragma once

#include "core/append_only_file.h"
#include "core/record_codec.h"
#include "core/types.h"
#include <atomic>
#include <mutex>
#include <string>

namespace tickagg {

template <typename Summary>
struct SummaryFormat;

template <>
struct SummaryFormat<CandlestickSummary> {
    static const std::string& header() { return RecordCodec::candlestickHeader(); }
    static std::string encode(const CandlestickSummary& s) { return RecordCodec::encodeCandlestick(s); }
};

template <>
struct SummaryFormat<MeanSummary> {
    static const std::string& header() { return RecordCodec::meanHeader(); }
    static std::string encode(const MeanSummary& s) { return RecordCodec::encodeMean(s); }
};

// Append-only output store for one kind of summary.
// The header is written as soon as the store is opened.
template <typename Summary>
class SummarySink {
private:
    AppendOnlyFile file_;
    std::mutex mutex_;
    std::atomic<uint64_t> rows_written_{0};

public:
    explicit SummarySink(const std::string& path)
        : file_(path, SummaryFormat<Summary>::header()) {
        file_.writeHeaderIfEmpty();
    }

    SummarySink(const SummarySink&) = delete;
    SummarySink& operator=(const SummarySink&) = delete;

    void write(const Summary& summary) {
        std::string row = SummaryFormat<Summary>::encode(summary);

        std::lock_guard<std::mutex> lock(mutex_);
        file_.appendRow(row);
        rows_written_++;
    }

    uint64_t rowsWritten() const { return rows_written_.load(); }
    const std::string& path() const { return file_.path(); }
};

using CandlestickSink = SummarySink<CandlestickSummary>;
using MeanSink = SummarySink<MeanSummary>;

} // namespace tickagg
