#pragma once

#include "core/types.h"
#include <string>
#include <vector>

namespace tickagg {

// Delimited text rows for the three per-symbol stores.
// Field order is fixed per record type; the first row of every store is its header.
class RecordCodec {
public:
    static constexpr char kDelimiter = ',';

    static const std::string& tickHeader();
    static const std::string& candlestickHeader();
    static const std::string& meanHeader();

    static std::string encodeTick(const TickRecord& record);
    static std::string encodeCandlestick(const CandlestickSummary& summary);
    static std::string encodeMean(const MeanSummary& summary);

    // Throws std::invalid_argument when the row does not hold exactly one tick
    static TickRecord decodeTick(const std::string& row);

    static std::vector<std::string> splitRow(const std::string& row);
    static std::string formatPrice(Price price);
};

} // namespace tickagg
