#include "core/symbol_registry.h"
#include "core/errors.h"
#include "utils/file_utils.h"
#include "utils/logger.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace tickagg {

SymbolRegistry::SymbolRegistry(const std::string& data_dir, const std::vector<std::string>& symbols)
    : data_dir_(data_dir) {

    for (const char* kind : {"rolling", "candlestick", "mean"}) {
        const std::string dir = (fs::path(data_dir_) / kind).string();
        if (!ensureDirectory(dir)) {
            throw StartupFailure("Cannot create storage directory " + dir);
        }
    }

    handles_.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        if (by_symbol_.count(symbol)) {
            LOG_WARNING("Symbol " + symbol + " listed more than once, tracking it once");
            continue;
        }

        // Distinct symbols must not share store files
        const std::string file_name = sanitizeSymbol(symbol);
        auto owner = by_file_name_.find(file_name);
        if (owner != by_file_name_.end()) {
            throw StartupFailure("Symbols " + owner->second + " and " + symbol +
                                 " both map to store file " + file_name + ".csv");
        }

        // Opening the sinks writes their headers, so construction can fail on I/O too.
        // Initialize before any worker or feed thread can see the handle.
        std::unique_ptr<SymbolHandle> handle;
        try {
            handle = std::make_unique<SymbolHandle>(
                symbol, SymbolPaths::forSymbol(data_dir_, symbol));
            handle->initialize();
        } catch (const IOFailure& e) {
            throw StartupFailure("Cannot initialize " + symbol + ": " + e.what());
        }

        LOG_SYMBOL_INFO(symbol, "Tracking, tick log " + handle->log().path() +
                        " (" + std::to_string(handle->log().rowCount()) + " existing rows)");

        by_symbol_[symbol] = handle.get();
        by_file_name_[file_name] = symbol;
        handles_.push_back(std::move(handle));
    }
}

SymbolHandle* SymbolRegistry::find(const std::string& symbol) const {
    auto it = by_symbol_.find(symbol);
    return it == by_symbol_.end() ? nullptr : it->second;
}

} // namespace tickagg
