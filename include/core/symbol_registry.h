#pragma once

#include "core/symbol_handle.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tickagg {

// The fixed set of tracked symbols, one initialized SymbolHandle each.
// Built once at startup and shared by reference with the ingestion path,
// the dispatcher and the workers.
class SymbolRegistry {
private:
    std::string data_dir_;
    std::vector<std::unique_ptr<SymbolHandle>> handles_;
    std::unordered_map<std::string, SymbolHandle*> by_symbol_;
    std::unordered_map<std::string, std::string> by_file_name_;  // sanitized name -> symbol

public:
    // Creates the storage directories and every handle, in configuration order.
    // Duplicate symbols collapse to one handle. Throws StartupFailure, also when two
    // different symbols sanitize to the same file name.
    SymbolRegistry(const std::string& data_dir, const std::vector<std::string>& symbols);

    SymbolRegistry(const SymbolRegistry&) = delete;
    SymbolRegistry& operator=(const SymbolRegistry&) = delete;

    // nullptr for an untracked symbol
    SymbolHandle* find(const std::string& symbol) const;

    const std::vector<std::unique_ptr<SymbolHandle>>& handles() const { return handles_; }
    size_t size() const { return handles_.size(); }
    const std::string& dataDir() const { return data_dir_; }
};

} // namespace tickagg
