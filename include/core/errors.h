#pragma once

#include <stdexcept>
#include <string>

namespace tickagg {

// A per-symbol store could not be opened or created at startup
class StartupFailure : public std::runtime_error {
public:
    explicit StartupFailure(const std::string& what) : std::runtime_error(what) {}
};

// Append, scan or sink write failed after startup
class IOFailure : public std::runtime_error {
public:
    explicit IOFailure(const std::string& what) : std::runtime_error(what) {}
};

// A stored row could not be parsed
class MalformedRecord : public std::runtime_error {
private:
    size_t line_;

public:
    MalformedRecord(const std::string& what, size_t line)
        : std::runtime_error(what + " (line " + std::to_string(line) + ")"), line_(line) {}

    size_t line() const { return line_; }
};

} // namespace tickagg
