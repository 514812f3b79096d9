#pragma once

#include <string>

namespace tickagg {

// Creates the directory chain. True if it exists afterwards, false (logged)
// on permission or any other filesystem error.
bool ensureDirectory(const std::string& path);

} // namespace tickagg
