#include "core/append_only_file.h"
#include "core/errors.h"
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace tickagg {

AppendOnlyFile::AppendOnlyFile(const std::string& path, const std::string& header)
    : path_(path), header_(header), size_bytes_(0) {

    errno = 0;
    stream_.open(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!stream_.is_open()) {
        std::string reason = errno == EACCES ? "permission denied"
                           : errno != 0      ? std::strerror(errno)
                                             : "unknown error";
        throw StartupFailure("Cannot open " + path_ + ": " + reason);
    }

    std::error_code ec;
    auto size = fs::file_size(path_, ec);
    if (ec) {
        throw StartupFailure("Cannot stat " + path_ + ": " + ec.message());
    }
    size_bytes_ = size;
}

void AppendOnlyFile::writeLine(const std::string& line) {
    stream_ << line << '\n';
    stream_.flush();
    if (!stream_) {
        stream_.clear();
        throw IOFailure("Write to " + path_ + " failed");
    }
    size_bytes_ += line.size() + 1;
}

bool AppendOnlyFile::writeHeaderIfEmpty() {
    if (!empty()) {
        return false;
    }
    writeLine(header_);
    return true;
}

void AppendOnlyFile::appendRow(const std::string& row) {
    writeHeaderIfEmpty();
    writeLine(row);
}

} // namespace tickagg
