/*
 * part_file.cpp
 *
 * Staging-then-rename writer for downloaded documents:
 * - Bytes land in "<name>.<pid>-<n>.part" next to the final file (same directory, same
 *   filesystem); every writer gets its own staging name, so two writers for one target
 *   never share a partial file
 * - commit() flushes, closes and renames; rename over an existing file replaces it
 * - Any failure, or destruction before commit, removes the staging file
 */

#include <dsexport/exporter/part_file.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace dsexport::exporter {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> g_stagingCounter{0};

} // namespace

PartFile::PartFile(fs::path finalPath) : finalPath_(std::move(finalPath)) {
    stagingPath_ = finalPath_;
    stagingPath_ += fmt::format(".{}-{}.part", static_cast<long>(::getpid()), ++g_stagingCounter);
}

PartFile::~PartFile() {
    if (!committed_)
        discard();
}

Expected<void> PartFile::open() {
    if (out_.is_open())
        out_.close();
    written_ = 0;
    out_.open(stagingPath_, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out_) {
        return Error{ErrorCode::IoError, "Failed to open staging file: " + stagingPath_.string()};
    }
    return {};
}

Expected<void> PartFile::write(ByteSpan bytes) {
    if (!out_.is_open()) {
        return Error{ErrorCode::IoError, "Staging file is not open: " + stagingPath_.string()};
    }
    out_.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!out_) {
        return Error{ErrorCode::IoError, "Write failed: " + stagingPath_.string()};
    }
    written_ += bytes.size();
    return {};
}

Expected<void> PartFile::commit() {
    if (!out_.is_open()) {
        return Error{ErrorCode::IoError, "Staging file is not open: " + stagingPath_.string()};
    }
    out_.flush();
    const bool flushed = static_cast<bool>(out_);
    out_.close();
    if (!flushed || out_.fail()) {
        discard();
        return Error{ErrorCode::IoError, "Flush failed: " + stagingPath_.string()};
    }

    std::error_code ec;
    fs::rename(stagingPath_, finalPath_, ec);
    if (ec) {
        discard();
        return Error{ErrorCode::IoError, "Rename to " + finalPath_.string() +
                                             " failed: " + ec.message()};
    }
    committed_ = true;
    spdlog::debug("Wrote {} ({} bytes)", finalPath_.string(), written_);
    return {};
}

void PartFile::discard() noexcept {
    if (out_.is_open())
        out_.close();
    std::error_code ec;
    fs::remove(stagingPath_, ec);
    written_ = 0;
}

} // namespace dsexport::exporter
