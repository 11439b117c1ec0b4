#pragma once

#include <dsexport/core/types.h>

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace dsexport::exporter {

/**
 * Staged output file.
 *
 * Bytes go to a staging file "<final>.<pid>-<n>.part" unique to this writer; commit()
 * flushes and renames onto the final name. Until then
 * nothing is visible under the final name, and a writer that is destroyed (or discarded)
 * without committing removes its partial file.
 */
class PartFile {
public:
    explicit PartFile(std::filesystem::path finalPath);
    ~PartFile();

    PartFile(const PartFile&) = delete;
    PartFile& operator=(const PartFile&) = delete;

    // Create (truncate) the staging file
    Expected<void> open();
    Expected<void> write(ByteSpan bytes);
    Expected<void> commit();
    void discard() noexcept;

    [[nodiscard]] const std::filesystem::path& finalPath() const noexcept { return finalPath_; }
    [[nodiscard]] const std::filesystem::path& stagingPath() const noexcept { return stagingPath_; }
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return written_; }

private:
    std::filesystem::path finalPath_;
    std::filesystem::path stagingPath_;
    std::ofstream out_;
    std::uint64_t written_{0};
    bool committed_{false};
};

} // namespace dsexport::exporter
