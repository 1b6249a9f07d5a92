#include "patcher.hpp"
#include "errors.hpp"
#include <fstream>
#include <string>
#include <system_error>

namespace iopatch {

void Patcher::writeInPlace(const std::filesystem::path& path, const std::vector<PatchWrite>& writes)
{
    if (writes.empty()) return;

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IoError("Cannot stat " + path.string() + ": " + ec.message());
    }

    // Validate every write before touching the file
    for (const auto& write : writes) {
        if (write.offset > size || write.bytes.size() > size - write.offset) {
            throw IoError("Write at offset " + std::to_string(write.offset) +
                          " falls outside " + path.string() + " (" + std::to_string(size) + " bytes)");
        }
    }

    // in|out never creates, truncates or appends
    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Could not open file for update: " + path.string());
    }

    for (const auto& write : writes) {
        file.seekp(static_cast<std::streamoff>(write.offset), std::ios::beg);
        file.write(reinterpret_cast<const char*>(write.bytes.data()),
                   static_cast<std::streamsize>(write.bytes.size()));
        if (!file) {
            throw IoError("Write failed at offset " + std::to_string(write.offset) + " in " + path.string());
        }
    }

    file.flush();
    if (!file) {
        throw IoError("Flush failed for " + path.string());
    }
}

PatchResult Patcher::apply(const std::filesystem::path& tocPath,
                           const std::vector<PatchWrite>& tocWrites,
                           const std::filesystem::path& bulkPath,
                           const std::vector<PatchWrite>& bulkWrites)
{
    PatchResult result;

    writeInPlace(tocPath, tocWrites);
    result.tocPatched = !tocWrites.empty();

    try {
        writeInPlace(bulkPath, bulkWrites);
        result.bulkPatched = !bulkWrites.empty();
    } catch (const IoError& e) {
        // The .utoc changes stay; the pair is now out of sync
        result.warnings.push_back({
            Severity::Critical,
            "Partial patch: " + tocPath.filename().string() +
                " was updated but the bulk-data copy was not (" + e.what() + ")"
        });
    }

    return result;
}

} // namespace iopatch
