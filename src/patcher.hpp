#pragma once

#include "container.hpp"
#include "iostore.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace iopatch {

// Eight bytes to overwrite at an absolute file offset
struct PatchWrite {
    uint64_t offset;
    std::array<uint8_t, iostore::ID_SIZE> bytes;
};

struct PatchResult {
    bool tocPatched = false;
    bool bulkPatched = false;
    std::vector<Warning> warnings;
};

/**
 * Applies planned writes in place.
 *
 * Files are opened one at a time, never truncated or extended. The .utoc
 * writes happen first; a failure on the .ucas side afterwards is reported as
 * a Critical warning and the .utoc changes are kept.
 */
class Patcher
{
public:
    /**
     * @throws IoError if the .utoc file cannot be opened or a write falls
     *         outside it. Nothing has been written in that case.
     */
    PatchResult apply(const std::filesystem::path& tocPath,
                      const std::vector<PatchWrite>& tocWrites,
                      const std::filesystem::path& bulkPath,
                      const std::vector<PatchWrite>& bulkWrites);

    // Write every entry of `writes` into `path` after checking bounds
    // @throws IoError
    static void writeInPlace(const std::filesystem::path& path, const std::vector<PatchWrite>& writes);
};

} // namespace iopatch
