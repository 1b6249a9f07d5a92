#pragma once

#include "batch.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace iopatch {

constexpr const char* TOC_EXTENSION = ".utoc";
constexpr const char* BULK_EXTENSION = ".ucas";

// Every .utoc below `root`, sorted by path so the first-seen winner is stable
// @throws IoError if the directory cannot be walked
std::vector<std::filesystem::path> findTocFiles(const std::filesystem::path& root);

// The .ucas companion sits next to the .utoc with the same stem
FilePair pairFor(const std::filesystem::path& tocPath);

/**
 * Expand command-line operands into file pairs.
 * Directories are scanned recursively; files must end in .utoc. Operand
 * order is kept and a file named twice is only listed once.
 * @throws IoError for a missing path or a file that is not a .utoc
 */
std::vector<FilePair> collectPairs(const std::vector<std::string>& operands);

} // namespace iopatch
