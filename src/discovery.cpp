#include "discovery.hpp"
#include "errors.hpp"
#include <algorithm>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace iopatch {

std::vector<fs::path> findTocFiles(const fs::path& root)
{
    std::vector<fs::path> found;
    std::error_code ec;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == TOC_EXTENSION) {
            found.push_back(it->path());
        }
    }
    if (ec) {
        throw IoError("Could not scan " + root.string() + ": " + ec.message());
    }

    std::sort(found.begin(), found.end());
    return found;
}

FilePair pairFor(const fs::path& tocPath)
{
    fs::path bulkPath = tocPath;
    bulkPath.replace_extension(BULK_EXTENSION);
    return {tocPath, bulkPath};
}

std::vector<FilePair> collectPairs(const std::vector<std::string>& operands)
{
    std::vector<FilePair> pairs;
    std::set<fs::path> listed;

    auto addToc = [&](const fs::path& toc) {
        std::error_code ec;
        fs::path key = fs::weakly_canonical(toc, ec);
        if (ec) key = fs::absolute(toc).lexically_normal();
        if (listed.insert(key).second) {
            pairs.push_back(pairFor(toc));
        }
    };

    for (const auto& operand : operands) {
        fs::path path(operand);
        std::error_code ec;

        if (fs::is_directory(path, ec)) {
            for (const auto& toc : findTocFiles(path)) {
                addToc(toc);
            }
        } else if (fs::is_regular_file(path, ec)) {
            if (path.extension() != TOC_EXTENSION) {
                throw IoError("Not a " + std::string(TOC_EXTENSION) + " file: " + operand);
            }
            addToc(path);
        } else {
            throw IoError("No such file or directory: " + operand);
        }
    }

    return pairs;
}

} // namespace iopatch
