#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>

namespace iopatch {

// Container ids and chunk ids live in independent namespaces
enum class IdScope {
    Container,
    Chunk
};

enum class IdOrigin {
    Seen,       // Already present on disk when first encountered
    Allocated   // Handed out by claim()
};

/**
 * Batch-lifetime record of every id already in use.
 *
 * Shared by reference between all files of one batch; never persisted.
 * Updates are visible to the next file as soon as the call returns.
 */
class IdRegistry
{
public:
    using CandidateSource = std::function<uint64_t()>;

    static constexpr int MAX_ATTEMPTS = 10;

    // Random candidates from a nondeterministically seeded engine
    IdRegistry();
    explicit IdRegistry(uint64_t seed);
    explicit IdRegistry(CandidateSource source);

    /**
     * Claim an id in `scope`.
     * Returns `hint` if it is given and still free, otherwise a fresh random
     * non-zero value.
     * @throws AllocationExhausted after MAX_ATTEMPTS colliding candidates
     */
    uint64_t claim(IdScope scope, std::optional<uint64_t> hint = std::nullopt);

    // True if the id is recorded in `scope`, whether seen or allocated
    bool isClaimed(IdScope scope, uint64_t id) const;

    // Record an id found on disk. Keeps an earlier Allocated origin.
    void markSeen(IdScope scope, uint64_t id);

    std::optional<IdOrigin> origin(IdScope scope, uint64_t id) const;

    size_t size(IdScope scope) const;

    // Forget everything; called when a new batch starts
    void reset();

private:
    std::unordered_map<uint64_t, IdOrigin>& table(IdScope scope);
    const std::unordered_map<uint64_t, IdOrigin>& table(IdScope scope) const;

    CandidateSource source;
    std::unordered_map<uint64_t, IdOrigin> containerIds;
    std::unordered_map<uint64_t, IdOrigin> chunkIds;
};

} // namespace iopatch
