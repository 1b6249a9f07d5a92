#include "id_registry.hpp"
#include "errors.hpp"
#include <memory>
#include <random>
#include <string>
#include <utility>

namespace iopatch {

namespace {

IdRegistry::CandidateSource engineSource(uint64_t seed)
{
    // Shared so the std::function stays copyable
    auto engine = std::make_shared<std::mt19937_64>(seed);
    return [engine]() { return (*engine)(); };
}

uint64_t randomSeed()
{
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) | device();
}

} // namespace

IdRegistry::IdRegistry() : source(engineSource(randomSeed())) {}

IdRegistry::IdRegistry(uint64_t seed) : source(engineSource(seed)) {}

IdRegistry::IdRegistry(CandidateSource source) : source(std::move(source)) {}

uint64_t IdRegistry::claim(IdScope scope, std::optional<uint64_t> hint)
{
    auto& ids = table(scope);

    if (hint && *hint != 0 && !ids.contains(*hint)) {
        ids[*hint] = IdOrigin::Allocated;
        return *hint;
    }

    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        uint64_t candidate = source();
        // 0 reads as "unchanged" in reports
        if (candidate == 0 || ids.contains(candidate)) {
            continue;
        }
        ids[candidate] = IdOrigin::Allocated;
        return candidate;
    }

    throw AllocationExhausted("No unique id found after " + std::to_string(MAX_ATTEMPTS) + " attempts");
}

bool IdRegistry::isClaimed(IdScope scope, uint64_t id) const
{
    return table(scope).contains(id);
}

void IdRegistry::markSeen(IdScope scope, uint64_t id)
{
    table(scope).try_emplace(id, IdOrigin::Seen);
}

std::optional<IdOrigin> IdRegistry::origin(IdScope scope, uint64_t id) const
{
    const auto& ids = table(scope);
    auto it = ids.find(id);
    if (it == ids.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t IdRegistry::size(IdScope scope) const
{
    return table(scope).size();
}

void IdRegistry::reset()
{
    containerIds.clear();
    chunkIds.clear();
}

std::unordered_map<uint64_t, IdOrigin>& IdRegistry::table(IdScope scope)
{
    return scope == IdScope::Container ? containerIds : chunkIds;
}

const std::unordered_map<uint64_t, IdOrigin>& IdRegistry::table(IdScope scope) const
{
    return scope == IdScope::Container ? containerIds : chunkIds;
}

} // namespace iopatch
