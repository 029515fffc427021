#pragma once

#include "Snapshot.hpp"

#include <optional>
#include <string>

namespace storage
{

// Durable "previous snapshot" per watch target. Implementations must give
// read-after-write consistency for a single target.
class IFingerprintStore
{
public:
    virtual ~IFingerprintStore() = default;

    // Returns false only on a read error. A target that was never saved yields
    // true with `out` left empty.
    virtual bool load(const WatchTarget& target, std::optional<Snapshot>& out, std::string& outError) = 0;

    // Replaces the stored snapshot, creating the storage location if needed
    virtual bool save(const WatchTarget& target, const std::string& text, std::string& outError) = 0;
};

} // namespace storage
