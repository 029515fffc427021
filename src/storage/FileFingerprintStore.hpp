#pragma once

#include "IFingerprintStore.hpp"

#include <filesystem>

namespace storage
{

// Keeps the snapshot of a target as two files in its state directory:
//   previous.txt     normalized text (UTF-8)
//   previous.sha256  hex digest of previous.txt (diagnostic only, recomputed on load)
class FileFingerprintStore : public IFingerprintStore
{
public:
    static constexpr const char* kTextFile = "previous.txt";
    static constexpr const char* kHashFile = "previous.sha256";

    bool load(const WatchTarget& target, std::optional<Snapshot>& out, std::string& outError) override;
    bool save(const WatchTarget& target, const std::string& text, std::string& outError) override;

    static std::filesystem::path textPath(const WatchTarget& target);
    static std::filesystem::path hashPath(const WatchTarget& target);

private:
    static bool writeAtomic(const std::filesystem::path& path, const std::string& content, std::string& outError);
};

} // namespace storage
