#pragma once

#include <string>
#include <string_view>

namespace storage
{

// One watched page and the directory that holds its state. Each running
// instance owns exactly one target.
struct WatchTarget
{
    std::string url;
    std::string state_dir;
};

// Normalized page text plus its SHA-256 (lowercase hex)
struct Snapshot
{
    std::string text;
    std::string sha256;

    static Snapshot fromText(std::string text);

    bool sameContentAs(const Snapshot& other) const { return sha256 == other.sha256; }
};

// SHA-256 of the UTF-8 bytes of `text`, as 64 lowercase hex characters
[[nodiscard]] std::string sha256_hex(std::string_view text);

} // namespace storage
