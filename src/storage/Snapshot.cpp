#include "Snapshot.hpp"

#include <picosha2.h>

#include <vector>

namespace storage
{

Snapshot Snapshot::fromText(std::string text)
{
    Snapshot snap;
    snap.sha256 = sha256_hex(text);
    snap.text = std::move(text);
    return snap;
}

std::string sha256_hex(std::string_view text)
{
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(text.begin(), text.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

} // namespace storage
