#include "FileFingerprintStore.hpp"

#include <plog/Log.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace storage
{

fs::path FileFingerprintStore::textPath(const WatchTarget& target) { return fs::path(target.state_dir) / kTextFile; }

fs::path FileFingerprintStore::hashPath(const WatchTarget& target) { return fs::path(target.state_dir) / kHashFile; }

bool FileFingerprintStore::load(const WatchTarget& target, std::optional<Snapshot>& out, std::string& outError)
{
    out.reset();
    const fs::path path = textPath(target);

    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        if (ec)
        {
            outError = "Cannot stat " + path.string() + ": " + ec.message();
            return false;
        }
        return true;
    }
    if (!fs::is_regular_file(path, ec))
    {
        outError = path.string() + " is not a regular file";
        return false;
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        outError = "Cannot open " + path.string() + " for reading";
        return false;
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad())
    {
        outError = "Read error on " + path.string();
        return false;
    }

    Snapshot snap = Snapshot::fromText(buffer.str());

    std::ifstream hash_in(hashPath(target), std::ios::binary);
    if (hash_in)
    {
        std::string recorded((std::istreambuf_iterator<char>(hash_in)), std::istreambuf_iterator<char>());
        while (!recorded.empty() && (recorded.back() == '\n' || recorded.back() == '\r' || recorded.back() == ' '))
            recorded.pop_back();
        if (recorded != snap.sha256)
        {
            PLOG_WARNING << "Stored hash in " << hashPath(target).string()
                         << " does not match " << kTextFile << "; using recomputed hash " << snap.sha256;
        }
    }

    out = std::move(snap);
    return true;
}

bool FileFingerprintStore::save(const WatchTarget& target, const std::string& text, std::string& outError)
{
    std::error_code ec;
    fs::create_directories(target.state_dir, ec);
    if (ec)
    {
        outError = "Cannot create state directory " + target.state_dir + ": " + ec.message();
        return false;
    }

    if (!writeAtomic(textPath(target), text, outError))
        return false;

    // The digest is advisory, losing it does not affect change detection
    std::string hash_error;
    if (!writeAtomic(hashPath(target), sha256_hex(text), hash_error))
        PLOG_WARNING << "Snapshot saved but digest file was not written: " << hash_error;

    PLOG_DEBUG << "Saved snapshot (" << text.size() << " bytes) to " << textPath(target).string();
    return true;
}

bool FileFingerprintStore::writeAtomic(const fs::path& path, const std::string& content, std::string& outError)
{
    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            outError = "Cannot open " + tmp.string() + " for writing";
            return false;
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs)
        {
            outError = "Write error on " + tmp.string();
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
    {
        outError = "Cannot rename " + tmp.string() + " to " + path.string() + ": " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace storage
