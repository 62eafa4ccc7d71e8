#include "ota/firmware_swapper.hpp"

#include "util/logger.hpp"

#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace fwsync {

namespace {

Result IoFail(const std::string& what, const fs::path& p, const std::error_code& ec) {
    return Result::Fail(ErrorCode::Io, what + " " + p.string() + ": " + ec.message());
}

// rename(2), or copy + remove when the two trees live on different filesystems.
Result MoveEntry(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec)
        return Result::Ok();
    if (ec != std::errc::cross_device_link)
        return IoFail("rename failed:", src, ec);

    ec.clear();
    fs::copy(src, dst,
             fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    if (ec)
        return IoFail("copy failed:", src, ec);
    fs::remove_all(src, ec);
    if (ec)
        return IoFail("remove failed:", src, ec);
    return Result::Ok();
}

Result MoveDirectoryContents(const fs::path& src_dir, const fs::path& dst_dir) {
    std::error_code ec;
    fs::create_directories(dst_dir, ec);
    if (ec)
        return IoFail("create_directories failed:", dst_dir, ec);

    std::vector<fs::path> entries;
    for (fs::directory_iterator it(src_dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec)
        return IoFail("cannot list", src_dir, ec);

    for (const auto& src : entries) {
        const fs::path dst = dst_dir / src.filename();
        const bool src_is_dir = fs::is_directory(fs::symlink_status(src, ec));
        const bool dst_is_dir = fs::is_directory(fs::symlink_status(dst, ec));

        Result r;
        if (src_is_dir && dst_is_dir) {
            r = MoveDirectoryContents(src, dst);
        } else {
            if (!src_is_dir && dst_is_dir) {
                fs::remove_all(dst, ec);
                if (ec)
                    return IoFail("remove failed:", dst, ec);
            }
            r = MoveEntry(src, dst);
        }
        if (!r.is_ok())
            return r;
    }

    fs::remove(src_dir, ec);
    if (ec)
        return IoFail("remove failed:", src_dir, ec);
    return Result::Ok();
}

} // namespace

Result FirmwareSwapper::WipeLiveTree(const fs::path& live_root) const {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(live_root, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec)
        return IoFail("cannot list", live_root, ec);

    for (const auto& entry : entries) {
        const std::string name = entry.path().filename().string();
        const bool is_dir = entry.is_directory(ec);

        if (is_dir ? policy_.KeepsDirectory(name) : policy_.KeepsFile(name)) {
            LogDebug("keep: %s", entry.path().string().c_str());
            continue;
        }

        fs::remove_all(entry.path(), ec);
        if (ec)
            return IoFail("remove failed:", entry.path(), ec);
        LogDebug("removed: %s", entry.path().string().c_str());
    }
    return Result::Ok();
}

Result FirmwareSwapper::MoveStagedContents(const fs::path& staging_root,
                                           const fs::path& live_root) const {
    std::error_code ec;
    if (!fs::is_directory(staging_root, ec)) {
        return Result::Fail(ErrorCode::Io, "staging tree missing: " + staging_root.string());
    }
    return MoveDirectoryContents(staging_root, live_root);
}

Result FirmwareSwapper::Swap(const fs::path& staging_root, const fs::path& live_root) const {
    std::error_code ec;
    if (!fs::is_directory(staging_root, ec)) {
        return Result::Fail(ErrorCode::Io, "staging tree missing: " + staging_root.string());
    }
    fs::create_directories(live_root, ec);
    if (ec)
        return IoFail("create_directories failed:", live_root, ec);

    auto wr = WipeLiveTree(live_root);
    if (!wr.is_ok())
        return wr;

    return MoveStagedContents(staging_root, live_root);
}

} // namespace fwsync
