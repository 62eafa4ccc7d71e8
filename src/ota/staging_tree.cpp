#include "ota/staging_tree.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace fwsync {

Result StagingTree::Acquire(const fs::path& root, StagingTree& out) {
    (void)out.Release();

    std::error_code ec;
    if (fs::exists(root, ec)) {
        LogWarn("Removing leftover staging tree: %s", root.string().c_str());
        fs::remove_all(root, ec);
        if (ec) {
            return Result::Fail(ErrorCode::Io,
                                "cannot clear staging tree " + root.string() + ": " + ec.message());
        }
    }

    fs::create_directories(root, ec);
    if (ec) {
        return Result::Fail(ErrorCode::Io,
                            "cannot create staging tree " + root.string() + ": " + ec.message());
    }

    out.root_ = root;
    out.held_ = true;
    out.staged_count_ = 0;
    return Result::Ok();
}

StagingTree::StagingTree() = default;

StagingTree::StagingTree(StagingTree&& other) noexcept
    : root_(std::move(other.root_)), held_(other.held_), staged_count_(other.staged_count_) {
    other.held_ = false;
    other.staged_count_ = 0;
}

StagingTree& StagingTree::operator=(StagingTree&& other) noexcept {
    if (this != &other) {
        (void)Release();
        root_ = std::move(other.root_);
        held_ = other.held_;
        staged_count_ = other.staged_count_;
        other.held_ = false;
        other.staged_count_ = 0;
    }
    return *this;
}

StagingTree::~StagingTree() {
    auto r = Release();
    if (!r.is_ok()) {
        LogError("%s", r.message().c_str());
    }
}

Result StagingTree::StageFile(const std::string& relative_path, std::span<const std::uint8_t> bytes) {
    if (!held_)
        return Result::Fail(ErrorCode::Io, "staging tree not acquired");

    const fs::path dst = root_ / relative_path;
    std::error_code ec;
    fs::create_directories(dst.parent_path(), ec);
    if (ec) {
        return Result::Fail(ErrorCode::Io, "create_directories failed: " +
                                               dst.parent_path().string() + ": " + ec.message());
    }

    Fd fd;
    auto r = Fd::OpenForWrite(dst.string(), fd);
    if (!r.is_ok())
        return r;
    r = fd.WriteAll(bytes);
    if (!r.is_ok())
        return Result::Wrap(r, dst.string());
    r = fd.Sync();
    if (!r.is_ok())
        return Result::Wrap(r, dst.string());

    ++staged_count_;
    return Result::Ok();
}

Result StagingTree::Release() {
    if (!held_)
        return Result::Ok();

    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        return Result::Fail(ErrorCode::Io,
                            "cannot remove staging tree " + root_.string() + ": " + ec.message());
    }
    held_ = false;
    return Result::Ok();
}

} // namespace fwsync
