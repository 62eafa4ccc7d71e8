#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace fwsync {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC
    static Result OpenForWrite(const std::string& path, Fd& out);

    int Get() const;
    bool Valid() const;

    Result WriteAll(std::span<const std::uint8_t> data);
    Result Sync();

    void Reset(int fd);
    void Close();

  private:
    int fd_{-1};
};

} // namespace fwsync
