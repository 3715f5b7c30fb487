#pragma once

#include <network/transport.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>
#include <utility>

namespace Testing {

/// @brief In-memory transport: reads from the given string, collects everything written.
class CMockTransport final : public minihttp::ITransport
{
  public:
    /// @param maxPiece - max bytes returned by 1 ReadSome(), small values emulate slow network.
    explicit CMockTransport(std::string input, std::size_t maxPiece = 4096) :
        iInput(std::move(input)),
        iMaxPiece(maxPiece)
    {
    }

    Result ReadSome(void *buf, std::size_t size_buf) override
    {
        ++iReadCalls;
        if (iFailReads)
        {
            return {minihttp::EIoStatus::Error, 0u};
        }
        const auto size = std::min({size_buf, iMaxPiece, iInput.size() - iPos});
        if (size == 0)
        {
            return {minihttp::EIoStatus::OkReceivedZero, 0u};
        }
        std::memcpy(buf, iInput.data() + iPos, size);
        iPos += size;
        return {minihttp::EIoStatus::Ok, size};
    }

    Result WriteAll(const void *buf, std::size_t size_buf) override
    {
        if (iFailWrites)
        {
            return {minihttp::EIoStatus::Error, size_buf};
        }
        iWritten.append(static_cast<const char *>(buf), size_buf);
        return {minihttp::EIoStatus::Ok, 0u};
    }

    void Close() noexcept override
    {
        iPos = iInput.size();
    }

    [[nodiscard]]
    const std::string &Written() const
    {
        return iWritten;
    }

    /// @returns bytes of the input which were not read yet.
    [[nodiscard]]
    std::string Unread() const
    {
        return iInput.substr(iPos);
    }

    [[nodiscard]]
    std::size_t ReadCalls() const
    {
        return iReadCalls;
    }

    bool iFailReads{false};
    bool iFailWrites{false};

  private:
    std::string iInput;
    std::size_t iMaxPiece;
    std::size_t iPos{0};
    std::size_t iReadCalls{0};
    std::string iWritten;
};

} // namespace Testing
