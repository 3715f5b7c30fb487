#pragma once

#include "http_error.hpp"

#include <common/cm_ctors.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace minihttp {

namespace utility {
/// @brief Trims @p str from both ends, removes " \t\r\n" symbols.
inline void HttpTrim(std::string &str)
{
    static constexpr std::string_view kToRemove = " \t\r\n";
    const auto start = str.find_first_not_of(kToRemove);
    if (start == std::string::npos)
    {
        str.clear();
        return;
    }
    const auto end = str.find_last_not_of(kToRemove);
    str = str.substr(start, end + 1u - start);
}

/// @returns true if @p a and @p b are equal ignoring ASCII case.
inline bool EqualsNoCase(std::string_view a, std::string_view b)
{
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}
} // namespace utility

/// @brief Represents 1st line of the HTTP request.
class CHttpRequestLine
{
  public:
    inline static constexpr std::string_view kHttp11 = "HTTP/1.1";

    CHttpRequestLine() = default;

    /// @brief Construct object out of separated fields of request line.
    CHttpRequestLine(std::string method, std::string path,
                     std::string version = std::string(kHttp11)) :
        iMethod(std::move(method)),
        iPath(std::move(path)),
        iVersion(std::move(version))
    {
        utility::HttpTrim(iMethod);
        utility::HttpTrim(iPath);
        utility::HttpTrim(iVersion);
    }
    ~CHttpRequestLine() = default;
    DEFAULT_COPYMOVE(CHttpRequestLine);

    /// @brief Constructs object out of a string formatted as "Method Path Version" (e.g., GET
    /// /index.html HTTP/1.1)
    explicit CHttpRequestLine(const std::string &request_line)
    {
        std::istringstream stream(request_line);
        stream >> iMethod >> iPath >> iVersion;
    }

    /// @return std::string formatted as "Method Path Version" without line end.
    [[nodiscard]]
    std::string ToString() const
    {
        return iMethod + " " + iPath + " " + iVersion;
    }

    /// @returns true if all fields are set.
    [[nodiscard]]
    bool IsValid() const
    {
        return !iMethod.empty() && !iPath.empty() && !iVersion.empty();
    }

    bool operator==(const CHttpRequestLine &other) const
    {
        const auto tie = [](const CHttpRequestLine &what) {
            return std::tie(what.iMethod, what.iPath, what.iVersion);
        };
        return tie(*this) == tie(other);
    }

    [[nodiscard]]
    const std::string &GetMethod() const
    {
        return iMethod;
    }
    [[nodiscard]]
    const std::string &GetPath() const
    {
        return iPath;
    }
    [[nodiscard]]
    const std::string &GetVersion() const
    {
        return iVersion;
    }

  private:
    std::string iMethod;  // Method (GET, POST)
    std::string iPath;    // Path with query (/index.html?a=b)
    std::string iVersion; // Version(HTTP/1.1)
};

/// @brief Represents 1st line of the HTTP response.
class CHttpResponseLine
{
  public:
    CHttpResponseLine() = default;

    /// @brief Constructs object out of separated fields.
    CHttpResponseLine(std::string version, int status_code, std::string status_text) :
        iVersion(std::move(version)),
        iStatusCode(status_code),
        iStatusText(std::move(status_text))
    {
        utility::HttpTrim(iVersion);
        utility::HttpTrim(iStatusText);
    }

    ~CHttpResponseLine() = default;
    DEFAULT_COPYMOVE(CHttpResponseLine);

    /// @brief Parses "HTTP/<version> <3 digits code> <reason>", reason may be empty.
    /// @throws CHttpError(EHttpError::MalformedStatusLine).
    static CHttpResponseLine Parse(std::string line)
    {
        static constexpr std::string_view kPrefix = "HTTP/";
        static constexpr std::size_t kCodeLength = 3;

        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        {
            line.pop_back();
        }
        if (line.compare(0, kPrefix.size(), kPrefix) != 0)
        {
            throw CHttpError(EHttpError::MalformedStatusLine, "no HTTP/ prefix in: " + line);
        }
        const auto versionEnd = line.find(' ');
        if (versionEnd == std::string::npos || versionEnd == kPrefix.size())
        {
            throw CHttpError(EHttpError::MalformedStatusLine, "no version in: " + line);
        }
        const auto codeStart = versionEnd + 1;
        const auto codeEnd = std::min(line.find(' ', codeStart), line.size());
        const auto code = line.substr(codeStart, codeEnd - codeStart);
        const bool isDigits = std::all_of(code.begin(), code.end(), [](const char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
        if (code.size() != kCodeLength || !isDigits)
        {
            throw CHttpError(EHttpError::MalformedStatusLine, "bad status code in: " + line);
        }
        const auto reason = codeEnd < line.size() ? line.substr(codeEnd + 1) : std::string{};
        return {line.substr(0, versionEnd), std::stoi(code), reason};
    }

    [[nodiscard]]
    std::string ToString() const
    {
        return iVersion + " " + std::to_string(iStatusCode) + " " + iStatusText;
    }

    [[nodiscard]]
    bool IsSuccess() const
    {
        return iStatusCode >= 200 && iStatusCode <= 299;
    }

    bool operator==(const CHttpResponseLine &other) const
    {
        const auto tie = [](const CHttpResponseLine &what) {
            return std::tie(what.iStatusCode, what.iVersion, what.iStatusText);
        };
        return tie(*this) == tie(other);
    }

    [[nodiscard]]
    const std::string &GetVersion() const
    {
        return iVersion;
    }

    [[nodiscard]]
    int GetStatusCode() const
    {
        return iStatusCode;
    }

    [[nodiscard]]
    const std::string &GetStatusText() const
    {
        return iStatusText;
    }

  private:
    std::string iVersion;    // Version(HTTP/1.1)
    int iStatusCode{-1};     // Status code(200)
    std::string iStatusText; // Status text(OK)
};

/// @brief Header fields of the request or response. Names are case-insensitive, setting existing
/// name replaces the value.
class CHttpHeaders
{
  public:
    struct CaseInsensitiveHash
    {
        std::size_t operator()(const std::string &key) const
        {
            std::size_t hash = 0;
            for (const char c : key)
            {
                hash = hash * 31 + std::tolower(static_cast<unsigned char>(c));
            }
            return hash;
        }
    };

    struct CaseInsensitiveEqual
    {
        bool operator()(const std::string &a, const std::string &b) const
        {
            return utility::EqualsNoCase(a, b);
        }
    };

    using TMap =
      std::unordered_map<std::string, std::string, CaseInsensitiveHash, CaseInsensitiveEqual>;
    using TPairs = std::vector<std::pair<std::string, std::string>>;

    CHttpHeaders() = default;
    ~CHttpHeaders() = default;
    DEFAULT_COPYMOVE(CHttpHeaders);

    explicit CHttpHeaders(const TPairs &pairs)
    {
        Merge(pairs);
    }

    /// @brief Sets @p value for the @p key, last one wins.
    void Set(const std::string &key, std::string value)
    {
        iHeaders[key] = std::move(value);
    }

    /// @brief Sets all @p pairs in order, so later pair overrides earlier one with the same name.
    void Merge(const TPairs &pairs)
    {
        for (const auto &[key, value] : pairs)
        {
            Set(key, value);
        }
    }

    /// @brief Parses single "Name: value" line (without CRLF) and stores it.
    /// @throws CHttpError(EHttpError::MalformedHeader) if there is no colon or name is empty.
    void ParseAndAdd(const std::string &line)
    {
        const auto colonPos = line.find(':');
        if (colonPos == std::string::npos)
        {
            throw CHttpError(EHttpError::MalformedHeader, "no colon in header line: " + line);
        }
        std::string key = line.substr(0, colonPos);
        std::string value = line.substr(colonPos + 1);
        utility::HttpTrim(key);
        utility::HttpTrim(value);
        if (key.empty())
        {
            throw CHttpError(EHttpError::MalformedHeader, "empty name in header line: " + line);
        }
        Set(key, std::move(value));
    }

    /// @returns value by key if found.
    [[nodiscard]]
    std::optional<std::string> Find(const std::string &key) const
    {
        const auto it = iHeaders.find(key);
        if (it != iHeaders.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    /// @returns value by key if found or empty string otherwise.
    [[nodiscard]]
    std::string Value(const std::string &key) const
    {
        return Find(key).value_or(std::string{});
    }

    [[nodiscard]]
    bool Contains(const std::string &key) const
    {
        return iHeaders.count(key) > 0;
    }

    [[nodiscard]]
    std::size_t Size() const
    {
        return iHeaders.size();
    }

    [[nodiscard]]
    const TMap &Map() const
    {
        return iHeaders;
    }

    /// @returns "Name: value\r\n" lines for every stored header.
    [[nodiscard]]
    std::string ToString() const
    {
        std::ostringstream result;
        for (const auto &[key, value] : iHeaders)
        {
            result << key << ": " << value << "\r\n";
        }
        return result.str();
    }

    bool operator==(const CHttpHeaders &other) const
    {
        return iHeaders == other.iHeaders;
    }

  private:
    TMap iHeaders;
};

} // namespace minihttp
