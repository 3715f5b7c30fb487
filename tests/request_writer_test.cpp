#include "mock_transport.hpp"

#include <network/http_error.hpp>
#include <network/request_spec.hpp>
#include <network/request_writer.hpp>
#include <network/url.hpp>

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace Testing {

using namespace minihttp;

class CRequestWriterTest : public ::testing::Test
{
  public:
    static TRequestSpec MakeSpec(const std::string &url)
    {
        return TRequestSpec(CUrl::Parse(url));
    }

    static bool HasLine(const std::string &request, const std::string &line)
    {
        return request.find("\r\n" + line + "\r\n") != std::string::npos;
    }
};

TEST_F(CRequestWriterTest, GetWithSynthesizedHeaders)
{
    const auto request = CRequestWriter::Serialize(MakeSpec("http://example.com/index.html?a=b"));
    EXPECT_EQ(request, "GET /index.html?a=b HTTP/1.1\r\n"
                       "Host: example.com\r\n"
                       "Connection: close\r\n"
                       "\r\n");
}

TEST_F(CRequestWriterTest, HostHasPortIfNotDefault)
{
    const auto request = CRequestWriter::Serialize(MakeSpec("https://127.0.0.1:8443/"));
    EXPECT_TRUE(HasLine(request, "Host: 127.0.0.1:8443"));

    const auto defaultPort = CRequestWriter::Serialize(MakeSpec("https://example.com:443/"));
    EXPECT_TRUE(HasLine(defaultPort, "Host: example.com"));
}

TEST_F(CRequestWriterTest, UserHeadersOverrideSynthesized)
{
    auto spec = MakeSpec("http://example.com/");
    spec.headers.Merge({{"host", "other.org"}, {"CONNECTION", "keep-alive"}, {"X-Id", "42"}});
    const auto request = CRequestWriter::Serialize(spec);

    EXPECT_TRUE(HasLine(request, "host: other.org"));
    EXPECT_TRUE(HasLine(request, "CONNECTION: keep-alive"));
    EXPECT_TRUE(HasLine(request, "X-Id: 42"));
    EXPECT_EQ(request.find("Host: example.com"), std::string::npos);
    EXPECT_EQ(request.find("Connection: close"), std::string::npos);
    EXPECT_EQ(request.substr(request.size() - 4), "\r\n\r\n");
}

TEST_F(CRequestWriterTest, HostIsAlwaysSecondLine)
{
    auto spec = MakeSpec("http://example.com:8080/");
    spec.headers.Merge({{"A-One", "1"}, {"B-Two", "2"}, {"C-Three", "3"}, {"D-Four", "4"}});
    const auto synthesized = CRequestWriter::Serialize(spec);
    EXPECT_EQ(synthesized.rfind("GET / HTTP/1.1\r\nHost: example.com:8080\r\n", 0), 0u);

    spec.headers.Set("host", "override");
    const auto request = CRequestWriter::Serialize(spec);
    EXPECT_EQ(request.rfind("GET / HTTP/1.1\r\nhost: override\r\n", 0), 0u);
    EXPECT_EQ(request.find("override"), request.rfind("override"));
    EXPECT_EQ(request.find("example.com"), std::string::npos);
    EXPECT_TRUE(HasLine(request, "D-Four: 4"));
}

TEST_F(CRequestWriterTest, BodyGetsContentLength)
{
    auto spec = MakeSpec("http://example.com/submit");
    spec.method = std::string(methods::kPost);
    const std::string body = "{\"a\":\r\n1}";
    spec.body = std::vector<char>(body.begin(), body.end());
    const auto request = CRequestWriter::Serialize(spec);

    EXPECT_EQ(request.rfind("POST /submit HTTP/1.1\r\n", 0), 0u);
    EXPECT_TRUE(HasLine(request, "Content-Length: 9"));
    EXPECT_EQ(request.substr(request.find("\r\n\r\n") + 4), body);
}

TEST_F(CRequestWriterTest, EmptyBodyStillHasContentLength)
{
    auto spec = MakeSpec("http://example.com/");
    spec.method = std::string(methods::kPut);
    spec.body = std::vector<char>{};
    const auto request = CRequestWriter::Serialize(spec);
    EXPECT_TRUE(HasLine(request, "Content-Length: 0"));
    EXPECT_EQ(request.substr(request.size() - 4), "\r\n\r\n");
}

TEST_F(CRequestWriterTest, UserContentLengthIsKept)
{
    auto spec = MakeSpec("http://example.com/");
    spec.method = std::string(methods::kPost);
    spec.body = std::vector<char>{'a', 'b', 'c'};
    spec.headers.Set("content-length", "3");
    const auto request = CRequestWriter::Serialize(spec);

    EXPECT_TRUE(HasLine(request, "content-length: 3"));
    EXPECT_EQ(request.find("Content-Length"), std::string::npos);
}

TEST_F(CRequestWriterTest, BinaryBodyIsWrittenAsIs)
{
    auto spec = MakeSpec("http://example.com/");
    spec.method = std::string(methods::kPost);
    spec.body = std::vector<char>{'\0', '\xFF', '\n', '\0'};
    const auto request = CRequestWriter::Serialize(spec);
    EXPECT_EQ(request.substr(request.size() - 4), std::string("\0\xFF\n\0", 4));
}

TEST_F(CRequestWriterTest, WriteSendsSerializedRequest)
{
    const auto spec = MakeSpec("http://example.com/");
    CMockTransport transport("");
    CRequestWriter::Write(spec, transport);
    EXPECT_EQ(transport.Written(), CRequestWriter::Serialize(spec));
}

TEST_F(CRequestWriterTest, WriteFailureIsTransportError)
{
    CMockTransport transport("");
    transport.iFailWrites = true;
    try
    {
        CRequestWriter::Write(MakeSpec("http://example.com/"), transport);
        FAIL() << "Write must throw";
    }
    catch (const CHttpError &e)
    {
        EXPECT_EQ(e.Kind(), EHttpError::TransportError);
    }
}

TEST_F(CRequestWriterTest, MethodsAllowingBody)
{
    EXPECT_TRUE(methods::AllowsBody(methods::kPost));
    EXPECT_TRUE(methods::AllowsBody(methods::kPut));
    EXPECT_TRUE(methods::AllowsBody(methods::kPatch));
    EXPECT_TRUE(methods::AllowsBody("PROPFIND"));
    EXPECT_FALSE(methods::AllowsBody(methods::kGet));
    EXPECT_FALSE(methods::AllowsBody("get"));
    EXPECT_FALSE(methods::AllowsBody(methods::kHead));
    EXPECT_FALSE(methods::AllowsBody(methods::kDelete));
    EXPECT_FALSE(methods::AllowsBody(methods::kOptions));
}

} // namespace Testing
