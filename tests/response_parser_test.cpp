#include "mock_transport.hpp"

#include <common/lambda_visitors.h>
#include <network/client_config.hpp>
#include <network/http_error.hpp>
#include <network/response_parser.hpp>

#include <cstddef>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

namespace Testing {

using namespace minihttp;

class CResponseParserTest : public ::testing::TestWithParam<std::size_t>
{
  public:
    CHttpResponse Parse(const std::string &raw, const std::string &method = "GET") const
    {
        CMockTransport transport(raw, GetParam());
        return CResponseParser(config).Parse(transport, method);
    }

    EHttpError ErrorOf(const std::string &raw) const
    {
        try
        {
            [[maybe_unused]] const auto response = Parse(raw);
        }
        catch (const CHttpError &e)
        {
            return e.Kind();
        }
        ADD_FAILURE() << "No error for " << raw;
        return EHttpError::InvalidConfig;
    }

    static std::string BodyOf(const CHttpResponse &response)
    {
        return {response.Body().begin(), response.Body().end()};
    }

    TClientConfig config{};
};

TEST_P(CResponseParserTest, ChunkedBodyIsDecoded)
{
    const auto response = Parse("HTTP/1.1 200 OK\r\n"
                                "Transfer-Encoding: chunked\r\n"
                                "\r\n"
                                "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n");
    EXPECT_EQ(response.StatusCode(), 200);
    EXPECT_EQ(response.Reason(), "OK");
    EXPECT_EQ(BodyOf(response), "Wikipedia");
}

TEST_P(CResponseParserTest, ChunkedWithExtensionsAndTrailers)
{
    const auto response = Parse("HTTP/1.1 200 OK\r\n"
                                "transfer-encoding: gzip, Chunked\r\n"
                                "\r\n"
                                "A;name=value\r\n0123456789\r\n"
                                "1\r\n!\r\n"
                                "0\r\n"
                                "Expires: never\r\n"
                                "X-Trailer: 1\r\n"
                                "\r\n");
    EXPECT_EQ(BodyOf(response), "0123456789!");
    EXPECT_FALSE(response.Header("X-Trailer").has_value());
    EXPECT_FALSE(response.Header("Expires").has_value());
}

TEST_P(CResponseParserTest, ChunkSizeWithLeadingZeros)
{
    const auto response = Parse("HTTP/1.1 200 OK\r\n"
                                "Transfer-Encoding: chunked\r\n"
                                "\r\n"
                                "00000000000000004\r\nWiki\r\n"
                                "000000000000000000000\r\n\r\n");
    EXPECT_EQ(BodyOf(response), "Wiki");
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                      "10000000000000000\r\nWiki\r\n"),
              EHttpError::MalformedChunk);
}

TEST_P(CResponseParserTest, ChunkedHasPriorityOverContentLength)
{
    const auto response = Parse("HTTP/1.1 200 OK\r\n"
                                "Content-Length: 100\r\n"
                                "Transfer-Encoding: chunked\r\n"
                                "\r\n"
                                "3\r\nabc\r\n0\r\n\r\n");
    EXPECT_EQ(BodyOf(response), "abc");
}

TEST_P(CResponseParserTest, ContentLengthStopsReading)
{
    CMockTransport transport("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhelloEXTRA", GetParam());
    const auto response = CResponseParser(config).Parse(transport);
    EXPECT_EQ(BodyOf(response), "hello");
    EXPECT_EQ(response.Header("content-length"), std::string("5"));
}

TEST_P(CResponseParserTest, ContentLengthThenCloseDoesNotBlock)
{
    const auto response = Parse("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello");
    EXPECT_EQ(BodyOf(response), "hello");
}

TEST_P(CResponseParserTest, ZeroContentLength)
{
    const auto response = Parse("HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n");
    EXPECT_EQ(response.StatusCode(), 201);
    EXPECT_TRUE(response.Body().empty());
}

TEST_P(CResponseParserTest, BodyUntilEofWithoutLength)
{
    static const std::string kBody = "everything\r\nuntil\r\n\r\nthe end";
    const auto response = Parse("HTTP/1.0 200 OK\r\nServer: test\r\n\r\n" + kBody);
    EXPECT_EQ(response.Version(), "HTTP/1.0");
    EXPECT_EQ(BodyOf(response), kBody);
    EXPECT_EQ(response.Header("SERVER"), std::string("test"));
}

TEST_P(CResponseParserTest, NotFoundStatusAndReason)
{
    const auto response = Parse("HTTP/1.1 404 Not Found\r\nContent-Length: 3\r\n\r\nnop");
    EXPECT_EQ(response.StatusCode(), 404);
    EXPECT_EQ(response.Reason(), "Not Found");
    EXPECT_EQ(BodyOf(response), "nop");
}

TEST_P(CResponseParserTest, ResponsesWithoutBody)
{
    const auto head = Parse("HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n", "HEAD");
    EXPECT_TRUE(head.Body().empty());
    EXPECT_EQ(head.Header("Content-Length"), std::string("1000"));

    const auto noContent = Parse("HTTP/1.1 204 No Content\r\n\r\n");
    EXPECT_TRUE(noContent.Body().empty());

    const auto notModified = Parse("HTTP/1.1 304 Not Modified\r\nContent-Length: 10\r\n\r\n");
    EXPECT_TRUE(notModified.Body().empty());
}

TEST_P(CResponseParserTest, InterimResponsesAreSkipped)
{
    const auto response = Parse("HTTP/1.1 100 Continue\r\n\r\n"
                                "HTTP/1.1 103 Early Hints\r\n"
                                "Link: </style.css>; rel=preload\r\n"
                                "\r\n"
                                "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok",
                                "POST");
    EXPECT_EQ(response.StatusCode(), 200);
    EXPECT_EQ(response.Reason(), "OK");
    EXPECT_EQ(BodyOf(response), "ok");
    EXPECT_FALSE(response.Header("Link").has_value());

    EXPECT_EQ(ErrorOf("HTTP/1.1 100 Continue\r\n\r\n"), EHttpError::UnexpectedEof);
}

TEST_P(CResponseParserTest, SwitchingProtocolsIsFinal)
{
    const auto response =
      Parse("HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n\r\nframes");
    EXPECT_EQ(response.StatusCode(), 101);
    EXPECT_TRUE(response.Body().empty());
}

TEST_P(CResponseParserTest, DuplicateHeadersLastWins)
{
    const auto response =
      Parse("HTTP/1.1 200 OK\r\nX-Value: a\r\nx-value:   B  \r\nContent-Length: 0\r\n\r\n");
    EXPECT_EQ(response.Header("X-Value"), std::string("B"));
}

TEST_P(CResponseParserTest, BinaryBodyIsKept)
{
    const std::string body("\x00\xFF\x01\r\n\x7F", 6);
    const auto response = Parse("HTTP/1.1 200 OK\r\nContent-Length: 6\r\n\r\n" + body);
    EXPECT_EQ(BodyOf(response), body);
}

TEST_P(CResponseParserTest, MalformedInputsFailWithProperKind)
{
    EXPECT_EQ(ErrorOf("HTTP/1.1 2OO OK\r\n\r\n"), EHttpError::MalformedStatusLine);
    EXPECT_EQ(ErrorOf("SMTP ready\r\n\r\n"), EHttpError::MalformedStatusLine);
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nNoColonHere\r\n\r\n"), EHttpError::MalformedHeader);
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nContent-Length: five\r\n\r\nhello"),
              EHttpError::MalformedHeader);
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                      "4\r\nWikiXX5\r\npedia\r\n0\r\n\r\n"),
              EHttpError::MalformedChunk);
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nZZ\r\nabc\r\n"),
              EHttpError::MalformedChunk);
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n\r\n"),
              EHttpError::MalformedChunk);
}

TEST_P(CResponseParserTest, EarlyEofIsReported)
{
    EXPECT_EQ(ErrorOf(""), EHttpError::UnexpectedEof);
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n"),
              EHttpError::UnexpectedEof);
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nhello"),
              EHttpError::UnexpectedEof);
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhel"),
              EHttpError::UnexpectedEof);
    EXPECT_EQ(ErrorOf("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n"),
              EHttpError::UnexpectedEof);
}

INSTANTIATE_TEST_SUITE_P(NetworkPieces, CResponseParserTest, ::testing::Values(1u, 3u, 4096u));

TEST(CResponseParserFramingTest, FramingIsDetected)
{
    using TParser = CResponseParser;
    const auto isChunked = LambdaVisitor{
      [](const TParser::TChunked &) {
          return true;
      },
      [](const auto &) {
          return false;
      },
    };
    const auto fixedLength = LambdaVisitor{
      [](const TParser::TFixedLength &fixed) {
          return static_cast<long long>(fixed.length);
      },
      [](const auto &) {
          return -1LL;
      },
    };

    const CHttpHeaders chunked({{"Transfer-Encoding", "chunked"}, {"Content-Length", "3"}});
    EXPECT_TRUE(std::visit(isChunked, TParser::DetectFraming(200, chunked, "GET")));

    const CHttpHeaders sized(CHttpHeaders::TPairs{{"Content-Length", " 42 "}});
    EXPECT_EQ(std::visit(fixedLength, TParser::DetectFraming(200, sized, "POST")), 42);

    EXPECT_TRUE(
      std::holds_alternative<TParser::TNoBody>(TParser::DetectFraming(200, sized, "head")));
    EXPECT_TRUE(
      std::holds_alternative<TParser::TNoBody>(TParser::DetectFraming(101, sized, "GET")));
    EXPECT_TRUE(std::holds_alternative<TParser::TUntilEof>(
      TParser::DetectFraming(200, CHttpHeaders{}, "GET")));
    const CHttpHeaders gzipped(CHttpHeaders::TPairs{{"Transfer-Encoding", "gzip"}});
    EXPECT_TRUE(
      std::holds_alternative<TParser::TUntilEof>(TParser::DetectFraming(200, gzipped, "GET")));
}

TEST(CResponseParserLoggingTest, DebugVerbosityWritesStatus)
{
    std::ostringstream out;
    TClientConfig config;
    config.verbosity = EVerbosity::Debug;
    config.outStream = out;

    CMockTransport transport("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
    [[maybe_unused]] const auto response = CResponseParser(config).Parse(transport);
    EXPECT_NE(out.str().find("[DEBUG] Response status: HTTP/1.1 200 OK"), std::string::npos);
}

} // namespace Testing
