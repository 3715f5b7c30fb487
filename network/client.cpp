#include "client.hpp" // IWYU pragma: keep

#include "connector.hpp"
#include "http_error.hpp"
#include "request_writer.hpp"
#include "response_parser.hpp"
#include "url.hpp"

#include <chrono>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace minihttp {

CClient::CClient(const std::string &url) :
    iSpec(CUrl::Parse(url))
{
}

CClient CClient::Get() const
{
    return Method(std::string(methods::kGet));
}

CClient CClient::Post() const
{
    return Method(std::string(methods::kPost));
}

CClient CClient::Put() const
{
    return Method(std::string(methods::kPut));
}

CClient CClient::Head() const
{
    return Method(std::string(methods::kHead));
}

CClient CClient::Delete() const
{
    return Method(std::string(methods::kDelete));
}

CClient CClient::Options() const
{
    return Method(std::string(methods::kOptions));
}

CClient CClient::Method(std::string method) const
{
    return With([&method](CClient &copy) {
        copy.iSpec.method = std::move(method);
    });
}

CClient CClient::Headers(const CHttpHeaders::TPairs &pairs) const
{
    return With([&pairs](CClient &copy) {
        copy.iSpec.headers.Merge(pairs);
    });
}

CClient CClient::Header(const std::string &name, std::string value) const
{
    return With([&name, &value](CClient &copy) {
        copy.iSpec.headers.Set(name, std::move(value));
    });
}

CClient CClient::Body(std::vector<char> body) const
{
    return With([&body](CClient &copy) {
        copy.iSpec.body = std::move(body);
    });
}

CClient CClient::Body(std::string_view body) const
{
    return Body(std::vector<char>(body.begin(), body.end()));
}

CClient CClient::Proxy(const std::string &proxyUrl) const
{
    auto proxy = CUrl::Parse(proxyUrl);
    return With([&proxy](CClient &copy) {
        copy.iSpec.proxy = std::move(proxy);
    });
}

CClient CClient::Timeout(const std::chrono::seconds timeout) const
{
    auto config = iConfig;
    config.timeout = timeout;
    return Config(config);
}

CClient CClient::Verify(const bool verify) const
{
    if (!iSpec.url.IsTls())
    {
        throw CHttpError(EHttpError::InvalidConfig, "certificate verification is only for https");
    }
    auto config = iConfig;
    config.verifyTls = verify;
    return Config(config);
}

CClient CClient::Config(TClientConfig config) const
{
    if (!config.Validate())
    {
        throw CHttpError(EHttpError::InvalidConfig, "timeout must not be negative");
    }
    return With([&config](CClient &copy) {
        copy.iConfig = std::move(config);
    });
}

CHttpResponse CClient::Send() const
{
    try
    {
        if (iSpec.body && !methods::AllowsBody(iSpec.method))
        {
            throw CHttpError(EHttpError::InvalidConfig, iSpec.method + " request can't have body");
        }

        iConfig.ExecIfFittingVerbosity(EVerbosity::Debug, [this](auto &ostream) {
            ostream << "[DEBUG] Send(): " << iSpec.method << " " << iSpec.url.ToString();
            if (iSpec.proxy)
            {
                ostream << " via proxy " << iSpec.proxy->Authority();
            }
            ostream << std::endl;
        });

        const auto transport = CConnector::Connect(iSpec.url, iSpec.proxy, iConfig);
        CRequestWriter::Write(iSpec, *transport);
        return CResponseParser(iConfig).Parse(*transport, iSpec.method);
    }
    catch (const CHttpError &e)
    {
        iConfig.ExecIfFittingVerbosity(EVerbosity::Error, [&e](auto &ostream) {
            ostream << "[ERROR] Send() failed: " << e.what() << std::endl;
        });
        throw;
    }
}

CHttpResponse Get(const std::string &url)
{
    return CClient(url).Get().Send();
}

CHttpResponse Post(const std::string &url)
{
    return CClient(url).Post().Send();
}

CHttpResponse Put(const std::string &url)
{
    return CClient(url).Put().Send();
}

CHttpResponse Head(const std::string &url)
{
    return CClient(url).Head().Send();
}

CHttpResponse Delete(const std::string &url)
{
    return CClient(url).Delete().Send();
}

CHttpResponse Options(const std::string &url)
{
    return CClient(url).Options().Send();
}

} // namespace minihttp
