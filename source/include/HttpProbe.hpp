#pragma once

#include "BaseProbe.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <optional>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/url.hpp>

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

struct ChatEndpoint {
    std::string host, port, target;
    bool tls = false;
};

struct TokenBudget {
    std::string_view field;
    uint32_t limit;
};

// POSTs the fixed prompt to <api_base>/chat/completions, http or https
class HttpProbe: public BaseProbe {
public:
    HttpProbe();

    boost::asio::awaitable<ProbeOutcome> async_probe(const ServerDescriptor& server, std::chrono::milliseconds deadline) override;

    static constexpr std::string_view PROBE_PROMPT = "What is 2+2? Please provide a short, direct answer.";
    static constexpr uint32_t DEFAULT_MAX_TOKENS = 50;
    static constexpr size_t MAX_REPLY_CHARS = 200;
    static constexpr uint64_t MAX_BODY_BYTES = 1024 * 1024;
    static constexpr std::chrono::seconds CLOSE_TIMEOUT{ 1 };

    static std::optional<ChatEndpoint> resolve_endpoint(std::string_view api_base);
    static TokenBudget token_budget(const ServerDescriptor& server);
    static std::string build_request_body(const ServerDescriptor& server);

    static ProbeOutcome classify_response(const ServerDescriptor& server, std::chrono::system_clock::time_point issued_at,
                                          std::chrono::milliseconds duration, unsigned status_code, std::string_view body);

    static ProbeStatus classify_transport_error(const boost::system::error_code& ec);

private:
    using TlsStream = ssl::stream<boost::beast::tcp_stream>;

    ssl::context _ssl_ctx;

    struct Exchange {
        boost::system::error_code ec{};
        std::string stage{};
        unsigned status{};
        std::string body{};
        std::chrono::milliseconds took{};   // dispatch to parsed response
    };

    template <typename Stream>
    boost::asio::awaitable<Exchange> exchange(Stream& stream, const http::request<http::string_body>& req);

    static boost::asio::awaitable<void> close_tls(std::shared_ptr<TlsStream> stream);

    static std::string error_message(std::string_view body);
};
