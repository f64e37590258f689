#include "HttpProbe.hpp"
#include "Utils.hpp"
#include "Log.hpp"

#include <array>
#include <format>
#include <memory>

#include <boost/json.hpp>
#include <openssl/err.h>

namespace {
    // models that reject max_tokens and want max_completion_tokens instead
    constexpr std::array<std::pair<std::string_view, uint32_t>, 6> COMPLETION_TOKEN_MODELS{{
        { "o3", 100 },
        { "o4-mini", 150 },
        { "gpt-4.1", 50 },
        { "scout", 50 },
        { "Qwen", 50 },
        { "meta-llama/Llama-3.3-70B-Instruct", 50 },
    }};

    uint64_t read_count(const boost::json::object& obj, std::string_view key) {
        const auto* v = obj.if_contains(key);

        if (!v) return TokenUsage::unknown;
        if (v->is_uint64()) return v->as_uint64();
        if (v->is_int64() && v->as_int64() >= 0) return static_cast<uint64_t>(v->as_int64());

        return TokenUsage::unknown;
    }

    // n counts code points
    std::string clip(std::string_view s, size_t n) {
        auto head = utf8_prefix(s, n);
        if (head.size() == s.size()) return std::string(s);
        return std::string(head) + "...";
    }
}

HttpProbe::HttpProbe(): _ssl_ctx(ssl::context::tlsv12_client) {
    _ssl_ctx.set_default_verify_paths();
    _ssl_ctx.set_verify_mode(ssl::verify_peer);
}

std::optional<ChatEndpoint> HttpProbe::resolve_endpoint(std::string_view api_base) {
    auto rv = boost::urls::parse_uri(api_base);
    if (!rv) return std::nullopt;

    auto url = *rv;
    auto scheme = std::string(url.scheme());

    if (scheme != "http" && scheme != "https") return std::nullopt;
    if (url.host().empty()) return std::nullopt;

    ChatEndpoint out;

    out.tls = scheme == "https";
    out.host = std::string(url.host());
    out.port = url.port().empty() ? (out.tls ? "443" : "80") : std::string(url.port());

    std::string path = std::string(url.encoded_path());
    while (!path.empty() && path.back() == '/') path.pop_back();

    out.target = path + "/chat/completions";

    return out;
}

TokenBudget HttpProbe::token_budget(const ServerDescriptor& server) {
    TokenBudget budget{ "max_tokens", DEFAULT_MAX_TOKENS };

    for (const auto& [model, limit]: COMPLETION_TOKEN_MODELS) {
        if (model == server.model_name) {
            budget = { "max_completion_tokens", limit };
            break;
        }
    }

    if (server.max_tokens) budget.limit = *server.max_tokens;

    return budget;
}

std::string HttpProbe::build_request_body(const ServerDescriptor& server) {
    auto budget = token_budget(server);

    boost::json::object message;
    message["role"] = "user";
    message["content"] = PROBE_PROMPT;

    boost::json::array messages;
    messages.push_back(std::move(message));

    boost::json::object body;
    body["model"] = server.model_name;
    body["messages"] = std::move(messages);
    body[budget.field] = budget.limit;

    return boost::json::serialize(body);
}

std::string HttpProbe::error_message(std::string_view body) {
    boost::system::error_code ec;
    auto jv = boost::json::parse(body, ec);

    if (!ec && jv.is_object()) {
        const auto& obj = jv.as_object();

        if (const auto* err = obj.if_contains("error")) {
            if (err->is_string()) return std::string(err->as_string());

            if (err->is_object()) {
                if (const auto* msg = err->as_object().if_contains("message"); msg && msg->is_string())
                    return std::string(msg->as_string());
            }
        }

        // vllm and fastapi style
        if (const auto* detail = obj.if_contains("detail"); detail && detail->is_string()) return std::string(detail->as_string());
    }

    return clip(body, 160);
}

ProbeStatus HttpProbe::classify_transport_error(const boost::system::error_code& ec) {
    if (ec == boost::beast::error::timeout ||
        ec == net::error::operation_aborted ||
        ec == net::error::timed_out) return ProbeStatus::Timeout;

    // malformed http from the server, the connection itself was fine
    if (ec.category() == http::make_error_code(http::error::bad_version).category()) return ProbeStatus::ProtocolError;

    return ProbeStatus::ConnectionError;
}

ProbeOutcome HttpProbe::classify_response(const ServerDescriptor& server, std::chrono::system_clock::time_point issued_at,
                                          std::chrono::milliseconds duration, unsigned status_code, std::string_view body) {
    auto fail = [&](ProbeStatus status, std::string detail) {
        return ProbeOutcome::failure(server.id, issued_at, duration, status, std::move(detail));
    };

    if (status_code == 401 || status_code == 403)
        return fail(ProbeStatus::AuthError, std::format("HTTP {}: {}", status_code, error_message(body)));

    if (status_code == 429)
        return fail(ProbeStatus::ProtocolError, std::format("rate limited: {}", error_message(body)));

    if (status_code < 200 || status_code >= 300)
        return fail(ProbeStatus::ProtocolError, std::format("HTTP {}: {}", status_code, error_message(body)));

    boost::system::error_code ec;
    auto jv = boost::json::parse(body, ec);

    if (ec) return fail(ProbeStatus::ProtocolError, std::format("malformed json response: {}", ec.message()));
    if (!jv.is_object()) return fail(ProbeStatus::ProtocolError, "response is not a json object");

    const auto& root = jv.as_object();

    const auto* choices = root.if_contains("choices");
    if (!choices || !choices->is_array() || choices->as_array().empty())
        return fail(ProbeStatus::ProtocolError, "no valid response received");

    const auto& first = choices->as_array().front();
    if (!first.is_object()) return fail(ProbeStatus::ProtocolError, "choice is not an object");

    const auto* message = first.as_object().if_contains("message");
    if (!message || !message->is_object()) return fail(ProbeStatus::ProtocolError, "choice has no message");

    const auto* content = message->as_object().if_contains("content");
    if (!content) return fail(ProbeStatus::ProtocolError, "message has no content field");

    std::string reply;

    // null content means the model connected but said nothing, still a success
    if (content->is_string()) reply = clip(content->as_string(), MAX_REPLY_CHARS);
    else if (!content->is_null()) return fail(ProbeStatus::ProtocolError, "message content is not text");

    TokenUsage usage;

    if (const auto* u = root.if_contains("usage"); u && u->is_object()) {
        const auto& uo = u->as_object();

        usage.total = read_count(uo, "total_tokens");
        usage.prompt = read_count(uo, "prompt_tokens");
        usage.completion = read_count(uo, "completion_tokens");
    }

    return ProbeOutcome::success(server.id, issued_at, duration, usage, std::move(reply));
}

template <typename Stream>
boost::asio::awaitable<HttpProbe::Exchange> HttpProbe::exchange(Stream& stream, const http::request<http::string_body>& req) {
    Exchange out;

    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, out.ec));
    if (out.ec) { out.stage = "send request"; co_return out; }

    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_BYTES);

    co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, out.ec));

    // some servers close without a clean tls shutdown, keep what they sent
    if (out.ec == net::ssl::error::stream_truncated && parser.is_done()) out.ec = {};

    if (out.ec) { out.stage = "read response"; co_return out; }

    auto res = parser.release();

    out.status = res.result_int();
    out.body = std::move(res.body());

    co_return out;
}

boost::asio::awaitable<void> HttpProbe::close_tls(std::shared_ptr<TlsStream> stream) {
    boost::beast::get_lowest_layer(*stream).expires_after(CLOSE_TIMEOUT);

    // peers that never answer close_notify just run into the expiry
    boost::system::error_code ec;
    co_await stream->async_shutdown(net::redirect_error(net::use_awaitable, ec));

    if (ec && ec != net::ssl::error::stream_truncated) Log::debug("tls shutdown: {}", ec.message());
}

boost::asio::awaitable<ProbeOutcome> HttpProbe::async_probe(const ServerDescriptor& server, std::chrono::milliseconds deadline) {
    const auto issued_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    auto elapsed = [start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    };

    auto fail = [&](ProbeStatus status, std::string detail) {
        return ProbeOutcome::failure(server.id, issued_at, elapsed(), status, std::move(detail));
    };

    auto key = resolve_api_key(server.api_key_ref);
    if (!key) co_return fail(ProbeStatus::AuthError, std::format("environment variable {} not set", key_env_name(server.api_key_ref)));

    auto endpoint = resolve_endpoint(server.api_base_url);
    if (!endpoint) co_return fail(ProbeStatus::ProtocolError, std::format("invalid api base '{}'", server.api_base_url));

    bool default_port = endpoint->port == (endpoint->tls ? "443" : "80");

    http::request<http::string_body> req{ http::verb::post, endpoint->target, 11 };
    req.set(http::field::host, default_port ? endpoint->host : endpoint->host + ":" + endpoint->port);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::authorization, "Bearer " + *key);
    req.body() = build_request_body(server);
    req.prepare_payload();

    Exchange ex;
    std::optional<ProbeOutcome> thrown;

    try {
        auto executor = co_await net::this_coro::executor;

        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(endpoint->host, endpoint->port, net::redirect_error(net::use_awaitable, ex.ec));

        if (ex.ec) ex.stage = std::format("resolve {}", endpoint->host);
        else if (elapsed() >= deadline) {
            ex.ec = boost::beast::error::timeout;
            ex.stage = "resolve";
        }

        if (!ex.ec && endpoint->tls) {
            auto stream = std::make_shared<TlsStream>(executor, _ssl_ctx);
            auto& lowest = boost::beast::get_lowest_layer(*stream);

            lowest.expires_after(deadline - elapsed());

            if (!SSL_set_tlsext_host_name(stream->native_handle(), endpoint->host.c_str())) {
                ex.ec = boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                ex.stage = "set tls server name";
            }
            else {
                stream->set_verify_callback(ssl::host_name_verification(endpoint->host));

                co_await lowest.async_connect(results, net::redirect_error(net::use_awaitable, ex.ec));
                if (ex.ec) ex.stage = "connect";
            }

            if (!ex.ec) {
                co_await stream->async_handshake(ssl::stream_base::client, net::redirect_error(net::use_awaitable, ex.ec));
                if (ex.ec) ex.stage = "tls handshake";
            }

            if (!ex.ec) {
                ex = co_await exchange(*stream, req);
                ex.took = elapsed();

                // the answer is in hand, close_notify happens off the clock
                net::co_spawn(executor, close_tls(stream), net::detached);
            }
        }
        else if (!ex.ec) {
            boost::beast::tcp_stream stream(executor);
            stream.expires_after(deadline - elapsed());

            co_await stream.async_connect(results, net::redirect_error(net::use_awaitable, ex.ec));

            if (ex.ec) ex.stage = "connect";
            else {
                ex = co_await exchange(stream, req);
                ex.took = elapsed();

                boost::system::error_code shutdown_ec;
                stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
            }
        }
    }
    catch (const boost::system::system_error& e) {
        // cancellation from the round coordinator lands here
        thrown = fail(classify_transport_error(e.code()), e.code().message());
    }
    catch (const std::exception& e) {
        thrown = fail(ProbeStatus::ProtocolError, std::format("unexpected error: {}", e.what()));
    }

    if (thrown) co_return *thrown;

    if (ex.ec) co_return fail(classify_transport_error(ex.ec), std::format("{}: {}", ex.stage, ex.ec.message()));

    co_return classify_response(server, issued_at, ex.took, ex.status, ex.body);
}
