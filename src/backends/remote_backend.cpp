#include "remote_backend.hpp"
#include "../base64.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace {

constexpr uint64_t response_body_limit = 64ull * 1024 * 1024;

struct HttpReply {
    boost::system::error_code ec;
    std::string stage;
    bool completed = false;
    bool timed_out = false;
    bool cancelled = false;
    http::response<http::string_body> response;

    bool ok() const { return completed && !ec && !timed_out && !cancelled; }
};

// One request/response exchange driven by a private io_context. The object
// must outlive ioc.run(); handlers only capture `this`.
template <class Stream>
class HttpExchange {
public:
    template <class... StreamArgs>
    HttpExchange(net::io_context& ioc, const ServiceUrl& url, http::request<http::string_body> req,
                 HttpReply& reply, StreamArgs&&... stream_args)
        : url_(url), resolver_(ioc), stream_(std::forward<StreamArgs>(stream_args)...),
          req_(std::move(req)), reply_(reply) {
        parser_.body_limit(response_body_limit);
    }

    void start(std::chrono::steady_clock::time_point deadline) {
        deadline_ = deadline;
        resolver_.async_resolve(url_.host, url_.port,
            [this](beast::error_code ec, tcp::resolver::results_type results) { on_resolve(ec, results); });
    }

private:
    static constexpr bool use_ssl = !std::is_same<Stream, beast::tcp_stream>::value;

    bool fail(beast::error_code ec, const char* stage) {
        if (!ec) return false;
        reply_.ec = ec;
        reply_.stage = stage;
        if (ec == beast::error::timeout) reply_.timed_out = true;
        return true;
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (fail(ec, "resolve")) return;
        beast::get_lowest_layer(stream_).expires_at(deadline_);
        beast::get_lowest_layer(stream_).async_connect(results,
            [this](beast::error_code ec, tcp::resolver::results_type::endpoint_type) { on_connect(ec); });
    }

    void on_connect(beast::error_code ec) {
        if (fail(ec, "connect")) return;
        if constexpr (use_ssl) {
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
                fail(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()), "sni");
                return;
            }
            beast::get_lowest_layer(stream_).expires_at(deadline_);
            stream_.async_handshake(ssl::stream_base::client,
                [this](beast::error_code ec) { on_handshake(ec); });
        } else {
            on_handshake({});
        }
    }

    void on_handshake(beast::error_code ec) {
        if (fail(ec, "handshake")) return;
        beast::get_lowest_layer(stream_).expires_at(deadline_);
        http::async_write(stream_, req_,
            [this](beast::error_code ec, std::size_t) { on_write(ec); });
    }

    void on_write(beast::error_code ec) {
        if (fail(ec, "write")) return;
        beast::get_lowest_layer(stream_).expires_at(deadline_);
        http::async_read(stream_, buffer_, parser_,
            [this](beast::error_code ec, std::size_t) { on_read(ec); });
    }

    void on_read(beast::error_code ec) {
        if (fail(ec, "read")) return;
        reply_.response = parser_.release();
        reply_.completed = true;
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    ServiceUrl url_;
    tcp::resolver resolver_;
    Stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response_parser<http::string_body> parser_;
    HttpReply& reply_;
    std::chrono::steady_clock::time_point deadline_;
};

HttpReply run_exchange(const ServiceUrl& url, http::request<http::string_body> req,
                       std::chrono::milliseconds timeout, bool insecure, CancellationToken* cancel) {
    HttpReply reply;
    net::io_context ioc;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::optional<CancelSubscription> subscription;
    if (cancel) subscription.emplace(*cancel, [&ioc] { ioc.stop(); });

    auto drive = [&](auto& exchange) {
        exchange.start(deadline);
        // The socket deadline does not cover name resolution, so bound the whole run as well.
        ioc.run_for(timeout + std::chrono::milliseconds(50));
        if (!ioc.stopped()) {
            ioc.stop();
            if (!reply.completed && !reply.ec) reply.timed_out = true;
        }
    };

    try {
        if (url.use_ssl()) {
            ssl::context ctx{ssl::context::tls_client};
            if (insecure) {
                ctx.set_verify_mode(ssl::verify_none);
            } else {
                ctx.set_default_verify_paths();
                ctx.set_verify_mode(ssl::verify_peer);
            }
            HttpExchange<beast::ssl_stream<beast::tcp_stream>> exchange(ioc, url, std::move(req), reply, ioc, ctx);
            drive(exchange);
        } else {
            HttpExchange<beast::tcp_stream> exchange(ioc, url, std::move(req), reply, ioc);
            drive(exchange);
        }
    } catch (const boost::system::system_error& e) {
        reply.ec = e.code();
        reply.stage = "setup";
    }

    subscription.reset();
    if (cancel && cancel->cancelled() && !reply.completed) reply.cancelled = true;
    return reply;
}

// Runs the exchange on a detached worker that owns everything it touches.
// Asio resolves names on a private thread that ~io_context joins, so a hung
// getaddrinfo must not sit between the caller and its deadline.
HttpReply perform(const ServiceUrl& url, http::request<http::string_body> req,
                  std::chrono::milliseconds timeout, bool insecure, CancellationToken* cancel) {
    auto inner = std::make_shared<CancellationToken>();
    auto done = std::make_shared<std::promise<HttpReply>>();
    auto result = done->get_future();

    std::thread([url, req = std::move(req), timeout, insecure, inner, done]() mutable {
        try {
            done->set_value(run_exchange(url, std::move(req), timeout, insecure, inner.get()));
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    }).detach();

    std::optional<CancelSubscription> forward;
    if (cancel) forward.emplace(*cancel, [inner] { inner->cancel(); });

    // run_exchange bounds itself by timeout + 50ms; the rest is slack for it to report.
    const auto deadline = std::chrono::steady_clock::now() + timeout + std::chrono::milliseconds(100);
    while (result.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
        bool cancelled = cancel && cancel->cancelled();
        if (cancelled || std::chrono::steady_clock::now() >= deadline) {
            inner->cancel();
            HttpReply reply;
            reply.stage = "abandoned";
            if (cancelled) reply.cancelled = true;
            else reply.timed_out = true;
            return reply;
        }
    }
    return result.get();
}

http::request<http::string_body> make_request(http::verb method, const ServiceUrl& url,
                                              const std::string& endpoint, const std::string& api_key) {
    http::request<http::string_body> req{method, url.target(endpoint), 11};
    req.set(http::field::host, url.host_header());
    req.set(http::field::user_agent, "wasmbox/1.0");
    if (!api_key.empty()) req.set(http::field::authorization, "Bearer " + api_key);
    return req;
}

template <typename T>
std::optional<T> first_number(const json& j, const char* a, const char* b) {
    for (const char* key : {a, b}) {
        auto it = j.find(key);
        if (it != j.end() && it->is_number()) return it->get<T>();
    }
    return std::nullopt;
}

} // namespace

RemoteBackend::RemoteBackend(ServiceUrl url, std::string api_key,
                             std::chrono::milliseconds health_timeout, bool insecure)
    : url_(std::move(url)), api_key_(std::move(api_key)), health_timeout_(health_timeout), insecure_(insecure) {
    std::cout << "[remote] Sandbox service: " << url_.protocol << "://" << url_.host_header() << url_.base_path << std::endl;
}

json RemoteBackend::build_request_body(const CompiledArtifact& artifact, const json& input, const ExecutionLimits& limits) {
    return json{
        {"wasm", base64_encode(artifact.bytes)},
        {"input", input},
        {"function_name", limits.function_name.empty() ? std::string("main") : limits.function_name},
        {"memory_limit", limits.memory_limit_bytes},
        {"timeout", limits.timeout_ms}
    };
}

DispatchResult RemoteBackend::dispatch(const CompiledArtifact& artifact, const json& input,
                                       const ExecutionLimits& limits, CancellationToken& cancel) {
    DispatchResult r;
    r.code = error_code::execution_error;
    auto t0 = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    };
    auto finish_error = [&](std::string message, json extra = json::object()) {
        r.ok = false;
        r.error = std::move(message);
        if (r.ms == 0.0) r.ms = elapsed();
        r.details = {{"executionTimeMs", static_cast<uint64_t>(r.ms)},
                     {"memoryUsedBytes", r.memory_used_bytes ? json(*r.memory_used_bytes) : json(nullptr)}};
        r.details.update(extra);
        std::cerr << "[remote] " << r.error << std::endl;
        return r;
    };

    try {
        auto req = make_request(http::verb::post, url_, "/execute", api_key_);
        req.set(http::field::content_type, "application/json");
        req.body() = build_request_body(artifact, input, limits).dump();
        req.prepare_payload();

        std::cout << "[remote] POST " << url_.target("/execute") << " (" << artifact.size_bytes << " bytes wasm)" << std::endl;
        auto reply = perform(url_, std::move(req), std::chrono::milliseconds(limits.timeout_ms), insecure_, &cancel);

        if (reply.timed_out || reply.cancelled) {
            r.code = error_code::timeout;
            return finish_error("sandbox service timed out after " + std::to_string(limits.timeout_ms) + "ms");
        }
        if (reply.ec) {
            return finish_error("sandbox service request failed during " + reply.stage + ": " + reply.ec.message());
        }

        const auto& res = reply.response;
        unsigned status = res.result_int();
        json body = json::parse(res.body(), nullptr, /*allow_exceptions*/false);

        if (body.is_object()) {
            if (auto t = first_number<double>(body, "executionTime", "execution_time")) r.ms = *t;
            r.memory_used_bytes = first_number<uint64_t>(body, "memoryUsed", "memory_used");
        }

        if (status < 200 || status >= 300) {
            std::string text = res.body();
            if (body.is_object() && body.contains("error") && body["error"].is_string()) text = body["error"].get<std::string>();
            return finish_error("sandbox service error: " + std::to_string(status) + " " + text, {{"status", status}});
        }
        if (!body.is_object()) {
            return finish_error("malformed response from sandbox service", {{"status", status}});
        }

        if (!body.value("success", false)) {
            std::string msg = "sandbox execution failed";
            if (body.contains("error") && body["error"].is_string()) msg = body["error"].get<std::string>();
            return finish_error(msg, {{"status", status}});
        }

        r.ok = true;
        r.output = body.contains("output") && !body["output"].is_null() ? body["output"] : input;
        if (r.ms == 0.0) r.ms = elapsed();
        std::cout << "[remote] Execution succeeded in " << r.ms << "ms" << std::endl;
        return r;
    } catch (const std::exception& e) {
        return finish_error(std::string("sandbox service request failed: ") + e.what());
    }
}

bool RemoteBackend::health_check() {
    try {
        auto reply = perform(url_, make_request(http::verb::get, url_, "/health", api_key_),
                             health_timeout_, insecure_, nullptr);
        if (!reply.ok()) {
            std::cerr << "[remote] Health check failed: "
                      << (reply.timed_out ? std::string("timed out") : reply.ec.message()) << std::endl;
            return false;
        }
        unsigned status = reply.response.result_int();
        return status >= 200 && status < 300;
    } catch (const std::exception& e) {
        std::cerr << "[remote] Health check failed: " << e.what() << std::endl;
        return false;
    }
}
