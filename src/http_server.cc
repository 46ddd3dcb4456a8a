#include <algorithm>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <cctype>
#include <csignal>
#include <chrono>
#include <json/reader.h>
#include <memory>
#include <optional>
#include <snipbox/blocking_pool.hh>
#include <snipbox/concat_tostr.hh>
#include <snipbox/http_server.hh>
#include <snipbox/responder.hh>
#include <spdlog/spdlog.h>
#include <string_view>
#include <variant>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using asio::ip::tcp;
using std::string_view;

namespace snipbox::http {

namespace {

constexpr auto io_timeout = std::chrono::seconds{30};
constexpr uint64_t max_request_body_size = 2 << 20;

string_view to_std(beast::string_view str) noexcept { return {str.data(), str.size()}; }

// A response to HEAD keeps the Content-Length of the body it would carry, but not the body
Response make_response(
    unsigned version,
    bool keep_alive,
    unsigned status,
    std::string body,
    string_view content_type,
    bool head = false
) {
    Response res;
    res.version(version);
    res.result(status);
    res.set(bhttp::field::server, "snipbox");
    res.set(bhttp::field::access_control_allow_origin, "*");
    res.set(bhttp::field::access_control_allow_methods, "*");
    res.set(bhttp::field::access_control_allow_headers, "*");
    if (not body.empty()) {
        res.set(
            bhttp::field::content_type,
            beast::string_view{content_type.data(), content_type.size()}
        );
    }
    res.keep_alive(keep_alive);
    auto body_size = body.size();
    res.body() = std::move(body);
    res.prepare_payload();
    if (head) {
        res.body().clear();
        res.content_length(body_size);
    }
    return res;
}

Response make_response(const Request& req, unsigned status, std::string body = {}) {
    return make_response(
        req.version(),
        req.keep_alive(),
        status,
        std::move(body),
        "text/plain; charset=utf-8",
        req.method() == bhttp::verb::head
    );
}

// Accepts application/json and application/<anything>+json
bool is_json_content_type(string_view content_type) {
    auto mime = content_type.substr(0, content_type.find(';'));
    while (not mime.empty() and std::isspace(static_cast<unsigned char>(mime.back()))) {
        mime.remove_suffix(1);
    }
    std::string lower{mime};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    string_view sv = lower;
    if (sv == "application/json") {
        return true;
    }
    return sv.starts_with("application/") and sv.ends_with("+json");
}

class Session : public std::enable_shared_from_this<Session> {
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
    Response response_;
    Router& router_;
    BlockingPool& blocking_pool_;

public:
    Session(tcp::socket&& socket, Router& router, BlockingPool& blocking_pool)
    : stream_{std::move(socket)}
    , router_{router}
    , blocking_pool_{blocking_pool} {}

    void start() { do_read(); }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(max_request_body_size);
        stream_.expires_after(io_timeout);
        bhttp::async_read(
            stream_,
            buffer_,
            *parser_,
            beast::bind_front_handler(&Session::on_read, shared_from_this())
        );
    }

    void on_read(beast::error_code ec, size_t /*bytes_transferred*/) {
        if (ec == bhttp::error::end_of_stream) {
            return do_close();
        }
        if (ec == bhttp::error::body_limit) {
            return send(make_response(11, false, 413, "Request body too large", "text/plain"));
        }
        if (ec) {
            if (ec != beast::error::timeout) {
                spdlog::debug("reading request failed: {}", ec.message());
            }
            return;
        }
        auto routed = router_.route(parser_->get());
        if (auto* res = std::get_if<Response>(&routed)) {
            return send(std::move(*res));
        }
        // The handler may wait for the submitted program for a long time
        stream_.expires_never();
        try {
            blocking_pool_.post([self = shared_from_this(),
                                 handler = std::move(std::get<Router::BlockingHandler>(routed))] {
                auto res = handler();
                asio::post(
                    self->stream_.get_executor(),
                    [self, res = std::move(res)]() mutable { self->send(std::move(res)); }
                );
            });
        } catch (const std::exception& e) {
            spdlog::error("scheduling request failed: {}", e.what());
            const auto& req = parser_->get();
            send(make_response(req.version(), false, 503, "Service Unavailable", "text/plain"));
        }
    }

    void send(Response res) {
        response_ = std::move(res);
        stream_.expires_after(io_timeout);
        bhttp::async_write(
            stream_,
            response_,
            beast::bind_front_handler(&Session::on_write, shared_from_this(), response_.need_eof())
        );
    }

    void on_write(bool close, beast::error_code ec, size_t /*bytes_transferred*/) {
        if (ec) {
            spdlog::debug("writing response failed: {}", ec.message());
            return;
        }
        if (close) {
            return do_close();
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec and ec != beast::errc::not_connected) {
            spdlog::debug("shutdown() failed: {}", ec.message());
        }
    }
};

} // namespace

Router::Routed Router::route(const Request& req) noexcept {
    try {
        return dispatch(req);
    } catch (const std::exception& e) {
        spdlog::error(
            "handling {} {} failed: {}", to_std(req.method_string()), to_std(req.target()),
            e.what()
        );
        return make_response(req, 500, "Internal Server Error");
    }
}

Response Router::handle(const Request& req) noexcept {
    auto routed = route(req);
    if (auto* handler = std::get_if<BlockingHandler>(&routed)) {
        return (*handler)();
    }
    return std::get<Response>(std::move(routed));
}

Router::Routed Router::dispatch(const Request& req) {
    auto target = to_std(req.target());
    auto path = target.substr(0, target.find('?'));

    // CORS preflight
    if (req.method() == bhttp::verb::options) {
        return make_response(req, 200);
    }

    if (path == "/") {
        if (req.method() != bhttp::verb::get and req.method() != bhttp::verb::head) {
            return make_response(req, 405);
        }
        spdlog::info("Received request to /");
        return make_response(req, 200, greeting);
    }

    if (path == "/health") {
        if (req.method() != bhttp::verb::get and req.method() != bhttp::verb::head) {
            return make_response(req, 405);
        }
        spdlog::info("Health check request received");
        return BlockingHandler{[this,
                                version = req.version(),
                                keep_alive = req.keep_alive(),
                                head = req.method() == bhttp::verb::head] {
            return check_health(version, keep_alive, head);
        }};
    }

    for (const auto& profile : profiles_) {
        if (path == profile.route) {
            if (req.method() != bhttp::verb::post) {
                return make_response(req, 405);
            }
            return handle_submission(profile, req);
        }
    }
    return make_response(req, 404);
}

Router::Routed Router::handle_submission(const LanguageProfile& profile, const Request& req) {
    if (not is_json_content_type(to_std(req[bhttp::field::content_type]))) {
        return make_response(req, 415, "Expected request with `Content-Type: application/json`");
    }

    Json::Value root;
    {
        Json::CharReaderBuilder builder;
        Json::CharReaderBuilder::strictMode(&builder.settings_);
        std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
        const auto& body = req.body();
        std::string errs;
        if (not reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
            return make_response(
                req, 400, concat_tostr("Failed to parse the request body as JSON: ", errs)
            );
        }
    }
    if (not root.isObject() or not root.isMember("code")) {
        return make_response(
            req,
            422,
            "Failed to deserialize the JSON body into the target type: missing field `code`"
        );
    }
    if (not root["code"].isString()) {
        return make_response(
            req,
            422,
            "Failed to deserialize the JSON body into the target type: code: invalid type, "
            "expected a string"
        );
    }

    spdlog::info("Received {} execution request", profile.name);
    return BlockingHandler{[this,
                            &profile,
                            code = root["code"].asString(),
                            version = req.version(),
                            keep_alive = req.keep_alive()] {
        return execute(profile, code, version, keep_alive);
    }};
}

Response Router::execute(
    const LanguageProfile& profile, const std::string& code, unsigned version, bool keep_alive
) noexcept {
    auto start = std::chrono::steady_clock::now();
    ExecutionResult result;
    try {
        result = executor_.execute(profile, code);
    } catch (const std::exception& e) {
        spdlog::error("{}: execution crashed: {}", profile.name, e.what());
        result = ExecutionError{
            .kind = ExecutionError::Kind::RuntimeFailure,
            .message = concat_tostr("Task panic: ", e.what()),
        };
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start
    );

    auto response = respond(result);
    if (auto* error = std::get_if<ExecutionError>(&result)) {
        spdlog::info(
            "{}: {} after {} ms (status {})", profile.name, to_string(error->kind),
            elapsed.count(), response.status
        );
    } else {
        spdlog::info("{}: success after {} ms", profile.name, elapsed.count());
    }
    return make_response(
        version, keep_alive, response.status, to_json_string(response.body), "application/json"
    );
}

Response Router::check_health(unsigned version, bool keep_alive, bool head) noexcept {
    bool healthy = false;
    try {
        healthy = health_check_();
    } catch (const std::exception& e) {
        spdlog::error("health check failed: {}", e.what());
    }
    return make_response(version, keep_alive, healthy ? 200 : 503, {}, {}, head);
}

Server::Server(const Config& config, Router& router)
: acceptor_{ioc_}
, blocking_pool_{config.max_blocking_threads}
, signals_{ioc_, SIGINT, SIGTERM}
, router_{router} {
    tcp::endpoint endpoint{asio::ip::make_address(config.host), config.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
}

tcp::endpoint Server::local_endpoint() const { return acceptor_.local_endpoint(); }

void Server::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::error("accept() failed: {}", ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), router_, blocking_pool_)->start();
        }
        do_accept();
    });
}

void Server::run() {
    signals_.async_wait([this](beast::error_code ec, int signum) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signum);
        stop();
    });
    auto endpoint = local_endpoint();
    spdlog::info("Listening on http://{}:{}", endpoint.address().to_string(), endpoint.port());
    do_accept();
    ioc_.run();
    // Let the requests being handled finish their executions
    blocking_pool_.join();
}

void Server::stop() noexcept { ioc_.stop(); }

} // namespace snipbox::http
