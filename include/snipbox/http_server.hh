#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <functional>
#include <snipbox/blocking_pool.hh>
#include <snipbox/config.hh>
#include <snipbox/execution.hh>
#include <snipbox/language_profile.hh>
#include <string>
#include <variant>
#include <vector>

namespace snipbox::http {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

constexpr const char* greeting =
    "Hello, World! Welcome to the Solana Playground Service (Rust + TypeScript)";

// Maps requests to responses; every response allows any CORS origin, method and header
class Router {
public:
    // Returns true iff every toolchain is available
    using HealthCheck = std::function<bool()>;
    // Produces the response of a request whose handling may block for a long time; never
    // throws
    using BlockingHandler = std::function<Response()>;
    using Routed = std::variant<Response, BlockingHandler>;

    Router(std::vector<LanguageProfile> profiles, Executor& executor, HealthCheck health_check)
    : profiles_{std::move(profiles)}
    , executor_{executor}
    , health_check_{std::move(health_check)} {}

    // Answers right away unless the request runs a submission or the health check, in which
    // case the returned handler does the blocking part. Never blocks and never throws.
    Routed route(const Request& req) noexcept;

    // route() followed by running the handler if there is one
    Response handle(const Request& req) noexcept;

private:
    Routed dispatch(const Request& req);

    Routed handle_submission(const LanguageProfile& profile, const Request& req);

    Response execute(
        const LanguageProfile& profile, const std::string& code, unsigned version, bool keep_alive
    ) noexcept;

    Response check_health(unsigned version, bool keep_alive, bool head) noexcept;

    std::vector<LanguageProfile> profiles_;
    Executor& executor_;
    HealthCheck health_check_;
};

// HTTP/1.1 server: connections and the requests that can be answered right away are served
// on a single I/O thread; submissions and health checks run on a BlockingPool, so a
// long-running submission never delays other requests
class Server {
public:
    // Binds to config.host:config.port; throws on error
    Server(const Config& config, Router& router);

    Server(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(const Server&) = delete;
    Server& operator=(Server&&) = delete;
    ~Server() = default;

    // Serves until SIGINT or SIGTERM is received or stop() is called, then waits for the
    // requests being handled
    void run();

    // Thread-safe
    void stop() noexcept;

    [[nodiscard]] boost::asio::ip::tcp::endpoint local_endpoint() const;

private:
    void do_accept();

    boost::asio::io_context ioc_{1};
    boost::asio::ip::tcp::acceptor acceptor_;
    BlockingPool blocking_pool_;
    boost::asio::signal_set signals_;
    Router& router_;
};

} // namespace snipbox::http
