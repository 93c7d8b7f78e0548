#include "sign_server.hpp"
#include "trade_log.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <sys/socket.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <thread>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

static http::response<http::string_body> make_json_response(unsigned version, bool keep_alive,
                                                            http::status status, const std::string& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, "mrkt-builder-signer");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = body;
    res.prepare_payload();
    return res;
}

static http::response<http::string_body> route(const http::request<http::string_body>& req,
                                               IBuilderHeaderSigner* signer) {
    const unsigned v = req.version();
    const bool ka = req.keep_alive();

    std::string target(req.target());
    const auto q = target.find('?');
    if (q != std::string::npos) target.resize(q);

    if (target != "/sign") {
        return make_json_response(v, ka, http::status::not_found,
                                  nlohmann::json{{"success", false}, {"error", "Not found"}}.dump());
    }

    if (req.method() == http::verb::get) {
        return make_json_response(v, ka, http::status::ok, sign_endpoint_status(signer != nullptr).dump());
    }
    if (req.method() == http::verb::post) {
        const SignReply reply = handle_sign_request(req.body(), signer, now_unix_seconds());
        return make_json_response(v, ka, static_cast<http::status>(reply.status), reply.body.dump());
    }

    auto res = make_json_response(v, ka, http::status::method_not_allowed,
                                  nlohmann::json{{"success", false}, {"error", "Method not allowed"}}.dump());
    res.set(http::field::allow, "GET, POST");
    return res;
}

// Connection served on its own thread. idle_deadline_ms is read by the
// accept loop, which shuts the socket down once it passes.
struct SignSession {
    explicit SignSession(tcp::socket s) : socket(std::move(s)) {}

    tcp::socket socket;
    std::atomic<std::int64_t> idle_deadline_ms{0};
};

static std::int64_t steady_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch()).count();
}

static void serve(SignSession& session, IBuilderHeaderSigner* signer) {
    tcp::socket& socket = session.socket;
    beast::flat_buffer buffer;
    beast::error_code ec;

    for (;;) {
        // covers both an idle keep-alive and a request that stalls mid-read
        session.idle_deadline_ms = steady_ms() + SignServer::kReadTimeoutMs;

        http::request<http::string_body> req;
        http::read(socket, buffer, req, ec);
        if (ec == http::error::end_of_stream) break;
        if (ec) {
            log_debug("SIGNER", "read failed: " + ec.message());
            break;
        }
        session.idle_deadline_ms = steady_ms() + SignServer::kReadTimeoutMs;

        auto res = route(req, signer);
        log_info("SIGNER", std::string(req.method_string()) + " " + std::string(req.target()) + " -> " +
                           std::to_string(res.result_int()));

        const bool keep_alive = res.keep_alive();
        http::write(socket, res, ec);
        if (ec) {
            log_debug("SIGNER", "write failed: " + ec.message());
            break;
        }
        if (!keep_alive) break;
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

SignServer::SignServer(std::uint16_t port, IBuilderHeaderSigner* signer, std::atomic<bool>& running)
    : port_(port), signer_(signer), running_(running)
{}

SignServer::~SignServer() = default;

// Unblocks the session's pending read; the session thread then exits on its own.
static void force_close(SignSession& session) {
    ::shutdown(session.socket.native_handle(), SHUT_RDWR);
}

void SignServer::close_sessions(bool all) {
    const std::int64_t now = steady_ms();
    std::lock_guard<std::mutex> lk(sessions_mtx_);
    for (auto& kv : sessions_) {
        SignSession& s = *kv.second;
        if (all || now > s.idle_deadline_ms.load()) {
            if (!all) log_debug("SIGNER", "closing idle connection #" + std::to_string(kv.first));
            force_close(s);
            s.idle_deadline_ms = std::numeric_limits<std::int64_t>::max();
        }
    }
}

std::size_t SignServer::open_sessions() const {
    std::lock_guard<std::mutex> lk(sessions_mtx_);
    return sessions_.size();
}

void SignServer::run() {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc);
    const tcp::endpoint ep{tcp::v4(), port_};

    acceptor.open(ep.protocol());
    acceptor.set_option(net::socket_base::reuse_address(true));
    acceptor.bind(ep);
    acceptor.listen();
    acceptor.non_blocking(true);

    log_info("SIGNER", "listening on port " + std::to_string(port_) +
                       (signer_ ? " (signing enabled)" : " (no credentials, POST /sign returns 503)"));

    std::uint64_t next_id = 0;
    while (running_.load()) {
        close_sessions(false);

        tcp::socket socket(ioc);
        beast::error_code ec;
        acceptor.accept(socket, ec);

        if (ec == net::error::would_block || ec == net::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            log_warn("SIGNER", "accept failed: " + ec.message());
            continue;
        }

        socket.non_blocking(false, ec);
        auto session = std::make_shared<SignSession>(std::move(socket));
        session->idle_deadline_ms = steady_ms() + kReadTimeoutMs;
        const std::uint64_t id = ++next_id;
        {
            std::lock_guard<std::mutex> lk(sessions_mtx_);
            sessions_[id] = session;
        }
        std::thread([this, id, session]() mutable {
            try {
                serve(*session, signer_);
            } catch (const std::exception& e) {
                log_warn("SIGNER", std::string("session error: ") + e.what());
            }
            // the map holds the last reference; the socket closes inside the erase
            session.reset();
            std::lock_guard<std::mutex> lk(sessions_mtx_);
            sessions_.erase(id);
        }).detach();
    }

    beast::error_code ec;
    acceptor.close(ec);

    const std::size_t open = open_sessions();
    if (open > 0) log_info("SIGNER", "closing " + std::to_string(open) + " open connection(s)");
    while (open_sessions() > 0) {
        close_sessions(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    log_info("SIGNER", "stopped");
}
