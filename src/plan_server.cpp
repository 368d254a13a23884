#include "plan_server.hpp"
#include "plan_handler.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <thread>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace bulk_planner {

namespace {

constexpr const char* kPlanTarget = "/api/plan";
constexpr const char* kServerName = "bulk_planner/1.0";

HttpResponse jsonResponse(const HttpRequest& req, unsigned int status,
                          const nlohmann::json& body) {
    HttpResponse res{http::status::ok, req.version()};
    res.result(status);
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(req.keep_alive());
    res.body() = dumpBody(body);
    res.prepare_payload();
    return res;
}

nlohmann::json routeError(const std::string& code, const std::string& message) {
    return {{"action", "error"}, {"code", code}, {"message", message}};
}

void serveSession(tcp::socket socket, bool verbose) {
    beast::error_code ec;
    beast::flat_buffer buffer;

    for (;;) {
        HttpRequest req;
        http::read(socket, buffer, req, ec);
        if (ec == http::error::end_of_stream) break;
        if (ec) {
            if (verbose) {
                std::cerr << "[PlanServer] Read failed: " << ec.message() << "\n";
            }
            break;
        }

        HttpResponse res = routeRequest(req, verbose);
        const bool close = res.need_eof();

        http::write(socket, res, ec);
        if (ec) {
            std::cerr << "[PlanServer] Write failed: " << ec.message() << "\n";
            break;
        }
        if (close) break;
    }

    // Peer may already be gone; nothing left to report.
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------

HttpResponse routeRequest(const HttpRequest& req, bool verbose) {
    std::string path(req.target().data(), req.target().size());
    auto query = path.find('?');
    if (query != std::string::npos) path.resize(query);

    if (verbose) {
        std::cerr << "[PlanServer] " << req.method_string() << " " << path << "\n";
    }

    if (path != kPlanTarget) {
        return jsonResponse(req, 404, routeError("not_found", "No route for " + path));
    }
    if (req.method() != http::verb::post) {
        auto res = jsonResponse(req, 405,
                                routeError("method_not_allowed", "Use POST " + path));
        res.set(http::field::allow, "POST");
        return res;
    }

    const HandlerResult result = handlePlanBody(req.body(), verbose);
    return jsonResponse(req, result.httpStatus, result.body);
}

// ---------------------------------------------------------------------------
// Server
// ---------------------------------------------------------------------------

PlanServer::PlanServer(const ListenAddress& address, bool verbose)
    : mIoc()
    , mAcceptor(mIoc, tcp::endpoint{net::ip::make_address(address.host), address.port})
    , mVerbose(verbose)
{
    if (mVerbose) {
        std::cerr << "[PlanServer] Listening on " << address.host << ":"
                  << port() << "\n";
    }
}

unsigned short PlanServer::port() const {
    return mAcceptor.local_endpoint().port();
}

void PlanServer::serveOne() {
    tcp::socket socket{mIoc};
    mAcceptor.accept(socket);
    serveSession(std::move(socket), mVerbose);
}

void PlanServer::run() {
    for (;;) {
        tcp::socket socket{mIoc};
        mAcceptor.accept(socket);
        std::thread([s = std::move(socket), verbose = mVerbose]() mutable {
            try {
                serveSession(std::move(s), verbose);
            } catch (const std::exception& e) {
                std::cerr << "[PlanServer] Session aborted: " << e.what() << "\n";
            }
        }).detach();
    }
}

} // namespace bulk_planner
