#pragma once

#include "util.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include <string>

namespace bulk_planner {

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

/// Map one HTTP request to its response:
///   POST /api/plan   planning endpoint (see handlePlanBody)
///   /api/plan        any other method -> 405
///   anything else    404
/// Every response is JSON with Cache-Control: no-store.
HttpResponse routeRequest(const HttpRequest& req, bool verbose = false);

/// Minimal synchronous HTTP/1.1 server built on Boost.Beast.
/// Each accepted connection is served on its own thread.
class PlanServer {
public:
    /// Binds and listens immediately; port 0 picks an ephemeral port.
    /// @throws boost::system::system_error if the address cannot be bound.
    explicit PlanServer(const ListenAddress& address, bool verbose = false);

    /// Port actually bound (useful when constructed with port 0).
    unsigned short port() const;

    /// Accept one connection and serve it on the calling thread until the
    /// peer closes it.
    void serveOne();

    /// Accept connections forever.
    void run();

private:
    boost::asio::io_context        mIoc;
    boost::asio::ip::tcp::acceptor mAcceptor;
    bool                           mVerbose;
};

} // namespace bulk_planner
