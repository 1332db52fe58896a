#pragma once

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace cs::protocols::http {

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

class Router;

// Accepts connections for the JSON API and hands each one to a Session.
// Runs on whatever threads drive the io_context.
class Server : public std::enable_shared_from_this<Server> {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router);

    void run();

    // Closes the acceptor; open sessions finish their current exchange. Run it on an io thread.
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

    [[nodiscard]] size_t openSessions() const { return open_sessions_->load(); }
    [[nodiscard]] uint64_t acceptedTotal() const { return accepted_.load(); }

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<const Router> router_;

    std::shared_ptr<std::atomic<size_t>> open_sessions_ = std::make_shared<std::atomic<size_t>>(0);
    std::atomic<uint64_t> accepted_{0};

    void doAccept();
};

}
