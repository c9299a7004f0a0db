#include "infrastructure/network/TcpPortProbe.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>

namespace lanwatch::infra {

namespace {

/// Single-threaded connect sweep; handlers all run inside io.run().
class ConnectSweep {
public:
    ConnectSweep(asio::io_context& io, asio::ip::address_v4 address,
                 const std::vector<uint16_t>& ports, std::chrono::milliseconds timeout)
        : io_(io), address_(address), ports_(ports), timeout_(timeout) {}

    void start(size_t concurrency) {
        size_t initial = std::min(concurrency, ports_.size());
        for (size_t i = 0; i < initial; ++i) {
            launchNext();
        }
    }

    std::vector<uint16_t> result() const {
        auto ports = open_;
        std::sort(ports.begin(), ports.end());
        return ports;
    }

private:
    void launchNext() {
        if (next_ >= ports_.size()) {
            return;
        }

        uint16_t port = ports_[next_++];
        auto socket = std::make_shared<asio::ip::tcp::socket>(io_);
        auto timer = std::make_shared<asio::steady_timer>(io_);
        auto completed = std::make_shared<bool>(false);

        timer->expires_after(timeout_);
        timer->async_wait([this, socket, completed](const asio::error_code& ec) {
            if (ec || *completed) {
                return;
            }
            *completed = true;
            asio::error_code ignored;
            socket->close(ignored);
            launchNext();
        });

        socket->async_connect(
            asio::ip::tcp::endpoint(address_, port),
            [this, socket, timer, completed, port](const asio::error_code& ec) {
                if (*completed) {
                    return;
                }
                *completed = true;
                timer->cancel();

                if (!ec) {
                    open_.push_back(port);
                }

                asio::error_code ignored;
                socket->close(ignored);
                launchNext();
            });
    }

    asio::io_context& io_;
    asio::ip::address_v4 address_;
    const std::vector<uint16_t>& ports_;
    std::chrono::milliseconds timeout_;
    size_t next_{0};
    std::vector<uint16_t> open_;
};

} // namespace

std::vector<uint16_t> TcpPortProbe::openPorts(const std::string& address,
                                              const std::vector<uint16_t>& ports,
                                              std::chrono::milliseconds timeout,
                                              int maxConcurrency) const {
    asio::error_code ec;
    auto target = asio::ip::make_address_v4(address, ec);
    if (ec || ports.empty()) {
        return {};
    }

    asio::io_context io;
    ConnectSweep sweep(io, target, ports, timeout);
    sweep.start(static_cast<size_t>(std::max(maxConcurrency, 1)));
    io.run();

    auto open = sweep.result();
    spdlog::debug("{}: {} of {} probed ports open", address, open.size(), ports.size());
    return open;
}

} // namespace lanwatch::infra
