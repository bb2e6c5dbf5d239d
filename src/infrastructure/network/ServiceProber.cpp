#include "infrastructure/network/ServiceProber.hpp"

#include "core/probe/ResponseMatcher.hpp"
#include "core/types/PortSpec.hpp"

#include <spdlog/spdlog.h>

namespace portprobe::infra {

namespace {

using ExchangeHandler = std::function<void(std::optional<std::string>)>;

/**
 * One connect, write, read round trip bounded by a single deadline.
 * All handlers run on the exchange's strand.
 */
class ProbeExchange : public std::enable_shared_from_this<ProbeExchange> {
public:
    ProbeExchange(asio::io_context& context, const asio::ip::tcp::endpoint& endpoint,
                  std::string payload, size_t readSize, std::chrono::milliseconds timeout,
                  ExchangeHandler handler)
        : strand_(asio::make_strand(context)), socket_(strand_), timer_(strand_),
          endpoint_(endpoint), payload_(std::move(payload)), buffer_(readSize),
          timeout_(timeout), handler_(std::move(handler)) {}

    void start() {
        auto self = shared_from_this();
        asio::dispatch(strand_, [self]() { self->connect(); });
    }

private:
    void connect() {
        auto self = shared_from_this();

        timer_.expires_after(timeout_);
        timer_.async_wait([self](const asio::error_code& ec) {
            if (ec || self->finished_) {
                return; // Cancelled
            }
            spdlog::debug("Probe exchange with {}:{} timed out",
                          self->endpoint_.address().to_string(), self->endpoint_.port());
            self->finish(std::nullopt);
        });

        socket_.async_connect(endpoint_, [self](const asio::error_code& ec) {
            if (self->finished_) {
                return;
            }
            if (ec) {
                spdlog::debug("Probe connect to {}:{} failed: {}",
                              self->endpoint_.address().to_string(), self->endpoint_.port(),
                              ec.message());
                self->finish(std::nullopt);
                return;
            }
            if (self->payload_.empty()) {
                self->read();
            } else {
                self->write();
            }
        });
    }

    void write() {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(payload_),
                          [self](const asio::error_code& ec, size_t /*bytesWritten*/) {
                              if (self->finished_) {
                                  return;
                              }
                              if (ec) {
                                  self->finish(std::nullopt);
                                  return;
                              }
                              self->read();
                          });
    }

    void read() {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(buffer_),
                                [self](const asio::error_code& ec, size_t bytesRead) {
                                    if (self->finished_) {
                                        return;
                                    }
                                    if (ec || bytesRead == 0) {
                                        self->finish(std::nullopt);
                                        return;
                                    }
                                    self->finish(std::string(self->buffer_.data(), bytesRead));
                                });
    }

    void finish(std::optional<std::string> response) {
        finished_ = true;

        timer_.cancel();
        asio::error_code ignored;
        socket_.close(ignored);

        auto handler = std::move(handler_);
        handler(std::move(response));
    }

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::tcp::socket socket_;
    asio::steady_timer timer_;
    asio::ip::tcp::endpoint endpoint_;
    std::string payload_;
    std::vector<char> buffer_;
    std::chrono::milliseconds timeout_;
    ExchangeHandler handler_;
    bool finished_{false};
};

} // namespace

ServiceProber::ServiceProber(asio::io_context& context, const asio::ip::tcp::endpoint& endpoint,
                             std::shared_ptr<const core::ProbeDatabase> database,
                             std::chrono::milliseconds timeout, DetectHandler handler)
    : context_(context), endpoint_(endpoint), database_(std::move(database)), timeout_(timeout),
      handler_(std::move(handler)) {
    plan_ = database_->probePlan(endpoint_.port(), core::Protocol::Tcp);
}

void ServiceProber::detectAsync(asio::io_context& context, const asio::ip::tcp::endpoint& endpoint,
                                std::shared_ptr<const core::ProbeDatabase> database,
                                std::chrono::milliseconds timeout, DetectHandler handler) {
    if (!database) {
        handler(std::nullopt);
        return;
    }

    std::shared_ptr<ServiceProber> prober(
        new ServiceProber(context, endpoint, std::move(database), timeout, std::move(handler)));

    spdlog::debug("Probing {}:{} with {} probes", endpoint.address().to_string(), endpoint.port(),
                  prober->plan_.size());
    prober->tryNextProbe();
}

void ServiceProber::tryNextProbe() {
    if (nextProbe_ >= plan_.size()) {
        auto handler = std::move(handler_);
        handler(std::nullopt);
        return;
    }

    const core::ProbeEntry* probe = plan_[nextProbe_++];
    auto self = shared_from_this();

    auto exchange = std::make_shared<ProbeExchange>(
        context_, endpoint_, probe->payload, ResponseBufferSize, timeout_,
        [self, probe](std::optional<std::string> response) {
            if (response) {
                if (auto info = core::matchResponse(*response, *probe)) {
                    spdlog::debug("Port {} identified as {} by probe {}", self->endpoint_.port(),
                                  info->service, probe->name);
                    auto handler = std::move(self->handler_);
                    handler(std::move(info));
                    return;
                }
            }
            self->tryNextProbe();
        });
    exchange->start();
}

void ServiceProber::grabBannerAsync(asio::io_context& context,
                                    const asio::ip::tcp::endpoint& endpoint,
                                    std::chrono::milliseconds timeout, BannerHandler handler) {
    auto exchange = std::make_shared<ProbeExchange>(
        context, endpoint, std::string{}, BannerBufferSize, timeout,
        [handler = std::move(handler)](std::optional<std::string> response) {
            if (!response) {
                handler(std::nullopt);
                return;
            }
            auto banner = core::trimWhitespace(*response);
            if (banner.empty()) {
                handler(std::nullopt);
                return;
            }
            handler(std::string(banner));
        });
    exchange->start();
}

} // namespace portprobe::infra
