#include "acpp/connection/channel_connection.hpp"

#include "acpp/async/spawn.hpp"
#include "acpp/log/logger.hpp"

#include <asio/co_spawn.hpp>

namespace acpp {

struct ChannelConnection::Link {
    explicit Link(const asio::any_io_executor& executor)
        : left_to_right(executor)
        , right_to_left(executor) {}

    AsyncQueue<Json> left_to_right;
    AsyncQueue<Json> right_to_left;
};

ChannelConnection::ChannelConnection(std::shared_ptr<Link> link, bool left_end)
    : link_(std::move(link))
    , left_end_(left_end) {}

ChannelConnection::~ChannelConnection() {
    close();
}

AsyncQueue<Json>& ChannelConnection::inbound() const {
    return left_end_ ? link_->right_to_left : link_->left_to_right;
}

AsyncQueue<Json>& ChannelConnection::outbound() const {
    return left_end_ ? link_->left_to_right : link_->right_to_left;
}

TransportResult<void> ChannelConnection::send(Json message) {
    if (closed_) {
        return tl::unexpected(TransportError::closed());
    }
    if (outbound().push(std::move(message)) == false) {
        return tl::unexpected(TransportError::closed("Peer closed the connection"));
    }
    return {};
}

asio::awaitable<TransportResult<Json>> ChannelConnection::async_receive() {
    auto message = co_await inbound().async_next();
    if (!message) {
        co_return tl::unexpected(TransportError::closed("End of stream"));
    }
    co_return std::move(*message);
}

asio::awaitable<void> ChannelConnection::async_close() {
    close();
    co_return;
}

void ChannelConnection::close() {
    if (closed_.exchange(true)) {
        return;
    }
    link_->left_to_right.close();
    link_->right_to_left.close();
}

bool ChannelConnection::is_open() const {
    return (closed_ == false) && (outbound().is_closed() == false);
}

ChannelPair make_channel_pair(asio::any_io_executor executor) {
    auto link = std::make_shared<ChannelConnection::Link>(executor);
    return ChannelPair{
        std::make_unique<ChannelConnection>(link, true),
        std::make_unique<ChannelConnection>(link, false)};
}

// ─────────────────────────────────────────────────────────────────────────────
// InProcessConnector
// ─────────────────────────────────────────────────────────────────────────────

InProcessConnector::InProcessConnector(Handler handler, std::string name)
    : handler_(std::move(handler))
    , name_(std::move(name)) {}

asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
InProcessConnector::async_connect(asio::any_io_executor executor) {
    if (!handler_) {
        co_return tl::unexpected(TransportError::network(name_ + ": no handler"));
    }

    auto pair = make_channel_pair(executor);
    std::shared_ptr<IConnection> far_end = std::move(pair.right);
    asio::co_spawn(executor, handler_(std::move(far_end)), log_on_exception(name_));

    ACPP_LOG_DEBUG("Started " + name_);
    co_return std::unique_ptr<IConnection>(std::move(pair.left));
}

// ─────────────────────────────────────────────────────────────────────────────
// PreconnectedConnector
// ─────────────────────────────────────────────────────────────────────────────

PreconnectedConnector::PreconnectedConnector(std::unique_ptr<IConnection> connection)
    : connection_(std::move(connection)) {}

asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
PreconnectedConnector::async_connect(asio::any_io_executor /*executor*/) {
    std::unique_ptr<IConnection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection = std::move(connection_);
    }
    if (!connection) {
        co_return tl::unexpected(TransportError::closed("Connection was already handed out"));
    }
    co_return std::move(connection);
}

}  // namespace acpp
