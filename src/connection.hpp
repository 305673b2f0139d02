#pragma once
#include <asio.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "log.hpp"
#include "outbound_channel.hpp"

// One client socket. Reads newline-delimited JSON, hands each message to the
// handler, and queues outgoing lines. All socket work runs on the socket's
// strand, so deliver() is safe from any thread.
class Connection : public OutboundChannel, public std::enable_shared_from_this<Connection> {
public:
    using MessageHandler = std::function<void(const std::shared_ptr<Connection>&, const nlohmann::json&)>;
    using CloseHandler = std::function<void(const std::string& /*connection_id*/)>;

    static constexpr std::size_t kMaxLineBytes = 1024 * 1024;
    static constexpr std::size_t kMaxQueuedBytes = 8 * 1024 * 1024;

    // The socket must have been accepted onto a strand executor. A peer that
    // stops reading is dropped once more than max_queued_bytes wait unsent.
    static std::shared_ptr<Connection> create_incoming(asio::ip::tcp::socket sock,
                                                       MessageHandler on_message,
                                                       CloseHandler on_close,
                                                       std::shared_ptr<Logger> logger = nullptr,
                                                       std::size_t max_queued_bytes = kMaxQueuedBytes);

    ~Connection() override;

    void start(); // start read loop
    void async_send_json(const nlohmann::json& j);
    void close();

    const std::string& channel_id() const override { return connection_id_; }
    bool deliver(const nlohmann::json& message) override;
    bool is_open() const { return !closed_.load(); }
    std::size_t queued_bytes() const { return queued_bytes_.load(); }
    const std::string& remote_address() const { return remote_address_; }

private:
    Connection(asio::ip::tcp::socket sock,
               MessageHandler on_message,
               CloseHandler on_close,
               std::shared_ptr<Logger> logger,
               std::size_t max_queued_bytes);
    void do_read();
    void handle_line(const std::string& line);
    void do_write();
    void close_on_strand();
    void close_after_overflow();
    void shutdown_on_strand();

    asio::ip::tcp::socket socket_;
    asio::streambuf read_buf_;
    std::deque<std::string> write_queue_;
    MessageHandler on_message_;
    CloseHandler on_close_;
    std::shared_ptr<Logger> logger_;
    std::string connection_id_;
    std::string remote_address_;
    std::size_t max_queued_bytes_;
    std::atomic<std::size_t> queued_bytes_{0};
    std::atomic<bool> closed_{false};
};
