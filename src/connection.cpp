#include "connection.hpp"
#include "utils.hpp"

using json = nlohmann::json;

std::shared_ptr<Connection> Connection::create_incoming(asio::ip::tcp::socket sock,
                                                        MessageHandler on_message,
                                                        CloseHandler on_close,
                                                        std::shared_ptr<Logger> logger,
                                                        std::size_t max_queued_bytes)
{
    auto c = std::shared_ptr<Connection>(new Connection(std::move(sock),
                                                        std::move(on_message),
                                                        std::move(on_close),
                                                        std::move(logger),
                                                        max_queued_bytes));
    c->start();
    return c;
}

Connection::Connection(asio::ip::tcp::socket sock,
                       MessageHandler on_message,
                       CloseHandler on_close,
                       std::shared_ptr<Logger> logger,
                       std::size_t max_queued_bytes)
: socket_(std::move(sock)),
  read_buf_(kMaxLineBytes),
  on_message_(std::move(on_message)),
  on_close_(std::move(on_close)),
  logger_(std::move(logger)),
  connection_id_(generate_id("conn")),
  max_queued_bytes_(max_queued_bytes)
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if(!ec) remote_address_ = ep.address().to_string() + ":" + std::to_string(ep.port());
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::start(){
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self](){ do_read(); });
}

void Connection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                if(ec != asio::error::eof && ec != asio::error::operation_aborted){
                    log_info(logger_.get(), "Connection {} read error: {}", connection_id_, ec.message());
                }
                close_on_strand();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty() && line.back() == '\r') line.pop_back();
            if(!line.empty()){
                handle_line(line);
            }
            if(!closed_.load()) do_read();
        });
}

void Connection::handle_line(const std::string& line){
    json j;
    try{
        j = json::parse(line);
    } catch(const json::parse_error& ex){
        log_warn(logger_.get(), "Failed to parse JSON from {}: {}  raw: {}", connection_id_, ex.what(), line);
        return;
    }
    if(on_message_) on_message_(shared_from_this(), j);
}

bool Connection::deliver(const nlohmann::json& message){
    if(closed_.load()) return false;
    async_send_json(message);
    return !closed_.load();
}

void Connection::async_send_json(const nlohmann::json& j){
    auto s = j.dump() + "\n";
    const auto backlog = queued_bytes_.fetch_add(s.size()) + s.size();
    if(backlog > max_queued_bytes_){
        queued_bytes_.fetch_sub(s.size());
        log_warn(logger_.get(), "Connection {} has {} bytes unsent, dropping it", connection_id_, backlog - s.size());
        if(!closed_.exchange(true)) close_after_overflow();
        return;
    }
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self, s = std::move(s)]() mutable {
        if(closed_.load()) return;
        bool start_write = write_queue_.empty();
        write_queue_.push_back(std::move(s));
        if(start_write){
            do_write();
        }
    });
}

void Connection::do_write(){
    if(write_queue_.empty()) return;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                log_info(logger_.get(), "Connection {} write error: {}", connection_id_, ec.message());
                close_on_strand();
                return;
            }
            queued_bytes_.fetch_sub(write_queue_.front().size());
            write_queue_.pop_front();
            if(!write_queue_.empty()){
                do_write();
            }
        });
}

void Connection::close(){
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self](){ close_on_strand(); });
}

void Connection::close_on_strand(){
    if(closed_.exchange(true)) return;
    shutdown_on_strand();
}

void Connection::close_after_overflow(){
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self](){ shutdown_on_strand(); });
}

void Connection::shutdown_on_strand(){
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    write_queue_.clear();
    queued_bytes_.store(0);
    if(on_close_) on_close_(connection_id_);
}
