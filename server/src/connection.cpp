#include "chunkvault/server/connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace chunkvault::server
{

    Connection::Connection(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), dispatcher_(services, remote_endpoint()) {}

    void Connection::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Connection::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        write_queue_.clear();
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = chunkvault::protocol::decode_frame_header(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{}: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_response(make_error_response(chunkvault::ErrorCode::InvalidPayload, ex.what()));
                             }
                             buffer_.clear();
                             read_frame_header();
                         });
    }

    void Connection::process_message(const nlohmann::json &json)
    {
        chunkvault::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<chunkvault::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_response(make_error_response(chunkvault::ErrorCode::InvalidCommand, ex.what()));
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), chunkvault::protocol::to_string(envelope.command));
        send_response(dispatcher_.dispatch(envelope));
    }

    void Connection::send_response(const chunkvault::protocol::ResponseEnvelope &envelope)
    {
        if (closed_)
        {
            return;
        }
        std::vector<std::uint8_t> frame;
        try
        {
            frame = chunkvault::protocol::encode_frame(nlohmann::json(envelope));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{}: failed to encode response: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }
        write_queue_.push_back(std::move(frame));
        if (write_queue_.size() == 1)
        {
            write_next();
        }
    }

    void Connection::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(write_queue_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              write_queue_.pop_front();
                              if (!write_queue_.empty())
                              {
                                  write_next();
                              }
                          });
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace chunkvault::server
