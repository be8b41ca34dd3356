#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/framing.hpp"
#include "chunkvault/protocol.hpp"
#include "chunkvault/server/request_dispatcher.hpp"

namespace chunkvault::server
{

    // One client connection. Handlers for a connection run on its strand.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const chunkvault::protocol::ResponseEnvelope &envelope);
        void write_next();

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        RequestDispatcher dispatcher_;

        std::array<std::uint8_t, chunkvault::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> write_queue_;
        bool closed_{false};
    };

} // namespace chunkvault::server
