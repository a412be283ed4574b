#pragma once
#ifndef YA_XDCC_RECEIVER_DETAIL_TRANSFER_ENGINE_HPP_
#define YA_XDCC_RECEIVER_DETAIL_TRANSFER_ENGINE_HPP_

#include "receiver/detail/session_context.hpp"
#include "receiver/detail/output_sink.hpp"
#include "detail/common.hpp"

#include <array>
#include <functional>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			// Owns the raw DCC connection and the output sink for the duration of one
			// transfer. Runs entirely on the network io_context; the read loop is the
			// only writer of session_context::received_bytes.
			class transfer_engine :
				public std::enable_shared_from_this<transfer_engine> {
				struct private_ctor_tag {};
			public:
				class employer {
				public:
					virtual void on_transfer_connected() = 0;
					// reason is empty when the peer closed the connection or the grace delay
					// after the last byte elapsed; success is judged by the byte count anyway
					virtual void on_transfer_ended(std::error_condition reason) = 0;
					virtual ~employer();
				};

				using acknowledgement = std::array<std::uint8_t, 4>;
				// true when an acknowledgement can be sent without blocking
				using outbound_check = std::function<bool (boost::asio::ip::tcp::socket& socket)>;
				static constexpr std::size_t read_buffer_size = 64u * 1024u;

				transfer_engine(boost::asio::io_context& net_io_ctx,
					session_context& ctx, private_ctor_tag tag);
				transfer_engine(const transfer_engine&) = delete;
				transfer_engine& operator=(const transfer_engine&) = delete;
				~transfer_engine();

				static std::shared_ptr<transfer_engine>
					create(boost::asio::io_context& net_io_ctx, session_context& ctx);

				void learn_employer(std::weak_ptr<employer> boss);
				// replaces the zero-timeout poll of the data connection
				void check_outbound_with(outbound_check check);
				void start(const transfer_descriptor& descriptor, std::unique_ptr<output_sink> sink);
				// closes sink and socket, safe to call any number of times
				void close();

				// big endian, low 32 bits of the running total
				[[nodiscard]] static acknowledgement encode_acknowledgement(std::uintmax_t received);
			private:
				void do_read();
				void on_chunk_received(const boost::system::error_code ec, std::size_t bytes_read);
				void acknowledge(std::uintmax_t received);
				void schedule_grace_close();
				void notify_ended(std::error_condition reason);

				boost::asio::io_context&			m_net_io_ctx;
				boost::asio::ip::tcp::socket		m_socket;
				boost::asio::steady_timer			m_grace_timer;
				session_context&					m_context;
				std::unique_ptr<output_sink>		m_sink;
				message_blob						m_read_buffer;
				std::weak_ptr<employer>				m_employer;
				outbound_check						m_outbound_check;
				std::uintmax_t						m_declared_size = 0u;
				bool								m_grace_scheduled = false;
				bool								m_end_notified = false;
				bool								m_closed = false;
			};
		}
	}
}

#endif
