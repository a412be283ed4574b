#include "receiver/detail/transfer_engine.hpp"
#include "detail/logging.hpp"

#include "boost/endian/conversion.hpp"

#ifdef _WIN32
#include <winsock2.h>
#else
#include <poll.h>
#endif

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			namespace {
				bool socket_writable(boost::asio::ip::tcp::socket& socket){
#ifdef _WIN32
					auto pfd = WSAPOLLFD{ socket.native_handle(), POLLWRNORM, 0 };
					return WSAPoll(&pfd, 1, 0) > 0 and (pfd.revents & POLLWRNORM);
#else
					auto pfd = pollfd{ socket.native_handle(), POLLOUT, 0 };
					return ::poll(&pfd, 1, 0) > 0 and (pfd.revents & POLLOUT);
#endif
				}
			}

			transfer_engine::employer::~employer() = default;

			transfer_engine::transfer_engine(boost::asio::io_context& net_io_ctx,
				session_context& ctx, private_ctor_tag tag) :
				m_net_io_ctx(net_io_ctx), m_socket(m_net_io_ctx),
				m_grace_timer(m_net_io_ctx), m_context(ctx),
				m_read_buffer(make_message_blob(read_buffer_size)),
				m_outbound_check(&socket_writable) {}

			transfer_engine::~transfer_engine() = default;

			std::shared_ptr<transfer_engine>
				transfer_engine::create(boost::asio::io_context& net_io_ctx, session_context& ctx){
				return std::make_shared<transfer_engine>(net_io_ctx, ctx, private_ctor_tag{});
			}

			void transfer_engine::learn_employer(std::weak_ptr<employer> boss){
				m_employer = std::move(boss);
			}

			void transfer_engine::check_outbound_with(outbound_check check){
				m_outbound_check = std::move(check);
			}

			transfer_engine::acknowledgement transfer_engine::encode_acknowledgement(std::uintmax_t received){
				auto ack = acknowledgement{};
				boost::endian::store_big_u32(ack.data(), static_cast<std::uint32_t>(received & 0xffffffffu));
				return ack;
			}

			void transfer_engine::start(const transfer_descriptor& descriptor, std::unique_ptr<output_sink> sink){
				m_sink = std::move(sink);
				m_declared_size = descriptor.size;
				auto peer_ep = boost::asio::ip::tcp::endpoint{ descriptor.address, descriptor.port };
				log::get()->debug("Connecting to {}:{}", descriptor.address.to_string(), descriptor.port);

				m_socket.async_connect(peer_ep,
					[this_engine = shared_from_this(), peer_ep](const boost::system::error_code ec){
					if (this_engine->m_closed)
						return;
					if (ec){
						log::get()->error("failed to establish data connection to {}:{}: {}",
							peer_ep.address().to_string(), peer_ep.port(), ec.message());
						this_engine->notify_ended(std::make_error_condition(std::errc::connection_refused));
						return;
					}

					this_engine->m_context.connected.store(true, std::memory_order_release);
					if (auto boss = this_engine->m_employer.lock(); boss)
						boss->on_transfer_connected();
					if (this_engine->m_declared_size == 0u)
						this_engine->schedule_grace_close();
					this_engine->do_read();
				});
			}

			void transfer_engine::do_read(){
				m_socket.async_read_some(boost::asio::buffer(*m_read_buffer),
					[this_engine = shared_from_this()](const boost::system::error_code ec, std::size_t bytes_read){
					this_engine->on_chunk_received(ec, bytes_read);
				});
			}

			void transfer_engine::on_chunk_received(const boost::system::error_code ec, std::size_t bytes_read){
				if (m_closed)
					return;
				if (ec){
					if (ec == boost::asio::error::operation_aborted)
						return;
					if (ec == boost::asio::error::eof){
						log::get()->debug("Peer closed the data connection");
						notify_ended(std::error_condition{});
					}
					else{
						log::get()->error("Data connection broken: {}", ec.message());
						notify_ended(std::make_error_condition(std::errc::connection_reset));
					}
					return;
				}

				if (not m_sink->write(m_read_buffer->data(), bytes_read)){
					log::get()->error("Failed to write to the destination");
					notify_ended(std::make_error_condition(std::errc::io_error));
					return;
				}

				const auto received = m_context.received_bytes.load(std::memory_order_relaxed) + bytes_read;
				m_context.received_bytes.store(received, std::memory_order_release);
				acknowledge(received);

				// some peers keep the connection open after the last byte
				if (received >= m_declared_size and not m_grace_scheduled)
					schedule_grace_close();

				do_read();
			}

			void transfer_engine::acknowledge(std::uintmax_t received){
				const auto writable = m_outbound_check(m_socket);
				if (not writable and not m_context.params.force_response){
					log::get()->trace("Outbound direction busy, skipping acknowledgement of {}", received);
					return;
				}

				const auto blocks = not writable;
				if (blocks){
					log::get()->debug("Acknowledging {} on a busy connection", received);
					m_context.raise_warning("Download may be stuck.", false);
					// the blocking send below must not be mistaken for a stall
					m_context.reset_window.store(true, std::memory_order_release);
				}

				const auto ack = encode_acknowledgement(received);
				auto ec = boost::system::error_code{};
				boost::asio::write(m_socket, boost::asio::buffer(ack), ec);

				if (blocks)
					m_context.clear_warning();
				if (ec)
					log::get()->debug("Failed to send acknowledgement: {}", ec.message());
			}

			void transfer_engine::schedule_grace_close(){
				m_grace_scheduled = true;
				m_grace_timer.expires_after(m_context.params.completion_grace);
				m_grace_timer.async_wait([this_engine = shared_from_this()]
					(const boost::system::error_code ec){
					if (not ec and not this_engine->m_closed){
						log::get()->debug("Peer kept the data connection open, closing it ourselves");
						this_engine->notify_ended(std::error_condition{});
					}
				});
			}

			void transfer_engine::notify_ended(std::error_condition reason){
				if (m_end_notified)
					return;
				m_end_notified = true;
				if (auto boss = m_employer.lock(); boss)
					boss->on_transfer_ended(reason);
			}

			void transfer_engine::close(){
				if (m_closed)
					return;
				m_closed = true;

				auto ec = boost::system::error_code{};
				m_grace_timer.cancel(ec);
				if (m_socket.is_open()){
					m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
					m_socket.close(ec);
					if (ec)
						log::get()->debug("Failed to close data connection. Reason: {}", ec.message());
				}
				if (m_sink)
					m_sink->close();
				m_context.connected.store(false, std::memory_order_release);
			}
		}
	}
}
