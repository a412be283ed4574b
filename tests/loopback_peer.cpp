#include "loopback_peer.hpp"

#include "boost/endian/conversion.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <random>

namespace ya_xdcc{
	namespace testing{
		loopback_peer::loopback_peer(std::vector<std::uint8_t> payload, std::size_t send_limit, std::size_t chunk_size)
			: m_acceptor(m_ctx, boost::asio::ip::tcp::endpoint{ boost::asio::ip::address_v4::loopback(), 0 }),
			m_payload(std::move(payload)), m_send_limit(std::min(send_limit, m_payload.size())),
			m_chunk_size(chunk_size) {
			m_port = m_acceptor.local_endpoint().port();
			m_acceptor.async_accept([this](const boost::system::error_code ec, boost::asio::ip::tcp::socket socket){
				if (ec)
					return;
				{
					std::lock_guard peer_lock(m_mutex);
					m_connected = true;
				}
				serve(socket);
			});
			m_thread = std::thread{ [this](){ m_ctx.run(); } };
		}

		loopback_peer::~loopback_peer(){
			boost::asio::post(m_ctx, [this](){
				auto ec = boost::system::error_code{};
				m_acceptor.close(ec);
			});
			join();
		}

		void loopback_peer::serve(boost::asio::ip::tcp::socket& socket){
			auto ec = boost::system::error_code{};
			auto sent = std::size_t(0u);
			while (sent < m_send_limit and not ec) {
				const auto length = std::min(m_chunk_size, m_send_limit - sent);
				boost::asio::write(socket, boost::asio::buffer(m_payload.data() + sent, length), ec);
				sent += length;
			}

			// every acknowledgement is 4 bytes, collect them until the receiver leaves
			auto raw = std::array<std::uint8_t, 4>{};
			while (not ec) {
				boost::asio::read(socket, boost::asio::buffer(raw), ec);
				if (ec)
					break;
				const auto ack = boost::endian::load_big_u32(raw.data());
				std::lock_guard peer_lock(m_mutex);
				m_acks.push_back(ack);
				if (m_send_limit == m_payload.size() and ack == static_cast<std::uint32_t>(m_payload.size()))
					break;
			}
			socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
			socket.close(ec);
		}

		std::uint16_t loopback_peer::port() const{
			return m_port;
		}

		std::string loopback_peer::offer(const std::string& file_name) const{
			return "SEND \"" + file_name + "\" " + loopback_numeric + " " +
				std::to_string(port()) + " " + std::to_string(m_payload.size());
		}

		std::vector<std::uint32_t> loopback_peer::acknowledgements() const{
			std::lock_guard peer_lock(m_mutex);
			return m_acks;
		}

		bool loopback_peer::was_connected() const{
			std::lock_guard peer_lock(m_mutex);
			return m_connected;
		}

		void loopback_peer::join(){
			if (m_thread.joinable())
				m_thread.join();
		}

		std::vector<std::uint8_t> make_payload(std::size_t size){
			auto payload = std::vector<std::uint8_t>(size);
			auto engine = std::mt19937{ 20240229u };
			std::generate(payload.begin(), payload.end(), [&engine](){
				return static_cast<std::uint8_t>(engine() & 0xffu);
			});
			return payload;
		}

		temp_directory::temp_directory(){
			auto rd = std::random_device{};
			m_path = api::fs::temp_directory_path() / ("ya_xdcc_test_" + std::to_string(rd()) + std::to_string(rd()));
			api::fs::create_directories(m_path);
		}

		temp_directory::~temp_directory(){
			auto ec = api::error_code{};
			api::fs::remove_all(m_path, ec);
		}

		const api::fs::path& temp_directory::path() const{
			return m_path;
		}

		std::vector<std::uint8_t> read_file(const api::fs::path& fp){
			auto in = std::ifstream{ fp, std::ios_base::binary };
			return std::vector<std::uint8_t>{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
		}
	}
}
