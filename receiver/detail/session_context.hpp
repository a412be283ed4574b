#pragma once
#ifndef YA_XDCC_RECEIVER_DETAIL_SESSION_CONTEXT_HPP_
#define	YA_XDCC_RECEIVER_DETAIL_SESSION_CONTEXT_HPP_

#include <utility>
#include "boost/asio.hpp"
#include "receiver/adi.hpp"

#include <atomic>
#include <mutex>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			// what the peer offered in its DCC SEND, immutable once parsed
			struct transfer_descriptor{
				std::string					file_name;
				boost::asio::ip::address_v4	address;
				std::uint16_t				port = 0u;
				std::uintmax_t				size = 0u;
			};

			// State of one session. The network thread is the only writer of the
			// counters; the watchdog and the reporter only read them, except for the
			// window reset and the warning which are published by the network thread
			// and consumed on the timer thread.
			struct session_context{
				const task::parameters					params;
				std::atomic<std::uintmax_t>				received_bytes = 0u;
				std::atomic<bool>						connected = false;
				std::atomic<bool>						ended = false;
				std::atomic<bool>						reset_window = false;
				// written before connected is raised and never changed afterwards
				api::optional<transfer_descriptor>		offer;
				api::fs::path							destination;
				std::chrono::system_clock::time_point	request_time;

				explicit session_context(task::parameters p);
				session_context(const session_context&) = delete;
				session_context(session_context&&) = delete;
				session_context& operator=(const session_context&) = delete;
				session_context& operator=(session_context&&) = delete;
				~session_context();

				std::uintmax_t declared_size() const;
				void raise_warning(std::string text, bool short_lived);
				void clear_warning();
				// short lived warnings are gone after the first read
				api::optional<std::string> take_warning();
			private:
				std::mutex								m_warning_mutex;
				std::string								m_warning;
				bool									m_short_warning = true;
			};
		}
	}
}

#endif
