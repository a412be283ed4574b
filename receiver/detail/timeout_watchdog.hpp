#pragma once
#ifndef YA_XDCC_RECEIVER_DETAIL_TIMEOUT_WATCHDOG_HPP_
#define YA_XDCC_RECEIVER_DETAIL_TIMEOUT_WATCHDOG_HPP_

#include "receiver/detail/session_context.hpp"

#include <atomic>
#include <memory>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			// Aborts a session that never gets its data connection within the timeout,
			// or whose byte counter does not move for a whole timeout window. Lives on
			// the timer io_context and only reads the session counters.
			class timeout_watchdog :
				public std::enable_shared_from_this<timeout_watchdog> {
				struct private_ctor_tag {};
			public:
				enum class state : std::uint8_t {
					idle,
					armed,
					connected_polling,
					stopped
				};

				class employer {
				public:
					// called on the timer thread, connected tells which window expired
					virtual void on_watchdog_expired(bool connected) = 0;
					virtual ~employer();
				};

				timeout_watchdog(boost::asio::io_context& timer_io_ctx,
					session_context& ctx, private_ctor_tag tag);
				timeout_watchdog(const timeout_watchdog&) = delete;
				timeout_watchdog& operator=(const timeout_watchdog&) = delete;
				~timeout_watchdog();

				static std::shared_ptr<timeout_watchdog>
					create(boost::asio::io_context& timer_io_ctx, session_context& ctx);

				void learn_employer(std::weak_ptr<employer> boss);
				// thread safe, only the first call has an effect
				void arm();
				// thread safe, final
				void stop();
				state current_state() const;
			private:
				void on_armed_expired();
				void begin_window();
				void schedule_tick();
				void on_tick();
				void expire(bool connected);

				boost::asio::steady_timer			m_timer;
				session_context&					m_context;
				std::weak_ptr<employer>				m_employer;
				std::atomic<state>					m_state = state::idle;
				std::uintmax_t						m_window_baseline = 0u;
				std::uint64_t						m_ticks_left = 0u;
			};
		}
	}
}

#endif
