#pragma once
#ifndef YA_XDCC_RECEIVER_DETAIL_FETCH_SESSION_HPP_
#define YA_XDCC_RECEIVER_DETAIL_FETCH_SESSION_HPP_

#include "receiver/adi.hpp"
#include "receiver/session_port.hpp"
#include "receiver/detail/session_context.hpp"
#include "receiver/detail/handshake_sequencer.hpp"
#include "receiver/detail/transfer_engine.hpp"
#include "receiver/detail/timeout_watchdog.hpp"
#include "receiver/detail/progress_reporter.hpp"
#include "detail/progress_notification.hpp"

#include <memory>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			// One request from welcome to disconnect. Everything but the watchdog and the
			// reporter runs on the network io_context; all fatal paths go through
			// teardown(), which runs at most once.
			class fetch_session :
				public std::enable_shared_from_this<fetch_session>,
				public session_port::listener,
				public handshake_sequencer::employer,
				public transfer_engine::employer,
				public timeout_watchdog::employer {
				struct private_ctor_tag{};
			public:
				using completion_handler = std::function<void (task::outcome)>;

				fetch_session(boost::asio::io_context& net_io_ctx,
					boost::asio::io_context& timer_io_ctx,
					std::unique_ptr<session_port> port,
					task::parameters params,
					core::detail::progress_notification& notifier,
					completion_handler on_finished,
					private_ctor_tag tag);
				fetch_session(const fetch_session&) = delete;
				fetch_session& operator=(const fetch_session&) = delete;
				~fetch_session();

				static std::shared_ptr<fetch_session>
					create(boost::asio::io_context& net_io_ctx,
						boost::asio::io_context& timer_io_ctx,
						std::unique_ptr<session_port> port,
						task::parameters params,
						core::detail::progress_notification& notifier,
						completion_handler on_finished);

				void start();
				// thread safe, runs the regular teardown with an interrupted outcome
				void interrupt();

				void on_welcome() override;
				void on_join(const std::string& nick, const std::string& channel) override;
				void on_ctcp(const api::optional<std::string>& source,
					const std::string& command, const std::string& payload) override;
				void on_private_message(const api::optional<std::string>& source,
					const std::string& text) override;
				void on_disconnect() override;

				void on_request_issued() override;
				void on_transfer_connected() override;
				void on_transfer_ended(std::error_condition reason) override;
				void on_watchdog_expired(bool connected) override;

				const session_context& context() const;
				handshake_sequencer::state handshake_state() const;
			private:
				void on_offer(const api::optional<std::string>& source, const std::string& payload);
				void teardown(std::error_condition reason);
				void finish();
				task::outcome make_outcome() const;

				boost::asio::io_context&				m_net_io_ctx;
				boost::asio::io_context&				m_timer_io_ctx;
				std::unique_ptr<session_port>			m_port;
				session_context							m_context;
				handshake_sequencer						m_sequencer;
				core::detail::progress_notification&	m_notifier;
				std::shared_ptr<transfer_engine>		m_engine;
				std::shared_ptr<timeout_watchdog>		m_watchdog;
				std::shared_ptr<progress_reporter>		m_reporter;
				boost::asio::steady_timer				m_linger_timer;
				completion_handler						m_on_finished;
				std::error_condition					m_failure;
				api::optional<task::outcome>			m_outcome;
				bool									m_torn_down = false;
				bool									m_finished = false;
			};
		}
	}
}

#endif
