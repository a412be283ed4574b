#pragma once
#ifndef YA_XDCC_RECEIVER_DETAIL_PROGRESS_REPORTER_HPP_
#define YA_XDCC_RECEIVER_DETAIL_PROGRESS_REPORTER_HPP_

#include "receiver/detail/session_context.hpp"
#include "detail/progress_notification.hpp"

#include <atomic>
#include <memory>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			struct status_snapshot{
				std::uintmax_t				received_bytes = 0u;
				std::uintmax_t				total_bytes = 0u;
				// bytes received since the previous tick and the tick length
				std::uintmax_t				delta_bytes = 0u;
				std::chrono::milliseconds	tick = std::chrono::seconds(1);
				std::string					file_name;
				api::optional<std::string>	warning;
			};

			// Once per tick, while the data connection is open, renders the status line
			// and hands it to the progress listeners. Lives on the timer io_context.
			class progress_reporter :
				public std::enable_shared_from_this<progress_reporter> {
				struct private_ctor_tag {};
			public:
				static constexpr std::size_t bar_width = 30u;

				progress_reporter(boost::asio::io_context& timer_io_ctx, session_context& ctx,
					core::detail::progress_notification& notifier, private_ctor_tag tag);
				progress_reporter(const progress_reporter&) = delete;
				progress_reporter& operator=(const progress_reporter&) = delete;
				~progress_reporter();

				static std::shared_ptr<progress_reporter>
					create(boost::asio::io_context& timer_io_ctx, session_context& ctx,
						core::detail::progress_notification& notifier);

				void start();
				void stop();

				[[nodiscard]] static std::string render_status_line(const status_snapshot& snapshot, std::size_t width);
				[[nodiscard]] static std::string render_bar(std::uintmax_t received, std::uintmax_t total);
				[[nodiscard]] static std::string render_rate(std::uintmax_t delta_bytes, std::chrono::milliseconds tick);
			private:
				void schedule_tick();
				void on_tick();

				boost::asio::steady_timer				m_timer;
				session_context&						m_context;
				core::detail::progress_notification&	m_notifier;
				std::uintmax_t							m_checkpoint_bytes = 0u;
				std::atomic<bool>						m_started = false;
				std::atomic<bool>						m_stopped = false;
			};
		}
	}
}

#endif
