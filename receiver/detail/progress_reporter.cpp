#include "receiver/detail/progress_reporter.hpp"
#include "detail/logging.hpp"

#include <algorithm>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			namespace {
				constexpr auto mebibyte = 1024.0 * 1024.0;
			}

			progress_reporter::progress_reporter(boost::asio::io_context& timer_io_ctx, session_context& ctx,
				core::detail::progress_notification& notifier, private_ctor_tag tag) :
				m_timer(timer_io_ctx), m_context(ctx), m_notifier(notifier) {}

			progress_reporter::~progress_reporter() = default;

			std::shared_ptr<progress_reporter>
				progress_reporter::create(boost::asio::io_context& timer_io_ctx, session_context& ctx,
					core::detail::progress_notification& notifier){
				return std::make_shared<progress_reporter>(timer_io_ctx, ctx, notifier, private_ctor_tag{});
			}

			std::string progress_reporter::render_bar(std::uintmax_t received, std::uintmax_t total){
				auto filled = std::size_t(0u);
				// a zero sized offer reads as 0%
				if (total > 0u){
					const auto ratio = std::min(static_cast<long double>(received) / total, 1.0L);
					filled = static_cast<std::size_t>(ratio * bar_width);
				}

				auto bar = std::string(filled, '=');
				if (filled < bar_width)
					bar.push_back('>');
				bar.resize(bar_width, ' ');
				return bar;
			}

			std::string progress_reporter::render_rate(std::uintmax_t delta_bytes, std::chrono::milliseconds tick){
				const auto seconds = std::max(tick.count(), std::chrono::milliseconds::rep(1)) / 1000.0;
				const auto rate = delta_bytes / seconds;
				if (rate >= mebibyte)
					return spdlog::fmt_lib::format("{:.2f} MiB/s", rate / mebibyte);
				if (rate >= 1024.0)
					return spdlog::fmt_lib::format("{:.2f} KiB/s", rate / 1024.0);
				return spdlog::fmt_lib::format("{:.0f} B/s", rate);
			}

			std::string progress_reporter::render_status_line(const status_snapshot& snapshot, std::size_t width){
				auto extra = snapshot.warning ?
					">> " + snapshot.warning.value() + " <<" :
					"'" + snapshot.file_name + "'";

				auto line = spdlog::fmt_lib::format("{:.2f}/{:.2f} [{}] {}",
					snapshot.received_bytes / mebibyte, snapshot.total_bytes / mebibyte,
					render_bar(snapshot.received_bytes, snapshot.total_bytes), extra);

				// throughput only when the surface is wide enough for all of it
				auto with_rate = line + " " + render_rate(snapshot.delta_bytes, snapshot.tick);
				if (with_rate.size() <= width)
					return with_rate;
				if (line.size() > width)
					line.resize(width);
				return line;
			}

			void progress_reporter::start(){
				auto expected = false;
				if (not m_started.compare_exchange_strong(expected, true))
					return;
				boost::asio::post(m_timer.get_executor(), [this_reporter = shared_from_this()](){
					this_reporter->m_checkpoint_bytes = this_reporter->m_context.received_bytes.load(std::memory_order_acquire);
					this_reporter->schedule_tick();
				});
			}

			void progress_reporter::stop(){
				m_stopped.store(true);
				boost::asio::post(m_timer.get_executor(), [this_reporter = shared_from_this()](){
					auto ec = boost::system::error_code{};
					this_reporter->m_timer.cancel(ec);
				});
			}

			void progress_reporter::schedule_tick(){
				m_timer.expires_after(std::max(m_context.params.poll_interval, std::chrono::milliseconds(1)));
				m_timer.async_wait([this_reporter = shared_from_this()](const boost::system::error_code ec){
					if (not ec)
						this_reporter->on_tick();
				});
			}

			void progress_reporter::on_tick(){
				if (m_stopped.load() or m_context.ended.load())
					return;

				if (m_context.connected.load(std::memory_order_acquire)){
					auto snapshot = status_snapshot{};
					snapshot.received_bytes = m_context.received_bytes.load(std::memory_order_acquire);
					snapshot.total_bytes = m_context.declared_size();
					snapshot.delta_bytes = snapshot.received_bytes - m_checkpoint_bytes;
					snapshot.tick = m_context.params.poll_interval;
					snapshot.file_name = m_context.offer->file_name;
					snapshot.warning = m_context.take_warning();
					m_checkpoint_bytes = snapshot.received_bytes;

					auto pg = task::progress{};
					pg.current_status = task::status::transferring;
					pg.received_bytes = snapshot.received_bytes;
					pg.total_bytes = snapshot.total_bytes;
					pg.file_name = snapshot.file_name;
					pg.status_line = render_status_line(snapshot, m_context.params.status_width);
					m_notifier.post_progress(pg);
				}
				schedule_tick();
			}
		}
	}
}
