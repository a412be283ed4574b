#include "receiver/detail/timeout_watchdog.hpp"
#include "detail/logging.hpp"

#include <algorithm>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			timeout_watchdog::employer::~employer() = default;

			timeout_watchdog::timeout_watchdog(boost::asio::io_context& timer_io_ctx,
				session_context& ctx, private_ctor_tag tag) :
				m_timer(timer_io_ctx), m_context(ctx) {}

			timeout_watchdog::~timeout_watchdog() = default;

			std::shared_ptr<timeout_watchdog>
				timeout_watchdog::create(boost::asio::io_context& timer_io_ctx, session_context& ctx){
				return std::make_shared<timeout_watchdog>(timer_io_ctx, ctx, private_ctor_tag{});
			}

			void timeout_watchdog::learn_employer(std::weak_ptr<employer> boss){
				m_employer = std::move(boss);
			}

			timeout_watchdog::state timeout_watchdog::current_state() const{
				return m_state.load();
			}

			void timeout_watchdog::arm(){
				auto expected = state::idle;
				if (not m_state.compare_exchange_strong(expected, state::armed))
					return;

				boost::asio::post(m_timer.get_executor(), [this_dog = shared_from_this()](){
					if (this_dog->m_state.load() != state::armed)
						return;
					this_dog->m_timer.expires_after(this_dog->m_context.params.timeout);
					this_dog->m_timer.async_wait([this_dog](const boost::system::error_code ec){
						if (not ec)
							this_dog->on_armed_expired();
					});
				});
			}

			void timeout_watchdog::stop(){
				m_state.store(state::stopped);
				boost::asio::post(m_timer.get_executor(), [this_dog = shared_from_this()](){
					auto ec = boost::system::error_code{};
					this_dog->m_timer.cancel(ec);
				});
			}

			void timeout_watchdog::on_armed_expired(){
				if (m_state.load() != state::armed or m_context.ended.load()){
					m_state.store(state::stopped);
					return;
				}
				if (not m_context.connected.load(std::memory_order_acquire)){
					expire(false);
					return;
				}

				auto expected = state::armed;
				if (m_state.compare_exchange_strong(expected, state::connected_polling))
					begin_window();
			}

			void timeout_watchdog::begin_window(){
				const auto tick = std::max(m_context.params.poll_interval, std::chrono::milliseconds(1));
				m_ticks_left = std::max<std::uint64_t>(m_context.params.timeout / tick, 1u);
				m_window_baseline = m_context.received_bytes.load(std::memory_order_acquire);
				schedule_tick();
			}

			void timeout_watchdog::schedule_tick(){
				m_timer.expires_after(std::max(m_context.params.poll_interval, std::chrono::milliseconds(1)));
				m_timer.async_wait([this_dog = shared_from_this()](const boost::system::error_code ec){
					if (not ec)
						this_dog->on_tick();
				});
			}

			void timeout_watchdog::on_tick(){
				if (m_state.load() != state::connected_polling)
					return;
				if (m_context.ended.load()){
					m_state.store(state::stopped);
					return;
				}
				// a forced acknowledgement is about to block, start over
				if (m_context.reset_window.exchange(false, std::memory_order_acq_rel)){
					log::get()->trace("Watchdog window reset early");
					begin_window();
					return;
				}
				if (--m_ticks_left > 0u){
					schedule_tick();
					return;
				}

				const auto received = m_context.received_bytes.load(std::memory_order_acquire);
				const auto declared = m_context.declared_size();
				// completion wins over a stall
				if (received >= declared){
					m_state.store(state::stopped);
					return;
				}
				if (received == m_window_baseline){
					expire(true);
					return;
				}
				begin_window();
			}

			void timeout_watchdog::expire(bool connected){
				m_state.store(state::stopped);
				if (auto boss = m_employer.lock(); boss)
					boss->on_watchdog_expired(connected);
			}
		}
	}
}
