#include "receiver/server.hpp"

#include "receiver/detail/fetch_session.hpp"
#include "receiver/detail/batch.hpp"
#include "detail/core.hpp"
#include "detail/logging.hpp"
#include "detail/progress_notification.hpp"
#include <utility>
#include "boost/asio.hpp"

#include <future>

namespace ya_xdcc::receiver{
	session_port::~session_port() = default;
	session_port::listener::~listener() = default;

	class server::impl{
		port_factory							m_port_factory;
		core::detail::progress_notification		m_notifier;

		std::mutex								m_session_mutex;
		std::weak_ptr<detail::fetch_session>	m_active_session;
		bool									m_fetching = false;
		std::atomic<bool>						m_interrupted = false;

		static task::outcome refused(std::errc reason, std::string message){
			auto result = task::outcome{};
			result.reason = std::make_error_condition(reason);
			result.message = std::move(message);
			return result;
		}

		task::outcome run_session(const task::parameters& params){
			if (params.bot.empty() or params.pack_id.empty())
				return refused(std::errc::invalid_argument, "no bot or pack id given");
			if (m_interrupted.load())
				return refused(std::errc::interrupted, "interrupted");

			// declared first so it is stopped last, the network side drains into it
			auto timer_unit = core::detail::execution_unit{ core::detail::execution_unit::type::timers };
			auto net_unit = core::detail::execution_unit{ core::detail::execution_unit::type::network_io };

			auto port = m_port_factory(net_unit.context());
			if (port == nullptr)
				return refused(std::errc::not_connected, "failed to establish connection");

			auto finished = std::promise<task::outcome>{};
			auto outcome = finished.get_future();
			auto session = detail::fetch_session::create(net_unit.context(), timer_unit.context(),
				std::move(port), params, m_notifier, [&finished](task::outcome result){
					finished.set_value(std::move(result));
				});

			timer_unit.start();
			net_unit.start();
			boost::asio::post(net_unit.context(), [session](){
				session->start();
			});

			// published only once start is queued, interrupts are posted behind it
			{
				std::lock_guard session_lock(m_session_mutex);
				m_active_session = session;
			}
			// an interrupt that raced the registration above
			if (m_interrupted.load())
				session->interrupt();

			auto result = outcome.get();
			net_unit.stop();
			timer_unit.stop();

			{
				std::lock_guard session_lock(m_session_mutex);
				m_active_session.reset();
			}

			auto pg = task::progress{};
			pg.current_status = result.success ? task::status::complete : task::status::failed;
			pg.received_bytes = result.received_bytes;
			pg.total_bytes = result.total_bytes;
			pg.file_name = result.file_name;
			pg.status_line = result.message;
			m_notifier.post_progress(pg);
			return result;
		}

		bool begin(){
			std::lock_guard session_lock(m_session_mutex);
			if (m_fetching)
				return false;
			m_fetching = true;
			m_interrupted.store(false);
			return true;
		}

		void end(){
			std::lock_guard session_lock(m_session_mutex);
			m_fetching = false;
		}
	public:
		explicit impl(port_factory factory)
			: m_port_factory(std::move(factory)) {}

		~impl(){
			interrupt();
		}

		task::outcome fetch(const task::parameters& params){
			if (not begin())
				return refused(std::errc::operation_in_progress, "another download is running");
			auto result = run_session(params);
			end();
			return result;
		}

		api::variant<task::batch_result, std::error_condition>
			fetch_batch(const task::parameters& params, const std::string& id_spec){
			auto ranges = detail::parse_batch_spec(id_spec);
			if (api::holds_alternative<std::error_condition>(ranges)) {
				log::get()->error("Invalid pack id list: {}", id_spec);
				return api::get<std::error_condition>(ranges);
			}

			if (not begin())
				return std::make_error_condition(std::errc::operation_in_progress);
			auto result = detail::run_batch(params, api::get<std::vector<detail::id_range>>(ranges),
				[this](const task::parameters& session_params){
					return run_session(session_params);
				});
			end();
			return result;
		}

		void interrupt(){
			std::lock_guard session_lock(m_session_mutex);
			m_interrupted.store(true);
			if (auto session = m_active_session.lock(); session != nullptr)
				session->interrupt();
		}

		api::optional<std::uint32_t> install_progress_monitor(task::progress::listener lst){
			return m_notifier.add_listener(std::move(lst));
		}

		bool remove_progress_monitor(std::uint32_t key){
			return m_notifier.remove_listener(key);
		}
	};

	server::server(port_factory factory)
		: m_impl(std::make_unique<impl>(std::move(factory))){}

	server::~server() = default;

	task::outcome server::fetch(const task::parameters& params){
		return m_impl->fetch(params);
	}

	api::variant<task::batch_result, std::error_condition>
		server::fetch_batch(const task::parameters& params, const std::string& id_spec){
		return m_impl->fetch_batch(params, id_spec);
	}

	void server::interrupt(){
		m_impl->interrupt();
	}

	api::optional<std::uint32_t> server::install_progress_monitor(task::progress::listener lst){
		return m_impl->install_progress_monitor(std::move(lst));
	}

	bool server::remove_progress_monitor(std::uint32_t key){
		return m_impl->remove_progress_monitor(key);
	}
}
