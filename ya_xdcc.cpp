#include "ya_xdcc.hpp"
#include "detail/core.hpp"
#include "detail/logging.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>

#ifndef _WIN32
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace ya_xdcc {
	namespace {
		constexpr std::size_t fallback_width = 80u;

		// one line on stderr, redrawn in place
		class console_status{
			const std::size_t	m_width;
			bool				m_drawn = false;
		public:
			explicit console_status(std::size_t width) : m_width(width) {}

			void operator()(const receiver::task::progress& pg){
				if (pg.current_status == receiver::task::status::transferring) {
					spdlog::fmt_lib::print(stderr, "\r{:<{}}", pg.status_line, m_width > 0u ? m_width - 1u : 0u);
					std::fflush(stderr);
					m_drawn = true;
				}
				else if (m_drawn) {
					spdlog::fmt_lib::print(stderr, "\r{:<{}}\r", "", m_width > 0u ? m_width - 1u : 0u);
					std::fflush(stderr);
					m_drawn = false;
				}
			}
		};
	}

	std::size_t terminal_width(){
#ifndef _WIN32
		auto ws = ::winsize{};
		if (::ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 and ws.ws_col > 0)
			return ws.ws_col;
#endif
		if (const auto* columns = std::getenv("COLUMNS"); columns != nullptr) {
			const auto width = std::strtoul(columns, nullptr, 10);
			if (width > 0u)
				return width;
		}
		return fallback_width;
	}

	int run(const cli::invocation& inv, receiver::port_factory factory){
		if (inv.show_help) {
			spdlog::fmt_lib::print("{}", cli::usage());
			return EXIT_SUCCESS;
		}
		log::set_verbosity(inv.params.verbosity);

		auto params = inv.params;
		params.status_width = terminal_width();

		auto srv = receiver::server(std::move(factory));
		auto status_key = srv.install_progress_monitor(console_status{ params.status_width });

		// signals only, never busy
		auto signal_unit = core::detail::execution_unit{ core::detail::execution_unit::type::timers };
		auto signals = boost::asio::signal_set(signal_unit.context(), SIGINT, SIGTERM);
		signals.async_wait([&srv](const boost::system::error_code& ec, int signal_number){
			if (ec)
				return;
			log::get()->warn("Caught signal {}, disconnecting", signal_number);
			srv.interrupt();
		});
		signal_unit.start();

		auto exit_status = EXIT_FAILURE;
		if (inv.batch) {
			auto result = srv.fetch_batch(params, inv.ids);
			if (api::holds_alternative<std::error_condition>(result))
				log::get()->error("Batch refused: {}", api::get<std::error_condition>(result).message());
			else if (api::get<receiver::task::batch_result>(result).success)
				exit_status = EXIT_SUCCESS;
		}
		else {
			params.pack_id = inv.ids;
			if (srv.fetch(params).success)
				exit_status = EXIT_SUCCESS;
		}

		boost::asio::post(signal_unit.context(), [&signals](){
			auto ec = boost::system::error_code{};
			signals.cancel(ec);
		});
		signal_unit.stop();
		if (status_key)
			srv.remove_progress_monitor(status_key.value());
		return exit_status;
	}
}
