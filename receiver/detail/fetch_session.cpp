#include "receiver/detail/fetch_session.hpp"
#include "receiver/detail/offer_parser.hpp"
#include "receiver/detail/output_sink.hpp"
#include "detail/logging.hpp"

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			namespace {
				std::string describe_failure(const std::error_condition& reason){
					if (reason == std::errc::timed_out)
						return "timed out";
					if (reason == std::errc::interrupted)
						return "interrupted";
					if (reason == std::errc::protocol_error or reason == std::errc::bad_message)
						return "protocol violation";
					if (reason == std::errc::connection_refused)
						return "failed to establish data connection";
					if (reason == std::errc::io_error or reason == std::errc::invalid_argument)
						return "cannot write destination";
					return reason.message();
				}
			}

			fetch_session::fetch_session(boost::asio::io_context& net_io_ctx,
				boost::asio::io_context& timer_io_ctx,
				std::unique_ptr<session_port> port,
				task::parameters params,
				core::detail::progress_notification& notifier,
				completion_handler on_finished,
				private_ctor_tag tag) :
				m_net_io_ctx(net_io_ctx), m_timer_io_ctx(timer_io_ctx),
				m_port(std::move(port)), m_context(std::move(params)),
				m_sequencer(*m_port, m_context.params, *this),
				m_notifier(notifier),
				m_engine(transfer_engine::create(m_net_io_ctx, m_context)),
				m_watchdog(timeout_watchdog::create(m_timer_io_ctx, m_context)),
				m_reporter(progress_reporter::create(m_timer_io_ctx, m_context, m_notifier)),
				m_linger_timer(m_net_io_ctx),
				m_on_finished(std::move(on_finished)) {}

			fetch_session::~fetch_session() = default;

			std::shared_ptr<fetch_session>
				fetch_session::create(boost::asio::io_context& net_io_ctx,
					boost::asio::io_context& timer_io_ctx,
					std::unique_ptr<session_port> port,
					task::parameters params,
					core::detail::progress_notification& notifier,
					completion_handler on_finished){
				return std::make_shared<fetch_session>(net_io_ctx, timer_io_ctx, std::move(port),
					std::move(params), notifier, std::move(on_finished), private_ctor_tag{});
			}

			const session_context& fetch_session::context() const{
				return m_context;
			}

			handshake_sequencer::state fetch_session::handshake_state() const{
				return m_sequencer.current_state();
			}

			void fetch_session::start(){
				m_engine->learn_employer(shared_from_this());
				m_watchdog->learn_employer(shared_from_this());
				m_port->open(shared_from_this());
			}

			void fetch_session::interrupt(){
				boost::asio::post(m_net_io_ctx, [this_session = shared_from_this()](){
					if (not this_session->m_torn_down)
						log::get()->warn("Interrupted");
					this_session->teardown(std::make_error_condition(std::errc::interrupted));
				});
			}

			void fetch_session::on_welcome(){
				if (m_torn_down)
					return;
				log::get()->info("Waiting for connection.");
				auto result = m_sequencer.handle({ handshake_sequencer::event_kind::welcome });
				if (result)
					log::get()->warn("Ignoring welcome: {}", result.message());
			}

			void fetch_session::on_join(const std::string& nick, const std::string& channel){
				if (m_torn_down)
					return;
				auto result = m_sequencer.handle({ handshake_sequencer::event_kind::joined, nick, channel });
				if (result)
					log::get()->trace("Join of {} to {} not expected: {}", nick, channel, result.message());
			}

			void fetch_session::on_ctcp(const api::optional<std::string>& source,
				const std::string& command, const std::string& payload){
				if (m_torn_down)
					return;

				if (command == "VERSION"){
					if (source)
						m_port->send_ctcp_reply(source.value(), "VERSION " + m_context.params.user_agent);
				}
				else if (command == offer::ctcp_command){
					on_offer(source, payload);
				}
				else if (offer::authorized(m_context.params.sender, source, m_context.params.bot)){
					log::get()->error("Unexpected CTCP {} from {}", command, source.value_or("server"));
					teardown(std::make_error_condition(std::errc::protocol_error));
				}
				else
					log::get()->debug("Ignoring CTCP {} from {}", command, source.value_or("server"));
			}

			void fetch_session::on_offer(const api::optional<std::string>& source, const std::string& payload){
				if (not offer::authorized(m_context.params.sender, source, m_context.params.bot)){
					log::get()->warn("Unknown DCC source: {} ({})", source.value_or("server"), payload);
					return;
				}
				if (m_context.offer){
					log::get()->warn("Ignoring a second DCC offer from {}", source.value_or("server"));
					return;
				}

				auto parsed = offer::parse(payload);
				if (api::holds_alternative<std::error_condition>(parsed)){
					auto reason = api::get<std::error_condition>(parsed);
					if (reason == std::errc::protocol_error)
						log::get()->error("Unexpected DCC command: {}", payload.substr(0, payload.find(' ')));
					else
						log::get()->error("Malformed DCC offer: {}", payload);
					teardown(reason);
					return;
				}

				// an offer ahead of the request counts as the answer to it
				if (auto refused = m_sequencer.handle({ handshake_sequencer::event_kind::offer_accepted }); refused){
					log::get()->warn("Ignoring DCC offer from {} during {}: {}", source.value_or("server"),
						handshake_sequencer::state_name(m_sequencer.current_state()), refused.message());
					return;
				}

				auto& descriptor = api::get<transfer_descriptor>(parsed);
				m_context.offer = descriptor;
				auto sink = output_sink::open(m_context.params.output, descriptor.file_name);
				if (api::holds_alternative<std::error_condition>(sink)){
					teardown(api::get<std::error_condition>(sink));
					return;
				}

				auto& the_sink = api::get<std::unique_ptr<output_sink>>(sink);
				m_context.destination = the_sink->path();
				m_engine->start(descriptor, std::move(the_sink));
			}

			void fetch_session::on_private_message(const api::optional<std::string>& source,
				const std::string& text){
				if (offer::authorized(m_context.params.sender, source, m_context.params.bot, true))
					log::get()->info("> {}", text);
			}

			void fetch_session::on_disconnect(){
				teardown(std::make_error_condition(std::errc::not_connected));
				finish();
			}

			void fetch_session::on_request_issued(){
				m_context.request_time = std::chrono::system_clock::now();
				m_watchdog->arm();
			}

			void fetch_session::on_transfer_connected(){
				log::get()->debug("Data connection established");
				m_reporter->start();
			}

			void fetch_session::on_transfer_ended(std::error_condition reason){
				teardown(reason);
			}

			void fetch_session::on_watchdog_expired(bool connected){
				boost::asio::post(m_net_io_ctx, [this_session = shared_from_this(), connected](){
					if (this_session->m_torn_down)
						return;
					if (connected)
						log::get()->error("Download timed out.");
					else
						log::get()->error("No data connection within {} ms", this_session->m_context.params.timeout.count());
					this_session->teardown(std::make_error_condition(std::errc::timed_out));
				});
			}

			task::outcome fetch_session::make_outcome() const{
				auto result = task::outcome{};
				result.received_bytes = m_context.received_bytes.load();
				if (m_context.offer){
					result.file_name = m_context.offer->file_name;
					result.total_bytes = m_context.offer->size;
					result.destination = m_context.destination;
				}
				result.success = m_context.offer and result.received_bytes == result.total_bytes;

				if (result.success){
					result.message = "Download complete.";
					return result;
				}

				result.reason = m_failure;
				if (not result.reason or result.reason == std::errc::not_connected)
					result.reason = m_context.offer ?
						std::make_error_condition(std::errc::connection_aborted) :
						std::make_error_condition(std::errc::not_connected);

				result.message = m_context.offer ?
					"failed to download: " + m_context.offer->file_name :
					std::string{ "failed to establish connection" };
				if (m_failure and m_failure != std::errc::not_connected)
					result.message += " (" + describe_failure(m_failure) + ")";
				return result;
			}

			void fetch_session::teardown(std::error_condition reason){
				if (m_torn_down)
					return;
				m_torn_down = true;
				m_failure = reason;

				m_context.ended.store(true);
				m_engine->close();
				m_watchdog->stop();
				m_reporter->stop();
				m_sequencer.handle({ handshake_sequencer::event_kind::finished });

				m_outcome = make_outcome();
				if (m_outcome->success)
					log::get()->info("{}", m_outcome->message);
				else
					log::get()->error("{}", m_outcome->message);

				m_linger_timer.expires_after(m_context.params.quit_linger);
				m_linger_timer.async_wait([this_session = shared_from_this()](const boost::system::error_code ec){
					if (not ec){
						log::get()->debug("Session port did not confirm the disconnect");
						this_session->finish();
					}
				});
				auto quit_message = m_context.params.disconnect_message;
				if (quit_message.empty() and m_failure and m_failure != std::errc::not_connected)
					quit_message = describe_failure(m_failure);
				m_port->quit(quit_message);
			}

			void fetch_session::finish(){
				if (m_finished)
					return;
				m_finished = true;

				auto ec = boost::system::error_code{};
				m_linger_timer.cancel(ec);
				if (m_on_finished)
					m_on_finished(m_outcome.value());
			}
		}
	}
}
