#include "receiver/detail/handshake_sequencer.hpp"
#include "detail/common.hpp"
#include "detail/logging.hpp"

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			handshake_sequencer::employer::~employer() = default;

			const std::array<handshake_sequencer::transition, 17> handshake_sequencer::m_transitions{{
				{ state::awaiting_welcome,				event_kind::welcome,		&handshake_sequencer::on_welcome },
				{ state::awaiting_welcome,				event_kind::joined,			&handshake_sequencer::on_unrelated_join },
				{ state::joining_premessage_channel,	event_kind::joined,			&handshake_sequencer::on_premessage_channel_joined },
				{ state::joining_required_channel,		event_kind::joined,			&handshake_sequencer::on_required_channel_joined },
				{ state::requesting,					event_kind::joined,			&handshake_sequencer::on_unrelated_join },
				{ state::transferring,					event_kind::joined,			&handshake_sequencer::on_unrelated_join },
				{ state::joining_premessage_channel,	event_kind::offer_accepted,	&handshake_sequencer::on_early_offer_accepted },
				{ state::sending_premessage,			event_kind::offer_accepted,	&handshake_sequencer::on_early_offer_accepted },
				{ state::joining_required_channel,		event_kind::offer_accepted,	&handshake_sequencer::on_early_offer_accepted },
				{ state::requesting,					event_kind::offer_accepted,	&handshake_sequencer::on_offer_accepted },
				{ state::awaiting_welcome,				event_kind::finished,		&handshake_sequencer::on_finished },
				{ state::joining_premessage_channel,	event_kind::finished,		&handshake_sequencer::on_finished },
				{ state::sending_premessage,			event_kind::finished,		&handshake_sequencer::on_finished },
				{ state::joining_required_channel,		event_kind::finished,		&handshake_sequencer::on_finished },
				{ state::requesting,					event_kind::finished,		&handshake_sequencer::on_finished },
				{ state::transferring,					event_kind::finished,		&handshake_sequencer::on_finished },
				{ state::done,							event_kind::finished,		&handshake_sequencer::on_finished }
			}};

			handshake_sequencer::handshake_sequencer(session_port& port, const task::parameters& params, employer& boss)
				: m_port(port), m_params(params), m_employer(boss) {}

			handshake_sequencer::~handshake_sequencer() = default;

			const char* handshake_sequencer::state_name(state s){
				switch (s) {
				case state::awaiting_welcome:			return "awaiting-welcome";
				case state::joining_premessage_channel:	return "joining-premessage-channel";
				case state::sending_premessage:			return "sending-premessage";
				case state::joining_required_channel:	return "joining-required-channel";
				case state::requesting:					return "requesting";
				case state::transferring:				return "transferring";
				case state::done:						return "done";
				}
				return "unknown";
			}

			std::error_condition handshake_sequencer::handle(const event& evt){
				if (evt.kind == event_kind::welcome and m_state != state::awaiting_welcome)
					return std::make_error_condition(std::errc::operation_in_progress);

				// somebody else joining a channel we are in
				if (evt.kind == event_kind::joined and fold_case(evt.nick) != fold_case(m_port.nickname()))
					return {};

				for (auto& t : m_transitions) {
					if (t.from == m_state and t.on == evt.kind) {
						const auto previous = m_state;
						m_state = (this->*t.handler)(evt);
						if (previous != m_state)
							log::get()->debug("Handshake {} -> {}", state_name(previous), state_name(m_state));
						return {};
					}
				}
				return std::make_error_condition(std::errc::operation_not_permitted);
			}

			handshake_sequencer::state handshake_sequencer::current_state() const{
				return m_state;
			}

			bool handshake_sequencer::is_member_of(const std::string& channel) const{
				return m_joined_channels.count(fold_case(channel)) > 0;
			}

			api::optional<std::chrono::system_clock::time_point> handshake_sequencer::request_time() const{
				return m_request_time;
			}

			handshake_sequencer::state handshake_sequencer::on_welcome(const event& evt){
				return advance();
			}

			handshake_sequencer::state handshake_sequencer::on_premessage_channel_joined(const event& evt){
				m_joined_channels.emplace(fold_case(evt.channel));
				if (fold_case(evt.channel) != fold_case(m_pending_channel))
					return m_state;
				m_pending_channel.clear();
				send_current_premessage();
				return advance();
			}

			handshake_sequencer::state handshake_sequencer::on_required_channel_joined(const event& evt){
				m_joined_channels.emplace(fold_case(evt.channel));
				if (fold_case(evt.channel) != fold_case(m_pending_channel))
					return m_state;
				m_pending_channel.clear();
				return advance();
			}

			handshake_sequencer::state handshake_sequencer::on_unrelated_join(const event& evt){
				m_joined_channels.emplace(fold_case(evt.channel));
				return m_state;
			}

			handshake_sequencer::state handshake_sequencer::on_offer_accepted(const event& evt){
				return state::transferring;
			}

			// the offer stands in for the request, pending joins no longer advance
			handshake_sequencer::state handshake_sequencer::on_early_offer_accepted(const event& evt){
				log::get()->info("Offer arrived before the pack request, not requesting {}", m_params.request_text());
				m_pending_channel.clear();
				m_request_time = std::chrono::system_clock::now();
				m_employer.on_request_issued();
				return state::transferring;
			}

			handshake_sequencer::state handshake_sequencer::on_finished(const event& evt){
				return state::done;
			}

			handshake_sequencer::state handshake_sequencer::send_current_premessage(){
				m_state = state::sending_premessage;
				auto& pm = m_params.pre_messages[m_next_premessage];
				log::get()->debug("Sending pre-message to {}", pm.target);
				m_port.send_private_message(pm.target, pm.text);
				m_next_premessage++;
				return m_state;
			}

			handshake_sequencer::state handshake_sequencer::advance(){
				while (m_next_premessage < m_params.pre_messages.size()) {
					auto& target = m_params.pre_messages[m_next_premessage].target;
					if (is_channel_name(target) and not is_member_of(target)) {
						m_pending_channel = target;
						m_port.join(target);
						return state::joining_premessage_channel;
					}
					send_current_premessage();
				}

				if (m_params.channel and not is_member_of(m_params.channel.value())) {
					m_pending_channel = m_params.channel.value();
					m_port.join(m_pending_channel);
					return state::joining_required_channel;
				}

				log::get()->info("Requesting {} from {}", m_params.request_text(), m_params.bot);
				m_port.send_private_message(m_params.bot, m_params.request_text());
				m_request_time = std::chrono::system_clock::now();
				m_state = state::requesting;
				m_employer.on_request_issued();
				return state::requesting;
			}
		}
	}
}
