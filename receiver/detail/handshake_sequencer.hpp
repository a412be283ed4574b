#pragma once
#ifndef YA_XDCC_RECEIVER_DETAIL_HANDSHAKE_SEQUENCER_HPP_
#define YA_XDCC_RECEIVER_DETAIL_HANDSHAKE_SEQUENCER_HPP_

#include "receiver/adi.hpp"
#include "receiver/session_port.hpp"

#include <array>
#include <set>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			// Pre-messages (joining their channels first), the required channel, then the
			// pack request. Advances once per relevant inbound event, see the transition
			// table in handshake_sequencer.cpp.
			class handshake_sequencer{
			public:
				enum class state : std::uint8_t {
					awaiting_welcome,
					joining_premessage_channel,
					sending_premessage,
					joining_required_channel,
					requesting,
					transferring,
					done
				};

				enum class event_kind : std::uint8_t {
					welcome,
					joined,
					offer_accepted,
					finished
				};

				struct event{
					event_kind		kind;
					std::string		nick;
					std::string		channel;
				};

				class employer{
				public:
					virtual void on_request_issued() = 0;
					virtual ~employer();
				};

				handshake_sequencer(session_port& port, const task::parameters& params, employer& boss);
				handshake_sequencer(const handshake_sequencer&) = delete;
				handshake_sequencer& operator=(const handshake_sequencer&) = delete;
				~handshake_sequencer();

				// operation_in_progress for a second welcome while a request is active,
				// operation_not_permitted for an event the current state has no transition for
				std::error_condition handle(const event& evt);

				state current_state() const;
				bool is_member_of(const std::string& channel) const;
				api::optional<std::chrono::system_clock::time_point> request_time() const;
				static const char* state_name(state s);
			private:
				using transition_handler = state (handshake_sequencer::*)(const event&);
				struct transition{
					state				from;
					event_kind			on;
					transition_handler	handler;
				};

				state on_welcome(const event& evt);
				state on_premessage_channel_joined(const event& evt);
				state on_required_channel_joined(const event& evt);
				state on_unrelated_join(const event& evt);
				state on_offer_accepted(const event& evt);
				state on_early_offer_accepted(const event& evt);
				state on_finished(const event& evt);

				state advance();
				state send_current_premessage();

				static const std::array<transition, 17>		m_transitions;

				session_port&						m_port;
				const task::parameters&				m_params;
				employer&							m_employer;
				state								m_state = state::awaiting_welcome;
				std::size_t							m_next_premessage = 0u;
				std::string							m_pending_channel;
				std::set<std::string>				m_joined_channels;
				api::optional<std::chrono::system_clock::time_point>	m_request_time;
			};
		}
	}
}

#endif
