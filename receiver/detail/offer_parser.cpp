#include "receiver/detail/offer_parser.hpp"

#include "boost/lexical_cast.hpp"
#include "boost/program_options/parsers.hpp"

#include <limits>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			namespace offer{
				namespace {
					template<typename UINT>
					api::optional<UINT> to_unsigned(const std::string& token){
						if (token.empty() or token.find_first_not_of("0123456789") != std::string::npos)
							return api::nullopt;
						auto value = std::uintmax_t(0u);
						if (not boost::conversion::try_lexical_convert(token, value) or
							value > std::numeric_limits<UINT>::max())
							return api::nullopt;
						return static_cast<UINT>(value);
					}
				}

				bool authorized(const task::sender_policy& policy,
					const api::optional<std::string>& source, const std::string& bot,
					bool always_accept_target){
					if (not source)
						return policy.accept_server;

					if (policy.accept_all)
						return true;
					if ((always_accept_target or policy.accept_target) and source.value() == bot)
						return true;
					return policy.names.count(source.value()) > 0;
				}

				api::optional<boost::asio::ip::address_v4> decode_address(const std::string& numeric){
					auto value = to_unsigned<std::uint32_t>(numeric);
					if (not value)
						return api::nullopt;
					// the decimal number is the address in network byte order
					return boost::asio::ip::make_address_v4(value.value());
				}

				api::variant<transfer_descriptor, std::error_condition>
					parse(const std::string& payload){
					auto tokens = std::vector<std::string>{};
					try{
						tokens = boost::program_options::split_unix(payload);
					}
					catch (const std::exception&){
						// unbalanced quotes
						return std::make_error_condition(std::errc::bad_message);
					}

					if (tokens.size() != 5u)
						return std::make_error_condition(std::errc::bad_message);
					if (tokens[0] != send_subcommand)
						return std::make_error_condition(std::errc::protocol_error);

					auto address = decode_address(tokens[2]);
					auto port = to_unsigned<std::uint16_t>(tokens[3]);
					auto size = to_unsigned<std::uintmax_t>(tokens[4]);
					if (not address or not port or not size)
						return std::make_error_condition(std::errc::bad_message);

					const auto base_name = api::fs::path(tokens[1]).filename();
					if (base_name.empty() or base_name == "." or base_name == "..")
						return std::make_error_condition(std::errc::bad_message);

					auto descriptor = transfer_descriptor{};
					descriptor.file_name = tokens[1];
					descriptor.address = address.value();
					descriptor.port = port.value();
					descriptor.size = size.value();
					return descriptor;
				}
			}
		}
	}
}
