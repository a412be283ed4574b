#include "receiver/detail/batch.hpp"
#include "detail/logging.hpp"

#include "boost/algorithm/string/split.hpp"
#include "boost/algorithm/string/trim.hpp"
#include "boost/algorithm/string/classification.hpp"
#include "boost/lexical_cast.hpp"

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			namespace {
				api::optional<std::uint64_t> to_id(const std::string& token){
					if (token.empty() or token.find_first_not_of("0123456789") != std::string::npos)
						return api::nullopt;
					auto value = std::uint64_t(0u);
					if (not boost::conversion::try_lexical_convert(token, value))
						return api::nullopt;
					return value;
				}
			}

			api::variant<std::vector<id_range>, std::error_condition>
				parse_batch_spec(const std::string& spec){
				auto tokens = std::vector<std::string>{};
				boost::algorithm::split(tokens, spec, boost::algorithm::is_any_of(","));

				auto ranges = std::vector<id_range>{};
				for (auto& token : tokens) {
					boost::algorithm::trim(token);
					const auto dash = token.find('-');
					if (dash == std::string::npos) {
						auto id = to_id(token);
						if (not id)
							return std::make_error_condition(std::errc::invalid_argument);
						ranges.push_back({ id.value(), id.value() });
						continue;
					}

					auto first = to_id(boost::algorithm::trim_copy(token.substr(0, dash)));
					auto last = to_id(boost::algorithm::trim_copy(token.substr(dash + 1)));
					if (not first or not last or first.value() > last.value())
						return std::make_error_condition(std::errc::invalid_argument);
					ranges.push_back({ first.value(), last.value() });
				}
				return ranges;
			}

			api::variant<task::batch_result, std::error_condition>
				run_batch(const task::parameters& params, const std::vector<id_range>& ranges,
					const fetch_function& fetch){
				auto ec = api::error_code{};
				if (params.output == task::stdout_marker or not api::fs::is_directory(params.output, ec)) {
					log::get()->error("Batch mode needs an existing output directory, got '{}'", params.output);
					return std::make_error_condition(std::errc::not_a_directory);
				}

				auto result = task::batch_result{};
				for (auto& range : ranges) {
					// last may be the largest id, so the loop ends on equality
					for (auto id = range.first; ; ++id) {
						auto session_params = params;
						session_params.pack_id = std::to_string(id);
						log::get()->debug("Batch item {}", session_params.request_text());

						auto outcome = fetch(session_params);
						const auto succeeded = outcome.success;
						result.sessions.emplace_back(id, std::move(outcome));
						if (not succeeded) {
							result.success = false;
							log::get()->error("Batch stopped at {}{}", params.id_prefix, id);
							return result;
						}
						if (id == range.last)
							break;
					}
				}
				return result;
			}
		}
	}
}
