#pragma once
#ifndef YA_XDCC_RECEIVER_DETAIL_BATCH_HPP_
#define YA_XDCC_RECEIVER_DETAIL_BATCH_HPP_

#include "receiver/adi.hpp"

#include <functional>
#include <vector>

namespace ya_xdcc{
	namespace receiver{
		namespace detail{
			using fetch_function = std::function<task::outcome (const task::parameters&)>;

			// inclusive, a single id has first == last
			struct id_range{
				std::uint64_t	first;
				std::uint64_t	last;
			};

			// "3,5-7,10" -> [3,3] [5,7] [10,10], token order is kept as written
			[[nodiscard]] api::variant<std::vector<id_range>, std::error_condition>
				parse_batch_spec(const std::string& spec);

			// Sessions run one after another with params.pack_id set to each id and the
			// first failure ends the batch. Ranges are walked, never materialized.
			// not_a_directory when params.output is not an existing directory.
			[[nodiscard]] api::variant<task::batch_result, std::error_condition>
				run_batch(const task::parameters& params, const std::vector<id_range>& ranges,
					const fetch_function& fetch);
		}
	}
}

#endif
