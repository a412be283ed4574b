#pragma once
#ifndef YA_XDCC_DETAIL_COMMON_HPP_
#define YA_XDCC_DETAIL_COMMON_HPP_

#include <memory>
#include <vector>
#include <string>
#include <cstdint>

#include "boost/algorithm/string/case_conv.hpp"

namespace ya_xdcc{
	using message_blob = std::shared_ptr<std::vector<std::uint8_t>>;

	template<typename... Args>
	inline auto make_message_blob(Args&&... args) -> decltype(std::make_shared<std::vector<std::uint8_t>>(std::forward<Args>(args)...)){
		return std::make_shared<std::vector<std::uint8_t>>(std::forward<Args>(args)...);
	}

	// IRC channel names start with one of these prefixes, everything else is a nick
	inline bool is_channel_name(const std::string& target){
		return not target.empty() and
			(target[0] == '#' or target[0] == '&' or target[0] == '+' or target[0] == '!');
	}

	inline std::string fold_case(const std::string& name){
		return boost::algorithm::to_lower_copy(name);
	}
}

#endif
