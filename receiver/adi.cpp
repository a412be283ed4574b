#include "receiver/adi.hpp"

#include "boost/algorithm/string/split.hpp"
#include "boost/algorithm/string/trim.hpp"
#include "boost/algorithm/string/classification.hpp"

namespace ya_xdcc::receiver::task{
	sender_policy sender_policy::parse(const std::string& spec){
		auto policy = sender_policy{};
		policy.accept_target = false;

		auto entries = std::vector<std::string>{};
		boost::algorithm::split(entries, spec, boost::algorithm::is_any_of(","));
		for (auto& entry : entries){
			boost::algorithm::trim(entry);
			if (entry.empty())
				continue;
			if (entry == "target")
				policy.accept_target = true;
			else if (entry == "all")
				policy.accept_all = true;
			else if (entry == "server")
				policy.accept_server = true;
			else
				policy.names.emplace(entry);
		}

		if (not policy.accept_all and policy.names.empty())
			policy.accept_target = true;
		return policy;
	}

	sender_policy sender_policy::target_only(){
		return sender_policy{};
	}

	std::string parameters::request_text() const{
		return verb + " " + id_prefix + pack_id;
	}

	parameters::parameters() = default;
	parameters::parameters(const parameters&) = default;
	parameters::parameters(parameters&&) = default;
	parameters& parameters::operator=(const parameters&) = default;
	parameters& parameters::operator=(parameters&&) = default;
	parameters::~parameters() = default;
}
