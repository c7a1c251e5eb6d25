#include "natkey.hpp"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string.hpp>

natural_key_type natural_key(const std::string& str) {
	auto left = str.begin(), mid = left, right = str.end();
	auto is_space = [] (char c) { return std::isspace(static_cast<unsigned char>(c)); };
	auto is_digit = [] (char c) { return std::isdigit(static_cast<unsigned char>(c)); };
	std::vector<natural_key_bit> keys;
	while(mid != right && is_space(*mid)) ++mid;
	while((left = mid) != right) {
		if(is_space(*mid)) {
			while(mid != right && is_space(*mid)) ++mid;
			keys.push_back(" ");
		} else if(is_digit(*mid)) {
			while(left != right && *left == '0') ++left, ++mid;
			while(mid != right && is_digit(*mid)) ++mid;
			if(left == mid)
				keys.push_back(boost::multiprecision::cpp_int(0));
			else
				keys.push_back(boost::multiprecision::cpp_int(std::string(left, mid)));
		} else {
			while(mid != right && !is_space(*mid) && !is_digit(*mid)) ++mid;
			keys.push_back(boost::algorithm::to_lower_copy(std::string(left, mid)));
		}
	}
	return std::pair{keys, str};
}

bool natural_less(const std::string& x, const std::string& y) {
	return natural_key(x) < natural_key(y);
}

void sort_for_display(std::vector<const entry*>& entries) {
	std::vector<std::pair<natural_key_type, const entry*>> keyed;
	keyed.reserve(entries.size());
	for(auto node : entries)
		keyed.emplace_back(natural_key(node->name), node);
	std::stable_sort(keyed.begin(), keyed.end(), [] (const auto& x, const auto& y) {
		if(x.second->is_directory() != y.second->is_directory())
			return x.second->is_directory();
		return x.first < y.first;
	});
	for(std::size_t i = 0; i < keyed.size(); ++i)
		entries[i] = keyed[i].second;
}
