#include "fingerprint.hpp"

#include <ostream>
#include <random>
#include <vector>

#include <boost/endian/conversion.hpp>
#include <boost/functional/hash.hpp>

std::ostream& operator <<(std::ostream& out, const attribute_config& attrs) {
	const char* sep = "";
	auto flag = [&] (bool on, const char* name) {
		if(!on) return;
		out << sep << name;
		sep = "+";
	};
	flag(attrs.mode, "mode");
	flag(attrs.mod_time, "mtime");
	flag(attrs.size, "size");
	flag(attrs.path, "path");
	flag(attrs.name, "name");
	if(*sep == '\0') out << "none";
	return out;
}

std::uint64_t make_seed() {
	std::random_device device;
	std::uniform_int_distribution<std::uint64_t> dist;
	return dist(device);
}

fingerprint_t fingerprint(
	const leaf_metadata& meta,
	const attribute_config& attrs,
	std::uint64_t seed
) {
	std::vector<unsigned char> data;
	data.reserve(20 + meta.directory.size() + 1 + meta.name.size());
	unsigned char word[8];
	if(attrs.mode) {
		boost::endian::store_little_u32(word, meta.mode);
		data.insert(data.end(), word, word + 4);
	}
	if(attrs.mod_time) {
		boost::endian::store_little_u64(word, std::uint64_t(meta.mtime_ns));
		data.insert(data.end(), word, word + 8);
	}
	if(attrs.size) {
		boost::endian::store_little_u64(word, meta.size);
		data.insert(data.end(), word, word + 8);
	}
	if(attrs.path) {
		data.insert(data.end(), meta.directory.begin(), meta.directory.end());
		data.push_back('/');
	}
	if(attrs.name)
		data.insert(data.end(), meta.name.begin(), meta.name.end());
	std::size_t hash = seed;
	boost::hash_range(hash, data.begin(), data.end());
	return hash;
}
