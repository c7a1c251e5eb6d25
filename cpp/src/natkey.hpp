#pragma once

#include "entry.hpp"

#include <string>
#include <variant>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>

typedef std::variant<std::string, boost::multiprecision::cpp_int> natural_key_bit;
typedef std::pair<std::vector<natural_key_bit>, std::string> natural_key_type;

// Case-folded text runs and numeric runs, so "file2" sorts before "file10".
natural_key_type natural_key(const std::string& str);

bool natural_less(const std::string& x, const std::string& y);

// Directories first, each group in natural order of names.
void sort_for_display(std::vector<const entry*>& entries);
