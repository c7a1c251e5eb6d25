#pragma once

#include <iostream>
#include <fstream>
#include <filesystem>
#include <mutex>

struct time { };
extern struct time now;

std::ostream& operator <<(
	std::ostream& output,
	const struct time& _
);

// Tracing is on only when this file exists beforehand.
extern const std::filesystem::path trace_file;
extern std::mutex trace_mutex;

void tracef(std::ostream& out);

template<typename X, typename ...Xs>
void tracef(std::ostream& out, X&& x, Xs&& ...xs) {
	out << x << ' ';
	return tracef(out, xs...);
}

template<typename T>
decltype(auto) identity(T&& t) { return std::forward<T>(t); }

template<typename ...Xs>
decltype(auto) trace(Xs&& ...xs) {
	if(std::filesystem::exists(trace_file)) {
		const std::lock_guard<std::mutex> lock(trace_mutex);
		std::ofstream file(trace_file, std::ios::app);
		tracef(file, xs...);
	}
	return (identity(std::forward<Xs>(xs)), ...);
}
