#include "trace.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <thread>

struct time now;

const std::filesystem::path trace_file = "naivecmp.log";
std::mutex trace_mutex;

std::ostream& operator <<(std::ostream& output, const struct time& _) {
	auto stamp = std::chrono::system_clock::now();
	auto secs = std::chrono::system_clock::to_time_t(stamp);
	auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
		stamp.time_since_epoch()).count() % 1000000;
	std::tm local;
	localtime_r(&secs, &local);
	return output << std::put_time(&local, "%H:%M:%S")
		<< '.' << std::setw(6) << std::setfill('0') << micros
		<< std::setfill(' ') << " [" << std::this_thread::get_id() << ']';
}

void tracef(std::ostream& out) {
	out << std::endl;
}
