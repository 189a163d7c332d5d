#include "cansched/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace std::chrono;

namespace cansched {

static std::atomic<uint8_t> g_level{ static_cast<uint8_t>(LogLevel::Info) };
static std::mutex g_log_m;

static const char* level_name(LogLevel lv) {
	switch (lv) {
	case LogLevel::Debug: return "DEBUG";
	case LogLevel::Info:  return "INFO";
	case LogLevel::Warn:  return "WARN";
	case LogLevel::Error: return "ERROR";
	}
	return "?";
}

static std::string timestamp_ms() {
	auto t = system_clock::now();
	auto tt = system_clock::to_time_t(t);
	auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;
	std::tm tm{}; localtime_r(&tt, &tm);
	std::ostringstream os;
	os << std::put_time(&tm, "%F %T") << "."
		<< std::setw(3) << std::setfill('0') << ms.count();
	return os.str();
}

void set_log_level(LogLevel lv) { g_level.store(static_cast<uint8_t>(lv)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

bool parse_log_level(const std::string& s, LogLevel* out) {
	if (!out) return false;
	if (s == "debug")     *out = LogLevel::Debug;
	else if (s == "info") *out = LogLevel::Info;
	else if (s == "warn" || s == "warning") *out = LogLevel::Warn;
	else if (s == "error") *out = LogLevel::Error;
	else return false;
	return true;
}

void logln(LogLevel lv, const char* tag, const std::string& msg) {
	if (static_cast<uint8_t>(lv) < g_level.load()) return;
	const std::string ts = timestamp_ms();
	std::lock_guard<std::mutex> lk(g_log_m);
	std::cerr << "[" << ts << "][" << level_name(lv) << "][" << tag << "] " << msg << "\n";
}


bool LogSink::open(const std::string& path) {
	std::lock_guard<std::mutex> lk(mu_);
	if (f_.is_open()) f_.close();
	f_.open(path, std::ios::app);
	return (bool)f_;
}


bool LogSink::is_open() {
	std::lock_guard<std::mutex> lk(mu_);
	return f_.is_open();
}


void LogSink::write(const std::string& line) {
	std::lock_guard<std::mutex> lk(mu_);
	if (!f_.is_open()) return;
	auto now = system_clock::now();
	std::time_t tt = system_clock::to_time_t(now);
	std::tm tm{}; localtime_r(&tt, &tm);
	f_ << std::put_time(&tm, "%F %T") << " | " << line << "\n";
	f_.flush();
}


void LogSink::close() {
	std::lock_guard<std::mutex> lk(mu_);
	if (f_.is_open()) f_.close();
}

} // namespace cansched
