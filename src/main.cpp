#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>
#include <vector>

#include "cansched/control.hpp"
#include "cansched/log.hpp"
#include "cansched/scheduler.hpp"

using namespace cansched;

static std::atomic_bool g_stop{ false };

static void on_signal(int) { g_stop.store(true); }

static void usage(const char* argv0) {
	std::fprintf(stderr, "usage: %s <settings.json> <frames.json> <messages.json>\n", argv0);
}

int main(int argc, char** argv) {
	if (argc < 4) {
		usage(argv[0]);
		return 2;
	}
	std::signal(SIGINT, on_signal);
	std::signal(SIGTERM, on_signal);

	SchedulerConfig cfg = default_config();
	if (load_settings(argv[1], &cfg) != Err::Ok) return 1;
	set_log_level(cfg.log_level);

	Scheduler sched(cfg);
	if (sched.load_frame_db(argv[2]) != Err::Ok) return 1;
	if (sched.load_config(argv[3]) != Err::Ok) return 1;
	if (sched.connect() != Err::Ok) return 1;

	size_t sent = 0;
	std::vector<uint32_t> ids;
	if (sched.start_initial_messages(&sent) != Err::Ok || sched.start_periodic_messages(&ids) != Err::Ok) {
		sched.shutdown();
		return 1;
	}
	logln(LogLevel::Info, "MAIN", "initial " + std::to_string(sent) + ", periodic " + std::to_string(ids.size()));

	ControlServer ctl;
	if (!cfg.control_socket_path.empty()) {
		bool up = ctl.listen(cfg.control_socket_path) &&
			ctl.start([&sched](const nlohmann::json& req) { return handle_control_request(sched, req); });
		if (!up) {
			logln(LogLevel::Warn, "MAIN", "제어 소켓 없이 계속 진행");
		}
	}

	while (!g_stop.load()) {
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}

	logln(LogLevel::Info, "MAIN", "종료 신호 수신");
	ctl.stop();
	sched.shutdown();
	return 0;
}
