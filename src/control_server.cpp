#include "cansched/control.hpp"
#include "cansched/log.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

namespace cansched {

static int mk_server(const std::string& path, mode_t mode) {
	int fd = socket(AF_UNIX, SOCK_STREAM, 0);
	if (fd < 0) return -1;
	sockaddr_un addr{}; addr.sun_family = AF_UNIX;
	std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
	unlink(path.c_str()); // 기존 파일 제거
	if (bind(fd, (sockaddr*)&addr, sizeof(addr)) < 0) { close(fd); return -1; }
	chmod(path.c_str(), mode);
	if (listen(fd, 8) < 0) { close(fd); return -1; }
	return fd;
}

// 길이만큼 모두 읽기/쓰기 (timeout_ms < 0: 무한)
static bool read_full(int fd, void* buf, size_t len, int timeout_ms) {
	size_t n = 0;
	while (n < len) {
		pollfd p{ fd, POLLIN, 0 };
		int r = poll(&p, 1, timeout_ms);
		if (r < 0 && errno == EINTR) continue;
		if (r <= 0) return false;
		ssize_t k = read(fd, (char*)buf + n, len - n);
		if (k < 0 && errno == EINTR) continue;
		if (k <= 0) return false;
		n += (size_t)k;
	}
	return true;
}

static bool write_full(int fd, const void* buf, size_t len) {
	size_t n = 0;
	while (n < len) {
		ssize_t k = send(fd, (const char*)buf + n, len - n, MSG_NOSIGNAL);
		if (k < 0 && errno == EINTR) continue;
		if (k <= 0) return false;
		n += (size_t)k;
	}
	return true;
}

static bool write_msg(int fd, const json& j) {
	std::string s = j.dump();
	uint32_t len = (uint32_t)s.size();
	return write_full(fd, &len, sizeof(len)) && write_full(fd, s.data(), s.size());
}

static constexpr uint32_t kMaxMsg = 1u << 20;

static std::unique_ptr<json> read_msg(int fd, int timeout_ms) {
	uint32_t len = 0;
	if (!read_full(fd, &len, sizeof(len), timeout_ms)) return nullptr;
	if (len > kMaxMsg) return nullptr;
	std::string buf; buf.resize(len);
	if (len && !read_full(fd, &buf[0], len, timeout_ms)) return nullptr;
	auto j = std::make_unique<json>(json::parse(buf, nullptr, false));
	if (j->is_discarded()) return nullptr;
	return j;
}

bool ControlServer::listen(const std::string& path, mode_t mode) {
	if (srv_fd_ >= 0) return true;
	srv_fd_ = mk_server(path, mode);
	if (srv_fd_ < 0) {
		logln(LogLevel::Error, "CTL", "listen " + path + " 실패: " + std::strerror(errno));
		return false;
	}
	path_ = path;
	logln(LogLevel::Info, "CTL", "listening " + path);
	return true;
}

bool ControlServer::start(Handler h) {
	if (srv_fd_ < 0 || running_.load() || !h) return false;
	handler_ = std::move(h);
	running_ = true;
	th_ = std::thread([this] { loop_(); });
	return true;
}

void ControlServer::stop() {
	running_ = false;
	if (th_.joinable()) th_.join();
	if (srv_fd_ >= 0) {
		close(srv_fd_);
		srv_fd_ = -1;
		unlink(path_.c_str());
	}
}

void ControlServer::loop_() {
	while (running_.load()) {
		pollfd p{ srv_fd_, POLLIN, 0 };
		int r = poll(&p, 1, 100);
		if (r <= 0) continue;
		int cli = accept(srv_fd_, nullptr, nullptr);
		if (cli < 0) continue;
		serve_(cli);
		close(cli);
	}
}

void ControlServer::serve_(int cli) {
	auto req = read_msg(cli, 1000);
	json rep;
	if (!req) {
		rep = { {"ok", false}, {"err", "BadRequest"} };
	}
	else {
		try {
			rep = handler_(*req);
		}
		catch (const std::exception& ex) {
			logln(LogLevel::Error, "CTL", std::string("handler 예외: ") + ex.what());
			rep = { {"ok", false}, {"err", "Internal"} };
		}
	}
	if (!write_msg(cli, rep)) logln(LogLevel::Warn, "CTL", "응답 전송 실패");
}

std::unique_ptr<json> ControlClient::request(const std::string& path, const json& req, int timeout_ms) {
	int fd = socket(AF_UNIX, SOCK_STREAM, 0);
	if (fd < 0) return nullptr;
	sockaddr_un addr{}; addr.sun_family = AF_UNIX;
	std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
	if (connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) { close(fd); return nullptr; }

	if (!write_msg(fd, req)) { close(fd); return nullptr; }
	auto rep = read_msg(fd, timeout_ms);
	close(fd);
	return rep;
}

} // namespace cansched
