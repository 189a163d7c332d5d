#include "cansched/can_backend.hpp"
#include "cansched/log.hpp"

#include <sys/socket.h>
#include <sys/ioctl.h>
#include <net/if.h>
#include <linux/can.h>
#include <linux/can/raw.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

namespace cansched {

namespace {

void to_can_frame(const CanFrame& cf, struct can_frame* fr) {
	if (cf.flags & CAN_FRAME_EXTID) fr->can_id = (cf.id & CAN_EFF_MASK) | CAN_EFF_FLAG;
	else                            fr->can_id = cf.id & CAN_SFF_MASK;
	if (cf.flags & CAN_FRAME_RTR) fr->can_id |= CAN_RTR_FLAG;
	fr->can_dlc = cf.dlc;
	std::memcpy(fr->data, cf.data, cf.dlc);
}

void from_can_frame(const struct can_frame& fr, CanFrame* cf) {
	*cf = CanFrame{};
	if (fr.can_id & CAN_EFF_FLAG) { cf->id = fr.can_id & CAN_EFF_MASK; cf->flags |= CAN_FRAME_EXTID; }
	else                          { cf->id = fr.can_id & CAN_SFF_MASK; }
	if (fr.can_id & CAN_RTR_FLAG) cf->flags |= CAN_FRAME_RTR;
	if (fr.can_id & CAN_ERR_FLAG) cf->flags |= CAN_FRAME_ERR;
	cf->dlc = fr.can_dlc > 8 ? 8 : (uint8_t)fr.can_dlc;
	std::memcpy(cf->data, fr.data, cf->dlc);
}

/**
* SocketCanBackend
* - raw 소켓 1개 (넌블로킹). 비트레이트는 `ip link set canX type can bitrate N`에서 설정.
* - rx 핸들러가 등록되면 poll 기반 수신 스레드를 띄운다.
*/
class SocketCanBackend : public CanBackend {
public:
	~SocketCanBackend() override { close(); }

	can_err_t probe() override {
		int fd = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
		if (fd < 0) return (errno == EACCES || errno == EPERM) ? CAN_ERR_PERMISSION : CAN_ERR_NODEV;
		::close(fd);
		return CAN_OK;
	}

	can_err_t open(const std::string& name, const CanConfig& cfg) override {
		if (fd_ >= 0) return CAN_ERR_STATE;
		int fd = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
		if (fd < 0) return CAN_ERR_IO;

		int fl = fcntl(fd, F_GETFL, 0);
		if (fl >= 0) fcntl(fd, F_SETFL, fl | O_NONBLOCK);

		struct ifreq ifr{};
		std::strncpy(ifr.ifr_name, name.c_str(), IFNAMSIZ - 1);
		if (ioctl(fd, SIOCGIFINDEX, &ifr) < 0) { ::close(fd); return CAN_ERR_NODEV; }

		// LOOPBACK 계열 모드에서만 자기 송신 프레임을 다시 받는다
		int own = (cfg.mode == CAN_MODE_LOOPBACK || cfg.mode == CAN_MODE_SILENT_LOOPBACK) ? 1 : 0;
		if (setsockopt(fd, SOL_CAN_RAW, CAN_RAW_RECV_OWN_MSGS, &own, sizeof(own)) < 0) {
			logln(LogLevel::Warn, "CAN", name + ": CAN_RAW_RECV_OWN_MSGS 설정 실패");
		}

		sockaddr_can addr{};
		addr.can_family  = AF_CAN;
		addr.can_ifindex = ifr.ifr_ifindex;
		if (bind(fd, (sockaddr*)&addr, sizeof(addr)) < 0) { ::close(fd); return CAN_ERR_IO; }

		fd_ = fd;
		ifname_ = name;
		return CAN_OK;
	}

	void close() override {
		stop_.store(true);
		if (rx_thread_.joinable()) rx_thread_.join();
		if (fd_ >= 0) ::close(fd_);
		fd_ = -1;
	}

	void set_rx_handler(rx_handler_t cb, void* user) override {
		{
			std::lock_guard<std::mutex> lk(cb_m_);
			on_rx_ = cb;
			on_rx_user_ = user;
		}
		if (cb && fd_ >= 0 && !rx_thread_.joinable()) {
			stop_.store(false);
			rx_thread_ = std::thread([this] { rx_loop_(); });
		}
	}

	can_err_t write(const CanFrame& cf, uint32_t timeout_ms) override {
		if (fd_ < 0) return CAN_ERR_STATE;
		if (cf.dlc > 8) return CAN_ERR_INVALID;
		struct can_frame fr{};
		to_can_frame(cf, &fr);

		ssize_t w = ::write(fd_, &fr, sizeof(fr));
		if (w == (ssize_t)sizeof(fr)) return CAN_OK;
		if (errno != EAGAIN && errno != EWOULDBLOCK && errno != ENOBUFS) {
			return (errno == ENETDOWN) ? CAN_ERR_BUSOFF : CAN_ERR_IO;
		}
		if (timeout_ms == 0) return CAN_ERR_AGAIN;

		// TX 큐 가득 → 한 번만 기다렸다 재시도
		pollfd pfd{}; pfd.fd = fd_; pfd.events = POLLOUT;
		if (::poll(&pfd, 1, (int)timeout_ms) <= 0) return CAN_ERR_TIMEOUT;
		w = ::write(fd_, &fr, sizeof(fr));
		return (w == (ssize_t)sizeof(fr)) ? CAN_OK : CAN_ERR_IO;
	}

	can_err_t read(CanFrame* out, uint32_t timeout_ms) override {
		if (!out) return CAN_ERR_INVALID;
		if (fd_ < 0) return CAN_ERR_STATE;

		pollfd pfd{}; pfd.fd = fd_; pfd.events = POLLIN;
		int r = ::poll(&pfd, 1, (int)timeout_ms);
		if (r < 0) return CAN_ERR_IO;
		if (r == 0) return timeout_ms == 0 ? CAN_ERR_AGAIN : CAN_ERR_TIMEOUT;

		struct can_frame fr{};
		ssize_t n = ::read(fd_, &fr, sizeof(fr));
		if (n == (ssize_t)sizeof(fr)) {
			from_can_frame(fr, out);
			return CAN_OK;
		}
		if (errno == EAGAIN || errno == EWOULDBLOCK) return CAN_ERR_AGAIN;
		return CAN_ERR_IO;
	}

	// bus-off 복구는 `ip link set canX type can restart-ms N`에 맡기므로 기본 status/recover 사용

private:
	void rx_loop_() {
		pollfd pfd{}; pfd.fd = fd_; pfd.events = POLLIN;
		while (!stop_.load()) {
			if (::poll(&pfd, 1, 50) <= 0) continue;
			struct can_frame fr{};
			ssize_t n = ::read(fd_, &fr, sizeof(fr));
			if (n == (ssize_t)sizeof(fr)) {
				CanFrame cf{};
				from_can_frame(fr, &cf);
				rx_handler_t cb;
				void* user;
				{
					std::lock_guard<std::mutex> lk(cb_m_);
					cb = on_rx_;
					user = on_rx_user_;
				}
				if (cb) cb(&cf, user);
			}
			else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
				logln(LogLevel::Warn, "CAN", ifname_ + " read 실패: " + std::strerror(errno));
			}
		}
	}

	int               fd_{ -1 };
	std::string       ifname_;
	std::thread       rx_thread_;
	std::atomic_bool  stop_{ false };

	std::mutex   cb_m_;
	rx_handler_t on_rx_{ nullptr };
	void*        on_rx_user_{ nullptr };
};

} // namespace

std::unique_ptr<CanBackend> create_socketcan_backend() {
	return std::unique_ptr<CanBackend>(new SocketCanBackend());
}

} // namespace cansched
