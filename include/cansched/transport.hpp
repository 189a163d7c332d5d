#pragma once
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "cansched/can_backend.hpp"
#include "cansched/common.hpp"

namespace cansched {

class DebugBus;

/**
* CanTransport
* - 백엔드(SocketCAN / DebugBus) 위의 단일 채널 송수신 객체.
* - 전역 상태 없음: 소유자가 명시적으로 생성/해제 (init → open → ... → dispose).
* - send()는 여러 워커 스레드에서 동시에 호출해도 안전.
* - 수신 프레임은 subscribe()한 콜백으로 분배 (필터 RANGE/MASK/LIST).
*/
class CanTransport {
public:
	CanTransport() = default;
	~CanTransport() { dispose(); }
	CanTransport(const CanTransport&) = delete;
	CanTransport& operator=(const CanTransport&) = delete;

	can_err_t init(can_device_t device);                        ///< 백엔드 생성 + probe
	can_err_t open(const std::string& name, const CanConfig& cfg); ///< 채널 오픈 (예: can0)
	can_err_t close();                                          ///< 채널 닫기 (백엔드 유지)
	void      dispose();                                        ///< 채널 + 백엔드 해제, 중복 호출 허용

	bool is_open() const;
	const std::string& name() const { return name_; }

	can_err_t send(const CanFrame& f, uint32_t timeout_ms = 0);
	can_err_t send(uint32_t id, const bytes& data, uint32_t flags = 0, uint32_t timeout_ms = 0);
	can_err_t recv(CanFrame* out, uint32_t timeout_ms);

	int       subscribe(const CanFilter& filter, can_callback_t cb, void* user); ///< >0: 구독 ID
	can_err_t unsubscribe(int sub_id);

	can_bus_state_t status();
	can_err_t       recover();

	DebugBus* debug_bus();   ///< CAN_DEVICE_DEBUG일 때만, dispose 전까지 유효

private:
	struct Sub {
		int                   id;
		CanFilter             filter;
		std::vector<uint32_t> list;   ///< CAN_FILTER_LIST 복사본
		can_callback_t        cb;
		void*                 user;
	};

	static void on_rx_(const CanFrame* f, void* user);
	static bool filter_match_(const Sub& s, uint32_t id);
	void close_locked_();

	mutable std::shared_mutex   m_;   ///< backend_/open_ 수명 (send는 shared, open/close는 unique)
	std::unique_ptr<CanBackend> backend_;
	bool                        open_ = false;
	std::string                 name_;
	CanConfig                   cfg_{};

	std::mutex       sub_m_;
	std::vector<Sub> subs_;
	int              next_sub_id_ = 0;
};

} // namespace cansched
