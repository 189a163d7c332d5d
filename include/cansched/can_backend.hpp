#pragma once
#include <memory>
#include <string>

#include "cansched/can_api.hpp"

namespace cansched {

// 백엔드 → CanTransport 수신 통지
using rx_handler_t = void (*)(const CanFrame* frame, void* user);

/**
* CanBackend
* - CanTransport 아래 장치 계층. 백엔드 1개 = 채널 1개.
* - write()는 여러 워커 스레드에서 동시에 호출된다.
* - rx 핸들러는 백엔드 내부 락 없이 호출 (핸들러 안에서 다시 write 가능).
*/
class CanBackend {
public:
	virtual ~CanBackend() = default;

	virtual can_err_t probe() = 0;
	virtual can_err_t open(const std::string& name, const CanConfig& cfg) = 0;
	virtual void      close() = 0;
	virtual void      set_rx_handler(rx_handler_t cb, void* user) = 0;

	virtual can_err_t write(const CanFrame& fr, uint32_t timeout_ms) = 0;
	virtual can_err_t read(CanFrame* out, uint32_t timeout_ms) = 0;

	virtual can_bus_state_t status() { return CAN_BUS_STATE_ERROR_ACTIVE; }
	virtual can_err_t       recover() { return CAN_OK; }
};

// CAN_DEVICE_NONE 이나 모르는 장치는 nullptr
std::unique_ptr<CanBackend> create_backend(can_device_t device);
std::unique_ptr<CanBackend> create_socketcan_backend();

} // namespace cansched
