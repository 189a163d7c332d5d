#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "cansched/can_backend.hpp"

namespace cansched {

/**
* DebugBus
* - CAN_DEVICE_DEBUG 백엔드. 실제 버스 없이 스케줄러를 돌려보기 위한 메모리 버스.
* - 송신 프레임은 기록(written)되고, recv 큐에 들어가고, rx 핸들러로 바로 되돌아온다.
* - 송신 실패/지연을 주입할 수 있다: listen-only 모드(SILENT*)는 항상 CAN_ERR_STATE.
*/
class DebugBus : public CanBackend {
public:
	static constexpr size_t kKeep = 4096;   ///< 기록/수신 큐 상한 (오래된 것부터 버림)

	can_err_t probe() override { return CAN_OK; }
	can_err_t open(const std::string& name, const CanConfig& cfg) override;
	void      close() override;
	void      set_rx_handler(rx_handler_t cb, void* user) override;

	can_err_t write(const CanFrame& fr, uint32_t timeout_ms) override;
	can_err_t read(CanFrame* out, uint32_t timeout_ms) override;

	/**
	* @brief 다음 count번의 write를 err로 실패시킨다
	* @param count 음수면 clear_faults()까지 계속
	*/
	void fail_writes(can_err_t err, int count = -1);
	void clear_faults();
	void set_write_delay(std::chrono::microseconds d);   ///< write마다 지연 (느린 컨트롤러 흉내)

	std::vector<CanFrame> written() const;
	size_t                written_count(uint32_t id) const;
	uint64_t              rejected() const;

private:
	mutable std::mutex      m_;
	std::condition_variable rx_cv_;
	std::string             name_;
	CanConfig               cfg_{};
	bool                    open_ = false;

	std::deque<CanFrame> rxq_;
	std::deque<CanFrame> written_;
	uint64_t             rejected_ = 0;

	can_err_t                 fault_ = CAN_OK;
	int                       fault_left_ = 0;
	std::chrono::microseconds delay_{ 0 };

	std::mutex   cb_m_;
	rx_handler_t on_rx_ = nullptr;
	void*        on_rx_user_ = nullptr;
};

} // namespace cansched
