#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>

#include "cansched/common.hpp"
#include "cansched/field_codec.hpp"
#include "cansched/frame_task.hpp"

namespace cansched {

class TaskRegistry;
class FrameDb;
class CanTransport;

/**
* TimingParams
* - 배포 환경별로 보정할 수 있는 타이밍 파라미터 (기본값은 config/app_config.h).
*/
struct TimingParams {
	std::chrono::microseconds min_sleep{ 1000 };          ///< 이보다 짧게 남으면 sleep 대신 busy-wait
	double                    compensation_factor{ 0.3 }; ///< 평균 실행시간 대비 보상 비율
	size_t                    history_len{ 5 };           ///< 실행시간 이력 길이
	std::chrono::microseconds max_compensation{ 100000 }; ///< 보상 상한
	std::chrono::microseconds disabled_poll{ 100000 };    ///< 비활성 상태 재확인 간격 (주기보다 길면 주기 사용)
};

/**
* DriftCompensator
* - 최근 N회 틱 실행시간의 평균 * factor 를 다음 sleep 에서 미리 빼준다 (상한 max_compensation).
*/
class DriftCompensator {
public:
	explicit DriftCompensator(const TimingParams& p) : p_(p) {}

	void record(std::chrono::nanoseconds exec);
	std::chrono::nanoseconds compensation() const;
	size_t samples() const { return hist_.size(); }

private:
	TimingParams                          p_;
	std::deque<std::chrono::nanoseconds>  hist_;
};

/**
* TickLoop
* - 프레임 1개 전용 워커 본체. 상태 머신: Running → (tick)* → Cancelled.
* - 종료 조건은 레지스트리에서 제거된 경우 하나뿐 (같은 id 재등록은 세대 번호로 구분).
* - 송신/인코딩 실패는 로그만 남기고 다음 틱으로 진행.
* - 데드라인은 생성 시각 기준 절대 격자: start + (n + 1) * period.
*/
class TickLoop {
public:
	TickLoop(TaskRegistry& reg, const FrameDb& db, CanTransport& tx,
		uint32_t frame_id, uint64_t gen,
		const TimingParams& timing, const CodecPolicy& policy);

	void run();

private:
	void tick_(const FrameTask& t);
	bool wait_enable_boundary_(Period period); ///< 재활성화 시 다음 격자 경계까지 대기, 취소되면 true

	TaskRegistry&  reg_;
	const FrameDb& db_;
	CanTransport&  tx_;
	uint32_t       id_;
	uint64_t       gen_;
	TimingParams   timing_;
	CodecPolicy    policy_;

	TimePoint      start_;
	uint64_t       iteration_{ 0 };
};

} // namespace cansched
