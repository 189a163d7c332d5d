#pragma once
#include <cstdint>
#include <string>

#include "cansched/common.hpp"
#include "cansched/field_codec.hpp"

namespace cansched {

// 워커가 틱마다 갱신하는 통계
struct TaskStats {
	uint64_t sent{ 0 };
	uint64_t send_failures{ 0 };
	uint64_t overruns{ 0 };
	bytes    last_payload;   ///< 마지막으로 송신 시도한 페이로드
};

/**
* FrameTask
* - 주기 송신 프레임 1개의 상태. 레지스트리가 소유하고, 워커는 틱마다 스냅샷 복사본을 읽는다.
* - frame_id / frame_name / period / byte_length / codec 은 생성 후 불변.
* - rolling_count 는 해당 워커만 갱신.
*/
struct FrameTask {
	uint32_t     frame_id{ 0 };
	std::string  frame_name;
	SignalValues field_values;
	Period       period{ 0 };
	uint8_t      byte_length{ 8 };
	uint32_t     flags{ 0 };          ///< 송신 플래그 (CAN_FRAME_EXTID)
	CodecParams  codec;               ///< rc_position / cs_position (선택)

	uint8_t      rolling_count{ 0 };
	bool         fixed_rc{ false };
	bool         fixed_cs{ false };
	bool         enabled{ true };

	TaskStats    stats;
};

} // namespace cansched
