#pragma once
#include <cstdint>
#include <optional>

#include "cansched/common.hpp"

namespace cansched {

/**
* Rolling counter 위치
* - byte      : 카운터가 들어있는 바이트 인덱스
* - start_bit : 바이트 내 카운터 MSB 위치 (0..7). LSB = start_bit - len + 1
* - len       : 비트 길이 (1..8)
*/
struct RcPosition {
	uint8_t byte{ 0 };
	uint8_t start_bit{ 7 };
	uint8_t len{ 4 };
};

// Checksum 바이트 위치
struct CsPosition {
	uint8_t byte{ 7 };
};

// 카운터를 진행하지 않을 때 (fixed RC)
enum class RcHoldMode : uint8_t {
	Keep = 0,   ///< 마지막 값을 유지해서 다시 기록
	Reset       ///< 0으로 기록
};

// 체크섬을 계산하지 않을 때 (fixed CS)
enum class CsHoldMode : uint8_t {
	Keep = 0,   ///< 인코딩된 바이트 그대로 둠
	Zero        ///< 0으로 기록
};

struct CodecPolicy {
	RcHoldMode rc_hold{ RcHoldMode::Keep };
	CsHoldMode cs_hold{ CsHoldMode::Keep };
};

struct CodecParams {
	std::optional<RcPosition> rc;
	std::optional<CsPosition> cs;
};

// 위치 검증: rc_len 0, 비트 범위 초과, 버퍼 밖 인덱스 → InvalidCodecParams
Err validate_codec(size_t buf_len, const CodecParams& p);

// 8-bit 합 (mod 256), cs_byte 자신은 제외
uint8_t checksum8(const bytes& buf, size_t cs_byte);

// len 비트 카운터의 다음 값 (최대값 다음은 0)
uint8_t rc_next(uint8_t rc, uint8_t len);

/**
* apply_rc_checksum
* - in 을 복사해 out 에 RC/CS 를 주입. in 은 변경하지 않음 (out == &in 허용).
* - 카운터 기록이 먼저, 체크섬은 카운터가 기록된 버퍼 위에서 계산.
* - 없는 필드(rc/cs nullopt)는 건너뜀.
* @param new_rc 기록된 카운터 값 (rc 없으면 current_rc 그대로)
*/
Err apply_rc_checksum(const bytes& in, const CodecParams& p,
	uint8_t current_rc, bool advance_rc, bool compute_cs,
	const CodecPolicy& policy, bytes* out, uint8_t* new_rc);

} // namespace cansched
