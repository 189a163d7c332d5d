#include "cansched/field_codec.hpp"

namespace cansched {

Err validate_codec(size_t buf_len, const CodecParams& p) {
	if (p.rc) {
		const RcPosition& rc = *p.rc;
		if (rc.len == 0 || rc.len > 8) return Err::InvalidCodecParams;
		if (rc.start_bit > 7) return Err::InvalidCodecParams;
		if ((int)rc.start_bit - (int)rc.len + 1 < 0) return Err::InvalidCodecParams;
		if (rc.byte >= buf_len) return Err::InvalidCodecParams;
	}
	if (p.cs) {
		if (p.cs->byte >= buf_len) return Err::InvalidCodecParams;
	}
	return Err::Ok;
}

uint8_t checksum8(const bytes& buf, size_t cs_byte) {
	uint8_t sum = 0;
	for (size_t i = 0; i < buf.size(); ++i) {
		if (i == cs_byte) continue;
		sum = (uint8_t)(sum + buf[i]);
	}
	return sum;
}

uint8_t rc_next(uint8_t rc, uint8_t len) {
	const unsigned max = (1u << len) - 1u;
	return (rc >= max) ? 0 : (uint8_t)(rc + 1);
}

Err apply_rc_checksum(const bytes& in, const CodecParams& p,
	uint8_t current_rc, bool advance_rc, bool compute_cs,
	const CodecPolicy& policy, bytes* out, uint8_t* new_rc)
{
	if (!out) return Err::Config;
	Err e = validate_codec(in.size(), p);
	if (e != Err::Ok) return e;

	bytes buf = in;
	uint8_t rc_val = current_rc;

	if (p.rc) {
		const RcPosition& rc = *p.rc;
		const unsigned mask = (1u << rc.len) - 1u;
		const unsigned shift = rc.start_bit - rc.len + 1u;

		if (advance_rc)                              rc_val = rc_next(current_rc, rc.len);
		else if (policy.rc_hold == RcHoldMode::Reset) rc_val = 0;
		else                                          rc_val = (uint8_t)(current_rc & mask);

		// 필드 비트만 지우고 새 값 기록, 나머지 비트는 보존
		buf[rc.byte] &= (uint8_t)~(mask << shift);
		buf[rc.byte] |= (uint8_t)((rc_val & mask) << shift);
	}

	if (p.cs) {
		const size_t cs = p.cs->byte;
		if (compute_cs)                            buf[cs] = checksum8(buf, cs);
		else if (policy.cs_hold == CsHoldMode::Zero) buf[cs] = 0;
	}

	*out = std::move(buf);
	if (new_rc) *new_rc = rc_val;
	return Err::Ok;
}

} // namespace cansched
