#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

#include "cansched/common.hpp"

namespace cansched {

// 신호 정의 (Intel/little-endian 비트 순서만 지원)
struct SignalDef {
	std::string           name;
	uint16_t              start_bit{ 0 };   ///< LSB의 절대 비트 위치 (byte*8 + bit)
	uint8_t               length{ 1 };      ///< 1..64
	bool                  is_signed{ false };
	double                scale{ 1.0 };
	double                offset{ 0.0 };
	std::optional<double> minimum;
	std::optional<double> maximum;
	std::optional<double> initial;
};

struct MessageDef {
	std::string              name;
	uint32_t                 frame_id{ 0 };
	uint8_t                  length{ 8 };     ///< 바이트 수 (classic CAN: 0..8)
	std::optional<uint32_t>  cycle_ms;        ///< 공칭 주기
	bool                     is_fd{ false };
	bool                     extended{ false };
	std::vector<SignalDef>   signals;

	const SignalDef* signal(const std::string& n) const;
};

// 필드 위치: (byte_offset, bit_offset = LSB의 바이트 내 위치, bit_length)
struct FieldPos {
	uint8_t byte_offset{ 0 };
	uint8_t bit_offset{ 0 };
	uint8_t bit_length{ 0 };
};

struct FrameLayout {
	uint32_t                        frame_id{ 0 };
	uint8_t                         byte_length{ 0 };
	std::optional<Period>           nominal_period;
	std::map<std::string, FieldPos> fields;
	uint32_t                        flags{ 0 };   ///< CAN_FRAME_EXTID 등
	bool                            is_fd{ false };
};

/**
* FrameDb
* - 메시지 이름 → 프레임 레이아웃 조회 / 신호값 인코딩·디코딩.
* - JSON(메시지 배열)에서 로드하거나 코드로 add_message.
* - 로드가 끝난 뒤에는 읽기 전용 → 워커 스레드들이 잠금 없이 동시 조회.
*/
class FrameDb {
public:
	Err add_message(const MessageDef& m);
	Err load_json(const std::string& path);
	Err load(const nlohmann::json& j);
	void clear();

	Err lookup(const std::string& name, FrameLayout* out) const;
	Err encode(const std::string& name, const SignalValues& values, bytes* out) const;
	Err decode(const std::string& name, const bytes& data, SignalValues* out) const;

	const MessageDef* find(const std::string& name) const;
	const MessageDef* find_by_id(uint32_t frame_id) const;
	size_t size() const { return msgs_.size(); }

private:
	std::vector<MessageDef>                 msgs_;
	std::unordered_map<std::string, size_t> by_name_;
	std::unordered_map<uint32_t, size_t>    by_id_;
};

// "0x341" / "833" / 833 → 833
bool parse_frame_id(const nlohmann::json& v, uint32_t* out);

} // namespace cansched
