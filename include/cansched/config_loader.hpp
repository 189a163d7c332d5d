#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "cansched/can_api.hpp"
#include "cansched/common.hpp"
#include "cansched/field_codec.hpp"
#include "cansched/frame_db.hpp"
#include "cansched/log.hpp"
#include "cansched/tick_loop.hpp"

namespace cansched {

/**
* SchedulerConfig
* - 런타임 설정. 기본값은 config/app_config.h, JSON 설정 파일로 덮어쓴다.
*/
struct SchedulerConfig {
	can_device_t    device{ CAN_DEVICE_LINUX };
	std::string     channel;
	CanConfig       can{};
	TimingParams    timing;
	CodecPolicy     codec;
	std::string     audit_log_path;        ///< 비어있으면 감사 로그 없음
	std::string     control_socket_path;   ///< 비어있으면 제어 소켓 없음
	LogLevel        log_level{ LogLevel::Info };
};

SchedulerConfig default_config();

/**
* @brief 설정 JSON 적용. 없는 키는 out의 현재 값 유지.
* @return Config: 타입 오류 / 알 수 없는 enum 문자열
*/
Err parse_settings(const nlohmann::json& j, SchedulerConfig* out);
Err load_settings(const std::string& path, SchedulerConfig* out);

// messages_info 항목 1개
struct MessageConfig {
	std::string                name;
	std::optional<uint32_t>    frame_id;   ///< 참고용. 실제 id는 레이아웃 DB 기준
	SignalValues               values;     ///< RC/CS 필드는 0으로 시드
	std::optional<Period>      cycle;      ///< cycle_time (ms)
	std::optional<std::string> rc_field;   ///< default_value "RC"
	std::optional<std::string> cs_field;   ///< default_value "CS"
	bool                       is_fd{ false };
};

Err parse_message_configs(const nlohmann::json& j, std::vector<MessageConfig>* out);
Err load_message_configs(const std::string& path, std::vector<MessageConfig>* out);

/**
* codec_from_layout
* - RC/CS 필드 이름을 레이아웃의 비트 위치로 변환.
*   rc_byte = byte_offset, rc_start_bit = bit_offset + bit_length - 1 (바이트 내 MSB), cs_byte = byte_offset
* @return NotFound: 필드가 레이아웃에 없음, InvalidCodecParams: RC가 바이트 경계를 넘음
*/
Err codec_from_layout(const FrameLayout& layout,
	const std::optional<std::string>& rc_field,
	const std::optional<std::string>& cs_field,
	CodecParams* out);

} // namespace cansched
