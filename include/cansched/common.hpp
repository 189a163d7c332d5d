#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <map>
#include <chrono>

namespace cansched {

// 바이트 배열 별칭
using bytes = std::vector<uint8_t>;

// 신호 이름 -> 물리값
using SignalValues = std::map<std::string, double>;

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using Period = std::chrono::microseconds;

/**
* Err
* - 스케줄러/레지스트리/설정 계층 공통 결과 코드.
* - 전송 계층은 can_err_t를 그대로 쓰고, 경계에서 Err::Transport로 올린다.
*/
enum class Err : uint8_t {
    Ok = 0,
    DuplicateFrame,      ///< 이미 등록된 frame_id로 add
    NotFound,            ///< 등록되지 않은 frame_id / 신호
    InvalidCodecParams,  ///< RC/CS 위치가 범위를 벗어남, rc_len == 0
    Transport,           ///< 송신 실패
    UnknownFrame,        ///< 레이아웃 DB에 없는 메시지
    Config,              ///< 설정값 누락/형식 오류
    State                ///< 호출 순서 오류 (미연결, 실행 중 DB 교체 등)
};

inline const char* err_str(Err e) {
    switch (e) {
    case Err::Ok:                 return "Ok";
    case Err::DuplicateFrame:     return "DuplicateFrame";
    case Err::NotFound:           return "NotFound";
    case Err::InvalidCodecParams: return "InvalidCodecParams";
    case Err::Transport:          return "Transport";
    case Err::UnknownFrame:       return "UnknownFrame";
    case Err::Config:             return "Config";
    case Err::State:              return "State";
    }
    return "Unknown";
}

// 헥스 문자열 유틸 (디버그 로그용)
inline std::string hex(const uint8_t* d, size_t n) {
    static const char* k = "0123456789ABCDEF";
    std::string s; s.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) { s.push_back(k[d[i] >> 4]); s.push_back(k[d[i] & 0xF]); }
    return s;
}

inline std::string hex(const bytes& v) { return hex(v.data(), v.size()); }

// "0x341"
inline std::string hex_id(uint32_t id) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%X", (unsigned)id);
    return buf;
}

} // namespace cansched
