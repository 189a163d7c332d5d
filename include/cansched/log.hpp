#pragma once
#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>

namespace cansched {

enum class LogLevel : uint8_t { Debug = 0, Info, Warn, Error };

void     set_log_level(LogLevel lv);
LogLevel log_level();
bool     parse_log_level(const std::string& s, LogLevel* out);

/**
* logln
* - stderr로 한 줄 출력: `[YYYY-MM-DD HH:MM:SS.mmm][LEVEL][TAG] msg`
* - 워커 스레드 여러 개가 동시에 호출하므로 내부 mutex로 줄 단위 직렬화.
*/
void logln(LogLevel lv, const char* tag, const std::string& msg);

/**
* LogSink
* - append 모드 파일 로그. 신호 업데이트 감사 로그(signal update log)에 사용.
*/
class LogSink {
public:
	bool open(const std::string& path); ///< 파일 오픈(append)
	bool is_open();
	void write(const std::string& line);///< 타임스탬프 + 라인 기록
	void close();
private:
	std::ofstream f_;
	std::mutex mu_;
};

} // namespace cansched
