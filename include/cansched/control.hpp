#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace cansched {

class Scheduler;

/**
* ControlServer
* - **UDS(Unix Domain Socket)** 기반 외부 제어 채널. 다른 프로세스가 실행 중인 스케줄러를 조작.
* - 메시지 프레이밍: **[4바이트 길이(LE)] + JSON 텍스트**. 연결 1개 = 요청 1건 + 응답 1건.
* - 파일 퍼미션(0660)으로 접근 주체 제어.
*/
class ControlServer {
public:
	using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

	ControlServer() = default;
	~ControlServer() { stop(); }
	ControlServer(const ControlServer&) = delete;
	ControlServer& operator=(const ControlServer&) = delete;

	/**
	* @brief UDS 서버 오픈
	* @param path 소켓 경로 (예: "/tmp/cansched.sock")
	* @param mode 파일 퍼미션
	*/
	bool listen(const std::string& path, mode_t mode = 0660);
	bool start(Handler h);   ///< accept 루프 스레드 시작 (listen 이후)
	void stop();             ///< 루프 종료 + 소켓 파일 제거, 중복 호출 허용
	bool running() const { return running_.load(); }

private:
	void loop_();
	void serve_(int cli);

	int               srv_fd_ = -1;
	std::string       path_;
	Handler           handler_;
	std::atomic<bool> running_{ false };
	std::thread       th_;
};

/**
* ControlClient
* - 요청 1건 전송 후 응답 대기.
*/
class ControlClient {
public:
	/**
	* @param timeout_ms 응답 대기 한도
	* @return 응답 JSON (연결/송수신 실패 시 nullptr)
	*/
	static std::unique_ptr<nlohmann::json> request(const std::string& path,
		const nlohmann::json& req, int timeout_ms = 2000);
};

/**
* handle_control_request
* - 요청 JSON → 스케줄러 호출 → 응답 JSON. 소켓과 무관하게 테스트 가능.
* - {"cmd":"update","id":"0x341","values":{...}} → {"ok":true,"unknown":[...]}
* - 실패: {"ok":false,"err":"NotFound"}
*/
nlohmann::json handle_control_request(Scheduler& s, const nlohmann::json& req);

} // namespace cansched
