#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cansched/common.hpp"
#include "cansched/config_loader.hpp"
#include "cansched/field_codec.hpp"
#include "cansched/frame_db.hpp"
#include "cansched/frame_task.hpp"
#include "cansched/log.hpp"
#include "cansched/task_registry.hpp"
#include "cansched/transport.hpp"

namespace cansched {

/**
* Scheduler
* - 주기 송신 엔진의 외부 경계. 호출자가 직접 생성/소유한다 (전역 인스턴스 없음).
* - 사용 순서: load_frame_db → connect → (load_config → start_initial_messages / start_periodic_messages | add_periodic) → ... → shutdown
* - 에러는 레지스트리의 Err 값을 그대로 돌려준다.
*/
class Scheduler {
public:
	explicit Scheduler(const SchedulerConfig& cfg = default_config());
	~Scheduler();
	Scheduler(const Scheduler&) = delete;
	Scheduler& operator=(const Scheduler&) = delete;

	Err connect();                                   ///< transport init + open, 감사 로그 오픈
	Err load_frame_db(const std::string& path);      ///< 태스크가 있으면 State, 제거된 워커는 종료까지 대기
	Err load_config(const std::string& path);        ///< messages_info 형식
	void set_message_configs(std::vector<MessageConfig> msgs);

	/**
	* @brief 주기 송신 태스크 추가
	* @param period 없으면 레이아웃 공칭 주기, 둘 다 없으면 Config
	* @param codec  RC/CS 위치 (없으면 코덱 미적용)
	* @param out_id 등록된 frame_id
	*/
	Err add_periodic(const std::string& frame_name, const SignalValues& initial_values,
		std::optional<Period> period, std::optional<CodecParams> codec, uint32_t* out_id);

	Err update(uint32_t frame_id, const SignalValues& values, std::vector<std::string>* unknown = nullptr);
	Err update_value(uint32_t frame_id, const std::string& name, double value); ///< 없는 신호 → NotFound
	Err set_fixed_rc(uint32_t frame_id, bool fixed);
	Err set_fixed_cs(uint32_t frame_id, bool fixed);
	Err enable(uint32_t frame_id, bool on);
	Err remove(uint32_t frame_id);
	size_t stop_all();
	void shutdown();                                 ///< 중복 호출 허용

	Err  start_initial_messages(size_t* sent = nullptr);
	Err  start_periodic_messages(std::vector<uint32_t>* ids = nullptr);

	Err                   snapshot(uint32_t frame_id, FrameTask* out) const;
	std::vector<uint32_t> task_ids() const;
	bool                  is_running(uint32_t frame_id) const;
	bool                  connected() const { return tx_.is_open(); }

	FrameDb&               frame_db() { return db_; }
	const FrameDb&         frame_db() const { return db_; }
	CanTransport&          transport() { return tx_; }
	const SchedulerConfig& config() const { return cfg_; }

private:
	Err  add_locked_(const std::string& frame_name, const SignalValues& initial_values,
		std::optional<Period> period, std::optional<CodecParams> codec, uint32_t* out_id);
	void audit_(uint32_t frame_id, const SignalValues& applied);

	SchedulerConfig cfg_;
	FrameDb         db_;
	CanTransport    tx_;
	TaskRegistry    reg_;      ///< db_/tx_ 뒤에 선언 (워커가 먼저 정리되도록)
	LogSink         audit_log_;

	std::mutex                 life_m_;   ///< 연결/종료, DB 교체, 태스크 등록 직렬화 (워커는 잡지 않음)
	bool                       shut_{ false };
	std::vector<MessageConfig> msgs_;
};

// "{HandBrkSts=1, Speed=12.5}"
std::string format_values(const SignalValues& v);

} // namespace cansched
