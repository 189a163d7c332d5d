#pragma once
#include <condition_variable>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "cansched/common.hpp"
#include "cansched/field_codec.hpp"
#include "cansched/frame_task.hpp"
#include "cansched/tick_loop.hpp"

namespace cansched {

class FrameDb;
class CanTransport;

/**
* WorkerHandle
* - add()가 돌려주는 워커 완료 대기용 핸들. 복사 가능.
*/
class WorkerHandle {
public:
	WorkerHandle() = default;

	bool valid() const { return done_.valid(); }
	void wait() const;                                       ///< 워커 종료까지 대기
	bool wait_for(std::chrono::milliseconds timeout) const;  ///< 종료되면 true
	bool finished() const { return wait_for(std::chrono::milliseconds(0)); }

private:
	friend class TaskRegistry;
	explicit WorkerHandle(std::shared_future<void> f) : done_(std::move(f)) {}
	std::shared_future<void> done_;
};

/**
* TaskRegistry
* - frame_id → (FrameTask, 워커 스레드) 맵. 단일 mutex, 조회/변경 동안만 잡는다 (송신/sleep 중에는 안 잡음).
* - 워커 핸들은 id가 맵에 있을 때만 존재. 제거(remove)가 워커를 멈추는 유일한 방법이며,
*   워커는 다음 틱(또는 대기 중이면 즉시) 제거를 관찰하고 스스로 빠져나간다.
* - remove()는 워커 종료를 기다리지 않는다. 종료된 스레드는 add/join_workers/소멸자에서 join.
*/
class TaskRegistry {
public:
	TaskRegistry(const FrameDb& db, CanTransport& tx,
		const TimingParams& timing = TimingParams{},
		const CodecPolicy& policy = CodecPolicy{});
	~TaskRegistry();
	TaskRegistry(const TaskRegistry&) = delete;
	TaskRegistry& operator=(const TaskRegistry&) = delete;

	Err add(uint32_t frame_id, const FrameTask& initial, WorkerHandle* out = nullptr);
	Err get_snapshot(uint32_t frame_id, FrameTask* out) const;

	/**
	* @brief 신호값 일괄 갱신 (부분 성공 허용)
	* @param unknown  태스크에 없는 신호 이름 (선택)
	* @param applied  실제로 반영된 신호 (선택)
	* @return NotFound: frame_id 미등록. 모르는 신호가 있어도 나머지는 반영하고 Ok.
	*/
	Err update_values(uint32_t frame_id, const SignalValues& values,
		std::vector<std::string>* unknown = nullptr, SignalValues* applied = nullptr);

	Err set_fixed_rc(uint32_t frame_id, bool fixed);
	Err set_fixed_cs(uint32_t frame_id, bool fixed);
	Err enable(uint32_t frame_id, bool on);

	Err    remove(uint32_t frame_id);
	size_t remove_all();
	void   join_workers();   ///< 제거된 워커들의 종료 대기

	bool                  contains(uint32_t frame_id) const;
	size_t                size() const;
	std::vector<uint32_t> ids() const;

	const TimingParams& timing() const { return timing_; }
	const CodecPolicy&  policy() const { return policy_; }

private:
	friend class TickLoop;

	struct Entry {
		FrameTask                task;
		uint64_t                 gen{ 0 };
		std::thread              worker;
		std::shared_future<void> done;
	};
	struct Retired {
		std::thread              worker;
		std::shared_future<void> done;
	};

	// ---- 워커 전용 ----
	Err  tick_snapshot_(uint32_t id, uint64_t gen, FrameTask* out) const;
	void commit_rc_(uint32_t id, uint64_t gen, uint8_t rc);
	void record_tick_(uint32_t id, uint64_t gen, bool sent, const bytes& payload);
	void record_overrun_(uint32_t id, uint64_t gen);
	bool wait_cancelled_until_(uint32_t id, uint64_t gen, TimePoint until,
		bool wake_on_enable = false) const; ///< 취소되면 true

	bool alive_locked_(uint32_t id, uint64_t gen) const;
	void retire_locked_(Entry& e);
	void reap_finished_locked_();

	const FrameDb& db_;
	CanTransport&  tx_;
	TimingParams   timing_;
	CodecPolicy    policy_;

	mutable std::mutex               m_;
	mutable std::condition_variable  cancel_cv_;
	std::unordered_map<uint32_t, Entry> tasks_;
	std::vector<Retired>             retired_;
	uint64_t                         next_gen_{ 0 };
};

} // namespace cansched
