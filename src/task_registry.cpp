#include "cansched/task_registry.hpp"

#include "cansched/frame_db.hpp"
#include "cansched/log.hpp"
#include "cansched/transport.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

namespace cansched {

void WorkerHandle::wait() const {
	if (done_.valid()) done_.wait();
}

bool WorkerHandle::wait_for(std::chrono::milliseconds timeout) const {
	if (!done_.valid()) return true;
	return done_.wait_for(timeout) == std::future_status::ready;
}

TaskRegistry::TaskRegistry(const FrameDb& db, CanTransport& tx,
	const TimingParams& timing, const CodecPolicy& policy)
	: db_(db), tx_(tx), timing_(timing), policy_(policy) {}

TaskRegistry::~TaskRegistry() {
	remove_all();
	join_workers();
}

Err TaskRegistry::add(uint32_t frame_id, const FrameTask& initial, WorkerHandle* out) {
	if (initial.period <= Period::zero()) return Err::Config;
	if (!db_.find(initial.frame_name)) return Err::UnknownFrame;
	Err e = validate_codec(initial.byte_length, initial.codec);
	if (e != Err::Ok) return e;

	std::lock_guard<std::mutex> lk(m_);
	reap_finished_locked_();
	if (tasks_.count(frame_id)) return Err::DuplicateFrame;

	Entry& slot = tasks_[frame_id];
	slot.task = initial;
	slot.task.frame_id = frame_id;
	slot.gen = ++next_gen_;

	std::promise<void> done;
	slot.done = done.get_future().share();
	const uint64_t gen = slot.gen;
	try {
		// 워커는 add()가 잠금을 놓은 뒤에야 첫 스냅샷을 얻는다
		slot.worker = std::thread([this, frame_id, gen](std::promise<void> p) {
			try {
				TickLoop loop(*this, db_, tx_, frame_id, gen, timing_, policy_);
				loop.run();
			}
			catch (const std::exception& ex) {
				logln(LogLevel::Error, "REG", hex_id(frame_id) + " worker 예외: " + ex.what());
			}
			p.set_value();
		}, std::move(done));
	}
	catch (const std::system_error& ex) {
		logln(LogLevel::Error, "REG", hex_id(frame_id) + " 스레드 생성 실패: " + ex.what());
		tasks_.erase(frame_id);
		return Err::State;
	}

	if (out) *out = WorkerHandle(slot.done);
	logln(LogLevel::Info, "REG", "add " + hex_id(frame_id) + " (" + initial.frame_name + ", " +
		std::to_string(initial.period.count() / 1000) + "ms)");
	return Err::Ok;
}

Err TaskRegistry::get_snapshot(uint32_t frame_id, FrameTask* out) const {
	std::lock_guard<std::mutex> lk(m_);
	auto it = tasks_.find(frame_id);
	if (it == tasks_.end()) return Err::NotFound;
	if (out) *out = it->second.task;
	return Err::Ok;
}

Err TaskRegistry::update_values(uint32_t frame_id, const SignalValues& values,
	std::vector<std::string>* unknown, SignalValues* applied)
{
	std::lock_guard<std::mutex> lk(m_);
	auto it = tasks_.find(frame_id);
	if (it == tasks_.end()) return Err::NotFound;

	SignalValues& fv = it->second.task.field_values;
	for (auto& kv : values) {
		auto f = fv.find(kv.first);
		if (f == fv.end()) {
			if (unknown) unknown->push_back(kv.first);
			continue;
		}
		f->second = kv.second;
		if (applied) (*applied)[kv.first] = kv.second;
	}
	return Err::Ok;
}

Err TaskRegistry::set_fixed_rc(uint32_t frame_id, bool fixed) {
	std::lock_guard<std::mutex> lk(m_);
	auto it = tasks_.find(frame_id);
	if (it == tasks_.end()) return Err::NotFound;
	it->second.task.fixed_rc = fixed;
	return Err::Ok;
}

Err TaskRegistry::set_fixed_cs(uint32_t frame_id, bool fixed) {
	std::lock_guard<std::mutex> lk(m_);
	auto it = tasks_.find(frame_id);
	if (it == tasks_.end()) return Err::NotFound;
	it->second.task.fixed_cs = fixed;
	return Err::Ok;
}

Err TaskRegistry::enable(uint32_t frame_id, bool on) {
	{
		std::lock_guard<std::mutex> lk(m_);
		auto it = tasks_.find(frame_id);
		if (it == tasks_.end()) return Err::NotFound;
		it->second.task.enabled = on;
	}
	if (on) cancel_cv_.notify_all();
	return Err::Ok;
}

Err TaskRegistry::remove(uint32_t frame_id) {
	{
		std::lock_guard<std::mutex> lk(m_);
		auto it = tasks_.find(frame_id);
		if (it == tasks_.end()) return Err::NotFound;
		retire_locked_(it->second);
		tasks_.erase(it);
	}
	cancel_cv_.notify_all();
	logln(LogLevel::Info, "REG", "remove " + hex_id(frame_id));
	return Err::Ok;
}

size_t TaskRegistry::remove_all() {
	size_t n = 0;
	{
		std::lock_guard<std::mutex> lk(m_);
		for (auto& kv : tasks_) retire_locked_(kv.second);
		n = tasks_.size();
		tasks_.clear();
	}
	cancel_cv_.notify_all();
	if (n) logln(LogLevel::Info, "REG", "remove_all (" + std::to_string(n) + ")");
	return n;
}

void TaskRegistry::join_workers() {
	std::vector<Retired> r;
	{
		std::lock_guard<std::mutex> lk(m_);
		r.swap(retired_);
	}
	for (auto& w : r) {
		if (w.worker.joinable()) w.worker.join();
	}
}

bool TaskRegistry::contains(uint32_t frame_id) const {
	std::lock_guard<std::mutex> lk(m_);
	return tasks_.count(frame_id) != 0;
}

size_t TaskRegistry::size() const {
	std::lock_guard<std::mutex> lk(m_);
	return tasks_.size();
}

std::vector<uint32_t> TaskRegistry::ids() const {
	std::vector<uint32_t> v;
	{
		std::lock_guard<std::mutex> lk(m_);
		v.reserve(tasks_.size());
		for (auto& kv : tasks_) v.push_back(kv.first);
	}
	std::sort(v.begin(), v.end());
	return v;
}

// ---- 워커 전용 ----

bool TaskRegistry::alive_locked_(uint32_t id, uint64_t gen) const {
	auto it = tasks_.find(id);
	return it != tasks_.end() && it->second.gen == gen;
}

Err TaskRegistry::tick_snapshot_(uint32_t id, uint64_t gen, FrameTask* out) const {
	std::lock_guard<std::mutex> lk(m_);
	auto it = tasks_.find(id);
	if (it == tasks_.end() || it->second.gen != gen) return Err::NotFound;
	*out = it->second.task;
	return Err::Ok;
}

void TaskRegistry::commit_rc_(uint32_t id, uint64_t gen, uint8_t rc) {
	std::lock_guard<std::mutex> lk(m_);
	auto it = tasks_.find(id);
	if (it == tasks_.end() || it->second.gen != gen) return;
	it->second.task.rolling_count = rc;
}

void TaskRegistry::record_tick_(uint32_t id, uint64_t gen, bool sent, const bytes& payload) {
	std::lock_guard<std::mutex> lk(m_);
	auto it = tasks_.find(id);
	if (it == tasks_.end() || it->second.gen != gen) return;
	TaskStats& s = it->second.task.stats;
	if (sent) ++s.sent;
	else      ++s.send_failures;
	s.last_payload = payload;
}

void TaskRegistry::record_overrun_(uint32_t id, uint64_t gen) {
	std::lock_guard<std::mutex> lk(m_);
	auto it = tasks_.find(id);
	if (it == tasks_.end() || it->second.gen != gen) return;
	++it->second.task.stats.overruns;
}

bool TaskRegistry::wait_cancelled_until_(uint32_t id, uint64_t gen, TimePoint until,
	bool wake_on_enable) const
{
	std::unique_lock<std::mutex> lk(m_);
	cancel_cv_.wait_until(lk, until, [&] {
		auto it = tasks_.find(id);
		if (it == tasks_.end() || it->second.gen != gen) return true;
		return wake_on_enable && it->second.task.enabled;
	});
	return !alive_locked_(id, gen);
}

void TaskRegistry::retire_locked_(Entry& e) {
	retired_.push_back(Retired{ std::move(e.worker), e.done });
}

void TaskRegistry::reap_finished_locked_() {
	auto it = retired_.begin();
	while (it != retired_.end()) {
		if (it->done.valid() && it->done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
			if (it->worker.joinable()) it->worker.join();
			it = retired_.erase(it);
		}
		else ++it;
	}
}

} // namespace cansched
