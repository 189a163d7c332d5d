#include "cansched/tick_loop.hpp"

#include "cansched/frame_db.hpp"
#include "cansched/log.hpp"
#include "cansched/task_registry.hpp"
#include "cansched/transport.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>

using namespace std::chrono;

namespace cansched {

void DriftCompensator::record(nanoseconds exec) {
	if (p_.history_len == 0) return;
	if (exec < nanoseconds::zero()) exec = nanoseconds::zero();
	hist_.push_back(exec);
	while (hist_.size() > p_.history_len) hist_.pop_front();
}

nanoseconds DriftCompensator::compensation() const {
	if (hist_.empty() || p_.compensation_factor <= 0.0) return nanoseconds::zero();
	double sum = 0.0;
	for (auto& d : hist_) sum += (double)d.count();
	const double mean = sum / (double)hist_.size();
	auto comp = nanoseconds(std::llround(mean * p_.compensation_factor));
	auto cap = duration_cast<nanoseconds>(p_.max_compensation);
	return std::min(comp, cap);
}

TickLoop::TickLoop(TaskRegistry& reg, const FrameDb& db, CanTransport& tx,
	uint32_t frame_id, uint64_t gen,
	const TimingParams& timing, const CodecPolicy& policy)
	: reg_(reg), db_(db), tx_(tx), id_(frame_id), gen_(gen),
	timing_(timing), policy_(policy), start_(Clock::now()) {}

void TickLoop::run() {
	DriftCompensator drift{ timing_ };
	bool paused = false;

	for (;;) {
		FrameTask t;
		if (reg_.tick_snapshot_(id_, gen_, &t) != Err::Ok) break;   // 제거됨 → 종료

		if (!t.enabled) {
			// 비활성: 카운터/반복 횟수 그대로, 짧게 대기 후 재확인
			paused = true;
			auto poll = std::min<Period>(timing_.disabled_poll, t.period);
			if (reg_.wait_cancelled_until_(id_, gen_, Clock::now() + poll, true)) break;
			continue;
		}
		if (paused) {
			paused = false;
			if (wait_enable_boundary_(t.period)) break;
			// 경계 대기 중 상태가 바뀌었을 수 있으므로 스냅샷 다시
			if (reg_.tick_snapshot_(id_, gen_, &t) != Err::Ok) break;
			if (!t.enabled) { paused = true; continue; }
		}

		auto t0 = Clock::now();
		try {
			tick_(t);
		}
		catch (const std::exception& ex) {
			logln(LogLevel::Error, "TX", hex_id(id_) + " tick 예외: " + ex.what());
		}
		auto t1 = Clock::now();
		drift.record(duration_cast<nanoseconds>(t1 - t0));

		const TimePoint deadline = start_ + t.period * (int64_t)(iteration_ + 1);
		++iteration_;

		auto now = Clock::now();
		auto sleep = duration_cast<nanoseconds>(deadline - now) - drift.compensation();

		if (sleep > duration_cast<nanoseconds>(timing_.min_sleep)) {
			if (reg_.wait_cancelled_until_(id_, gen_, now + sleep)) break;
		}
		else if (sleep > nanoseconds::zero()) {
			// sleep 해상도보다 짧음 → busy-wait
			while (Clock::now() < deadline) {}
		}
		else if (now >= deadline) {
			reg_.record_overrun_(id_, gen_);
			logln(LogLevel::Warn, "TX", hex_id(id_) + " overrun " +
				std::to_string(duration_cast<microseconds>(now - deadline).count()) + "us (iter " +
				std::to_string(iteration_) + ")");
		}
	}
	logln(LogLevel::Debug, "TX", hex_id(id_) + " worker 종료");
}

bool TickLoop::wait_enable_boundary_(Period period) {
	if (period <= Period::zero()) return false;
	auto now = Clock::now();
	auto elapsed = duration_cast<Period>(now - start_);
	int64_t k = elapsed.count() / period.count();
	if (elapsed.count() % period.count() != 0) ++k;
	// 놓친 틱은 몰아서 보내지 않고 건너뜀
	iteration_ = (uint64_t)k;
	return reg_.wait_cancelled_until_(id_, gen_, start_ + period * k);
}

void TickLoop::tick_(const FrameTask& t) {
	bytes payload;
	Err e = db_.encode(t.frame_name, t.field_values, &payload);
	if (e != Err::Ok) {
		logln(LogLevel::Warn, "TX", hex_id(id_) + " encode 실패: " + err_str(e));
		return;
	}

	if (t.codec.rc || t.codec.cs) {
		uint8_t rc = t.rolling_count;
		e = apply_rc_checksum(payload, t.codec, t.rolling_count,
			!t.fixed_rc, !t.fixed_cs, policy_, &payload, &rc);
		if (e != Err::Ok) {
			logln(LogLevel::Warn, "TX", hex_id(id_) + " RC/CS 적용 실패: " + err_str(e));
			return;
		}
		if (t.codec.rc) reg_.commit_rc_(id_, gen_, rc);
	}

	can_err_t r = tx_.send(t.frame_id, payload, t.flags);
	reg_.record_tick_(id_, gen_, r == CAN_OK, payload);
	if (r != CAN_OK) {
		logln(LogLevel::Warn, "TX", hex_id(id_) + " send 실패: " + can_err_str(r));
		return;
	}
	logln(LogLevel::Debug, "TX", hex_id(id_) + " " + hex(payload));
}

} // namespace cansched
