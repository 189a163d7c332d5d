#include "cansched/scheduler.hpp"
#include "config/app_config.h"

#include <sstream>
#include <thread>

namespace cansched {

std::string format_values(const SignalValues& v) {
	std::ostringstream os;
	os << "{";
	bool first = true;
	for (auto& kv : v) {
		if (!first) os << ", ";
		os << kv.first << "=" << kv.second;
		first = false;
	}
	os << "}";
	return os.str();
}

Scheduler::Scheduler(const SchedulerConfig& cfg)
	: cfg_(cfg), reg_(db_, tx_, cfg.timing, cfg.codec) {}

Scheduler::~Scheduler() {
	shutdown();
}

Err Scheduler::connect() {
	std::lock_guard<std::mutex> lk(life_m_);
	if (tx_.is_open()) return Err::Ok;

	can_err_t r = tx_.init(cfg_.device);
	if (r != CAN_OK) {
		logln(LogLevel::Error, "SCHED", std::string("transport init 실패: ") + can_err_str(r));
		return Err::Transport;
	}
	r = tx_.open(cfg_.channel, cfg_.can);
	if (r != CAN_OK) {
		logln(LogLevel::Error, "SCHED", "open " + cfg_.channel + " 실패: " + can_err_str(r));
		tx_.dispose();
		return Err::Transport;
	}
	if (!cfg_.audit_log_path.empty() && !audit_log_.open(cfg_.audit_log_path)) {
		logln(LogLevel::Warn, "SCHED", "감사 로그 열기 실패: " + cfg_.audit_log_path);
	}
	shut_ = false;
	logln(LogLevel::Info, "SCHED", "connected " + cfg_.channel + " @" + std::to_string(cfg_.can.bitrate));
	return Err::Ok;
}

Err Scheduler::load_frame_db(const std::string& path) {
	std::lock_guard<std::mutex> lk(life_m_);
	if (reg_.size() != 0) {
		logln(LogLevel::Error, "SCHED", "frame DB는 태스크가 없을 때만 교체 가능");
		return Err::State;
	}
	// remove()된 워커가 아직 encode 중일 수 있음 → 전부 끝난 뒤 교체
	reg_.join_workers();
	return db_.load_json(path);
}

Err Scheduler::load_config(const std::string& path) {
	std::vector<MessageConfig> msgs;
	Err e = load_message_configs(path, &msgs);
	if (e != Err::Ok) return e;
	set_message_configs(std::move(msgs));
	return Err::Ok;
}

void Scheduler::set_message_configs(std::vector<MessageConfig> msgs) {
	std::lock_guard<std::mutex> lk(life_m_);
	msgs_ = std::move(msgs);
}

Err Scheduler::add_periodic(const std::string& frame_name, const SignalValues& initial_values,
	std::optional<Period> period, std::optional<CodecParams> codec, uint32_t* out_id)
{
	std::lock_guard<std::mutex> lk(life_m_);
	return add_locked_(frame_name, initial_values, period, codec, out_id);
}

// life_m_ 보유 상태에서 호출: shutdown / DB 교체와 등록이 엇갈리지 않는다
Err Scheduler::add_locked_(const std::string& frame_name, const SignalValues& initial_values,
	std::optional<Period> period, std::optional<CodecParams> codec, uint32_t* out_id)
{
	if (shut_ || !tx_.is_open()) {
		logln(LogLevel::Error, "SCHED", "add_periodic(" + frame_name + "): 연결되지 않음");
		return Err::State;
	}

	FrameLayout layout;
	if (db_.lookup(frame_name, &layout) != Err::Ok) {
		logln(LogLevel::Error, "SCHED", "unknown frame: " + frame_name);
		return Err::UnknownFrame;
	}
	if (!period) period = layout.nominal_period;
	if (!period || *period <= Period::zero()) {
		logln(LogLevel::Error, "SCHED", frame_name + ": 주기 없음 (인자/레이아웃 모두)");
		return Err::Config;
	}

	// 레이아웃의 모든 신호를 기본값으로 시드 → update 시 "모르는 신호" = 레이아웃에 없는 이름
	FrameTask t;
	const MessageDef* m = db_.find(frame_name);
	for (const auto& s : m->signals) {
		double v = 0.0;
		if (s.initial)      v = *s.initial;
		else if (s.minimum) v = *s.minimum;
		t.field_values[s.name] = v;
	}
	for (auto& kv : initial_values) {
		auto it = t.field_values.find(kv.first);
		if (it == t.field_values.end()) {
			logln(LogLevel::Warn, "SCHED", frame_name + ": 신호 " + kv.first + " 없음, 무시");
			continue;
		}
		it->second = kv.second;
	}

	t.frame_id = layout.frame_id;
	t.frame_name = frame_name;
	t.period = *period;
	t.byte_length = layout.byte_length;
	t.flags = layout.flags;
	if (codec) t.codec = *codec;

	Err e = reg_.add(layout.frame_id, t);
	if (e != Err::Ok) {
		logln(LogLevel::Error, "SCHED", "add " + frame_name + " (" + hex_id(layout.frame_id) + ") 실패: " + err_str(e));
		return e;
	}
	if (out_id) *out_id = layout.frame_id;
	return Err::Ok;
}

void Scheduler::audit_(uint32_t frame_id, const SignalValues& applied) {
	if (applied.empty() || !audit_log_.is_open()) return;
	audit_log_.write("update id=" + hex_id(frame_id) + " " + format_values(applied));
}

Err Scheduler::update(uint32_t frame_id, const SignalValues& values, std::vector<std::string>* unknown) {
	std::vector<std::string> unk;
	SignalValues applied;
	Err e = reg_.update_values(frame_id, values, &unk, &applied);
	if (e != Err::Ok) {
		logln(LogLevel::Error, "SCHED", "update " + hex_id(frame_id) + ": " + err_str(e));
		return e;
	}
	for (auto& n : unk) logln(LogLevel::Warn, "SCHED", "신호 " + n + " 없음 (" + hex_id(frame_id) + ")");
	audit_(frame_id, applied);
	logln(LogLevel::Info, "SCHED", "update " + hex_id(frame_id) + " " + format_values(applied));
	if (unknown) *unknown = std::move(unk);
	return Err::Ok;
}

Err Scheduler::update_value(uint32_t frame_id, const std::string& name, double value) {
	std::vector<std::string> unk;
	SignalValues one;
	one[name] = value;
	Err e = update(frame_id, one, &unk);
	if (e != Err::Ok) return e;
	return unk.empty() ? Err::Ok : Err::NotFound;
}

Err Scheduler::set_fixed_rc(uint32_t frame_id, bool fixed) {
	Err e = reg_.set_fixed_rc(frame_id, fixed);
	if (e == Err::Ok) logln(LogLevel::Info, "SCHED", hex_id(frame_id) + " fixed_rc=" + (fixed ? "1" : "0"));
	return e;
}

Err Scheduler::set_fixed_cs(uint32_t frame_id, bool fixed) {
	Err e = reg_.set_fixed_cs(frame_id, fixed);
	if (e == Err::Ok) logln(LogLevel::Info, "SCHED", hex_id(frame_id) + " fixed_cs=" + (fixed ? "1" : "0"));
	return e;
}

Err Scheduler::enable(uint32_t frame_id, bool on) {
	Err e = reg_.enable(frame_id, on);
	if (e == Err::Ok) logln(LogLevel::Info, "SCHED", hex_id(frame_id) + (on ? " enabled" : " disabled"));
	return e;
}

Err Scheduler::remove(uint32_t frame_id) {
	return reg_.remove(frame_id);
}

size_t Scheduler::stop_all() {
	return reg_.remove_all();
}

void Scheduler::shutdown() {
	std::lock_guard<std::mutex> lk(life_m_);
	if (shut_) return;
	shut_ = true;
	reg_.remove_all();
	reg_.join_workers();   // 취소 신호 후 협조적 종료를 기다린 뒤 transport 해제
	tx_.dispose();
	audit_log_.close();
	logln(LogLevel::Info, "SCHED", "shutdown");
}

Err Scheduler::start_initial_messages(size_t* sent) {
	std::lock_guard<std::mutex> lk(life_m_);
	if (shut_ || !tx_.is_open()) return Err::State;
	size_t n = 0;
	for (const auto& mc : msgs_) {
		FrameLayout layout;
		if (db_.lookup(mc.name, &layout) != Err::Ok) continue;   // start_periodic에서 보고
		if (mc.cycle || layout.nominal_period) continue;          // 주기 메시지

		bytes data;
		Err e = db_.encode(mc.name, mc.values, &data);
		if (e == Err::Ok && (mc.rc_field || mc.cs_field)) {
			CodecParams p;
			e = codec_from_layout(layout, mc.rc_field, mc.cs_field, &p);
			uint8_t rc = 0;
			if (e == Err::Ok) e = apply_rc_checksum(data, p, 0, true, true, cfg_.codec, &data, &rc);
		}
		if (e != Err::Ok) {
			logln(LogLevel::Error, "SCHED", "초기 메시지 " + mc.name + " 조립 실패: " + err_str(e));
			continue;
		}
		can_err_t r = tx_.send(layout.frame_id, data, layout.flags);
		if (r == CAN_OK) {
			++n;
			logln(LogLevel::Info, "SCHED", "초기 메시지 전송: " + mc.name + " " + hex(data));
		}
		else {
			logln(LogLevel::Error, "SCHED", "초기 메시지 전송 실패: " + mc.name + " (" + can_err_str(r) + ")");
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(CANSCHED_INITIAL_GAP_MS));
	}
	if (sent) *sent = n;
	return Err::Ok;
}

Err Scheduler::start_periodic_messages(std::vector<uint32_t>* ids) {
	std::lock_guard<std::mutex> lk(life_m_);
	if (shut_ || !tx_.is_open()) return Err::State;
	for (const auto& mc : msgs_) {
		FrameLayout layout;
		if (db_.lookup(mc.name, &layout) != Err::Ok) {
			logln(LogLevel::Error, "SCHED", "unknown frame: " + mc.name);
			continue;
		}
		if (mc.frame_id && *mc.frame_id != layout.frame_id) {
			logln(LogLevel::Warn, "SCHED", mc.name + ": 설정 id " + hex_id(*mc.frame_id) +
				" != 레이아웃 id " + hex_id(layout.frame_id) + ", 레이아웃 기준");
		}

		// 주기: 레이아웃 우선, 없으면 설정 파일
		std::optional<Period> period = layout.nominal_period;
		if (!period) period = mc.cycle;
		if (!period) continue;   // 초기(one-shot) 메시지

		std::optional<CodecParams> codec;
		if (mc.rc_field || mc.cs_field) {
			CodecParams p;
			Err e = codec_from_layout(layout, mc.rc_field, mc.cs_field, &p);
			if (e != Err::Ok) {
				logln(LogLevel::Error, "SCHED", mc.name + ": RC/CS 위치 오류 (" + err_str(e) + ")");
				continue;
			}
			codec = p;
		}

		uint32_t id = 0;
		if (add_locked_(mc.name, mc.values, period, codec, &id) == Err::Ok && ids) ids->push_back(id);
	}
	return Err::Ok;
}

Err Scheduler::snapshot(uint32_t frame_id, FrameTask* out) const {
	return reg_.get_snapshot(frame_id, out);
}

std::vector<uint32_t> Scheduler::task_ids() const {
	return reg_.ids();
}

bool Scheduler::is_running(uint32_t frame_id) const {
	return reg_.contains(frame_id);
}

} // namespace cansched
