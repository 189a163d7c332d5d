#include "cansched/frame_db.hpp"
#include "cansched/can_api.hpp"
#include "cansched/log.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace cansched {

const SignalDef* MessageDef::signal(const std::string& n) const {
	for (const auto& s : signals) if (s.name == n) return &s;
	return nullptr;
}

bool parse_frame_id(const json& v, uint32_t* out) {
	if (!out) return false;
	if (v.is_number_unsigned() || v.is_number_integer()) {
		long long x = v.get<long long>();
		if (x < 0 || x > 0x1FFFFFFF) return false;
		*out = (uint32_t)x;
		return true;
	}
	if (!v.is_string()) return false;
	const std::string s = v.get<std::string>();
	if (s.empty()) return false;
	char* end = nullptr;
	unsigned long x = std::strtoul(s.c_str(), &end, 0);   // 0x 접두 자동 인식
	if (!end || *end != '\0' || x > 0x1FFFFFFFul) return false;
	*out = (uint32_t)x;
	return true;
}

// ---- 비트 pack/unpack (Intel: LSB부터 바이트 증가 방향) ----
static void pack_bits(bytes& buf, uint32_t start_bit, uint8_t len, uint64_t raw) {
	for (uint8_t i = 0; i < len; ++i) {
		uint32_t bit = start_bit + i;
		uint8_t mask = (uint8_t)(1u << (bit % 8));
		if ((raw >> i) & 1u) buf[bit / 8] |= mask;
		else                 buf[bit / 8] &= (uint8_t)~mask;
	}
}

static uint64_t unpack_bits(const bytes& buf, uint32_t start_bit, uint8_t len) {
	uint64_t raw = 0;
	for (uint8_t i = 0; i < len; ++i) {
		uint32_t bit = start_bit + i;
		if ((buf[bit / 8] >> (bit % 8)) & 1u) raw |= (uint64_t(1) << i);
	}
	return raw;
}

static void raw_limits(const SignalDef& s, int64_t* lo, int64_t* hi) {
	if (s.is_signed) {
		*lo = (s.length >= 64) ? std::numeric_limits<int64_t>::min() : -(int64_t(1) << (s.length - 1));
		*hi = (s.length >= 64) ? std::numeric_limits<int64_t>::max() : (int64_t(1) << (s.length - 1)) - 1;
	} else {
		*lo = 0;
		*hi = (s.length >= 63) ? std::numeric_limits<int64_t>::max() : (int64_t(1) << s.length) - 1;
	}
}

Err FrameDb::add_message(const MessageDef& m) {
	if (m.name.empty()) {
		logln(LogLevel::Error, "DB", "message without name");
		return Err::Config;
	}
	if (by_name_.count(m.name) || by_id_.count(m.frame_id)) {
		logln(LogLevel::Error, "DB", "duplicate message " + m.name + " id=" + hex_id(m.frame_id));
		return Err::Config;
	}
	if (m.length > 8) {
		logln(LogLevel::Error, "DB", m.name + ": length " + std::to_string(m.length) + " > 8 (classic CAN only)");
		return Err::Config;
	}
	for (size_t i = 0; i < m.signals.size(); ++i) {
		const auto& s = m.signals[i];
		if (s.length == 0 || s.length > 64 || (uint32_t)s.start_bit + s.length > (uint32_t)m.length * 8u) {
			logln(LogLevel::Error, "DB", m.name + "." + s.name + ": bit range out of frame");
			return Err::Config;
		}
		if (s.scale == 0.0) {
			logln(LogLevel::Error, "DB", m.name + "." + s.name + ": scale 0");
			return Err::Config;
		}
		for (size_t k = 0; k < i; ++k) {
			if (m.signals[k].name == s.name) {
				logln(LogLevel::Error, "DB", m.name + ": duplicate signal " + s.name);
				return Err::Config;
			}
		}
	}
	msgs_.push_back(m);
	by_name_[m.name] = msgs_.size() - 1;
	by_id_[m.frame_id] = msgs_.size() - 1;
	return Err::Ok;
}

void FrameDb::clear() {
	msgs_.clear();
	by_name_.clear();
	by_id_.clear();
}

static Err parse_signal(const json& js, SignalDef* out) {
	SignalDef s;
	s.name = js.at("name").get<std::string>();
	s.start_bit = js.at("start_bit").get<uint16_t>();
	s.length = js.at("length").get<uint8_t>();
	const std::string order = js.value("byte_order", std::string("little_endian"));
	if (order != "little_endian") {
		logln(LogLevel::Error, "DB", s.name + ": byte_order '" + order + "' not supported");
		return Err::Config;
	}
	s.is_signed = js.value("is_signed", false);
	s.scale = js.value("scale", 1.0);
	s.offset = js.value("offset", 0.0);
	if (js.contains("minimum") && !js["minimum"].is_null()) s.minimum = js["minimum"].get<double>();
	if (js.contains("maximum") && !js["maximum"].is_null()) s.maximum = js["maximum"].get<double>();
	if (js.contains("initial") && !js["initial"].is_null()) s.initial = js["initial"].get<double>();
	*out = s;
	return Err::Ok;
}

Err FrameDb::load(const json& root) {
	const json& arr = root.is_object() && root.contains("messages") ? root["messages"] : root;
	if (!arr.is_array()) {
		logln(LogLevel::Error, "DB", "frame database root must be an array of messages");
		return Err::Config;
	}
	FrameDb tmp;
	try {
		for (const auto& jm : arr) {
			MessageDef m;
			m.name = jm.at("name").get<std::string>();
			if (!parse_frame_id(jm.at("frame_id"), &m.frame_id)) {
				logln(LogLevel::Error, "DB", m.name + ": bad frame_id");
				return Err::Config;
			}
			m.length = jm.value("length", (uint8_t)8);
			if (jm.contains("cycle_time") && !jm["cycle_time"].is_null()) {
				m.cycle_ms = jm["cycle_time"].get<uint32_t>();
			}
			m.is_fd = jm.value("is_fd", false);
			m.extended = jm.value("extended", m.frame_id > 0x7FF);
			if (jm.contains("signals")) {
				for (const auto& js : jm["signals"]) {
					SignalDef s;
					Err e = parse_signal(js, &s);
					if (e != Err::Ok) return e;
					m.signals.push_back(s);
				}
			}
			Err e = tmp.add_message(m);
			if (e != Err::Ok) return e;
		}
	} catch (const json::exception& ex) {
		logln(LogLevel::Error, "DB", std::string("frame database format error: ") + ex.what());
		return Err::Config;
	}
	*this = std::move(tmp);
	return Err::Ok;
}

Err FrameDb::load_json(const std::string& path) {
	std::ifstream f(path);
	if (!f) {
		logln(LogLevel::Error, "DB", "cannot open " + path);
		return Err::Config;
	}
	json j = json::parse(f, nullptr, false);
	if (j.is_discarded()) {
		logln(LogLevel::Error, "DB", "JSON parse error: " + path);
		return Err::Config;
	}
	Err e = load(j);
	if (e == Err::Ok) logln(LogLevel::Info, "DB", "loaded " + std::to_string(msgs_.size()) + " messages from " + path);
	return e;
}

const MessageDef* FrameDb::find(const std::string& name) const {
	auto it = by_name_.find(name);
	return it == by_name_.end() ? nullptr : &msgs_[it->second];
}

const MessageDef* FrameDb::find_by_id(uint32_t frame_id) const {
	auto it = by_id_.find(frame_id);
	return it == by_id_.end() ? nullptr : &msgs_[it->second];
}

Err FrameDb::lookup(const std::string& name, FrameLayout* out) const {
	const MessageDef* m = find(name);
	if (!m) return Err::UnknownFrame;
	if (!out) return Err::Ok;
	FrameLayout l;
	l.frame_id = m->frame_id;
	l.byte_length = m->length;
	if (m->cycle_ms && *m->cycle_ms > 0) l.nominal_period = std::chrono::milliseconds(*m->cycle_ms);
	for (const auto& s : m->signals) {
		FieldPos p;
		p.byte_offset = (uint8_t)(s.start_bit / 8);
		p.bit_offset = (uint8_t)(s.start_bit % 8);
		p.bit_length = s.length;
		l.fields[s.name] = p;
	}
	l.flags = m->extended ? (uint32_t)CAN_FRAME_EXTID : 0u;
	l.is_fd = m->is_fd;
	*out = l;
	return Err::Ok;
}

Err FrameDb::encode(const std::string& name, const SignalValues& values, bytes* out) const {
	const MessageDef* m = find(name);
	if (!m) return Err::UnknownFrame;
	if (!out) return Err::Config;

	bytes buf(m->length, 0);
	for (const auto& s : m->signals) {
		double v = 0.0;
		auto it = values.find(s.name);
		if (it != values.end())  v = it->second;
		else if (s.initial)      v = *s.initial;
		else if (s.minimum)      v = *s.minimum;

		if (s.minimum && s.maximum && (v < *s.minimum || v > *s.maximum)) {
			logln(LogLevel::Warn, "DB", name + "." + s.name + "=" + std::to_string(v) + " out of range, clamped");
			v = v < *s.minimum ? *s.minimum : *s.maximum;
		}

		int64_t lo = 0, hi = 0;
		raw_limits(s, &lo, &hi);
		double rd = std::nearbyint((v - s.offset) / s.scale);
		int64_t raw;
		if (rd <= (double)lo)      raw = lo;
		else if (rd >= (double)hi) raw = hi;
		else                       raw = (int64_t)rd;
		if ((double)raw != rd) {
			logln(LogLevel::Warn, "DB", name + "." + s.name + " raw value saturated");
		}

		uint64_t bits = (uint64_t)raw;
		if (s.length < 64) bits &= (uint64_t(1) << s.length) - 1;
		pack_bits(buf, s.start_bit, s.length, bits);
	}
	*out = std::move(buf);
	return Err::Ok;
}

Err FrameDb::decode(const std::string& name, const bytes& data, SignalValues* out) const {
	const MessageDef* m = find(name);
	if (!m) return Err::UnknownFrame;
	if (!out) return Err::Config;
	if (data.size() < m->length) return Err::Config;

	SignalValues r;
	for (const auto& s : m->signals) {
		uint64_t bits = unpack_bits(data, s.start_bit, s.length);
		double v;
		if (s.is_signed && s.length < 64 && (bits >> (s.length - 1)) & 1u) {
			int64_t sv = (int64_t)(bits | ~((uint64_t(1) << s.length) - 1));
			v = (double)sv;
		} else if (s.is_signed) {
			v = (double)(int64_t)bits;
		} else {
			v = (double)bits;
		}
		r[s.name] = v * s.scale + s.offset;
	}
	*out = std::move(r);
	return Err::Ok;
}

} // namespace cansched
