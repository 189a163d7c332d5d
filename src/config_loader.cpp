#include "cansched/config_loader.hpp"
#include "config/app_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace cansched {

SchedulerConfig default_config() {
	SchedulerConfig c;
	c.device = CAN_DEVICE_LINUX;
	c.channel = CANSCHED_CAN_IFACE;
	c.can.channel = 0;
	c.can.bitrate = CANSCHED_CAN_BITRATE;
	c.can.samplePoint = 0.875f;
	c.can.sjw = 1;
	c.can.mode = CAN_MODE_NORMAL;
	c.timing.min_sleep = std::chrono::microseconds(CANSCHED_MIN_SLEEP_US);
	c.timing.compensation_factor = CANSCHED_COMP_FACTOR;
	c.timing.history_len = CANSCHED_COMP_HISTORY;
	c.timing.max_compensation = std::chrono::microseconds(CANSCHED_COMP_MAX_US);
	c.timing.disabled_poll = std::chrono::milliseconds(CANSCHED_DISABLED_POLL_MS);
	return c;
}

static std::string lower_trim(const std::string& s) {
	size_t b = 0, e = s.size();
	while (b < e && std::isspace((unsigned char)s[b])) ++b;
	while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
	std::string r = s.substr(b, e - b);
	std::transform(r.begin(), r.end(), r.begin(), [](unsigned char ch) { return (char)std::tolower(ch); });
	return r;
}

static bool parse_device(const std::string& s, can_device_t* out) {
	const std::string v = lower_trim(s);
	if (v == "linux" || v == "socketcan") *out = CAN_DEVICE_LINUX;
	else if (v == "debug")                *out = CAN_DEVICE_DEBUG;
	else return false;
	return true;
}

static bool parse_mode(const std::string& s, can_mode_t* out) {
	const std::string v = lower_trim(s);
	if (v == "normal")               *out = CAN_MODE_NORMAL;
	else if (v == "loopback")        *out = CAN_MODE_LOOPBACK;
	else if (v == "silent")          *out = CAN_MODE_SILENT;
	else if (v == "silent_loopback") *out = CAN_MODE_SILENT_LOOPBACK;
	else return false;
	return true;
}

Err parse_settings(const json& j, SchedulerConfig* out) {
	if (!out) return Err::Config;
	if (!j.is_object()) {
		logln(LogLevel::Error, "CFG", "settings root must be an object");
		return Err::Config;
	}
	SchedulerConfig c = *out;
	try {
		if (j.contains("device") && !parse_device(j["device"].get<std::string>(), &c.device)) {
			logln(LogLevel::Error, "CFG", "unknown device: " + j["device"].get<std::string>());
			return Err::Config;
		}
		c.channel = j.value("channel", c.channel);
		c.can.bitrate = j.value("bitrate", c.can.bitrate);
		if (j.contains("mode") && !parse_mode(j["mode"].get<std::string>(), &c.can.mode)) {
			logln(LogLevel::Error, "CFG", "unknown mode: " + j["mode"].get<std::string>());
			return Err::Config;
		}
		if (j.contains("timing")) {
			const json& t = j["timing"];
			c.timing.min_sleep = std::chrono::microseconds(t.value("min_sleep_us", (int64_t)c.timing.min_sleep.count()));
			c.timing.compensation_factor = t.value("compensation_factor", c.timing.compensation_factor);
			c.timing.history_len = t.value("history_len", c.timing.history_len);
			c.timing.max_compensation = std::chrono::microseconds(t.value("max_compensation_us", (int64_t)c.timing.max_compensation.count()));
			c.timing.disabled_poll = std::chrono::microseconds(t.value("disabled_poll_us", (int64_t)c.timing.disabled_poll.count()));
			if (c.timing.compensation_factor < 0.0 || c.timing.min_sleep.count() < 0 ||
				c.timing.max_compensation.count() < 0 || c.timing.disabled_poll.count() <= 0) {
				logln(LogLevel::Error, "CFG", "timing values must be non-negative");
				return Err::Config;
			}
		}
		if (j.contains("codec")) {
			const json& k = j["codec"];
			const std::string rc = lower_trim(k.value("rc_hold", std::string("keep")));
			const std::string cs = lower_trim(k.value("cs_hold", std::string("keep")));
			if (rc == "keep")       c.codec.rc_hold = RcHoldMode::Keep;
			else if (rc == "reset") c.codec.rc_hold = RcHoldMode::Reset;
			else { logln(LogLevel::Error, "CFG", "rc_hold: " + rc); return Err::Config; }
			if (cs == "keep")       c.codec.cs_hold = CsHoldMode::Keep;
			else if (cs == "zero")  c.codec.cs_hold = CsHoldMode::Zero;
			else { logln(LogLevel::Error, "CFG", "cs_hold: " + cs); return Err::Config; }
		}
		c.audit_log_path = j.value("audit_log", c.audit_log_path);
		c.control_socket_path = j.value("control_socket", c.control_socket_path);
		if (j.contains("log_level") && !parse_log_level(lower_trim(j["log_level"].get<std::string>()), &c.log_level)) {
			logln(LogLevel::Error, "CFG", "unknown log_level");
			return Err::Config;
		}
	}
	catch (const json::exception& ex) {
		logln(LogLevel::Error, "CFG", std::string("settings format error: ") + ex.what());
		return Err::Config;
	}
	*out = c;
	return Err::Ok;
}

static Err read_json_file(const std::string& path, json* out) {
	std::ifstream f(path);
	if (!f) {
		logln(LogLevel::Error, "CFG", "cannot open " + path);
		return Err::Config;
	}
	*out = json::parse(f, nullptr, false);
	if (out->is_discarded()) {
		logln(LogLevel::Error, "CFG", "JSON parse error: " + path);
		return Err::Config;
	}
	return Err::Ok;
}

Err load_settings(const std::string& path, SchedulerConfig* out) {
	json j;
	Err e = read_json_file(path, &j);
	if (e != Err::Ok) return e;
	return parse_settings(j, out);
}

// 숫자 또는 숫자 문자열
static bool parse_number(const json& v, double* out) {
	if (v.is_number()) { *out = v.get<double>(); return true; }
	if (v.is_boolean()) { *out = v.get<bool>() ? 1.0 : 0.0; return true; }
	if (!v.is_string()) return false;
	const std::string s = lower_trim(v.get<std::string>());
	if (s.empty()) return false;
	char* end = nullptr;
	double d = (s.size() > 2 && s[0] == '0' && s[1] == 'x')
		? (double)std::strtoull(s.c_str(), &end, 16)
		: std::strtod(s.c_str(), &end);
	if (!end || *end != '\0') return false;
	*out = d;
	return true;
}

Err parse_message_configs(const json& root, std::vector<MessageConfig>* out) {
	if (!out) return Err::Config;
	const json& arr = root.is_object() && root.contains("messages") ? root["messages"] : root;
	if (!arr.is_array()) {
		logln(LogLevel::Error, "CFG", "message config root must be an array");
		return Err::Config;
	}
	std::vector<MessageConfig> list;
	try {
		for (const auto& jm : arr) {
			MessageConfig mc;
			mc.name = jm.at("name").get<std::string>();
			if (jm.contains("frame_id") && !jm["frame_id"].is_null()) {
				uint32_t id = 0;
				if (!parse_frame_id(jm["frame_id"], &id)) {
					logln(LogLevel::Error, "CFG", mc.name + ": bad frame_id");
					return Err::Config;
				}
				mc.frame_id = id;
			}
			if (jm.contains("cycle_time") && !jm["cycle_time"].is_null()) {
				double ms = 0;
				if (!parse_number(jm["cycle_time"], &ms) || ms <= 0) {
					logln(LogLevel::Error, "CFG", mc.name + ": bad cycle_time");
					return Err::Config;
				}
				mc.cycle = std::chrono::duration_cast<Period>(std::chrono::duration<double, std::milli>(ms));
			}
			mc.is_fd = jm.value("is_fd", false);

			if (jm.contains("signals")) {
				for (const auto& js : jm["signals"]) {
					const std::string sig = js.at("name").get<std::string>();
					const json& dv = js.contains("default_value") ? js["default_value"] : json(0);
					if (dv.is_string()) {
						const std::string tag = lower_trim(dv.get<std::string>());
						if (tag == "rc") { mc.rc_field = sig; mc.values[sig] = 0; continue; }
						if (tag == "cs") { mc.cs_field = sig; mc.values[sig] = 0; continue; }
					}
					double v = 0;
					if (!parse_number(dv, &v)) {
						logln(LogLevel::Error, "CFG", mc.name + "." + sig + ": default_value is not a number");
						return Err::Config;
					}
					mc.values[sig] = v;
				}
			}
			list.push_back(std::move(mc));
		}
	}
	catch (const json::exception& ex) {
		logln(LogLevel::Error, "CFG", std::string("message config format error: ") + ex.what());
		return Err::Config;
	}
	*out = std::move(list);
	return Err::Ok;
}

Err load_message_configs(const std::string& path, std::vector<MessageConfig>* out) {
	json j;
	Err e = read_json_file(path, &j);
	if (e != Err::Ok) return e;
	e = parse_message_configs(j, out);
	if (e == Err::Ok) logln(LogLevel::Info, "CFG", "loaded " + std::to_string(out->size()) + " message configs from " + path);
	return e;
}

Err codec_from_layout(const FrameLayout& layout,
	const std::optional<std::string>& rc_field,
	const std::optional<std::string>& cs_field,
	CodecParams* out)
{
	if (!out) return Err::Config;
	CodecParams p;
	if (rc_field) {
		auto it = layout.fields.find(*rc_field);
		if (it == layout.fields.end()) return Err::NotFound;
		const FieldPos& f = it->second;
		if (f.bit_length == 0 || (unsigned)f.bit_offset + f.bit_length > 8) return Err::InvalidCodecParams;
		RcPosition rc;
		rc.byte = f.byte_offset;
		rc.start_bit = (uint8_t)(f.bit_offset + f.bit_length - 1);
		rc.len = f.bit_length;
		p.rc = rc;
	}
	if (cs_field) {
		auto it = layout.fields.find(*cs_field);
		if (it == layout.fields.end()) return Err::NotFound;
		CsPosition cs;
		cs.byte = it->second.byte_offset;
		p.cs = cs;
	}
	Err e = validate_codec(layout.byte_length, p);
	if (e != Err::Ok) return e;
	*out = p;
	return Err::Ok;
}

} // namespace cansched
