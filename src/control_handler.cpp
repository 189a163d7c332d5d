#include "cansched/control.hpp"
#include "cansched/log.hpp"
#include "cansched/scheduler.hpp"

using json = nlohmann::json;

namespace cansched {

static json fail(const char* err) {
	return json{ {"ok", false}, {"err", err} };
}

static json result(Err e) {
	if (e != Err::Ok) return fail(err_str(e));
	return json{ {"ok", true} };
}

static json snapshot_json(const FrameTask& t) {
	json values = json::object();
	for (auto& kv : t.field_values) values[kv.first] = kv.second;
	return json{
		{"ok", true},
		{"id", hex_id(t.frame_id)},
		{"name", t.frame_name},
		{"period_ms", (double)t.period.count() / 1000.0},
		{"values", values},
		{"rolling_count", t.rolling_count},
		{"fixed_rc", t.fixed_rc},
		{"fixed_cs", t.fixed_cs},
		{"enabled", t.enabled},
		{"sent", t.stats.sent},
		{"send_failures", t.stats.send_failures},
		{"overruns", t.stats.overruns},
		{"last_payload", hex(t.stats.last_payload)}
	};
}

json handle_control_request(Scheduler& s, const json& req) {
	if (!req.is_object() || !req.contains("cmd") || !req["cmd"].is_string()) return fail("BadRequest");
	const std::string cmd = req["cmd"].get<std::string>();

	if (cmd == "list") {
		json ids = json::array();
		for (uint32_t id : s.task_ids()) ids.push_back(hex_id(id));
		return json{ {"ok", true}, {"ids", ids} };
	}

	uint32_t id = 0;
	if (!req.contains("id") || !parse_frame_id(req["id"], &id)) return fail("BadRequest");

	if (cmd == "update") {
		if (!req.contains("values") || !req["values"].is_object()) return fail("BadRequest");
		SignalValues vals;
		for (auto it = req["values"].begin(); it != req["values"].end(); ++it) {
			if (!it.value().is_number() && !it.value().is_boolean()) return fail("BadRequest");
			vals[it.key()] = it.value().is_boolean() ? (it.value().get<bool>() ? 1.0 : 0.0) : it.value().get<double>();
		}
		std::vector<std::string> unknown;
		Err e = s.update(id, vals, &unknown);
		if (e != Err::Ok) return fail(err_str(e));
		return json{ {"ok", true}, {"unknown", unknown} };
	}
	if (cmd == "snapshot") {
		FrameTask t;
		Err e = s.snapshot(id, &t);
		if (e != Err::Ok) return fail(err_str(e));
		return snapshot_json(t);
	}
	if (cmd == "remove") return result(s.remove(id));

	if (cmd == "set_fixed_rc" || cmd == "set_fixed_cs" || cmd == "enable") {
		if (!req.contains("value") || !req["value"].is_boolean()) return fail("BadRequest");
		const bool v = req["value"].get<bool>();
		if (cmd == "set_fixed_rc") return result(s.set_fixed_rc(id, v));
		if (cmd == "set_fixed_cs") return result(s.set_fixed_cs(id, v));
		return result(s.enable(id, v));
	}

	logln(LogLevel::Warn, "CTL", "unknown cmd: " + cmd);
	return fail("UnknownCommand");
}

} // namespace cansched
