// 실행 중인 cansched에 제어 요청 1건 전송
//   cansched_ctl '{"cmd":"update","id":"0x341","values":{"HandBrkSts":1}}'
//   cansched_ctl -s /tmp/other.sock '{"cmd":"list"}'

#include <cstdio>
#include <cstring>
#include <string>
#include <nlohmann/json.hpp>

#include "cansched/control.hpp"
#include "config/app_config.h"

int main(int argc, char** argv) {
	std::string path = CANSCHED_CONTROL_SOCK;
	int i = 1;
	if (argc > 2 && std::strcmp(argv[1], "-s") == 0) {
		path = argv[2];
		i = 3;
	}
	if (i >= argc) {
		std::fprintf(stderr, "usage: %s [-s socket] '<json request>'\n", argv[0]);
		return 2;
	}

	nlohmann::json req = nlohmann::json::parse(argv[i], nullptr, false);
	if (req.is_discarded()) {
		std::fprintf(stderr, "invalid JSON: %s\n", argv[i]);
		return 2;
	}

	auto rep = cansched::ControlClient::request(path, req);
	if (!rep) {
		std::fprintf(stderr, "no reply from %s\n", path.c_str());
		return 1;
	}
	std::puts(rep->dump(2).c_str());
	return rep->value("ok", false) ? 0 : 1;
}
