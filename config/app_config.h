#pragma once

// ── CAN 인터페이스
#define CANSCHED_CAN_IFACE              "can0"
#define CANSCHED_CAN_BITRATE            500000

// ── 타이밍 보정 (배포 환경별 캘리브레이션 대상)
#define CANSCHED_MIN_SLEEP_US           1000     // 이보다 짧으면 busy-wait
#define CANSCHED_COMP_FACTOR            0.3
#define CANSCHED_COMP_HISTORY           5
#define CANSCHED_COMP_MAX_US            100000
#define CANSCHED_DISABLED_POLL_MS       100      // 비활성 태스크 재확인 간격

// ── 초기(one-shot) 메시지 간격
#define CANSCHED_INITIAL_GAP_MS         10

// ── 외부 제어 소켓 / 감사 로그
#define CANSCHED_CONTROL_SOCK           "/tmp/cansched.sock"
#define CANSCHED_AUDIT_LOG              "signal_update_log.txt"
