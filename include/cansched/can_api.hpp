#pragma once
#include <cstdint>
#include <cstddef>

namespace cansched {

typedef enum {
    CAN_DEVICE_NONE = 0,
    CAN_DEVICE_LINUX,
    CAN_DEVICE_DEBUG
} can_device_t;

typedef enum {
    CAN_MODE_NORMAL = 0,
    CAN_MODE_LOOPBACK,
    CAN_MODE_SILENT,
    CAN_MODE_SILENT_LOOPBACK
} can_mode_t;

typedef enum {
    CAN_BUS_STATE_ERROR_ACTIVE = 0,
    CAN_BUS_STATE_ERROR_PASSIVE,
    CAN_BUS_STATE_BUS_OFF
} can_bus_state_t;

typedef enum {
    CAN_OK = 0,
    CAN_ERR_AGAIN,
    CAN_ERR_TIMEOUT,
    CAN_ERR_INVALID,
    CAN_ERR_IO,
    CAN_ERR_BUSOFF,
    CAN_ERR_STATE,
    CAN_ERR_MEMORY,
    CAN_ERR_PERMISSION,
    CAN_ERR_NODEV
} can_err_t;

typedef enum {
    CAN_FRAME_EXTID = 1 << 0,
    CAN_FRAME_RTR = 1 << 1,
    CAN_FRAME_ERR = 1 << 2
} can_frame_flag_t;

typedef enum {
    CAN_FILTER_RANGE = 0,
    CAN_FILTER_MASK,
    CAN_FILTER_LIST
} can_filter_t;

// LIST 필터의 list 포인터는 subscribe 시점에 복사된다 (호출자 소유 유지)
typedef struct {
    can_filter_t type;
    union {
        struct { uint32_t min; uint32_t max; } range;
        struct { uint32_t id;  uint32_t mask; } mask;
        struct { const uint32_t* list; uint32_t count; } list;
    } data;
} CanFilter;

typedef struct {
    uint32_t id;      // 11-bit, CAN_FRAME_EXTID면 29-bit
    uint8_t  dlc;
    uint8_t  data[8];
    uint32_t flags;
} CanFrame;

typedef struct {
    uint8_t     channel;
    int         bitrate;
    float       samplePoint;
    int         sjw;
    can_mode_t  mode;
} CanConfig;

typedef void (*can_callback_t)(const CanFrame* frame, void* user);

const char* can_err_str(can_err_t e);

// 모든 프레임 통과 (mask 0)
inline CanFilter can_filter_any() {
    CanFilter f{};
    f.type = CAN_FILTER_MASK;
    f.data.mask.id = 0;
    f.data.mask.mask = 0;
    return f;
}

inline CanFilter can_filter_id(uint32_t id) {
    CanFilter f{};
    f.type = CAN_FILTER_MASK;
    f.data.mask.id = id;
    f.data.mask.mask = 0x1FFFFFFFu;
    return f;
}

} // namespace cansched
