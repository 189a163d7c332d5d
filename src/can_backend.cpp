#include "cansched/can_backend.hpp"
#include "cansched/debug_bus.hpp"

namespace cansched {

std::unique_ptr<CanBackend> create_backend(can_device_t device) {
	switch (device) {
	case CAN_DEVICE_LINUX: return create_socketcan_backend();
	case CAN_DEVICE_DEBUG: return std::unique_ptr<CanBackend>(new DebugBus());
	default:               return nullptr;
	}
}

const char* can_err_str(can_err_t e) {
	switch (e) {
	case CAN_OK:             return "CAN_OK";
	case CAN_ERR_AGAIN:      return "CAN_ERR_AGAIN";
	case CAN_ERR_TIMEOUT:    return "CAN_ERR_TIMEOUT";
	case CAN_ERR_INVALID:    return "CAN_ERR_INVALID";
	case CAN_ERR_IO:         return "CAN_ERR_IO";
	case CAN_ERR_BUSOFF:     return "CAN_ERR_BUSOFF";
	case CAN_ERR_STATE:      return "CAN_ERR_STATE";
	case CAN_ERR_MEMORY:     return "CAN_ERR_MEMORY";
	case CAN_ERR_PERMISSION: return "CAN_ERR_PERMISSION";
	case CAN_ERR_NODEV:      return "CAN_ERR_NODEV";
	}
	return "CAN_ERR_?";
}

} // namespace cansched
