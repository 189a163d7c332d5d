#include "cansched/debug_bus.hpp"

#include <thread>

namespace cansched {

can_err_t DebugBus::open(const std::string& name, const CanConfig& cfg) {
	std::lock_guard<std::mutex> lk(m_);
	if (open_) return CAN_ERR_STATE;
	name_ = name;
	cfg_ = cfg;
	open_ = true;
	return CAN_OK;
}

void DebugBus::close() {
	{
		std::lock_guard<std::mutex> lk(m_);
		open_ = false;
		rxq_.clear();
	}
	rx_cv_.notify_all();
	set_rx_handler(nullptr, nullptr);
}

void DebugBus::set_rx_handler(rx_handler_t cb, void* user) {
	std::lock_guard<std::mutex> lk(cb_m_);
	on_rx_ = cb;
	on_rx_user_ = user;
}

can_err_t DebugBus::write(const CanFrame& fr, uint32_t /*timeout_ms*/) {
	if (fr.dlc > 8) return CAN_ERR_INVALID;

	std::chrono::microseconds delay;
	{
		std::lock_guard<std::mutex> lk(m_);
		if (!open_) return CAN_ERR_STATE;
		if (cfg_.mode == CAN_MODE_SILENT || cfg_.mode == CAN_MODE_SILENT_LOOPBACK) {
			++rejected_;
			return CAN_ERR_STATE;
		}
		if (fault_ != CAN_OK && fault_left_ != 0) {
			can_err_t e = fault_;
			if (fault_left_ > 0 && --fault_left_ == 0) fault_ = CAN_OK;
			++rejected_;
			return e;
		}
		delay = delay_;
	}
	if (delay.count() > 0) std::this_thread::sleep_for(delay);

	{
		std::lock_guard<std::mutex> lk(m_);
		if (written_.size() >= kKeep) written_.pop_front();
		written_.push_back(fr);
		if (rxq_.size() >= kKeep) rxq_.pop_front();
		rxq_.push_back(fr);
	}
	rx_cv_.notify_one();

	rx_handler_t cb;
	void* user;
	{
		std::lock_guard<std::mutex> lk(cb_m_);
		cb = on_rx_;
		user = on_rx_user_;
	}
	if (cb) cb(&fr, user);
	return CAN_OK;
}

can_err_t DebugBus::read(CanFrame* out, uint32_t timeout_ms) {
	if (!out) return CAN_ERR_INVALID;
	std::unique_lock<std::mutex> lk(m_);
	if (!open_) return CAN_ERR_STATE;
	if (rxq_.empty()) {
		if (timeout_ms == 0) return CAN_ERR_AGAIN;
		bool got = rx_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
			[&] { return !rxq_.empty() || !open_; });
		if (!open_) return CAN_ERR_STATE;
		if (!got) return CAN_ERR_TIMEOUT;
	}
	*out = rxq_.front();
	rxq_.pop_front();
	return CAN_OK;
}

void DebugBus::fail_writes(can_err_t err, int count) {
	std::lock_guard<std::mutex> lk(m_);
	fault_ = err;
	fault_left_ = (err == CAN_OK) ? 0 : count;
}

void DebugBus::clear_faults() {
	fail_writes(CAN_OK, 0);
}

void DebugBus::set_write_delay(std::chrono::microseconds d) {
	std::lock_guard<std::mutex> lk(m_);
	delay_ = d;
}

std::vector<CanFrame> DebugBus::written() const {
	std::lock_guard<std::mutex> lk(m_);
	return std::vector<CanFrame>(written_.begin(), written_.end());
}

size_t DebugBus::written_count(uint32_t id) const {
	std::lock_guard<std::mutex> lk(m_);
	size_t n = 0;
	for (auto& f : written_) if (f.id == id) ++n;
	return n;
}

uint64_t DebugBus::rejected() const {
	std::lock_guard<std::mutex> lk(m_);
	return rejected_;
}

} // namespace cansched
