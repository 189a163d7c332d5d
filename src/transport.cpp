#include "cansched/transport.hpp"
#include "cansched/debug_bus.hpp"
#include "cansched/log.hpp"

#include <cstring>

namespace cansched {

can_err_t CanTransport::init(can_device_t device) {
	std::unique_lock<std::shared_mutex> lk(m_);
	if (backend_) return CAN_ERR_STATE;
	std::unique_ptr<CanBackend> b = create_backend(device);
	if (!b) return CAN_ERR_NODEV;

	can_err_t e = b->probe();
	if (e != CAN_OK) return e;
	backend_ = std::move(b);
	return CAN_OK;
}

can_err_t CanTransport::open(const std::string& name, const CanConfig& cfg) {
	std::unique_lock<std::shared_mutex> lk(m_);
	if (!backend_)    return CAN_ERR_STATE;
	if (name.empty()) return CAN_ERR_INVALID;
	if (open_)        return CAN_ERR_STATE;

	can_err_t e = backend_->open(name, cfg);
	if (e != CAN_OK) return e;

	open_ = true;
	name_ = name;
	cfg_ = cfg;
	backend_->set_rx_handler(on_rx_, this);
	logln(LogLevel::Info, "CAN", "channel open: " + name);
	return CAN_OK;
}

void CanTransport::close_locked_() {
	if (backend_ && open_) {
		backend_->close();
		logln(LogLevel::Info, "CAN", "channel closed: " + name_);
	}
	open_ = false;
}

can_err_t CanTransport::close() {
	std::unique_lock<std::shared_mutex> lk(m_);
	if (!open_) return CAN_ERR_STATE;
	close_locked_();
	return CAN_OK;
}

void CanTransport::dispose() {
	{
		std::unique_lock<std::shared_mutex> lk(m_);
		close_locked_();
		backend_.reset();
	}
	std::lock_guard<std::mutex> lk(sub_m_);
	subs_.clear();
}

bool CanTransport::is_open() const {
	std::shared_lock<std::shared_mutex> lk(m_);
	return open_;
}

// 이 스레드가 지금 shared 락을 잡고 write 중인 transport (루프백 콜백 안에서의 재송신 판별)
static thread_local const CanTransport* t_writing = nullptr;

can_err_t CanTransport::send(const CanFrame& f, uint32_t timeout_ms) {
	if (f.dlc > 8) return CAN_ERR_INVALID;
	if (t_writing == this) {
		// 바깥 send가 이미 락을 잡고 있음 (shared_mutex 재귀 잠금 금지)
		if (!backend_ || !open_) return CAN_ERR_STATE;
		return backend_->write(f, timeout_ms);
	}
	std::shared_lock<std::shared_mutex> lk(m_);
	if (!backend_ || !open_) return CAN_ERR_STATE;
	const CanTransport* prev = t_writing;
	t_writing = this;
	can_err_t r = backend_->write(f, timeout_ms);
	t_writing = prev;
	return r;
}

can_err_t CanTransport::send(uint32_t id, const bytes& data, uint32_t flags, uint32_t timeout_ms) {
	if (data.size() > 8) return CAN_ERR_INVALID;
	CanFrame f{};
	f.id = id;
	f.dlc = (uint8_t)data.size();
	f.flags = flags;
	if (!data.empty()) std::memcpy(f.data, data.data(), data.size());
	return send(f, timeout_ms);
}

can_err_t CanTransport::recv(CanFrame* out, uint32_t timeout_ms) {
	if (!out) return CAN_ERR_INVALID;
	std::shared_lock<std::shared_mutex> lk(m_);
	if (!backend_ || !open_) return CAN_ERR_STATE;
	return backend_->read(out, timeout_ms);
}

int CanTransport::subscribe(const CanFilter& filter, can_callback_t cb, void* user) {
	if (!cb) return -1;
	Sub s{};
	s.filter = filter;
	if (filter.type == CAN_FILTER_LIST) {
		if (filter.data.list.list && filter.data.list.count > 0) {
			s.list.assign(filter.data.list.list, filter.data.list.list + filter.data.list.count);
		}
		s.filter.data.list.list = nullptr;
	}
	s.cb = cb;
	s.user = user;

	std::lock_guard<std::mutex> lk(sub_m_);
	s.id = ++next_sub_id_;
	subs_.push_back(std::move(s));
	return subs_.back().id;
}

can_err_t CanTransport::unsubscribe(int sub_id) {
	if (sub_id <= 0) return CAN_ERR_INVALID;
	std::lock_guard<std::mutex> lk(sub_m_);
	for (auto it = subs_.begin(); it != subs_.end(); ++it) {
		if (it->id == sub_id) { subs_.erase(it); return CAN_OK; }
	}
	return CAN_ERR_INVALID;
}

can_bus_state_t CanTransport::status() {
	std::shared_lock<std::shared_mutex> lk(m_);
	if (!backend_ || !open_) return CAN_BUS_STATE_ERROR_PASSIVE;
	return backend_->status();
}

can_err_t CanTransport::recover() {
	std::shared_lock<std::shared_mutex> lk(m_);
	if (!backend_ || !open_) return CAN_ERR_STATE;
	return backend_->recover();
}

DebugBus* CanTransport::debug_bus() {
	std::shared_lock<std::shared_mutex> lk(m_);
	return dynamic_cast<DebugBus*>(backend_.get());
}

bool CanTransport::filter_match_(const Sub& s, uint32_t id) {
	const CanFilter& f = s.filter;
	switch (f.type) {
	case CAN_FILTER_RANGE:
		return (id >= f.data.range.min && id <= f.data.range.max);
	case CAN_FILTER_MASK:
		return ((id & f.data.mask.mask) == (f.data.mask.id & f.data.mask.mask));
	case CAN_FILTER_LIST:
		for (uint32_t v : s.list) if (v == id) return true;
		return false;
	default:
		return false;
	}
}

// 백엔드 → 구독자 분배. 콜백 안에서 (un)subscribe 할 수 있도록 복사본으로 호출
void CanTransport::on_rx_(const CanFrame* f, void* user) {
	auto* self = static_cast<CanTransport*>(user);
	if (!self || !f) return;
	std::vector<Sub> subs;
	{
		std::lock_guard<std::mutex> lk(self->sub_m_);
		subs = self->subs_;
	}
	for (const auto& s : subs) {
		if (!filter_match_(s, f->id)) continue;
		s.cb(f, s.user);
	}
}

} // namespace cansched
