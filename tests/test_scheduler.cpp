#include <doctest/doctest.h>

#include "cansched/debug_bus.hpp"
#include "cansched/scheduler.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>

using namespace cansched;
using namespace cansched_test;
using namespace std::chrono_literals;

namespace {

// 레코더가 스케줄러보다 나중에 파괴되도록 먼저 선언
struct Bench {
    FrameRecorder rec;
    Scheduler     s;

    explicit Bench(const SchedulerConfig& cfg = debug_config()) : s(cfg) {
        REQUIRE(s.frame_db().add_message(epb_message()) == Err::Ok);
        REQUIRE(s.frame_db().add_message(aux_message()) == Err::Ok);
        REQUIRE(s.connect() == Err::Ok);
        REQUIRE(s.transport().subscribe(can_filter_any(), FrameRecorder::on_rx, &rec) > 0);
    }
};

uint8_t sum7(const CanFrame& f) {
    unsigned s = 0;
    for (int i = 0; i < 7; ++i) s += f.data[i];
    return (uint8_t)s;
}

} // namespace

TEST_CASE("Scheduler: 0x341 first tick carries counter 1 and checksum") {
    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(100000), epb_codec(), &id) == Err::Ok);
    CHECK(id == 0x341);

    REQUIRE(wait_until([&] { return b.rec.count(0x341) >= 1; }, 500ms));
    const CanFrame f = b.rec.of(0x341).front().f;
    CHECK(f.dlc == 8);
    CHECK((f.data[0] >> 4) == 1);
    CHECK(f.data[7] == sum7(f));

    FrameTask snap;
    REQUIRE(b.s.snapshot(0x341, &snap) == Err::Ok);
    CHECK(snap.rolling_count >= 1);
    CHECK(snap.period == Period(100000));
}

TEST_CASE("Scheduler: period defaults to the layout cycle time") {
    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", { {"HandBrkSts", 2} }, std::nullopt, std::nullopt, &id) == Err::Ok);
    FrameTask snap;
    REQUIRE(b.s.snapshot(id, &snap) == Err::Ok);
    CHECK(snap.period == Period(100000));
    CHECK(snap.field_values["HandBrkSts"] == 2);
    // 레이아웃의 모든 신호가 시드됨
    CHECK(snap.field_values.size() == 4);
    CHECK_FALSE(snap.codec.rc.has_value());
}

TEST_CASE("Scheduler: add_periodic configuration errors") {
    Bench b;
    uint32_t id = 0;
    CHECK(b.s.add_periodic("Nope", {}, Period(10000), std::nullopt, &id) == Err::UnknownFrame);
    CHECK(b.s.add_periodic("Aux_Cmd", {}, std::nullopt, std::nullopt, &id) == Err::Config);

    CodecParams bad = epb_codec();
    bad.cs->byte = 4;   // Aux_Cmd는 4바이트
    CHECK(b.s.add_periodic("Aux_Cmd", {}, Period(10000), bad, &id) == Err::InvalidCodecParams);

    REQUIRE(b.s.add_periodic("Aux_Cmd", {}, Period(10000), std::nullopt, &id) == Err::Ok);
    CHECK(b.s.add_periodic("Aux_Cmd", {}, Period(10000), std::nullopt, &id) == Err::DuplicateFrame);

    Scheduler offline(debug_config());
    REQUIRE(offline.frame_db().add_message(aux_message()) == Err::Ok);
    CHECK(offline.add_periodic("Aux_Cmd", {}, Period(10000), std::nullopt, &id) == Err::State);
}

TEST_CASE("Scheduler: fixed counter holds while checksum keeps updating") {
    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(20000), epb_codec(), &id) == Err::Ok);
    REQUIRE(wait_until([&] { return b.rec.count(id) >= 2; }, 500ms));

    REQUIRE(b.s.set_fixed_rc(id, true) == Err::Ok);
    const TimePoint t_fix = Clock::now() + 30ms;   // 진행 중이던 틱은 제외
    std::this_thread::sleep_for(30ms);

    for (int v = 1; v <= 3; ++v) {
        const size_t before = b.rec.count_since(id, t_fix);
        REQUIRE(b.s.update_value(id, "HandBrkSts", v) == Err::Ok);
        REQUIRE(wait_until([&] { return b.rec.count_since(id, t_fix) >= before + 2; }, 500ms));
    }

    auto frames = b.rec.of(id);
    std::vector<CanFrame> after;
    for (auto& it : frames) if (it.at >= t_fix) after.push_back(it.f);
    REQUIRE(after.size() >= 3);

    const uint8_t rc = after.front().data[0] >> 4;
    bool cs_changed = false;
    for (auto& f : after) {
        CHECK((f.data[0] >> 4) == rc);
        CHECK(f.data[7] == sum7(f));
        if (f.data[7] != after.front().data[7]) cs_changed = true;
    }
    CHECK(cs_changed);

    FrameTask snap;
    REQUIRE(b.s.snapshot(id, &snap) == Err::Ok);
    CHECK(snap.rolling_count == rc);

    // 해제 후 다시 증가
    REQUIRE(b.s.set_fixed_rc(id, false) == Err::Ok);
    REQUIRE(wait_until([&] {
        FrameTask t;
        return b.s.snapshot(id, &t) == Err::Ok && t.rolling_count != rc;
    }, 500ms));
}

TEST_CASE("Scheduler: fixed checksum keeps the encoded byte") {
    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", { {"EPB_Checksum", 0xAB} }, Period(20000), epb_codec(), &id) == Err::Ok);
    REQUIRE(b.s.set_fixed_cs(id, true) == Err::Ok);
    const TimePoint t = Clock::now() + 30ms;
    REQUIRE(wait_until([&] { return b.rec.count_since(id, t) >= 2; }, 500ms));
    for (auto& it : b.rec.of(id)) {
        if (it.at >= t) CHECK(it.f.data[7] == 0xAB);
    }
}

TEST_CASE("Scheduler: disabled task sends nothing and resumes on a tick boundary") {
    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(20000), epb_codec(), &id) == Err::Ok);
    REQUIRE(wait_until([&] { return b.rec.count(id) >= 2; }, 500ms));

    REQUIRE(b.s.enable(id, false) == Err::Ok);
    const TimePoint t_off = Clock::now() + 25ms;
    std::this_thread::sleep_for(150ms);
    const TimePoint t_on = Clock::now();
    CHECK(b.rec.count_since(id, t_off) == 0);

    FrameTask paused;
    REQUIRE(b.s.snapshot(id, &paused) == Err::Ok);
    CHECK_FALSE(paused.enabled);

    REQUIRE(b.s.enable(id, true) == Err::Ok);
    REQUIRE(wait_until([&] { return b.rec.count_since(id, t_on) >= 1; }, 100ms));

    // 비활성 동안 카운터 진행 없음
    auto frames = b.rec.of(id);
    const CanFrame* last_before = nullptr;
    const CanFrame* first_after = nullptr;
    for (auto& it : frames) {
        if (it.at < t_on) last_before = &it.f;
        else if (!first_after) first_after = &it.f;
    }
    REQUIRE(last_before);
    REQUIRE(first_after);
    CHECK((first_after->data[0] >> 4) == (((last_before->data[0] >> 4) + 1) & 0xF));
}

TEST_CASE("Scheduler: removed task stops within one period") {
    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(20000), epb_codec(), &id) == Err::Ok);
    REQUIRE(wait_until([&] { return b.rec.count(id) >= 2; }, 500ms));
    REQUIRE(b.s.remove(id) == Err::Ok);
    CHECK_FALSE(b.s.is_running(id));

    std::this_thread::sleep_for(25ms);
    const size_t n = b.rec.count(id);
    std::this_thread::sleep_for(100ms);
    CHECK(b.rec.count(id) == n);

    FrameTask snap;
    CHECK(b.s.snapshot(id, &snap) == Err::NotFound);
    CHECK(b.s.update(id, { {"HandBrkSts", 1} }) == Err::NotFound);
}

TEST_CASE("Scheduler: transport failures are counted and the loop keeps running") {
    Bench b(debug_config(CAN_MODE_SILENT));
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(10000), epb_codec(), &id) == Err::Ok);

    FrameTask snap;
    REQUIRE(wait_until([&] {
        return b.s.snapshot(id, &snap) == Err::Ok && snap.stats.send_failures >= 3;
    }, 1000ms));
    CHECK(snap.stats.sent == 0);
    CHECK(b.s.is_running(id));
    CHECK(b.rec.count(id) == 0);
    // 송신 실패여도 카운터는 틱마다 진행
    CHECK(snap.rolling_count != 0);
}

TEST_CASE("Scheduler: update reports unknown signals and writes the audit log") {
    const std::string audit = "cansched_test_audit.txt";
    std::remove(audit.c_str());
    SchedulerConfig cfg = debug_config();
    cfg.audit_log_path = audit;
    {
        Bench b(cfg);
        uint32_t id = 0;
        REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(50000), epb_codec(), &id) == Err::Ok);

        std::vector<std::string> unknown;
        REQUIRE(b.s.update(id, { {"HandBrkSts", 1}, {"Ghost", 2} }, &unknown) == Err::Ok);
        REQUIRE(unknown.size() == 1);
        CHECK(unknown[0] == "Ghost");

        CHECK(b.s.update_value(id, "Ghost", 1) == Err::NotFound);
        CHECK(b.s.update_value(0x7FF, "HandBrkSts", 1) == Err::NotFound);
        CHECK(b.s.update_value(id, "Speed", 42.5) == Err::Ok);
        b.s.shutdown();
    }

    std::ifstream f(audit);
    REQUIRE(f);
    std::stringstream ss;
    ss << f.rdbuf();
    const std::string text = ss.str();
    CHECK(text.find("update id=0x341 {HandBrkSts=1}") != std::string::npos);
    CHECK(text.find("update id=0x341 {Speed=42.5}") != std::string::npos);
    CHECK(text.find("Ghost") == std::string::npos);
    std::remove(audit.c_str());
}

TEST_CASE("Scheduler: cadence follows the period") {
    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(20000), epb_codec(), &id) == Err::Ok);
    std::this_thread::sleep_for(505ms);
    const size_t n = b.rec.count(id);
    // 0ms부터 20ms 간격 → 약 26회
    CHECK(n >= 20);
    CHECK(n <= 28);
}

TEST_CASE("Scheduler: configured messages split into initial and periodic") {
    Bench b;
    std::vector<MessageConfig> msgs(2);
    msgs[0].name = "EPB_Status";
    msgs[0].values = { {"HandBrkSts", 1}, {"EPB_RollingCnt", 0}, {"EPB_Checksum", 0} };
    msgs[0].rc_field = std::string("EPB_RollingCnt");
    msgs[0].cs_field = std::string("EPB_Checksum");
    msgs[1].name = "Aux_Cmd";
    msgs[1].values = { {"Mode", 9} };
    b.s.set_message_configs(msgs);

    size_t sent = 0;
    REQUIRE(b.s.start_initial_messages(&sent) == Err::Ok);
    CHECK(sent == 1);
    REQUIRE(b.rec.count(0x250) == 1);
    CHECK(b.rec.of(0x250).front().f.data[0] == 9);

    std::vector<uint32_t> ids;
    REQUIRE(b.s.start_periodic_messages(&ids) == Err::Ok);
    REQUIRE(ids.size() == 1);
    CHECK(ids[0] == 0x341);
    CHECK_FALSE(b.s.is_running(0x250));

    FrameTask snap;
    REQUIRE(b.s.snapshot(0x341, &snap) == Err::Ok);
    REQUIRE(snap.codec.rc.has_value());
    CHECK(snap.codec.rc->start_bit == 7);
    CHECK(snap.field_values["HandBrkSts"] == 1);
}

TEST_CASE("Scheduler: shutdown is idempotent and releases the transport") {
    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(20000), epb_codec(), &id) == Err::Ok);
    REQUIRE(b.s.add_periodic("Aux_Cmd", {}, Period(30000), std::nullopt, &id) == Err::Ok);
    CHECK(b.s.task_ids().size() == 2);

    b.s.shutdown();
    CHECK_FALSE(b.s.connected());
    CHECK(b.s.task_ids().empty());
    b.s.shutdown();

    CHECK(b.s.add_periodic("EPB_Status", {}, Period(20000), std::nullopt, &id) == Err::State);
    CHECK(b.s.start_periodic_messages() == Err::State);
}

TEST_CASE("Scheduler: stop_all removes every task but keeps the transport") {
    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(20000), epb_codec(), &id) == Err::Ok);
    CHECK(b.s.stop_all() == 1);
    CHECK(b.s.task_ids().empty());
    CHECK(b.s.connected());
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(20000), epb_codec(), &id) == Err::Ok);
}

TEST_CASE("Scheduler: injected write failures are counted and sending recovers") {
    Bench b;
    DebugBus* bus = b.s.transport().debug_bus();
    REQUIRE(bus != nullptr);
    bus->fail_writes(CAN_ERR_BUSOFF, 3);

    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(5000), epb_codec(), &id) == Err::Ok);
    FrameTask snap;
    REQUIRE(wait_until([&] {
        return b.s.snapshot(id, &snap) == Err::Ok && snap.stats.sent >= 3;
    }, 1000ms));
    CHECK(snap.stats.send_failures == 3);
    CHECK(bus->rejected() == 3);

    // 실패한 3틱도 카운터를 소비 → 첫 성공 프레임의 카운터는 4
    auto frames = b.rec.of(id);
    REQUIRE(!frames.empty());
    CHECK((frames.front().f.data[0] >> 4) == 4);
}

TEST_CASE("Scheduler: overrunning ticks are counted and stay on the start grid") {
    Bench b;
    DebugBus* bus = b.s.transport().debug_bus();
    REQUIRE(bus != nullptr);

    const auto period = 10ms;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(period), epb_codec(), &id) == Err::Ok);
    REQUIRE(wait_until([&] { return b.rec.count(id) >= 1; }, 500ms));
    const TimePoint t0 = b.rec.of(id).front().at;

    // 컨트롤러가 한동안 주기보다 느림
    bus->set_write_delay(std::chrono::microseconds(35000));
    std::this_thread::sleep_for(120ms);
    bus->set_write_delay(std::chrono::microseconds(0));

    FrameTask snap;
    REQUIRE(b.s.snapshot(id, &snap) == Err::Ok);
    CHECK(snap.stats.overruns > 0);

    // 기준 시각을 다시 잡지 않으므로 밀린 틱을 따라잡아 총 횟수는 격자와 같다
    std::this_thread::sleep_until(t0 + 300ms);
    const size_t n = b.rec.count(id);
    CHECK(n >= 28);
    CHECK(n <= 32);

    // k번째 프레임은 t0 + k*period 보다 먼저 나가지 않는다
    auto frames = b.rec.of(id);
    for (size_t k = 0; k < frames.size(); ++k) {
        CHECK(frames[k].at - t0 >= period * (int64_t)k - 1ms);
    }
}

TEST_CASE("Scheduler: short waits are busy-waited up to the deadline") {
    SchedulerConfig cfg = debug_config();
    cfg.timing.min_sleep = std::chrono::microseconds(50000);
    Bench b(cfg);

    const auto period = 20ms;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(period), epb_codec(), &id) == Err::Ok);
    REQUIRE(wait_until([&] { return b.rec.count(id) >= 1; }, 500ms));
    const TimePoint t0 = b.rec.of(id).front().at;
    std::this_thread::sleep_until(t0 + 205ms);
    REQUIRE(b.s.remove(id) == Err::Ok);

    auto frames = b.rec.of(id);
    CHECK(frames.size() >= 9);
    CHECK(frames.size() <= 12);
    for (size_t k = 0; k < frames.size(); ++k) {
        CHECK(frames[k].at - t0 >= period * (int64_t)k - 500us);
    }
}

TEST_CASE("Scheduler: frame database reload waits for removed workers") {
    const std::string path = "cansched_test_frames.json";
    {
        std::ofstream f(path);
        f << R"([{"name":"EPB_Status","frame_id":"0x341","length":8,"cycle_time":20,
            "signals":[
                {"name":"EPB_RollingCnt","start_bit":4,"length":4},
                {"name":"HandBrkSts","start_bit":8,"length":2},
                {"name":"EPB_Checksum","start_bit":56,"length":8}]}])";
    }

    Bench b;
    uint32_t id = 0;
    REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(1000), epb_codec(), &id) == Err::Ok);
    CHECK(b.s.load_frame_db(path) == Err::State);
    REQUIRE(b.s.remove(id) == Err::Ok);

    // 1ms 태스크가 encode 중에 제거되는 경우를 반복
    for (int i = 0; i < 100; ++i) {
        REQUIRE(b.s.add_periodic("EPB_Status", {}, Period(1000), epb_codec(), &id) == Err::Ok);
        std::this_thread::sleep_for(std::chrono::microseconds(300 + (i % 7) * 100));
        REQUIRE(b.s.remove(id) == Err::Ok);
        REQUIRE(b.s.load_frame_db(path) == Err::Ok);
    }

    CHECK(b.s.frame_db().find("Aux_Cmd") == nullptr);
    const size_t before = b.rec.count(0x341);
    REQUIRE(b.s.add_periodic("EPB_Status", {}, std::nullopt, epb_codec(), &id) == Err::Ok);
    CHECK(wait_until([&] { return b.rec.count(0x341) > before; }, 500ms));
    std::remove(path.c_str());
}

TEST_CASE("Scheduler: tasks added during shutdown do not outlive it") {
    for (int round = 0; round < 20; ++round) {
        Bench b;
        std::thread adder([&] {
            for (;;) {
                uint32_t id = 0;
                Err e = b.s.add_periodic("EPB_Status", {}, Period(2000), epb_codec(), &id);
                if (e == Err::State) break;
                // shutdown이 먼저 지웠으면 NotFound
                if (e == Err::Ok && b.s.remove(id) != Err::Ok) break;
            }
        });
        std::this_thread::sleep_for(std::chrono::microseconds(200 + round * 50));
        b.s.shutdown();
        adder.join();

        CHECK(b.s.task_ids().empty());
        CHECK_FALSE(b.s.is_running(0x341));
        uint32_t id = 0;
        CHECK(b.s.add_periodic("EPB_Status", {}, Period(2000), epb_codec(), &id) == Err::State);
    }
}
