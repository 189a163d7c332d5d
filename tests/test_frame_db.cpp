#include <doctest/doctest.h>

#include "cansched/frame_db.hpp"
#include "test_support.hpp"

using namespace cansched;
using cansched_test::epb_message;

TEST_CASE("FrameDb: lookup reports id, length, period and field positions") {
    FrameDb db;
    REQUIRE(db.add_message(epb_message()) == Err::Ok);

    FrameLayout l;
    REQUIRE(db.lookup("EPB_Status", &l) == Err::Ok);
    CHECK(l.frame_id == 0x341);
    CHECK(l.byte_length == 8);
    REQUIRE(l.nominal_period.has_value());
    CHECK(*l.nominal_period == Period(100000));
    REQUIRE(l.fields.count("EPB_RollingCnt") == 1);
    CHECK(l.fields["EPB_RollingCnt"].byte_offset == 0);
    CHECK(l.fields["EPB_RollingCnt"].bit_offset == 4);
    CHECK(l.fields["EPB_RollingCnt"].bit_length == 4);
    CHECK(l.fields["EPB_Checksum"].byte_offset == 7);
    CHECK(l.flags == 0);

    CHECK(db.lookup("Nope", &l) == Err::UnknownFrame);
    CHECK(db.find_by_id(0x341) == db.find("EPB_Status"));
    CHECK(db.find_by_id(0x342) == nullptr);
}

TEST_CASE("FrameDb: encode packs Intel order with scale and clamps to range") {
    FrameDb db;
    REQUIRE(db.add_message(epb_message()) == Err::Ok);

    bytes out;
    SignalValues v{ {"HandBrkSts", 2}, {"Speed", 12.5}, {"NotASignal", 9} };
    REQUIRE(db.encode("EPB_Status", v, &out) == Err::Ok);
    REQUIRE(out.size() == 8);
    CHECK(out[1] == 0x02);
    CHECK(out[2] == 125);
    CHECK(out[3] == 0);

    // 300 초과 → 최대값으로
    REQUIRE(db.encode("EPB_Status", { {"Speed", 1000.0} }, &out) == Err::Ok);
    CHECK((out[2] | (out[3] << 8)) == 3000);

    SignalValues back;
    REQUIRE(db.decode("EPB_Status", out, &back) == Err::Ok);
    CHECK(back["Speed"] == doctest::Approx(300.0));

    CHECK(db.encode("Nope", v, &out) == Err::UnknownFrame);
}

TEST_CASE("FrameDb: missing values fall back to initial then minimum") {
    FrameDb db;
    MessageDef m = cansched_test::aux_message();
    m.signals[1].minimum = 7.0;
    m.signals[1].maximum = 100.0;
    REQUIRE(db.add_message(m) == Err::Ok);

    bytes out;
    REQUIRE(db.encode("Aux_Cmd", {}, &out) == Err::Ok);
    REQUIRE(out.size() == 4);
    CHECK(out[0] == 3);
    CHECK(out[1] == 7);
}

TEST_CASE("FrameDb: signed signals round-trip through decode") {
    FrameDb db;
    MessageDef m;
    m.name = "Steer";
    m.frame_id = 0x18FF0001;
    m.extended = true;
    m.length = 2;
    SignalDef a; a.name = "Angle"; a.start_bit = 0; a.length = 12; a.is_signed = true; a.scale = 0.5;
    m.signals = { a };
    REQUIRE(db.add_message(m) == Err::Ok);

    bytes out;
    REQUIRE(db.encode("Steer", { {"Angle", -10.0} }, &out) == Err::Ok);
    SignalValues back;
    REQUIRE(db.decode("Steer", out, &back) == Err::Ok);
    CHECK(back["Angle"] == doctest::Approx(-10.0));

    FrameLayout l;
    REQUIRE(db.lookup("Steer", &l) == Err::Ok);
    CHECK(l.flags == (uint32_t)CAN_FRAME_EXTID);
    CHECK_FALSE(l.nominal_period.has_value());
}

TEST_CASE("FrameDb: invalid definitions are rejected") {
    FrameDb db;
    MessageDef m = epb_message();

    SUBCASE("signal past the end of the frame") {
        m.signals[0].start_bit = 62;
        CHECK(db.add_message(m) == Err::Config);
    }
    SUBCASE("longer than classic CAN") {
        m.length = 12;
        CHECK(db.add_message(m) == Err::Config);
    }
    SUBCASE("duplicate frame id") {
        REQUIRE(db.add_message(m) == Err::Ok);
        m.name = "Other";
        CHECK(db.add_message(m) == Err::Config);
    }
    CHECK(db.size() <= 1);
}

TEST_CASE("FrameDb: loads the JSON message array") {
    auto j = nlohmann::json::parse(R"([
        {"name":"EPB_Status","frame_id":"0x341","length":8,"cycle_time":20,
         "signals":[
            {"name":"EPB_RollingCnt","start_bit":4,"length":4},
            {"name":"HandBrkSts","start_bit":8,"length":2,"initial":1},
            {"name":"EPB_Checksum","start_bit":56,"length":8}]},
        {"name":"Aux_Cmd","frame_id":592,"length":4,
         "signals":[{"name":"Mode","start_bit":0,"length":8,"byte_order":"little_endian"}]}
    ])");
    FrameDb db;
    REQUIRE(db.load(j) == Err::Ok);
    CHECK(db.size() == 2);

    FrameLayout l;
    REQUIRE(db.lookup("EPB_Status", &l) == Err::Ok);
    CHECK(l.frame_id == 0x341);
    CHECK(*l.nominal_period == Period(20000));
    REQUIRE(db.lookup("Aux_Cmd", &l) == Err::Ok);
    CHECK(l.frame_id == 592);

    bytes out;
    REQUIRE(db.encode("EPB_Status", {}, &out) == Err::Ok);
    CHECK(out[1] == 1);

    auto bad = nlohmann::json::parse(R"([{"name":"X","frame_id":"0x10","signals":[
        {"name":"S","start_bit":0,"length":8,"byte_order":"big_endian"}]}])");
    FrameDb db2;
    CHECK(db2.load(bad) == Err::Config);
    CHECK(db2.load(nlohmann::json::parse(R"([{"frame_id":1}])")) == Err::Config);
}

TEST_CASE("FrameDb: frame id parsing") {
    uint32_t id = 0;
    CHECK(parse_frame_id(nlohmann::json("0x341"), &id));
    CHECK(id == 0x341);
    CHECK(parse_frame_id(nlohmann::json(833), &id));
    CHECK(id == 833);
    CHECK_FALSE(parse_frame_id(nlohmann::json("zz"), &id));
    CHECK_FALSE(parse_frame_id(nlohmann::json(-1), &id));
}
