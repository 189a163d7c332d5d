#include <doctest/doctest.h>

#include "cansched/tick_loop.hpp"

using namespace cansched;
using std::chrono::microseconds;
using std::chrono::milliseconds;
using std::chrono::nanoseconds;

TEST_CASE("Drift: no history means no compensation") {
    DriftCompensator d{ TimingParams{} };
    CHECK(d.compensation() == nanoseconds::zero());
    CHECK(d.samples() == 0);
}

TEST_CASE("Drift: compensation is mean of recent samples times factor") {
    DriftCompensator d{ TimingParams{} };
    d.record(microseconds(1000));
    d.record(microseconds(3000));
    CHECK(d.compensation() == microseconds(600));   // 2000us * 0.3
}

TEST_CASE("Drift: history is bounded to the most recent samples") {
    DriftCompensator d{ TimingParams{} };
    for (int i = 0; i < 10; ++i) d.record(microseconds(10000));
    for (int i = 0; i < 5; ++i) d.record(microseconds(1000));
    CHECK(d.samples() == 5);
    CHECK(d.compensation() == microseconds(300));
}

TEST_CASE("Drift: compensation is capped") {
    TimingParams p;
    {
        DriftCompensator d{ p };
        d.record(milliseconds(2000));
        CHECK(d.compensation() == microseconds(100000));
    }
    p.max_compensation = microseconds(50);
    DriftCompensator d2{ p };
    d2.record(microseconds(1000));
    CHECK(d2.compensation() == microseconds(50));
}

TEST_CASE("Drift: tunable factor and history length") {
    TimingParams p;
    p.compensation_factor = 0.0;
    DriftCompensator off{ p };
    off.record(milliseconds(5));
    CHECK(off.compensation() == nanoseconds::zero());

    p.compensation_factor = 1.0;
    p.history_len = 1;
    DriftCompensator one{ p };
    one.record(microseconds(100));
    one.record(microseconds(700));
    CHECK(one.samples() == 1);
    CHECK(one.compensation() == microseconds(700));
}
