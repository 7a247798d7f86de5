#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/suppression_policy.hpp"
#include <vector>

using namespace caretsync;

namespace {

// A small coordinate space so that repeats are common.
struct Place {
    int file;
    int line;
    int character;
};

CursorPosition at(const Place& p, Origin origin, int64_t ts) {
    return CursorPosition(QStringLiteral("/src/f%1.ts").arg(p.file), p.line, p.character, origin,
                          Timestamp(ts));
}

} // namespace

namespace rc {

template<>
struct Arbitrary<Place> {
    static Gen<Place> arbitrary() {
        return gen::build<Place>(
            gen::set(&Place::file, gen::inRange(0, 2)),
            gen::set(&Place::line, gen::inRange(0, 3)),
            gen::set(&Place::character, gen::inRange(0, 3)));
    }
};

} // namespace rc

TEST_CASE("Property: nothing is sent while unfocused", "[property][suppression]") {
    REQUIRE(rc::check("unfocused local changes never produce a send",
        [](const std::vector<Place>& places) {
            SuppressionWindow window;
            int64_t ts = 0;
            for (const auto& p : places) {
                const auto candidate = at(p, Origin::Local, ts += 10);
                const auto decision = decide_outbound(window, candidate, false, false, true);
                RC_ASSERT(decision.kind == OutboundDecisionKind::SuppressUnfocused);
            }
        }));
}

TEST_CASE("Property: consecutive identical local changes send once", "[property][suppression]") {
    REQUIRE(rc::check("a coordinate equal to the last sent one is never re-sent",
        [](const std::vector<Place>& places) {
            SuppressionWindow window;
            std::vector<CursorPosition> sent;
            int64_t ts = 0;
            for (const auto& p : places) {
                const auto candidate = at(p, Origin::Local, ts += 1000);
                if (decide_outbound(window, candidate, false, true, true).accepted()) {
                    record_sent(window, candidate);
                    sent.push_back(candidate);
                }
            }
            for (size_t i = 1; i < sent.size(); ++i) {
                RC_ASSERT(!sent[i].samePlace(sent[i - 1]));
            }
            // Every change of place was sent
            size_t changes = 0;
            for (size_t i = 0; i < places.size(); ++i) {
                if (i == 0 || !at(places[i], Origin::Local, 0).samePlace(at(places[i - 1], Origin::Local, 0))) {
                    ++changes;
                }
            }
            RC_ASSERT(sent.size() == changes);
        }));
}

TEST_CASE("Property: own-label messages never apply", "[property][suppression]") {
    REQUIRE(rc::check("inbound positions not from the peer are always dropped",
        [](const std::vector<Place>& places) {
            SuppressionWindow window;
            int64_t ts = 0;
            for (const auto& p : places) {
                const auto decision = decide_inbound(window, at(p, Origin::Local, ts += 500));
                RC_ASSERT(decision.kind == InboundDecisionKind::DropNotPeerSourced);
            }
        }));
}

TEST_CASE("Property: inbound duplicates apply according to the time gap", "[property][suppression]") {
    REQUIRE(rc::check("second copy applies iff delta >= 250 ms",
        [](const Place& p) {
            const auto gap = *rc::gen::inRange<int64_t>(-1000, 1000);
            SuppressionWindow window;
            const auto first = at(p, Origin::Remote, 10'000);
            RC_ASSERT(decide_inbound(window, first).accepted());
            record_accepted(window, first);

            const auto second = at(p, Origin::Remote, 10'000 + gap);
            RC_ASSERT(decide_inbound(window, second).accepted() == (gap >= 250));
        }));
}

TEST_CASE("Property: decisions never mutate the window", "[property][suppression]") {
    REQUIRE(rc::check("decide_* leave the window as it was",
        [](const Place& sent, const Place& candidate, bool applying, bool focused, bool syncable) {
            SuppressionWindow window;
            record_sent(window, at(sent, Origin::Local, 1));
            (void)decide_outbound(window, at(candidate, Origin::Local, 2), applying, focused, syncable);
            (void)decide_inbound(window, at(candidate, Origin::Remote, 2));

            RC_ASSERT(window.last_sent->samePlace(at(sent, Origin::Local, 0)));
            RC_ASSERT(!window.last_accepted.has_value());
        }));
}
