#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <variant>

#include "mailbox/command/queue.hpp"
#include "mailbox/data_snapshot.hpp"

using namespace mailbox;

TEST_CASE("Command queue drains in push order", "[mailboxes]") {
    command::Queue q;
    REQUIRE(q.empty());

    q.push(command::SelectGesture{Gesture::Dump});
    q.push(command::TogglePause{});
    q.push(command::Quit{});
    REQUIRE_FALSE(q.empty());

    auto cmds = q.drain();
    REQUIRE(cmds.size() == 3);
    REQUIRE(std::holds_alternative<command::SelectGesture>(cmds[0]));
    REQUIRE(std::get<command::SelectGesture>(cmds[0]).gesture ==
            Gesture::Dump);
    REQUIRE(std::holds_alternative<command::TogglePause>(cmds[1]));
    REQUIRE(std::holds_alternative<command::Quit>(cmds[2]));

    REQUIRE(q.empty());
    REQUIRE(q.drain().empty());
}

TEST_CASE("FrameSnapshot publish/acquire", "[mailboxes]") {
    DataSnapshot<FrameSnapshot> mail;

    // default frame before anything is published
    REQUIRE(mail.acquire().label == "IDLE");
    REQUIRE(mail.acquire().pellet_count() == 0);

    FrameSnapshot f;
    f.positions = {1.f, 2.f, 3.f, 4.f};
    f.lifts = {1.5f, 0.f, 0.f};
    f.impulse = 3.5f;
    f.label = "Flattening";
    f.step_index = 10;
    f.step_count = 13;
    mail.publish(f);

    f.label = "Dumping";
    mail.publish(f);

    auto out = mail.acquire();
    REQUIRE(out.label == "Dumping");
    REQUIRE(out.pellet_count() == 2);
    REQUIRE(out.positions[3] == Catch::Approx(4.f));
    REQUIRE(out.impulse == Catch::Approx(3.5f));
    REQUIRE(out.step_count == 13);
}

TEST_CASE("SimulationStats publish/acquire", "[mailboxes]") {
    DataSnapshot<SimulationStatsSnapshot> stats;
    SimulationStatsSnapshot s{};
    s.effective_tps = 60;
    s.pellets = 500;
    s.last_step_ns = 1000;
    s.published_ns = 2000;
    s.num_steps = 42;
    stats.publish(s);
    auto out = stats.acquire();
    REQUIRE(out.effective_tps == 60);
    REQUIRE(out.pellets == 500);
    REQUIRE(out.last_step_ns == 1000);
    REQUIRE(out.published_ns == 2000);
    REQUIRE(out.num_steps == 42);
}
