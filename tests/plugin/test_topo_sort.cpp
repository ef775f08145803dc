// plughost_plugin stable topological sort tests

#include <catch2/catch_test_macros.hpp>
#include <plughost/plugin/topo_sort.hpp>

using namespace plughost_plugin;

TEST_CASE("Stable topological sort", "[plugin][topo]") {
    SECTION("empty graph") {
        auto outcome = stable_topological_sort({}, CyclePolicy::BestEffort);
        REQUIRE(outcome.order.empty());
        REQUIRE(outcome.complete());
    }

    SECTION("independent nodes keep ascending order") {
        OrderingGraph graph{{4, {}}, {1, {}}, {7, {}}};
        auto outcome = stable_topological_sort(graph, CyclePolicy::BestEffort);
        REQUIRE(outcome.order == std::vector<std::size_t>{1, 4, 7});
    }

    SECTION("smallest ready node is emitted first") {
        // 3 must precede 0; 1 and 2 are free
        OrderingGraph graph{{0, {}}, {1, {}}, {2, {}}, {3, {0}}};
        auto outcome = stable_topological_sort(graph, CyclePolicy::BestEffort);
        REQUIRE(outcome.order == std::vector<std::size_t>{1, 2, 3, 0});
        REQUIRE(outcome.forced.empty());
    }

    SECTION("a released node outranks larger ready nodes") {
        // 1 must precede 0; 0 is emitted as soon as 1 is, ahead of 2
        OrderingGraph graph{{0, {}}, {1, {0}}, {2, {}}};
        auto outcome = stable_topological_sort(graph, CyclePolicy::BestEffort);
        REQUIRE(outcome.order == std::vector<std::size_t>{1, 0, 2});
    }

    SECTION("edges to unknown nodes and self edges are ignored") {
        OrderingGraph graph{{0, {0, 9}}, {1, {0}}};
        auto outcome = stable_topological_sort(graph, CyclePolicy::Reject);
        REQUIRE(outcome.complete());
        REQUIRE(outcome.order == std::vector<std::size_t>{1, 0});
    }

    SECTION("best effort breaks a cycle at the smallest node") {
        OrderingGraph graph{{0, {1}}, {1, {2}}, {2, {0}}, {3, {}}};
        auto outcome = stable_topological_sort(graph, CyclePolicy::BestEffort);
        REQUIRE(outcome.complete());
        REQUIRE(outcome.order == std::vector<std::size_t>{3, 0, 1, 2});
        REQUIRE(outcome.forced == std::vector<std::size_t>{0});
    }

    SECTION("reject reports the stalled nodes") {
        OrderingGraph graph{{0, {1}}, {1, {0}}, {2, {}}, {3, {0}}};
        auto outcome = stable_topological_sort(graph, CyclePolicy::Reject);
        REQUIRE_FALSE(outcome.complete());
        REQUIRE(outcome.order == std::vector<std::size_t>{2, 3});
        REQUIRE(outcome.stalled == std::vector<std::size_t>{0, 1});
    }
}
