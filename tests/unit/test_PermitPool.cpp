#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/PermitPool.hpp"

#include <vector>

using namespace portprobe::infra;

using Permit = PermitPool::Permit;

TEST_CASE("PermitPool capacity", "[PermitPool]") {
    asio::io_context io;

    SECTION("Zero capacity is raised to one") {
        auto pool = PermitPool::create(io, 0);
        REQUIRE(pool->capacity() == 1);
    }

    SECTION("Fresh pool has nothing in flight") {
        auto pool = PermitPool::create(io, 4);
        REQUIRE(pool->capacity() == 4);
        REQUIRE(pool->inFlight() == 0);
        REQUIRE(pool->peakInFlight() == 0);
        REQUIRE(pool->totalAcquired() == 0);
    }
}

TEST_CASE("PermitPool bounds permits in flight", "[PermitPool]") {
    asio::io_context io;
    auto pool = PermitPool::create(io, 2);
    std::vector<Permit> held;

    auto keep = [&held](Permit permit) { held.push_back(std::move(permit)); };

    pool->acquire(keep);
    pool->acquire(keep);
    pool->acquire(keep);

    // Handlers are posted, never invoked inline
    REQUIRE(held.empty());
    io.poll();
    io.restart();

    REQUIRE(held.size() == 2);
    REQUIRE(pool->inFlight() == 2);
    // The third request is still queued
    REQUIRE(pool->totalAcquired() == 2);

    SECTION("Releasing a permit hands it to the waiter") {
        held.front().reset();
        REQUIRE(pool->inFlight() == 2);
        REQUIRE(pool->totalAcquired() == 3);

        io.poll();
        io.restart();
        REQUIRE(held.size() == 3);
        REQUIRE(pool->totalAcquired() == 3);
        REQUIRE(pool->peakInFlight() == 2);
    }

    SECTION("Dropping every permit drains the pool") {
        held.clear();
        io.poll();
        io.restart();
        REQUIRE(held.size() == 1);
        held.clear();

        REQUIRE(pool->inFlight() == 0);
        REQUIRE(pool->totalAcquired() == 3);
    }
}

TEST_CASE("PermitPool serves waiters in request order", "[PermitPool]") {
    asio::io_context io;
    auto pool = PermitPool::create(io, 1);

    std::vector<int> order;
    for (int id = 1; id <= 4; ++id) {
        // Each handler drops its permit on return, letting the next waiter in
        pool->acquire([&order, id](Permit) { order.push_back(id); });
    }
    REQUIRE(pool->totalAcquired() == 1);

    io.run();

    REQUIRE(order == std::vector<int>{1, 2, 3, 4});
    REQUIRE(pool->inFlight() == 0);
    REQUIRE(pool->peakInFlight() == 1);
    REQUIRE(pool->totalAcquired() == 4);
}

TEST_CASE("PermitPool Permit RAII", "[PermitPool]") {
    asio::io_context io;
    auto pool = PermitPool::create(io, 1);
    Permit permit;
    permit.reset();
    REQUIRE(pool->inFlight() == 0);

    pool->acquire([&permit](Permit granted) { permit = std::move(granted); });
    io.run();
    io.restart();

    REQUIRE(pool->inFlight() == 1);

    SECTION("Move transfers ownership") {
        Permit other(std::move(permit));
        permit.reset();
        REQUIRE(pool->inFlight() == 1);

        other.reset();
        REQUIRE(pool->inFlight() == 0);
    }

    SECTION("Reset twice releases once") {
        permit.reset();
        permit.reset();
        REQUIRE(pool->inFlight() == 0);
        REQUIRE(pool->totalAcquired() == 1);
    }

    SECTION("Destruction releases the permit") {
        { Permit scoped(std::move(permit)); }
        REQUIRE(pool->inFlight() == 0);
    }

    SECTION("Permit keeps its pool alive") {
        std::weak_ptr<PermitPool> weak = pool;
        pool.reset();
        REQUIRE_FALSE(weak.expired());

        permit.reset();
        REQUIRE(weak.expired());
    }
}
