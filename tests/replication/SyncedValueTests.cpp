/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SyncedValueTests
#include <boost/test/unit_test.hpp>

#include "entities/EntityTypes.hpp"
#include "replication/SyncedValue.hpp"

#include <utility>
#include <vector>

BOOST_AUTO_TEST_SUITE(AuthorityTests)

BOOST_AUTO_TEST_CASE(SetValueNotifiesWithOldAndNew) {
    SyncedValue<int> value(10);
    std::vector<std::pair<int, int>> changes;
    value.addChangeHandler([&](const int& oldValue, const int& newValue) {
        changes.emplace_back(oldValue, newValue);
    });

    BOOST_CHECK_EQUAL(value.setValue(25), SyncResult::Changed);

    BOOST_CHECK_EQUAL(value.get(), 25);
    BOOST_CHECK_EQUAL(value.getSequence(), 1u);
    BOOST_REQUIRE_EQUAL(changes.size(), 1u);
    BOOST_CHECK_EQUAL(changes[0].first, 10);
    BOOST_CHECK_EQUAL(changes[0].second, 25);
}

BOOST_AUTO_TEST_CASE(EqualValueIsSilent) {
    SyncedValue<int> value(10);
    int calls = 0;
    value.addChangeHandler([&](const int&, const int&) { ++calls; });

    BOOST_CHECK_EQUAL(value.setValue(10), SyncResult::Unchanged);
    BOOST_CHECK_EQUAL(calls, 0);
    BOOST_CHECK_EQUAL(value.getSequence(), 0u);
}

BOOST_AUTO_TEST_CASE(ObserverCannotWrite) {
    SyncedValue<int> value(10, SyncRole::Observer);
    int calls = 0;
    value.addChangeHandler([&](const int&, const int&) { ++calls; });

    BOOST_CHECK_EQUAL(value.setValue(99), SyncResult::NotAuthorized);
    BOOST_CHECK_EQUAL(value.get(), 10);
    BOOST_CHECK_EQUAL(calls, 0);
    BOOST_CHECK(!value.isAuthority());
}

BOOST_AUTO_TEST_CASE(RemovedHandlerStopsReceiving) {
    SyncedValue<int> value(0);
    int calls = 0;
    auto id = value.addChangeHandler([&](const int&, const int&) { ++calls; });

    value.setValue(1);
    BOOST_CHECK(value.removeChangeHandler(id));
    value.setValue(2);

    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK(!value.removeChangeHandler(id));
}

BOOST_AUTO_TEST_CASE(CopiesDropHandlers) {
    SyncedValue<int> original(5);
    original.addChangeHandler([](const int&, const int&) {});
    original.setValue(6);

    SyncedValue<int> copy(original);
    BOOST_CHECK_EQUAL(copy.get(), 6);
    BOOST_CHECK_EQUAL(copy.getSequence(), 1u);
    BOOST_CHECK_EQUAL(copy.getChangeHandlerCount(), 0u);
    BOOST_CHECK_EQUAL(original.getChangeHandlerCount(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ObserverTests)

BOOST_AUTO_TEST_CASE(ReplicatedValuesApplyInSequenceOrder) {
    SyncedValue<LifeState> mirror(LifeState::Alive, SyncRole::Observer);
    std::vector<LifeState> seen;
    mirror.addChangeHandler(
        [&](const LifeState&, const LifeState& newValue) { seen.push_back(newValue); });

    BOOST_CHECK(mirror.applyReplicated(LifeState::Fainted, 2));
    BOOST_CHECK(!mirror.applyReplicated(LifeState::Alive, 1));
    BOOST_CHECK(!mirror.applyReplicated(LifeState::Dead, 2));

    BOOST_CHECK_EQUAL(mirror.get(), LifeState::Fainted);
    BOOST_CHECK_EQUAL(mirror.getSequence(), 2u);
    BOOST_REQUIRE_EQUAL(seen.size(), 1u);
    BOOST_CHECK_EQUAL(seen[0], LifeState::Fainted);
}

BOOST_AUTO_TEST_CASE(NewerEqualValueAdvancesSequenceSilently) {
    SyncedValue<int> mirror(7, SyncRole::Observer);
    int calls = 0;
    mirror.addChangeHandler([&](const int&, const int&) { ++calls; });

    BOOST_CHECK(mirror.applyReplicated(7, 3));
    BOOST_CHECK_EQUAL(mirror.getSequence(), 3u);
    BOOST_CHECK_EQUAL(calls, 0);
}

BOOST_AUTO_TEST_SUITE_END()
