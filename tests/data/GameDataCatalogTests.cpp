/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file GameDataCatalogTests.cpp
 * @brief Tests for loading and validating action and class definitions
 *
 * Tests cover:
 * - Loading a well-formed document and the per-field defaults
 * - Rejected documents leaving the catalog unchanged
 * - Programmatic registration throwing on invalid or duplicate entries
 */

#define BOOST_TEST_MODULE GameDataCatalogTests
#include <boost/test/unit_test.hpp>

#include "data/GameDataCatalog.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* const VALID_DATA = R"({
  "actions": [
    { "id": "slash", "logic": "Melee", "amount": 18, "range": 2.0,
      "duration": 0.6, "executeTime": 0.3, "reuseTime": 1.5, "animTrigger": "Slash" },
    { "id": "mend", "logic": "Heal", "amount": 25, "duration": 1.0, "executeTime": 0.5 },
    { "id": "rally", "logic": "Revive", "amount": 30, "duration": 2.0, "executeTime": 2.0 },
    { "id": "shell", "logic": "Buff", "duration": 4.0, "damageMultiplier": 0.5, "interruptible": false }
  ],
  "classes": [
    { "id": "cleric", "maxHitPoints": 90, "skills": ["mend", "rally"] },
    { "id": "goblin", "maxHitPoints": 60, "moveSpeed": 3.0, "detectionRange": 6.0,
      "isNpc": true, "skills": ["slash"] }
  ]
})";

// Wraps a single action entry in an otherwise empty document
std::string withAction(const std::string& action) {
    return std::string(R"({ "actions": [ )") + action + " ] }";
}

} // namespace

struct CatalogFixture {
    GameDataCatalog catalog;

    ActionDefinition makeAction(const std::string& id) {
        ActionDefinition def;
        def.id = id;
        def.logic = ActionLogic::Melee;
        def.durationSeconds = 0.5f;
        def.executeTimeSeconds = 0.25f;
        def.amount = 5;
        return def;
    }
};

BOOST_AUTO_TEST_SUITE(LoadTests)

BOOST_FIXTURE_TEST_CASE(ValidDocumentLoads, CatalogFixture) {
    BOOST_REQUIRE(catalog.loadFromString(VALID_DATA));

    BOOST_CHECK_EQUAL(catalog.getActionCount(), 4u);
    BOOST_CHECK_EQUAL(catalog.getClassCount(), 2u);

    auto slash = catalog.getAction("slash");
    BOOST_REQUIRE(slash);
    BOOST_CHECK(slash->logic == ActionLogic::Melee);
    BOOST_CHECK_EQUAL(slash->amount, 18);
    BOOST_CHECK_CLOSE(slash->executeTimeSeconds, 0.3f, 0.001f);
    BOOST_CHECK_CLOSE(slash->reuseTimeSeconds, 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(slash->animTrigger, "Slash");
    BOOST_CHECK(!slash->friendly);

    auto goblin = catalog.getClass("goblin");
    BOOST_REQUIRE(goblin);
    BOOST_CHECK(goblin->isNpc);
    BOOST_CHECK_EQUAL(goblin->maxHitPoints, 60);
    BOOST_CHECK_CLOSE(goblin->detectionRange, 6.0f, 0.001f);
    BOOST_REQUIRE_EQUAL(goblin->skills.size(), 1u);
    BOOST_CHECK_EQUAL(goblin->skills[0], "slash");
}

BOOST_FIXTURE_TEST_CASE(DefaultsFollowLogic, CatalogFixture) {
    BOOST_REQUIRE(catalog.loadFromString(VALID_DATA));

    // Heal and Revive target allies unless told otherwise
    BOOST_CHECK(catalog.getAction("mend")->friendly);
    BOOST_CHECK(catalog.getAction("rally")->friendly);
    BOOST_CHECK_CLOSE(catalog.getAction("mend")->range, 1.5f, 0.001f);

    auto shell = catalog.getAction("shell");
    BOOST_CHECK(!shell->interruptible);
    BOOST_CHECK_CLOSE(shell->damageMultiplier, 0.5f, 0.001f);

    auto cleric = catalog.getClass("cleric");
    BOOST_CHECK(!cleric->isNpc);
    BOOST_CHECK_CLOSE(cleric->moveSpeed, 5.0f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(IdsAreListedInOrder, CatalogFixture) {
    BOOST_REQUIRE(catalog.loadFromString(VALID_DATA));

    const std::vector<std::string> classes{"cleric", "goblin"};
    BOOST_CHECK(catalog.getClassIds() == classes);
    BOOST_CHECK_EQUAL(catalog.getActionIds().size(), 4u);
    BOOST_CHECK(catalog.hasAction("shell"));
    BOOST_CHECK(!catalog.hasClass("dragon"));
    BOOST_CHECK(!catalog.getAction("dragonfire"));
}

BOOST_FIXTURE_TEST_CASE(MissingFileFails, CatalogFixture) {
    BOOST_CHECK(!catalog.loadFromFile("does/not/exist.json"));
    BOOST_CHECK_EQUAL(catalog.getActionCount(), 0u);
}

BOOST_FIXTURE_TEST_CASE(ClearKeepsHandedOutEntries, CatalogFixture) {
    BOOST_REQUIRE(catalog.loadFromString(VALID_DATA));
    auto slash = catalog.getAction("slash");

    catalog.clear();

    BOOST_CHECK_EQUAL(catalog.getActionCount(), 0u);
    BOOST_CHECK_EQUAL(catalog.getClassCount(), 0u);
    BOOST_CHECK_EQUAL(slash->id, "slash");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ValidationTests)

BOOST_FIXTURE_TEST_CASE(RejectedDocumentLeavesCatalogUnchanged, CatalogFixture) {
    BOOST_REQUIRE(catalog.loadFromString(VALID_DATA));

    BOOST_CHECK(!catalog.loadFromString(R"({
      "actions": [ { "id": "kick", "logic": "Melee", "duration": 0.5 } ],
      "classes": [ { "id": "monk", "skills": ["kick", "palm"] } ]
    })"));

    BOOST_CHECK(!catalog.hasAction("kick"));
    BOOST_CHECK(!catalog.hasClass("monk"));
    BOOST_CHECK_EQUAL(catalog.getActionCount(), 4u);
}

BOOST_FIXTURE_TEST_CASE(MalformedJsonFails, CatalogFixture) {
    BOOST_CHECK(!catalog.loadFromString("{ \"actions\": [ }"));
    BOOST_CHECK(!catalog.loadFromString("[1, 2]"));
}

BOOST_FIXTURE_TEST_CASE(InvalidActionsAreRejected, CatalogFixture) {
    BOOST_CHECK(!catalog.loadFromString(withAction(R"({ "id": "", "logic": "Melee" })")));
    BOOST_CHECK(!catalog.loadFromString(withAction(R"({ "id": "x", "logic": "Dance" })")));
    BOOST_CHECK(!catalog.loadFromString(withAction(R"({ "id": "x", "logic": "Melee", "reuseTime": -1 })")));
    BOOST_CHECK(!catalog.loadFromString(
        withAction(R"({ "id": "x", "logic": "Melee", "duration": 0.5, "executeTime": 0.8 })")));
    BOOST_CHECK(!catalog.loadFromString(withAction(R"({ "id": "x", "logic": "Ranged", "range": -2 })")));
    BOOST_CHECK(!catalog.loadFromString(withAction(R"({ "id": "x", "logic": "AreaOfEffect", "radius": -1 })")));
    BOOST_CHECK(!catalog.loadFromString(withAction(R"({ "id": "x", "logic": "Melee", "amount": -5 })")));
    BOOST_CHECK(!catalog.loadFromString(withAction(R"({ "id": "x", "logic": "Buff", "damageMultiplier": -0.5 })")));
    BOOST_CHECK(!catalog.loadFromString(withAction("42")));

    BOOST_CHECK_EQUAL(catalog.getActionCount(), 0u);
}

BOOST_FIXTURE_TEST_CASE(InvalidClassesAreRejected, CatalogFixture) {
    BOOST_CHECK(!catalog.loadFromString(R"({ "classes": [ { "id": "ghost", "maxHitPoints": 0 } ] })"));
    BOOST_CHECK(!catalog.loadFromString(R"({ "classes": [ { "id": "snail", "moveSpeed": -1 } ] })"));
    BOOST_CHECK(!catalog.loadFromString(R"({ "classes": [ { "id": "mage", "skills": ["fireball"] } ] })"));
    BOOST_CHECK(!catalog.loadFromString(R"({ "classes": [ { "id": "mage", "skills": [7] } ] })"));

    BOOST_CHECK_EQUAL(catalog.getClassCount(), 0u);
}

BOOST_FIXTURE_TEST_CASE(DuplicatesAreRejected, CatalogFixture) {
    BOOST_CHECK(!catalog.loadFromString(R"({ "actions": [
        { "id": "slash", "logic": "Melee" }, { "id": "slash", "logic": "Ranged" } ] })"));

    BOOST_REQUIRE(catalog.loadFromString(VALID_DATA));
    // A later file may not redefine an existing entry
    BOOST_CHECK(!catalog.loadFromString(withAction(R"({ "id": "slash", "logic": "Melee" })")));
}

BOOST_FIXTURE_TEST_CASE(AddActionThrowsOnInvalid, CatalogFixture) {
    catalog.addAction(makeAction("jab"));
    BOOST_CHECK(catalog.hasAction("jab"));

    BOOST_CHECK_THROW(catalog.addAction(makeAction("jab")), std::invalid_argument);

    ActionDefinition late = makeAction("late");
    late.executeTimeSeconds = 1.0f;
    BOOST_CHECK_THROW(catalog.addAction(late), std::invalid_argument);

    BOOST_CHECK_THROW(catalog.addAction(makeAction("")), std::invalid_argument);
    BOOST_CHECK_EQUAL(catalog.getActionCount(), 1u);
}

BOOST_FIXTURE_TEST_CASE(AddClassThrowsOnInvalid, CatalogFixture) {
    catalog.addAction(makeAction("jab"));

    CharacterClass brawler;
    brawler.id = "brawler";
    brawler.skills = {"jab"};
    catalog.addClass(brawler);
    BOOST_CHECK(catalog.hasClass("brawler"));

    BOOST_CHECK_THROW(catalog.addClass(brawler), std::invalid_argument);

    CharacterClass unknownSkill;
    unknownSkill.id = "mystic";
    unknownSkill.skills = {"jab", "meditate"};
    BOOST_CHECK_THROW(catalog.addClass(unknownSkill), std::invalid_argument);

    CharacterClass frail;
    frail.id = "frail";
    frail.maxHitPoints = -3;
    BOOST_CHECK_THROW(catalog.addClass(frail), std::invalid_argument);

    BOOST_CHECK_EQUAL(catalog.getClassCount(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
