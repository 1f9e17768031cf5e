/**
 * @file test_decisions.cpp
 * @brief Tests for merge decisions and the decision builder
 */

#include <gtest/gtest.h>
#include "trimerge/Decisions.hpp"
#include "trimerge/Errors.hpp"

using namespace trimerge;

TEST(Action, NamesRoundTrip) {
    for (Action a : {Action::Base, Action::Local, Action::Remote, Action::Either,
                     Action::Undecided, Action::LocalThenRemote}) {
        EXPECT_EQ(parse_action(to_string(a)), a);
    }
    EXPECT_THROW(parse_action("theirs"), std::invalid_argument);
}

TEST(DecisionKey, Formatting) {
    EXPECT_EQ(format_key(DecisionKey(std::string("cells"))), "cells");
    EXPECT_EQ(format_key(DecisionKey(KeyRange{2, 5})), "[2, 5)");
}

// ============================================================================
// Builder: map level
// ============================================================================

TEST(DecisionBuilder, KeepHasNoDiffs) {
    MergeDecisionBuilder b;
    b.keep("", "a");
    ASSERT_EQ(b.decisions().size(), 1u);
    const auto& d = b.decisions()[0];
    EXPECT_EQ(d.path, "");
    EXPECT_EQ(std::get<std::string>(d.key), "a");
    EXPECT_FALSE(d.conflict);
    EXPECT_EQ(d.action, Action::Base);
    EXPECT_FALSE(d.local_diff.has_value());
    EXPECT_FALSE(d.remote_diff.has_value());
    EXPECT_FALSE(d.custom_diff.has_value());
}

TEST(DecisionBuilder, OnesidedPicksChangedSide) {
    MergeDecisionBuilder b;
    auto entry = op_replace("a", 2);
    b.onesided("/m", "a", nullptr, &entry);
    b.onesided("/m", "a", &entry, nullptr);

    const auto& d = b.decisions();
    EXPECT_EQ(d[0].action, Action::Remote);
    EXPECT_FALSE(d[0].local_diff.has_value());
    EXPECT_EQ(*d[0].remote_diff, EditScript{entry});
    EXPECT_EQ(d[1].action, Action::Local);
    EXPECT_EQ(*d[1].local_diff, EditScript{entry});
    EXPECT_FALSE(d[1].remote_diff.has_value());
}

TEST(DecisionBuilder, OnesidedNeedsExactlyOneSide) {
    MergeDecisionBuilder b;
    auto entry = op_remove("a");
    EXPECT_THROW(b.onesided("", "a", nullptr, nullptr), ContractViolation);
    EXPECT_THROW(b.onesided("", "a", &entry, &entry), ContractViolation);
    EXPECT_TRUE(b.decisions().empty());
}

TEST(DecisionBuilder, AgreementAndConflictPreconditions) {
    MergeDecisionBuilder b;
    auto one = op_replace("a", 1);
    auto two = op_replace("a", 2);

    b.agreement("", "a", one, op_replace("a", 1));
    EXPECT_EQ(b.decisions().back().action, Action::Either);
    EXPECT_FALSE(b.decisions().back().conflict);

    b.conflict("", "a", one, two);
    EXPECT_EQ(b.decisions().back().action, Action::Undecided);
    EXPECT_TRUE(b.decisions().back().conflict);

    // Equal results reached through different entries of the same op
    b.agreement("", "a", op_patch("a", {op_add("x", 1)}), op_patch("a", {op_replace("x", 1)}));
    EXPECT_EQ(b.decisions().back().action, Action::Either);

    EXPECT_THROW(b.agreement("", "a", op_remove("a"), two), ContractViolation);
    EXPECT_THROW(b.conflict("", "a", one, one), ContractViolation);
    EXPECT_EQ(b.decisions().size(), 3u);
}

// ============================================================================
// Builder: chunk level
// ============================================================================

TEST(DecisionBuilder, ChunkDecisionsCarryRanges) {
    MergeDecisionBuilder b;
    EditScript insert = {op_addrange(3, Value::array({"x"}))};
    EditScript other = {op_addrange(3, Value::array({"y"}))};

    b.keep_chunk("", 0, 3);
    b.onesided_chunk("", 3, 3, insert, {});
    b.agreement_chunk("", 3, 3, insert, insert);
    b.conflict_chunk("", 3, 3, insert, other);
    b.local_then_remote("", 3, 3, insert, other);

    const auto& d = b.decisions();
    ASSERT_EQ(d.size(), 5u);
    EXPECT_EQ(std::get<KeyRange>(d[0].key), (KeyRange{0, 3}));
    EXPECT_EQ(d[0].action, Action::Base);
    EXPECT_EQ(d[1].action, Action::Local);
    EXPECT_EQ(d[2].action, Action::Either);
    EXPECT_EQ(d[3].action, Action::Undecided);
    EXPECT_TRUE(d[3].conflict);
    EXPECT_EQ(d[4].action, Action::LocalThenRemote);
    EXPECT_EQ(*d[4].local_diff, insert);
    EXPECT_EQ(*d[4].remote_diff, other);
}

TEST(DecisionBuilder, ChunkPreconditions) {
    MergeDecisionBuilder b;
    EditScript insert = {op_addrange(1, Value::array({1}))};
    EditScript removal = {op_removerange(1, 1)};

    EXPECT_THROW(b.keep_chunk("", 2, 1), ContractViolation);
    EXPECT_THROW(b.onesided_chunk("", 1, 2, {}, {}), ContractViolation);
    EXPECT_THROW(b.onesided_chunk("", 1, 2, insert, removal), ContractViolation);
    EXPECT_THROW(b.agreement_chunk("", 1, 2, insert, removal), ContractViolation);
    EXPECT_THROW(b.agreement_chunk("", 1, 2, {}, {}), ContractViolation);
    EXPECT_THROW(b.conflict_chunk("", 1, 2, insert, insert), ContractViolation);
    EXPECT_THROW(b.conflict_chunk("", 1, 2, insert, {}), ContractViolation);
    EXPECT_THROW(b.local_then_remote("", 1, 2, insert, removal), ContractViolation);
    EXPECT_THROW(b.local_then_remote("", 1, 1, insert, {}), ContractViolation);
    EXPECT_TRUE(b.decisions().empty());
}

TEST(DecisionBuilder, ValidatedHandsOverDecisions) {
    MergeDecisionBuilder b;
    b.keep("", "a");
    b.conflict("", "b", op_remove("b"), op_replace("b", 1));
    Decisions out = b.validated();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(has_conflicts(out));
    EXPECT_EQ(count_conflicts(out), 1u);
}

TEST(Decisions, ConflictCounting) {
    Decisions none;
    EXPECT_FALSE(has_conflicts(none));
    EXPECT_EQ(count_conflicts(none), 0u);
}

// ============================================================================
// JSON
// ============================================================================

TEST(DecisionJson, MapKeyRecord) {
    MergeDecision d;
    d.path = "/meta";
    d.key = std::string("title");
    d.action = Action::Remote;
    d.remote_diff = EditScript{op_replace("title", "B")};

    Value j = d;
    EXPECT_EQ(j["path"], "/meta");
    EXPECT_EQ(j["key"], "title");
    EXPECT_EQ(j["conflict"], false);
    EXPECT_EQ(j["action"], "remote");
    EXPECT_FALSE(j.contains("local_diff"));
    EXPECT_EQ(j["remote_diff"][0]["op"], "replace");

    auto back = j.get<MergeDecision>();
    EXPECT_EQ(back.path, d.path);
    EXPECT_EQ(back.key, d.key);
    EXPECT_EQ(back.action, d.action);
    EXPECT_FALSE(back.local_diff.has_value());
    EXPECT_EQ(back.remote_diff, d.remote_diff);
}

TEST(DecisionJson, RangeKeyIsPair) {
    MergeDecision d;
    d.key = KeyRange{3, 3};
    d.action = Action::LocalThenRemote;
    Value j = d;
    EXPECT_EQ(j["key"], Value::array({3, 3}));
    EXPECT_EQ(std::get<KeyRange>(j.get<MergeDecision>().key), (KeyRange{3, 3}));
}

TEST(DecisionJson, RejectsMalformedRecords) {
    Value bad_key = {{"path", ""}, {"key", 3}, {"conflict", false}, {"action", "base"}};
    EXPECT_THROW(bad_key.get<MergeDecision>(), std::invalid_argument);

    Value bad_action = {{"path", ""}, {"key", "a"}, {"conflict", false}, {"action", "mine"}};
    EXPECT_THROW(bad_action.get<MergeDecision>(), std::invalid_argument);
}

TEST(DecisionJson, RejectsBadRangeBounds) {
    Value negative = Value::parse(R"({"path": "/s", "key": [-1, 2], "conflict": false, "action": "base"})");
    EXPECT_THROW(negative.get<MergeDecision>(), std::invalid_argument);

    Value fractional = Value::parse(R"({"path": "/s", "key": [0.5, 2], "conflict": false, "action": "base"})");
    EXPECT_THROW(fractional.get<MergeDecision>(), std::invalid_argument);

    Value inverted = Value::parse(R"({"path": "/s", "key": [3, 1], "conflict": false, "action": "base"})");
    EXPECT_THROW(inverted.get<MergeDecision>(), std::invalid_argument);

    Value signed_ok = {{"path", "/s"}, {"key", Value::array({1, 2})}, {"conflict", false}, {"action", "base"}};
    EXPECT_EQ(std::get<KeyRange>(signed_ok.get<MergeDecision>().key), (KeyRange{1, 2}));
}

TEST(DecisionJson, ListConversion) {
    MergeDecisionBuilder b;
    b.keep("", "a");
    b.keep_chunk("/s", 0, 2);
    Value j = decisions_to_json(b.decisions());
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[1]["path"], "/s");
    EXPECT_EQ(j[1]["key"], Value::array({0, 2}));
}
