/**
 * @file test_merge_properties.cpp
 * @brief Structural properties of merge results over a set of documents
 */

#include <gtest/gtest.h>
#include "trimerge/Merge.hpp"

#include <set>

using namespace trimerge;

namespace {

struct Triple {
    const char* name;
    Value base;
    Value local;
    Value remote;
};

std::vector<Triple> documents() {
    return {
        {"notebook",
         {{"cells", Value::array({{{"source", "a"}}, {{"source", "b"}}})},
          {"metadata", {{"kernel", "py"}, {"tags", Value::array({"x"})}}},
          {"nbformat", 4}},
         {{"cells", Value::array({{{"source", "a"}}, {{"source", "b"}}, {{"source", "c"}}})},
          {"metadata", {{"kernel", "py3"}, {"tags", Value::array({"x"})}}},
          {"nbformat", 4}},
         {{"cells", Value::array({{{"source", "A"}}, {{"source", "b"}}})},
          {"metadata", {{"kernel", "py"}, {"tags", Value::array({"x", "y"})}}},
          {"nbformat", 5}}},
        {"sequence",
         Value::array({1, 2, 3, 4, 5}),
         Value::array({0, 1, 2, 4, 5, 6}),
         Value::array({1, 3, 4, 5, 7})},
        {"text",
         "the quick brown fox",
         "the quick red fox",
         "a quick brown fox!"},
        {"nested",
         {{"a", {{"b", {{"c", 1}, {"d", Value::array({1, 2})}}}}}},
         {{"a", {{"b", {{"c", 2}, {"d", Value::array({1, 2, 3})}}}}}},
         {{"a", {{"b", {{"c", 3}, {"d", Value::array({0, 1, 2})}}}}}}},
    };
}

Action mirrored(Action a) {
    switch (a) {
        case Action::Local: return Action::Remote;
        case Action::Remote: return Action::Local;
        default: return a;
    }
}

bool under(const std::string& path, const std::string& key) {
    const std::string prefix = "/" + key;
    return path == prefix || path.rfind(prefix + "/", 0) == 0;
}

} // namespace

TEST(MergeProperties, ConflictFlagMatchesAction) {
    for (const auto& t : documents()) {
        SCOPED_TRACE(t.name);
        for (const auto& d : merge(t.base, t.local, t.remote)) {
            EXPECT_EQ(d.conflict, d.action == Action::Undecided);
            EXPECT_FALSE(d.custom_diff.has_value());
        }
    }
}

TEST(MergeProperties, UnchangedMergeKeepsBase) {
    for (const auto& t : documents()) {
        SCOPED_TRACE(t.name);
        for (const auto& d : merge(t.base, t.base, t.base)) {
            EXPECT_EQ(d.action, Action::Base);
        }
    }
}

TEST(MergeProperties, SameChangeOnBothSidesNeverConflicts) {
    for (const auto& t : documents()) {
        SCOPED_TRACE(t.name);
        for (const Value* side : {&t.local, &t.remote}) {
            auto decisions = merge(t.base, *side, *side);
            EXPECT_FALSE(has_conflicts(decisions));
            for (const auto& d : decisions) {
                EXPECT_TRUE(d.action == Action::Base || d.action == Action::Either ||
                            d.action == Action::LocalThenRemote)
                    << to_string(d.action);
            }
        }
    }
}

TEST(MergeProperties, OneSidedChangesTakeThatSide) {
    for (const auto& t : documents()) {
        SCOPED_TRACE(t.name);
        for (const auto& d : merge(t.base, t.local, t.base)) {
            EXPECT_TRUE(d.action == Action::Base || d.action == Action::Local)
                << to_string(d.action);
        }
        for (const auto& d : merge(t.base, t.base, t.remote)) {
            EXPECT_TRUE(d.action == Action::Base || d.action == Action::Remote)
                << to_string(d.action);
        }
    }
}

TEST(MergeProperties, SwappingSidesMirrorsDecisions) {
    for (const auto& t : documents()) {
        SCOPED_TRACE(t.name);
        auto forward = merge(t.base, t.local, t.remote);
        auto backward = merge(t.base, t.remote, t.local);
        ASSERT_EQ(forward.size(), backward.size());
        for (std::size_t i = 0; i < forward.size(); ++i) {
            EXPECT_EQ(forward[i].path, backward[i].path);
            EXPECT_EQ(forward[i].key, backward[i].key);
            EXPECT_EQ(forward[i].conflict, backward[i].conflict);
            EXPECT_EQ(mirrored(forward[i].action), backward[i].action);
            EXPECT_EQ(forward[i].local_diff, backward[i].remote_diff);
            EXPECT_EQ(forward[i].remote_diff, backward[i].local_diff);
        }
    }
}

TEST(MergeProperties, EveryMapKeyDecidedOnce) {
    for (const auto& t : documents()) {
        if (!t.base.is_object()) continue;
        SCOPED_TRACE(t.name);
        auto decisions = merge(t.base, t.local, t.remote);

        std::set<std::string> keys;
        for (const Value* doc : {&t.base, &t.local, &t.remote}) {
            for (auto it = doc->begin(); it != doc->end(); ++it) keys.insert(it.key());
        }
        for (const auto& key : keys) {
            std::size_t at_root = 0;
            bool nested = false;
            for (const auto& d : decisions) {
                if (d.path.empty() && std::get<std::string>(d.key) == key) ++at_root;
                if (under(d.path, key)) nested = true;
            }
            EXPECT_EQ(at_root + (nested ? 1 : 0), 1u) << key;
        }
    }
}

TEST(MergeProperties, SequenceDecisionsCoverBase) {
    for (const auto& t : documents()) {
        if (t.base.is_object()) continue;
        SCOPED_TRACE(t.name);
        const std::size_t n = t.base.is_string() ? text_length(t.base.get<std::string>())
                                                 : t.base.size();
        std::size_t next = 0;
        const KeyRange* previous = nullptr;
        auto decisions = merge(t.base, t.local, t.remote);
        for (const auto& d : decisions) {
            const auto& range = std::get<KeyRange>(d.key);
            if (previous != nullptr && range == *previous) continue;
            EXPECT_EQ(range.begin, next);
            next = range.end;
            previous = &range;
        }
        EXPECT_EQ(next, n);
    }
}

TEST(MergeProperties, DivergentPatchesRecurseToLeaves) {
    const auto t = documents().back();
    auto decisions = merge(t.base, t.local, t.remote);

    ASSERT_EQ(decisions.size(), 3u);
    EXPECT_EQ(decisions[0].path, "/a/b");
    EXPECT_EQ(std::get<std::string>(decisions[0].key), "c");
    EXPECT_TRUE(decisions[0].conflict);

    EXPECT_EQ(decisions[1].path, "/a/b/d");
    EXPECT_EQ(std::get<KeyRange>(decisions[1].key), (KeyRange{0, 2}));
    EXPECT_EQ(decisions[1].action, Action::Remote);
    EXPECT_EQ(decisions[2].path, "/a/b/d");
    EXPECT_EQ(std::get<KeyRange>(decisions[2].key), (KeyRange{2, 2}));
    EXPECT_EQ(decisions[2].action, Action::Local);
}

TEST(MergeProperties, DeterministicOutput) {
    for (const auto& t : documents()) {
        SCOPED_TRACE(t.name);
        EXPECT_EQ(decisions_to_json(merge(t.base, t.local, t.remote)),
                  decisions_to_json(merge(t.base, t.local, t.remote)));
    }
}
