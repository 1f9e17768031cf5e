/**
 * @file Decisions.cpp
 * @brief Merge decision model and builder
 */

#include "trimerge/Decisions.hpp"
#include "trimerge/Errors.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace trimerge {

const char* to_string(Action action) {
    switch (action) {
        case Action::Base: return "base";
        case Action::Local: return "local";
        case Action::Remote: return "remote";
        case Action::Either: return "either";
        case Action::Undecided: return "undecided";
        case Action::LocalThenRemote: return "local_then_remote";
    }
    return "unknown";
}

Action parse_action(const std::string& name) {
    if (name == "base") return Action::Base;
    if (name == "local") return Action::Local;
    if (name == "remote") return Action::Remote;
    if (name == "either") return Action::Either;
    if (name == "undecided") return Action::Undecided;
    if (name == "local_then_remote") return Action::LocalThenRemote;
    throw std::invalid_argument("unknown merge action '" + name + "'");
}

std::string format_key(const DecisionKey& key) {
    if (const auto* s = std::get_if<std::string>(&key)) {
        return *s;
    }
    const auto& range = std::get<KeyRange>(key);
    return "[" + std::to_string(range.begin) + ", " + std::to_string(range.end) + ")";
}

bool has_conflicts(const Decisions& decisions) {
    return std::any_of(decisions.begin(), decisions.end(),
                       [](const MergeDecision& d) { return d.conflict; });
}

std::size_t count_conflicts(const Decisions& decisions) {
    return static_cast<std::size_t>(std::count_if(decisions.begin(), decisions.end(),
                                                  [](const MergeDecision& d) { return d.conflict; }));
}

// ============================================================================
// JSON conversion
// ============================================================================

void to_json(Value& j, const MergeDecision& d) {
    j = Value::object();
    j["path"] = d.path;
    if (const auto* s = std::get_if<std::string>(&d.key)) {
        j["key"] = *s;
    } else {
        const auto& range = std::get<KeyRange>(d.key);
        j["key"] = Value::array({range.begin, range.end});
    }
    j["conflict"] = d.conflict;
    j["action"] = to_string(d.action);
    if (d.local_diff) j["local_diff"] = edit_script_to_json(*d.local_diff);
    if (d.remote_diff) j["remote_diff"] = edit_script_to_json(*d.remote_diff);
    if (d.custom_diff) j["custom_diff"] = edit_script_to_json(*d.custom_diff);
}

namespace {

std::size_t range_bound(const Value& bound) {
    if (bound.is_number_unsigned()) {
        return bound.get<std::size_t>();
    }
    if (bound.is_number_integer() && bound.get<std::int64_t>() >= 0) {
        return static_cast<std::size_t>(bound.get<std::int64_t>());
    }
    throw std::invalid_argument("merge decision range bounds must be non-negative integers");
}

} // namespace

void from_json(const Value& j, MergeDecision& d) {
    if (!j.is_object()) {
        throw std::invalid_argument("merge decision must be an object");
    }
    d = MergeDecision{};
    d.path = j.at("path").get<std::string>();

    const Value& key = j.at("key");
    if (key.is_string()) {
        d.key = key.get<std::string>();
    } else if (key.is_array() && key.size() == 2) {
        d.key = KeyRange{range_bound(key[0]), range_bound(key[1])};
        if (std::get<KeyRange>(d.key).begin > std::get<KeyRange>(d.key).end) {
            throw std::invalid_argument("merge decision range is inverted");
        }
    } else {
        throw std::invalid_argument("merge decision key must be a string or [begin, end]");
    }

    d.conflict = j.at("conflict").get<bool>();
    d.action = parse_action(j.at("action").get<std::string>());

    auto read_diff = [&j](const char* field) -> std::optional<EditScript> {
        auto it = j.find(field);
        if (it == j.end()) return std::nullopt;
        return edit_script_from_json(*it);
    };
    d.local_diff = read_diff("local_diff");
    d.remote_diff = read_diff("remote_diff");
    d.custom_diff = read_diff("custom_diff");
}

Value decisions_to_json(const Decisions& decisions) {
    Value j = Value::array();
    for (const auto& d : decisions) {
        Value item;
        to_json(item, d);
        j.push_back(std::move(item));
    }
    return j;
}

// ============================================================================
// Builder
// ============================================================================

namespace {

void require(bool condition, const std::string& what, const std::string& path,
             const DecisionKey& key) {
    if (!condition) {
        throw ContractViolation(what + " at '" + path + "' key " + format_key(key));
    }
}

} // anonymous namespace

void MergeDecisionBuilder::add(std::string path, DecisionKey key, bool conflict, Action action,
                               std::optional<EditScript> local, std::optional<EditScript> remote) {
    MergeDecision d;
    d.path = std::move(path);
    d.key = std::move(key);
    d.conflict = conflict;
    d.action = action;
    d.local_diff = std::move(local);
    d.remote_diff = std::move(remote);
    decisions_.push_back(std::move(d));
}

void MergeDecisionBuilder::keep(const std::string& path, const std::string& key) {
    add(path, key, false, Action::Base, std::nullopt, std::nullopt);
}

void MergeDecisionBuilder::onesided(const std::string& path, const std::string& key,
                                    const DiffEntry* local, const DiffEntry* remote) {
    require((local == nullptr) != (remote == nullptr),
            "onesided decision needs exactly one side", path, key);
    if (local != nullptr) {
        add(path, key, false, Action::Local, EditScript{*local}, std::nullopt);
    } else {
        add(path, key, false, Action::Remote, std::nullopt, EditScript{*remote});
    }
}

void MergeDecisionBuilder::agreement(const std::string& path, const std::string& key,
                                     const DiffEntry& local, const DiffEntry& remote) {
    require(local.op == remote.op, "agreement on differing ops", path, key);
    add(path, key, false, Action::Either, EditScript{local}, EditScript{remote});
}

void MergeDecisionBuilder::conflict(const std::string& path, const std::string& key,
                                    const DiffEntry& local, const DiffEntry& remote) {
    require(local != remote, "conflict on equal changes", path, key);
    add(path, key, true, Action::Undecided, EditScript{local}, EditScript{remote});
}

void MergeDecisionBuilder::keep_chunk(const std::string& path, std::size_t begin, std::size_t end) {
    const KeyRange range{begin, end};
    require(begin <= end, "inverted chunk range", path, range);
    add(path, range, false, Action::Base, std::nullopt, std::nullopt);
}

void MergeDecisionBuilder::onesided_chunk(const std::string& path, std::size_t begin, std::size_t end,
                                          const EditScript& local, const EditScript& remote) {
    const KeyRange range{begin, end};
    require(local.empty() != remote.empty(), "onesided chunk needs exactly one side", path, range);
    if (!local.empty()) {
        add(path, range, false, Action::Local, local, std::nullopt);
    } else {
        add(path, range, false, Action::Remote, std::nullopt, remote);
    }
}

void MergeDecisionBuilder::agreement_chunk(const std::string& path, std::size_t begin, std::size_t end,
                                           const EditScript& local, const EditScript& remote) {
    const KeyRange range{begin, end};
    require(!local.empty() && local == remote, "agreement chunk on differing changes", path, range);
    add(path, range, false, Action::Either, local, remote);
}

void MergeDecisionBuilder::conflict_chunk(const std::string& path, std::size_t begin, std::size_t end,
                                          const EditScript& local, const EditScript& remote) {
    const KeyRange range{begin, end};
    require(!local.empty() && !remote.empty(), "conflict chunk needs both sides", path, range);
    require(local != remote, "conflict chunk on equal changes", path, range);
    add(path, range, true, Action::Undecided, local, remote);
}

void MergeDecisionBuilder::local_then_remote(const std::string& path, std::size_t begin, std::size_t end,
                                             const EditScript& local, const EditScript& remote) {
    const KeyRange range{begin, end};
    auto only_inserts = [](const EditScript& script) {
        return !script.empty() &&
               std::all_of(script.begin(), script.end(),
                           [](const DiffEntry& e) { return e.op == DiffOp::AddRange; });
    };
    require(only_inserts(local) && only_inserts(remote),
            "combined insertion needs insertions on both sides", path, range);
    add(path, range, false, Action::LocalThenRemote, local, remote);
}

Decisions MergeDecisionBuilder::validated() {
    for (const auto& d : decisions_) {
        require(d.conflict == (d.action == Action::Undecided),
                "conflict flag disagrees with action", d.path, d.key);
    }
    return std::move(decisions_);
}

} // namespace trimerge
