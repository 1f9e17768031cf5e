/**
 * @file Diff.cpp
 * @brief Edit-script model implementation
 */

#include "trimerge/Diff.hpp"
#include "trimerge/Errors.hpp"

namespace trimerge {

const char* to_string(DiffOp op) {
    switch (op) {
        case DiffOp::Add: return "add";
        case DiffOp::Remove: return "remove";
        case DiffOp::Replace: return "replace";
        case DiffOp::Patch: return "patch";
        case DiffOp::AddRange: return "addrange";
        case DiffOp::RemoveRange: return "removerange";
    }
    return "unknown";
}

DiffOp parse_diff_op(const std::string& name) {
    if (name == "add") return DiffOp::Add;
    if (name == "remove") return DiffOp::Remove;
    if (name == "replace") return DiffOp::Replace;
    if (name == "patch") return DiffOp::Patch;
    if (name == "addrange") return DiffOp::AddRange;
    if (name == "removerange") return DiffOp::RemoveRange;
    throw InvalidEditScript("unknown diff op '" + name + "'");
}

std::string format_key(const DiffKey& key) {
    if (const auto* s = std::get_if<std::string>(&key)) {
        return *s;
    }
    return std::to_string(std::get<std::size_t>(key));
}

bool operator==(const DiffEntry& a, const DiffEntry& b) {
    if (a.op != b.op || a.key != b.key) {
        return false;
    }
    switch (a.op) {
        case DiffOp::Add:
        case DiffOp::Replace:
        case DiffOp::AddRange:
            return a.value == b.value;
        case DiffOp::RemoveRange:
            return a.length == b.length;
        case DiffOp::Patch:
            return a.diff == b.diff;
        case DiffOp::Remove:
            return true;
    }
    return false;
}

bool operator!=(const DiffEntry& a, const DiffEntry& b) {
    return !(a == b);
}

// ============================================================================
// Entry constructors
// ============================================================================

DiffEntry op_add(const std::string& key, Value value) {
    DiffEntry e;
    e.op = DiffOp::Add;
    e.key = key;
    e.value = std::move(value);
    return e;
}

DiffEntry op_remove(const std::string& key) {
    DiffEntry e;
    e.op = DiffOp::Remove;
    e.key = key;
    return e;
}

DiffEntry op_replace(const std::string& key, Value value) {
    DiffEntry e;
    e.op = DiffOp::Replace;
    e.key = key;
    e.value = std::move(value);
    return e;
}

DiffEntry op_patch(const std::string& key, EditScript diff) {
    DiffEntry e;
    e.op = DiffOp::Patch;
    e.key = key;
    e.diff = std::move(diff);
    return e;
}

DiffEntry op_patch(std::size_t index, EditScript diff) {
    DiffEntry e;
    e.op = DiffOp::Patch;
    e.key = index;
    e.diff = std::move(diff);
    return e;
}

DiffEntry op_addrange(std::size_t index, Value valuelist) {
    DiffEntry e;
    e.op = DiffOp::AddRange;
    e.key = index;
    e.value = std::move(valuelist);
    return e;
}

DiffEntry op_removerange(std::size_t index, std::size_t length) {
    DiffEntry e;
    e.op = DiffOp::RemoveRange;
    e.key = index;
    e.length = length;
    return e;
}

// ============================================================================
// Key access
// ============================================================================

const std::string& map_key(const DiffEntry& e) {
    const auto* key = std::get_if<std::string>(&e.key);
    if (key == nullptr) {
        throw InvalidEditScript(std::string("expected a map key for '") + to_string(e.op) +
                                "' entry, got index " + format_key(e.key));
    }
    return *key;
}

std::size_t index_key(const DiffEntry& e) {
    const auto* index = std::get_if<std::size_t>(&e.key);
    if (index == nullptr) {
        throw InvalidEditScript(std::string("expected an index for '") + to_string(e.op) +
                                "' entry, got key '" + format_key(e.key) + "'");
    }
    return *index;
}

std::size_t valuelist_length(const DiffEntry& e) {
    if (e.value.is_string()) {
        return text_length(e.value.get_ref<const std::string&>());
    }
    if (e.value.is_array()) {
        return e.value.size();
    }
    throw InvalidEditScript("addrange valuelist at " + format_key(e.key) +
                            " must be an array or a string");
}

std::map<std::string, const DiffEntry*> as_map_diff(const EditScript& script) {
    std::map<std::string, const DiffEntry*> out;
    for (const auto& e : script) {
        if (e.op == DiffOp::AddRange || e.op == DiffOp::RemoveRange) {
            throw InvalidEditScript(std::string("range op '") + to_string(e.op) +
                                    "' in a map edit script");
        }
        const std::string& key = map_key(e);
        if (!out.emplace(key, &e).second) {
            throw InvalidEditScript("duplicate key '" + key + "' in map edit script");
        }
    }
    return out;
}

// ============================================================================
// JSON conversion
// ============================================================================

void to_json(Value& j, const DiffEntry& e) {
    j = Value::object();
    j["op"] = to_string(e.op);
    if (const auto* s = std::get_if<std::string>(&e.key)) {
        j["key"] = *s;
    } else {
        j["key"] = std::get<std::size_t>(e.key);
    }
    switch (e.op) {
        case DiffOp::Add:
        case DiffOp::Replace:
            j["value"] = e.value;
            break;
        case DiffOp::AddRange:
            j["valuelist"] = e.value;
            break;
        case DiffOp::RemoveRange:
            j["length"] = e.length;
            break;
        case DiffOp::Patch:
            j["diff"] = edit_script_to_json(e.diff);
            break;
        case DiffOp::Remove:
            break;
    }
}

namespace {

const Value& require_field(const Value& j, const char* field, DiffOp op) {
    auto it = j.find(field);
    if (it == j.end()) {
        throw InvalidEditScript(std::string("'") + to_string(op) +
                                "' entry is missing field '" + field + "'");
    }
    return *it;
}

} // anonymous namespace

void from_json(const Value& j, DiffEntry& e) {
    if (!j.is_object()) {
        throw InvalidEditScript("diff entry must be an object, got " + j.dump());
    }
    auto op_it = j.find("op");
    if (op_it == j.end() || !op_it->is_string()) {
        throw InvalidEditScript("diff entry without string 'op': " + j.dump());
    }
    e = DiffEntry{};
    e.op = parse_diff_op(op_it->get<std::string>());

    const Value& key = require_field(j, "key", e.op);
    if (key.is_string()) {
        e.key = key.get<std::string>();
    } else if (key.is_number_unsigned() ||
               (key.is_number_integer() && key.get<std::int64_t>() >= 0)) {
        e.key = key.get<std::size_t>();
    } else {
        throw InvalidEditScript("diff entry key must be a string or a non-negative integer: " +
                                key.dump());
    }

    switch (e.op) {
        case DiffOp::Add:
        case DiffOp::Replace:
            e.value = require_field(j, "value", e.op);
            break;
        case DiffOp::AddRange:
            e.value = require_field(j, "valuelist", e.op);
            if (!e.value.is_array() && !e.value.is_string()) {
                throw InvalidEditScript("addrange valuelist must be an array or a string");
            }
            break;
        case DiffOp::RemoveRange: {
            const Value& length = require_field(j, "length", e.op);
            if (!length.is_number_integer() || length.get<std::int64_t>() <= 0) {
                throw InvalidEditScript("removerange length must be a positive integer");
            }
            e.length = length.get<std::size_t>();
            break;
        }
        case DiffOp::Patch:
            e.diff = edit_script_from_json(require_field(j, "diff", e.op));
            break;
        case DiffOp::Remove:
            break;
    }
}

EditScript edit_script_from_json(const Value& j) {
    if (!j.is_array()) {
        throw InvalidEditScript("edit script must be an array, got " + j.dump());
    }
    EditScript script;
    script.reserve(j.size());
    for (const auto& item : j) {
        DiffEntry e;
        from_json(item, e);
        script.push_back(std::move(e));
    }
    return script;
}

Value edit_script_to_json(const EditScript& script) {
    Value j = Value::array();
    for (const auto& e : script) {
        Value item;
        to_json(item, e);
        j.push_back(std::move(item));
    }
    return j;
}

} // namespace trimerge
