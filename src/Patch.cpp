/**
 * @file Patch.cpp
 * @brief Edit-script application
 */

#include "trimerge/Patch.hpp"
#include "trimerge/Errors.hpp"

namespace trimerge {

namespace {

Value patch_map(const Value& base, const EditScript& script) {
    Value result = base;
    for (const auto& e : script) {
        const std::string& key = map_key(e);
        const bool present = result.contains(key);
        switch (e.op) {
            case DiffOp::Add:
                if (present) {
                    throw InvalidEditScript("add of existing key '" + key + "'");
                }
                result[key] = e.value;
                break;
            case DiffOp::Remove:
                if (!present) {
                    throw InvalidEditScript("remove of missing key '" + key + "'");
                }
                result.erase(key);
                break;
            case DiffOp::Replace:
                if (!present) {
                    throw InvalidEditScript("replace of missing key '" + key + "'");
                }
                result[key] = e.value;
                break;
            case DiffOp::Patch:
                if (!present) {
                    throw InvalidEditScript("patch of missing key '" + key + "'");
                }
                result[key] = patch(result[key], e.diff);
                break;
            case DiffOp::AddRange:
            case DiffOp::RemoveRange:
                throw InvalidEditScript(std::string("op '") + to_string(e.op) +
                                        "' in a map edit script");
        }
    }
    return result;
}

/**
 * @brief Apply a sequence script to a list of elements
 *
 * @p append_inserted adds the elements of an addrange valuelist,
 * @p patch_element produces the patched version of one base element.
 */
template <typename T, typename AppendInserted, typename PatchElement>
std::vector<T> patch_elements(const std::vector<T>& base, const EditScript& script,
                              AppendInserted append_inserted, PatchElement patch_element) {
    std::vector<T> out;
    out.reserve(base.size());
    std::size_t take = 0;
    for (const auto& e : script) {
        const std::size_t index = index_key(e);
        if (index < take || index > base.size()) {
            throw InvalidEditScript("sequence entry at " + std::to_string(index) +
                                    " is out of order or out of range");
        }
        out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(take),
                   base.begin() + static_cast<std::ptrdiff_t>(index));
        take = index;
        switch (e.op) {
            case DiffOp::AddRange:
                append_inserted(e, out);
                break;
            case DiffOp::RemoveRange:
                if (index + e.length > base.size()) {
                    throw InvalidEditScript("removerange at " + std::to_string(index) +
                                            " reaches past the end");
                }
                take = index + e.length;
                break;
            case DiffOp::Patch:
                if (index >= base.size()) {
                    throw InvalidEditScript("patch at " + std::to_string(index) +
                                            " reaches past the end");
                }
                out.push_back(patch_element(base[index], e.diff));
                take = index + 1;
                break;
            case DiffOp::Add:
            case DiffOp::Remove:
            case DiffOp::Replace:
                throw InvalidEditScript(std::string("op '") + to_string(e.op) +
                                        "' in a sequence edit script");
        }
    }
    out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(take), base.end());
    return out;
}

Value patch_sequence(const Value& base, const EditScript& script) {
    const std::vector<Value> elements(base.begin(), base.end());
    auto patched = patch_elements(
        elements, script,
        [](const DiffEntry& e, std::vector<Value>& out) {
            if (!e.value.is_array()) {
                throw InvalidEditScript("addrange valuelist of a sequence must be an array");
            }
            out.insert(out.end(), e.value.begin(), e.value.end());
        },
        [](const Value& element, const EditScript& diff) {
            return patch(element, diff);
        });

    Value result = Value::array();
    for (auto& element : patched) {
        result.push_back(std::move(element));
    }
    return result;
}

Value patch_text(const std::string& base, const EditScript& script) {
    auto patched = patch_elements(
        split_code_points(base), script,
        [](const DiffEntry& e, std::vector<std::string>& out) {
            if (!e.value.is_string()) {
                throw InvalidEditScript("addrange valuelist of a text must be a string");
            }
            auto inserted = split_code_points(e.value.get_ref<const std::string&>());
            out.insert(out.end(), inserted.begin(), inserted.end());
        },
        [](const std::string&, const EditScript&) -> std::string {
            throw InvalidEditScript("patch entry in a text edit script");
        });

    std::string result;
    for (const auto& cp : patched) {
        result += cp;
    }
    return result;
}

} // anonymous namespace

Value patch(const Value& value, const EditScript& script) {
    switch (kind_of(value)) {
        case ValueKind::Map:
            return patch_map(value, script);
        case ValueKind::Sequence:
            return patch_sequence(value, script);
        case ValueKind::Text:
            return patch_text(value.get_ref<const std::string&>(), script);
        case ValueKind::Scalar:
            break;
    }
    if (script.empty()) {
        return value;
    }
    throw UnsupportedValueKind("", kind_name(kind_of(value)));
}

} // namespace trimerge
