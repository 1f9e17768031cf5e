/**
 * @file Value.cpp
 * @brief Value model helpers
 */

#include "trimerge/Value.hpp"
#include "trimerge/Errors.hpp"

namespace trimerge {

namespace {

/**
 * @brief Number of bytes in the UTF-8 sequence starting with @p lead,
 *        or 0 if @p lead cannot start a sequence
 */
std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

std::optional<Value> lookup(const Value& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<std::string> split_code_points(const std::string& text) {
    std::vector<std::string> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8_sequence_length(static_cast<unsigned char>(text[i]));
        bool valid = len > 0 && i + len <= text.size();
        for (size_t n = 1; valid && n < len; ++n) {
            valid = is_continuation(static_cast<unsigned char>(text[i + n]));
        }
        if (!valid) {
            len = 1;
        }
        out.push_back(text.substr(i, len));
        i += len;
    }
    return out;
}

std::size_t text_length(const std::string& text) {
    return split_code_points(text).size();
}

std::size_t sequence_length(const Value& val, const std::string& path) {
    switch (kind_of(val)) {
        case ValueKind::Sequence:
            return val.size();
        case ValueKind::Text:
            return text_length(val.get_ref<const std::string&>());
        case ValueKind::Map:
        case ValueKind::Scalar:
            break;
    }
    throw UnsupportedValueKind(path, kind_name(kind_of(val)));
}

} // namespace trimerge
