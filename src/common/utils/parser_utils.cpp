// common/utils/parser_utils.cpp
#include "parser_utils.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace blockflow {

namespace {

const std::regex& token_pattern() {
    // group 1/2: block reference id and ".field.sub" tail
    // group 3/4: env variable name and optional "|fallback"
    static const std::regex pattern(
        R"(<([A-Za-z_][\w\-]*)((?:\.[\w\-]+)*)>)"
        R"(|\{\{\s*([A-Za-z_][A-Za-z0-9_]*)\s*(?:\|([^}]*))?\}\})",
        std::regex::ECMAScript
    );
    return pattern;
}

std::vector<std::string> split_path(const std::string& tail) {
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (pos < tail.size()) {
        if (tail[pos] == '.') {
            ++pos;
            continue;
        }
        std::size_t next = tail.find('.', pos);
        if (next == std::string::npos) next = tail.size();
        parts.push_back(tail.substr(pos, next - pos));
        pos = next;
    }
    return parts;
}

bool is_index(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

std::vector<InputToken> scan_input_tokens(const std::string& text) {
    std::vector<InputToken> tokens;
    auto begin = std::sregex_iterator(text.begin(), text.end(), token_pattern());
    auto end = std::sregex_iterator();

    for (auto it = begin; it != end; ++it) {
        const auto& m = *it;
        InputToken token;
        token.offset = static_cast<std::size_t>(m.position(0));
        token.length = static_cast<std::size_t>(m.length(0));
        token.raw = m[0].str();
        if (m[1].matched) {
            token.type = InputToken::Type::BLOCK_REFERENCE;
            token.name = m[1].str();
            token.path = split_path(m[2].str());
        } else {
            token.type = InputToken::Type::ENV_VARIABLE;
            token.name = m[3].str();
            if (m[4].matched) {
                token.fallback = m[4].str();
            }
        }
        tokens.push_back(std::move(token));
    }
    return tokens;
}

Value lookup_path(const Value& root, const std::vector<std::string>& path) {
    const Value* current = &root;
    for (const auto& segment : path) {
        if (current->is_object()) {
            auto it = current->find(segment);
            if (it == current->end()) return nullptr;
            current = &(*it);
        } else if (current->is_array() && is_index(segment)) {
            std::size_t idx = std::stoul(segment);
            if (idx >= current->size()) return nullptr;
            current = &(*current)[idx];
        } else {
            return nullptr;
        }
    }
    return *current;
}

bool is_valid_block_id(const std::string& id) {
    static const std::regex valid(R"(^[A-Za-z_][\w\-]*$)");
    return std::regex_match(id, valid);
}

} // namespace blockflow
