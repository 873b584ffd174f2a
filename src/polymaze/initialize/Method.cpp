/**
 * @file Method.cpp
 */
#include "Method.hpp"
#include <algorithm>

namespace polymaze {

namespace {
const std::string SPELUNKER_PREFIX = "spelunker(";
const std::string SPELUNKER_SUFFIX = ")";
} // namespace

std::optional<Instructions> parse_instructions(const std::string& text) {
    Instructions result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '|': result.push_back(Instruction::Forward); break;
            case '<': result.push_back(Instruction::Left); break;
            case '>': result.push_back(Instruction::Right); break;
            case '}': result.push_back(Instruction::ForkLeft); break;
            case '{': result.push_back(Instruction::ForkRight); break;
            default: return std::nullopt;
        }
    }
    // Sem avanço o programa nunca termina
    if (std::find(result.begin(), result.end(), Instruction::Forward) == result.end()) {
        return std::nullopt;
    }
    return result;
}

std::string format_instructions(const Instructions& instructions) {
    std::string result;
    result.reserve(instructions.size());
    for (Instruction i : instructions) result.push_back(static_cast<char>(i));
    return result;
}

bool operator==(const Method& a, const Method& b) {
    if (a.kind != b.kind) return false;
    return a.kind != Method::Kind::Spelunker || a.instructions == b.instructions;
}

std::optional<Method> parse_method(const std::string& text) {
    if (text == "braid") return Method{Method::Kind::Braid, {}};
    if (text == "branching") return Method{Method::Kind::Branching, {}};
    if (text == "clear") return Method{Method::Kind::Clear, {}};
    if (text == "dividing") return Method{Method::Kind::Dividing, {}};
    if (text == "winding") return Method{Method::Kind::Winding, {}};

    const std::size_t min_len = SPELUNKER_PREFIX.size() + SPELUNKER_SUFFIX.size();
    if (text.size() >= min_len
        && text.compare(0, SPELUNKER_PREFIX.size(), SPELUNKER_PREFIX) == 0
        && text.compare(text.size() - SPELUNKER_SUFFIX.size(), SPELUNKER_SUFFIX.size(),
                        SPELUNKER_SUFFIX) == 0) {
        const auto program = parse_instructions(
            text.substr(SPELUNKER_PREFIX.size(), text.size() - min_len));
        if (program) return Method{Method::Kind::Spelunker, *program};
    }
    return std::nullopt;
}

std::string method_name(const Method& method) {
    switch (method.kind) {
        case Method::Kind::Braid: return "braid";
        case Method::Kind::Branching: return "branching";
        case Method::Kind::Clear: return "clear";
        case Method::Kind::Dividing: return "dividing";
        case Method::Kind::Spelunker:
            return SPELUNKER_PREFIX + format_instructions(method.instructions) + SPELUNKER_SUFFIX;
        case Method::Kind::Winding: return "winding";
    }
    return "?";
}

} // namespace polymaze
