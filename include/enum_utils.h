#pragma once

#include <cctype>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <string>
#include <string_view>

// Enumerators are PascalCase in code and snake_case in TOML, JSON and on the
// command line, e.g. CriticalPointType::StableNode <-> "stable_node".

namespace enum_utils {

namespace detail {

// Lowercase with underscores removed: "stable_node" and "StableNode" both
// fold to "stablenode"
inline std::string fold(std::string_view name) {
    std::string folded;
    folded.reserve(name.size());
    for (char c : name) {
        if (c != '_') {
            folded += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return folded;
}

} // namespace detail

template <typename E>
std::string toString(E value) {
    std::string_view pascal = magic_enum::enum_name(value);
    std::string snake;
    snake.reserve(pascal.size() + 4);
    for (size_t i = 0; i < pascal.size(); ++i) {
        auto c = static_cast<unsigned char>(pascal[i]);
        if (std::isupper(c) && i > 0) {
            snake += '_';
        }
        snake += static_cast<char>(std::tolower(c));
    }
    return snake;
}

// Matches ignoring case and underscores
template <typename E>
std::optional<E> fromString(std::string_view str) {
    std::string wanted = detail::fold(str);
    for (E value : magic_enum::enum_values<E>()) {
        if (detail::fold(magic_enum::enum_name(value)) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

// "analytic | sampled", for error messages
template <typename E>
std::string choices() {
    std::string result;
    for (E value : magic_enum::enum_values<E>()) {
        if (!result.empty()) {
            result += " | ";
        }
        result += toString(value);
    }
    return result;
}

} // namespace enum_utils
