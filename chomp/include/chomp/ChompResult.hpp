#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "chomp/ChompError.hpp"
#include "chomp/ChompForward.hpp"

namespace chomp {

template<typename T>
class MatchSuccess {
public:
    MatchSuccess(Text remaining, T value)
    : mRemaining(remaining), mValue(std::move(value)) {
    }
    [[nodiscard]] Text getRemaining() const {
        return mRemaining;
    }
    [[nodiscard]] const T& getValue() const& {
        return mValue;
    }
    [[nodiscard]] T&& moveValue() & {
        return std::move(mValue);
    }

private:
    Text mRemaining;
    T mValue;
};

class MatchFailure {
public:
    MatchFailure(Text remaining, sp<const ParseError> error)
    : mRemaining(remaining), mError(std::move(error)) {
    }
    // The input of the combinator that failed; nothing is consumed on failure.
    [[nodiscard]] Text getRemaining() const {
        return mRemaining;
    }
    [[nodiscard]] const sp<const ParseError>& getError() const {
        return mError;
    }

private:
    Text mRemaining;
    sp<const ParseError> mError;
};

template<typename T>
using Result = std::variant<MatchSuccess<T>, MatchFailure>;

template<typename T>
[[nodiscard]] inline bool isSuccess(const Result<T>& result) {
    return result.index() == 0;
}

template<typename T>
[[nodiscard]] inline Text remainingOf(const Result<T>& result) {
    return std::visit([](const auto& r) { return r.getRemaining(); }, result);
}

// Throws std::bad_variant_access if the match failed.
template<typename T>
[[nodiscard]] inline const T& valueOf(const Result<T>& result) {
    return std::get<0>(result).getValue();
}

// Throws std::bad_variant_access if the match succeeded.
template<typename T>
[[nodiscard]] inline const sp<const ParseError>& errorOf(const Result<T>& result) {
    return std::get<1>(result).getError();
}

// The part of `input` a match consumed, given what it left behind.
[[nodiscard]] inline Text consumedPrefix(Text input, Text remaining) {
    return input.substr(0, input.size() - remaining.size());
}

template<typename T>
class Combinator {
public:
    using Output = T;

    virtual ~Combinator() = default;
    [[nodiscard]] virtual Result<T> match(Text input) const = 0;
    [[nodiscard]] virtual std::string dump() const = 0;
};

template<typename T>
[[nodiscard]] inline Result<T> succeed(Text remaining, T value) {
    return MatchSuccess<T>{ remaining, std::move(value) };
}

template<typename T>
[[nodiscard]] inline Result<T> fail(Text input, sp<const ParseError> error) {
    return MatchFailure{ input, std::move(error) };
}

template<typename T>
const Parser<T>& requireParser(const Parser<T>& parser, const char* role) {
    if(!parser) {
        throw std::invalid_argument{ std::string{ "A parser is required for the " } + role };
    }
    return parser;
}

// Sequencing combinators splice text outputs and sequences into one flat Seq.
template<typename T>
inline constexpr bool isFlattenable = std::is_same_v<T, Text> || std::is_same_v<T, std::string> || std::is_same_v<T, Seq>;

inline void appendFlattened(Seq& out, Text value) {
    out.emplace_back(value);
}
inline void appendFlattened(Seq& out, std::string&& value) {
    out.emplace_back(std::move(value));
}
inline void appendFlattened(Seq& out, const std::string& value) {
    out.emplace_back(value);
}
inline void appendFlattened(Seq& out, Seq&& values) {
    for(auto& value : values) {
        out.emplace_back(std::move(value));
    }
}
inline void appendFlattened(Seq& out, const Seq& values) {
    out.insert(out.end(), values.cbegin(), values.cend());
}

}
