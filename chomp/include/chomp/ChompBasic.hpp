#pragma once

#include <optional>
#include <string>
#include <vector>

#include "chomp/ChompPredicate.hpp"
#include "chomp/ChompResult.hpp"

namespace chomp {

class TagCombinator final : public Combinator<Text> {
public:
    explicit TagCombinator(std::string literal, bool caseless = false);
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    std::string mLiteral;
    bool mCaseless;
    // Case folded codepoints of the literal, only used when caseless.
    std::vector<int32_t> mFolded;
};

class CharCombinator final : public Combinator<Text> {
public:
    explicit CharCombinator(int32_t codepoint);
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    int32_t mCodepoint;
};

class AnyCharCombinator final : public Combinator<Text> {
public:
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;
};

class SatisfyCombinator final : public Combinator<Text> {
public:
    explicit SatisfyCombinator(Predicate predicate);
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    Predicate mPredicate;
};

// A single codepoint that is (or, when excluding, is not) part of a set.
class CharacterSetCombinator final : public Combinator<Text> {
public:
    explicit CharacterSetCombinator(std::string set, bool exclude);
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    std::string mSet;
    std::vector<int32_t> mCodepoints;
    bool mExclude;
};

// The longest non-empty run of codepoints that are (or are not) part of a set.
class CharacterRunCombinator final : public Combinator<Text> {
public:
    explicit CharacterRunCombinator(std::string set, bool exclude);
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    std::string mSet;
    std::vector<int32_t> mCodepoints;
    bool mExclude;
};

class UntilCombinator final : public Combinator<Text> {
public:
    explicit UntilCombinator(std::string literal, bool requireOne);
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    std::string mLiteral;
    bool mRequireOne;
};

class TakeCombinator final : public Combinator<Text> {
public:
    explicit TakeCombinator(size_t count);
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    size_t mCount;
};

// The whole run of codepoints for which the predicate holds (or does not).
// Runs shorter than the minimum or longer than the maximum fail.
class TakeWhileCombinator final : public Combinator<Text> {
public:
    TakeWhileCombinator(std::string type, Predicate predicate, bool negate, size_t minimum, std::optional<size_t> maximum);
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    std::string mType;
    Predicate mPredicate;
    bool mNegate;
    size_t mMinimum;
    std::optional<size_t> mMaximum;
};

class EscapedCombinator final : public Combinator<Text> {
public:
    EscapedCombinator(Parser<Text> normal, int32_t escapeChar, Parser<Text> escapable);
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    Parser<Text> mNormal;
    int32_t mEscapeChar;
    Parser<Text> mEscapable;
};

class EscapedTransformCombinator final : public Combinator<std::string> {
public:
    EscapedTransformCombinator(Parser<Text> normal, int32_t escapeChar, Parser<std::string> transform);
    [[nodiscard]] Result<std::string> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    Parser<Text> mNormal;
    int32_t mEscapeChar;
    Parser<std::string> mTransform;
};

// Exact, byte for byte, prefix match.
[[nodiscard]] Parser<Text> tag(std::string literal);
// Prefix match under Unicode case folding. Returns the text as it appears in
// the input, not the literal.
[[nodiscard]] Parser<Text> tagNoCase(std::string literal);
[[nodiscard]] Parser<Text> character(int32_t codepoint);
[[nodiscard]] Parser<Text> anyChar();
[[nodiscard]] Parser<Text> satisfy(Predicate predicate);
[[nodiscard]] Parser<Text> oneOf(std::string set);
[[nodiscard]] Parser<Text> noneOf(std::string set);
[[nodiscard]] Parser<Text> any(std::string set);
[[nodiscard]] Parser<Text> notAny(std::string set);
// Everything up to, but excluding, the first occurrence of `literal`.
[[nodiscard]] Parser<Text> until(std::string literal);
[[nodiscard]] Parser<Text> takeUntil1(std::string literal);
[[nodiscard]] Parser<Text> take(size_t count);

[[nodiscard]] Parser<Text> takeWhile(Predicate predicate);
[[nodiscard]] Parser<Text> takeWhileN(Predicate predicate, size_t n);
[[nodiscard]] Parser<Text> takeWhileNM(Predicate predicate, size_t n, size_t m);
[[nodiscard]] Parser<Text> takeWhileNot(Predicate predicate);
[[nodiscard]] Parser<Text> takeWhileNotN(Predicate predicate, size_t n);
[[nodiscard]] Parser<Text> takeWhileNotNM(Predicate predicate, size_t n, size_t m);

[[nodiscard]] Parser<Text> digit();
[[nodiscard]] Parser<Text> alpha();
[[nodiscard]] Parser<Text> alphanumeric();
[[nodiscard]] Parser<Text> hexDigit();
[[nodiscard]] Parser<Text> octalDigit();
[[nodiscard]] Parser<Text> binaryDigit();
[[nodiscard]] Parser<Text> space();
[[nodiscard]] Parser<Text> multispace();

// Alternates between `normal` text and escape sequences made of `escapeChar`
// followed by `escapable`. The escape sequences are kept verbatim.
[[nodiscard]] Parser<Text> escaped(Parser<Text> normal, int32_t escapeChar, Parser<Text> escapable);
// As escaped, but every escape sequence is replaced by the output of `transform`.
[[nodiscard]] Parser<std::string> escapedTransform(Parser<Text> normal, int32_t escapeChar, Parser<std::string> transform);

}
