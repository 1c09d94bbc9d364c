#include "chomp/ChompBasic.hpp"
#include <algorithm>
#include <stdexcept>
#include <unicode/uchar.h>

namespace chomp {

namespace {

std::vector<int32_t> decodeAll(std::string_view bytes, const char* what) {
    std::vector<int32_t> ret;
    while(!bytes.empty()) {
        auto cp = decodeUTF8Codepoint(bytes);
        if(!cp) {
            throw std::invalid_argument{ std::string{ "Malformed UTF-8 in " } + what };
        }
        ret.push_back(cp->utf32Value);
        bytes.remove_prefix(cp->len);
    }
    return ret;
}

bool contains(const std::vector<int32_t>& codepoints, int32_t codepoint) {
    return std::find(codepoints.cbegin(), codepoints.cend(), codepoint) != codepoints.cend();
}

int32_t fold(int32_t codepoint) {
    return u_foldCase(codepoint, U_FOLD_CASE_DEFAULT);
}

Result<Text> takePrefix(Text input, size_t len) {
    return succeed(input.substr(len), input.substr(0, len));
}

}

TagCombinator::TagCombinator(std::string literal, bool caseless)
: mLiteral(std::move(literal)), mCaseless(caseless) {
    auto codepoints = decodeAll(mLiteral, "tag literal");
    if(mCaseless) {
        for(auto cp : codepoints) {
            mFolded.push_back(fold(cp));
        }
    }
}
Result<Text> TagCombinator::match(Text input) const {
    if(!mCaseless) {
        if(input.substr(0, mLiteral.size()) == mLiteral) {
            return takePrefix(input, mLiteral.size());
        }
        return fail<Text>(input, ParseError::combinatorFailed("tag", input, mLiteral));
    }
    size_t pos = 0;
    for(auto expected : mFolded) {
        if(pos >= input.size()) {
            return fail<Text>(input, ParseError::combinatorFailed("tag_no_case", input, mLiteral));
        }
        auto cp = nextCodepoint(input.substr(pos));
        if(fold(cp.utf32Value) != expected) {
            return fail<Text>(input, ParseError::combinatorFailed("tag_no_case", input, mLiteral));
        }
        pos += cp.len;
    }
    return takePrefix(input, pos);
}
std::string TagCombinator::dump() const {
    if(mCaseless) {
        return "i'" + mLiteral + '\'';
    }
    return '\'' + mLiteral + '\'';
}

CharCombinator::CharCombinator(int32_t codepoint)
: mCodepoint(codepoint) {
}
Result<Text> CharCombinator::match(Text input) const {
    if(!input.empty()) {
        auto cp = nextCodepoint(input);
        if(cp.utf32Value == mCodepoint) {
            return takePrefix(input, cp.len);
        }
    }
    return fail<Text>(input, ParseError::combinatorFailed("char", input, encodeUTF8Codepoint(mCodepoint)));
}
std::string CharCombinator::dump() const {
    return '\'' + encodeUTF8Codepoint(mCodepoint) + '\'';
}

Result<Text> AnyCharCombinator::match(Text input) const {
    if(input.empty()) {
        return fail<Text>(input, ParseError::combinatorFailed("any_char", input));
    }
    return takePrefix(input, nextCodepoint(input).len);
}
std::string AnyCharCombinator::dump() const {
    return ".";
}

SatisfyCombinator::SatisfyCombinator(Predicate predicate)
: mPredicate(predicate) {
}
Result<Text> SatisfyCombinator::match(Text input) const {
    if(!input.empty()) {
        auto cp = nextCodepoint(input);
        if(mPredicate(cp.utf32Value)) {
            return takePrefix(input, cp.len);
        }
    }
    return fail<Text>(input, ParseError::combinatorFailed("satisfy", input, mPredicate.dump()));
}
std::string SatisfyCombinator::dump() const {
    return '<' + mPredicate.dump() + '>';
}

CharacterSetCombinator::CharacterSetCombinator(std::string set, bool exclude)
: mSet(std::move(set)), mCodepoints(decodeAll(mSet, "character set")), mExclude(exclude) {
}
Result<Text> CharacterSetCombinator::match(Text input) const {
    if(!input.empty()) {
        auto cp = nextCodepoint(input);
        if(contains(mCodepoints, cp.utf32Value) != mExclude) {
            return takePrefix(input, cp.len);
        }
    }
    return fail<Text>(input, ParseError::combinatorFailed(mExclude ? "none_of" : "one_of", input, mSet));
}
std::string CharacterSetCombinator::dump() const {
    return std::string{ mExclude ? "[^" : "[" } + mSet + ']';
}

CharacterRunCombinator::CharacterRunCombinator(std::string set, bool exclude)
: mSet(std::move(set)), mCodepoints(decodeAll(mSet, "character set")), mExclude(exclude) {
}
Result<Text> CharacterRunCombinator::match(Text input) const {
    size_t pos = 0;
    while(pos < input.size()) {
        auto cp = nextCodepoint(input.substr(pos));
        if(contains(mCodepoints, cp.utf32Value) == mExclude) {
            break;
        }
        pos += cp.len;
    }
    if(pos == 0) {
        return fail<Text>(input, ParseError::combinatorFailed(mExclude ? "not" : "any", input, mSet));
    }
    return takePrefix(input, pos);
}
std::string CharacterRunCombinator::dump() const {
    return std::string{ mExclude ? "[^" : "[" } + mSet + "]+";
}

UntilCombinator::UntilCombinator(std::string literal, bool requireOne)
: mLiteral(std::move(literal)), mRequireOne(requireOne) {
    decodeAll(mLiteral, "until literal");
}
Result<Text> UntilCombinator::match(Text input) const {
    auto idx = input.find(mLiteral);
    if(idx == Text::npos || (mRequireOne && idx == 0)) {
        return fail<Text>(input, ParseError::combinatorFailed(mRequireOne ? "take_until1" : "until", input, mLiteral));
    }
    return takePrefix(input, idx);
}
std::string UntilCombinator::dump() const {
    return std::string{ mRequireOne ? "until1('" : "until('" } + mLiteral + "')";
}

TakeCombinator::TakeCombinator(size_t count)
: mCount(count) {
}
Result<Text> TakeCombinator::match(Text input) const {
    auto len = codepointPrefixLength(input, mCount);
    if(!len) {
        return fail<Text>(input, ParseError::rangeFailed("take", input, countCodepoints(input), mCount, mCount));
    }
    return takePrefix(input, *len);
}
std::string TakeCombinator::dump() const {
    return ".{" + std::to_string(mCount) + "}";
}

TakeWhileCombinator::TakeWhileCombinator(std::string type, Predicate predicate, bool negate, size_t minimum, std::optional<size_t> maximum)
: mType(std::move(type)), mPredicate(predicate), mNegate(negate), mMinimum(minimum), mMaximum(maximum) {
    if(mMaximum && *mMaximum < mMinimum) {
        std::swap(mMinimum, *mMaximum);
    }
}
Result<Text> TakeWhileCombinator::match(Text input) const {
    size_t pos = 0;
    size_t count = 0;
    while(pos < input.size()) {
        auto cp = nextCodepoint(input.substr(pos));
        if(mPredicate(cp.utf32Value) == mNegate) {
            break;
        }
        pos += cp.len;
        count += 1;
    }
    if(count < mMinimum || (mMaximum && count > *mMaximum)) {
        return fail<Text>(input, ParseError::rangeFailed(mType, input, count, mMinimum, mMaximum, {}, mPredicate.dump()));
    }
    return takePrefix(input, pos);
}
std::string TakeWhileCombinator::dump() const {
    std::string ret = mNegate ? "!<" : "<";
    ret += mPredicate.dump() + ">";
    if(mMaximum) {
        return ret + "{" + std::to_string(mMinimum) + "," + std::to_string(*mMaximum) + "}";
    }
    switch(mMinimum) {
    case 0:
        return ret + "*";
    case 1:
        return ret + "+";
    default:
        return ret + "{" + std::to_string(mMinimum) + ",}";
    }
}

EscapedCombinator::EscapedCombinator(Parser<Text> normal, int32_t escapeChar, Parser<Text> escapable)
: mNormal(requireParser(normal, "escaped normal text")), mEscapeChar(escapeChar), mEscapable(requireParser(escapable, "escaped sequences")) {
}
Result<Text> EscapedCombinator::match(Text input) const {
    size_t pos = 0;
    while(pos < input.size()) {
        auto rest = input.substr(pos);
        auto normalRes = mNormal->match(rest);
        if(isSuccess(normalRes)) {
            auto len = consumedPrefix(rest, remainingOf(normalRes)).size();
            if(len > 0) {
                pos += len;
                continue;
            }
        } else if(errorOf(normalRes)->isFatal()) {
            return fail<Text>(input, ParseError::parserFailed("escaped", input, errorOf(normalRes)));
        }
        auto cp = nextCodepoint(rest);
        if(cp.utf32Value != mEscapeChar) {
            break;
        }
        auto escapedRest = rest.substr(cp.len);
        auto escapableRes = mEscapable->match(escapedRest);
        if(!isSuccess(escapableRes)) {
            return fail<Text>(input, ParseError::parserFailed("escaped", input, errorOf(escapableRes)));
        }
        pos += cp.len + consumedPrefix(escapedRest, remainingOf(escapableRes)).size();
    }
    if(pos == 0) {
        return fail<Text>(input, ParseError::combinatorFailed("escaped", input, encodeUTF8Codepoint(mEscapeChar)));
    }
    return takePrefix(input, pos);
}
std::string EscapedCombinator::dump() const {
    return "escaped(" + mNormal->dump() + ", '" + encodeUTF8Codepoint(mEscapeChar) + "', " + mEscapable->dump() + ")";
}

EscapedTransformCombinator::EscapedTransformCombinator(Parser<Text> normal, int32_t escapeChar, Parser<std::string> transform)
: mNormal(requireParser(normal, "escaped normal text")), mEscapeChar(escapeChar), mTransform(requireParser(transform, "escape transform")) {
}
Result<std::string> EscapedTransformCombinator::match(Text input) const {
    std::string out;
    Text rest = input;
    while(!rest.empty()) {
        auto normalRes = mNormal->match(rest);
        if(isSuccess(normalRes)) {
            auto consumed = consumedPrefix(rest, remainingOf(normalRes));
            if(!consumed.empty()) {
                out += consumed;
                rest = remainingOf(normalRes);
                continue;
            }
        } else if(errorOf(normalRes)->isFatal()) {
            return fail<std::string>(input, ParseError::parserFailed("escaped_transform", input, errorOf(normalRes)));
        }
        auto cp = nextCodepoint(rest);
        if(cp.utf32Value != mEscapeChar) {
            break;
        }
        auto transformRes = mTransform->match(rest.substr(cp.len));
        if(!isSuccess(transformRes)) {
            return fail<std::string>(input, ParseError::parserFailed("escaped_transform", input, errorOf(transformRes)));
        }
        out += valueOf(transformRes);
        rest = remainingOf(transformRes);
    }
    if(rest.size() == input.size()) {
        return fail<std::string>(input, ParseError::combinatorFailed("escaped_transform", input, encodeUTF8Codepoint(mEscapeChar)));
    }
    return succeed(rest, std::move(out));
}
std::string EscapedTransformCombinator::dump() const {
    return "escaped_transform(" + mNormal->dump() + ", '" + encodeUTF8Codepoint(mEscapeChar) + "', " + mTransform->dump() + ")";
}

Parser<Text> tag(std::string literal) {
    return std::make_shared<TagCombinator>(std::move(literal));
}
Parser<Text> tagNoCase(std::string literal) {
    return std::make_shared<TagCombinator>(std::move(literal), true);
}
Parser<Text> character(int32_t codepoint) {
    return std::make_shared<CharCombinator>(codepoint);
}
Parser<Text> anyChar() {
    return std::make_shared<AnyCharCombinator>();
}
Parser<Text> satisfy(Predicate predicate) {
    return std::make_shared<SatisfyCombinator>(predicate);
}
Parser<Text> oneOf(std::string set) {
    return std::make_shared<CharacterSetCombinator>(std::move(set), false);
}
Parser<Text> noneOf(std::string set) {
    return std::make_shared<CharacterSetCombinator>(std::move(set), true);
}
Parser<Text> any(std::string set) {
    return std::make_shared<CharacterRunCombinator>(std::move(set), false);
}
Parser<Text> notAny(std::string set) {
    return std::make_shared<CharacterRunCombinator>(std::move(set), true);
}
Parser<Text> until(std::string literal) {
    return std::make_shared<UntilCombinator>(std::move(literal), false);
}
Parser<Text> takeUntil1(std::string literal) {
    return std::make_shared<UntilCombinator>(std::move(literal), true);
}
Parser<Text> take(size_t count) {
    return std::make_shared<TakeCombinator>(count);
}

Parser<Text> takeWhile(Predicate predicate) {
    return std::make_shared<TakeWhileCombinator>("take_while", predicate, false, 0, std::nullopt);
}
Parser<Text> takeWhileN(Predicate predicate, size_t n) {
    return std::make_shared<TakeWhileCombinator>("take_while_n", predicate, false, n, std::nullopt);
}
Parser<Text> takeWhileNM(Predicate predicate, size_t n, size_t m) {
    return std::make_shared<TakeWhileCombinator>("take_while_n_m", predicate, false, n, m);
}
Parser<Text> takeWhileNot(Predicate predicate) {
    return std::make_shared<TakeWhileCombinator>("take_while_not", predicate, true, 0, std::nullopt);
}
Parser<Text> takeWhileNotN(Predicate predicate, size_t n) {
    return std::make_shared<TakeWhileCombinator>("take_while_not_n", predicate, true, n, std::nullopt);
}
Parser<Text> takeWhileNotNM(Predicate predicate, size_t n, size_t m) {
    return std::make_shared<TakeWhileCombinator>("take_while_not_n_m", predicate, true, n, m);
}

Parser<Text> digit() {
    return std::make_shared<TakeWhileCombinator>("digit", isDigit, false, 1, std::nullopt);
}
Parser<Text> alpha() {
    return std::make_shared<TakeWhileCombinator>("alpha", isLetter, false, 1, std::nullopt);
}
Parser<Text> alphanumeric() {
    return std::make_shared<TakeWhileCombinator>("alphanumeric", isAlphanumeric, false, 1, std::nullopt);
}
Parser<Text> hexDigit() {
    return std::make_shared<TakeWhileCombinator>("hex_digit", isHexDigit, false, 1, std::nullopt);
}
Parser<Text> octalDigit() {
    return std::make_shared<TakeWhileCombinator>("octal_digit", isOctalDigit, false, 1, std::nullopt);
}
Parser<Text> binaryDigit() {
    return std::make_shared<TakeWhileCombinator>("binary_digit", isBinaryDigit, false, 1, std::nullopt);
}
Parser<Text> space() {
    return std::make_shared<TakeWhileCombinator>("space", isSpace, false, 1, std::nullopt);
}
Parser<Text> multispace() {
    return std::make_shared<TakeWhileCombinator>("multispace", isMultispace, false, 1, std::nullopt);
}

Parser<Text> escaped(Parser<Text> normal, int32_t escapeChar, Parser<Text> escapable) {
    return std::make_shared<EscapedCombinator>(std::move(normal), escapeChar, std::move(escapable));
}
Parser<std::string> escapedTransform(Parser<Text> normal, int32_t escapeChar, Parser<std::string> transform) {
    return std::make_shared<EscapedTransformCombinator>(std::move(normal), escapeChar, std::move(transform));
}

}
