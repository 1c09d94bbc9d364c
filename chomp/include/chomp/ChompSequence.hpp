#pragma once

#include <charconv>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "chomp/ChompBasic.hpp"
#include "chomp/ChompResult.hpp"

namespace chomp {

template<typename T, typename U>
class PairCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T> && isFlattenable<U>, "pair can only combine text or sequence outputs");

public:
    PairCombinator(Parser<T> first, Parser<U> second)
    : mFirst(requireParser(first, "first half of a pair")), mSecond(requireParser(second, "second half of a pair")) {
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        auto firstRes = mFirst->match(input);
        if(!isSuccess(firstRes)) {
            return fail<Seq>(input, ParseError::parserFailed("pair", input, errorOf(firstRes)));
        }
        auto secondRes = mSecond->match(remainingOf(firstRes));
        if(!isSuccess(secondRes)) {
            return fail<Seq>(input, ParseError::parserFailed("pair", input, errorOf(secondRes)));
        }
        Seq out;
        appendFlattened(out, std::get<0>(firstRes).moveValue());
        appendFlattened(out, std::get<0>(secondRes).moveValue());
        return succeed(remainingOf(secondRes), std::move(out));
    }
    [[nodiscard]] std::string dump() const override {
        return mFirst->dump() + " " + mSecond->dump();
    }

private:
    Parser<T> mFirst;
    Parser<U> mSecond;
};

template<typename T, typename S, typename U>
class SepPairCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T> && isFlattenable<U>, "sepPair can only combine text or sequence outputs");

public:
    SepPairCombinator(Parser<T> first, Parser<S> separator, Parser<U> second)
    : mFirst(requireParser(first, "first half of a pair")), mSeparator(requireParser(separator, "pair separator")), mSecond(requireParser(second, "second half of a pair")) {
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        auto firstRes = mFirst->match(input);
        if(!isSuccess(firstRes)) {
            return fail<Seq>(input, ParseError::parserFailed("sep_pair", input, errorOf(firstRes)));
        }
        auto sepRes = mSeparator->match(remainingOf(firstRes));
        if(!isSuccess(sepRes)) {
            return fail<Seq>(input, ParseError::parserFailed("sep_pair", input, errorOf(sepRes)));
        }
        auto secondRes = mSecond->match(remainingOf(sepRes));
        if(!isSuccess(secondRes)) {
            return fail<Seq>(input, ParseError::parserFailed("sep_pair", input, errorOf(secondRes)));
        }
        Seq out;
        appendFlattened(out, std::get<0>(firstRes).moveValue());
        appendFlattened(out, std::get<0>(secondRes).moveValue());
        return succeed(remainingOf(secondRes), std::move(out));
    }
    [[nodiscard]] std::string dump() const override {
        return mFirst->dump() + " " + mSeparator->dump() + " " + mSecond->dump();
    }

private:
    Parser<T> mFirst;
    Parser<S> mSeparator;
    Parser<U> mSecond;
};

// Runs the child between `minimum` and `maximum` times, stopping at the first
// ordinary failure once the minimum has been met.
template<typename T>
class RepeatCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T>, "repeat can only collect text or sequence outputs");

public:
    RepeatCombinator(std::string type, Parser<T> child, size_t minimum, size_t maximum)
    : mType(std::move(type)), mChild(requireParser(child, "repeated element")), mMinimum(minimum), mMaximum(maximum) {
        if(mMaximum < mMinimum) {
            std::swap(mMinimum, mMaximum);
        }
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        Seq out;
        Text rest = input;
        size_t count = 0;
        while(count < mMaximum) {
            auto childRes = mChild->match(rest);
            if(!isSuccess(childRes)) {
                if(count < mMinimum) {
                    return fail<Seq>(input, ParseError::rangeFailed(mType, input, count, mMinimum, mMaximum, errorOf(childRes)));
                }
                if(errorOf(childRes)->isFatal()) {
                    return fail<Seq>(input, ParseError::parserFailed(mType, input, errorOf(childRes)));
                }
                break;
            }
            rest = remainingOf(childRes);
            appendFlattened(out, std::get<0>(childRes).moveValue());
            count += 1;
        }
        return succeed(rest, std::move(out));
    }
    [[nodiscard]] std::string dump() const override {
        if(mMinimum == mMaximum) {
            return "(" + mChild->dump() + "){" + std::to_string(mMinimum) + "}";
        }
        return "(" + mChild->dump() + "){" + std::to_string(mMinimum) + "," + std::to_string(mMaximum) + "}";
    }

private:
    std::string mType;
    Parser<T> mChild;
    size_t mMinimum;
    size_t mMaximum;
};

template<typename L, typename T, typename R>
class DelimitedCombinator final : public Combinator<T> {
public:
    DelimitedCombinator(Parser<L> left, Parser<T> body, Parser<R> right)
    : mLeft(requireParser(left, "left delimiter")), mBody(requireParser(body, "delimited body")), mRight(requireParser(right, "right delimiter")) {
    }
    [[nodiscard]] Result<T> match(Text input) const override {
        auto leftRes = mLeft->match(input);
        if(!isSuccess(leftRes)) {
            return fail<T>(input, ParseError::parserFailed("delimited", input, errorOf(leftRes)));
        }
        auto bodyRes = mBody->match(remainingOf(leftRes));
        if(!isSuccess(bodyRes)) {
            return fail<T>(input, ParseError::parserFailed("delimited", input, errorOf(bodyRes)));
        }
        auto rightRes = mRight->match(remainingOf(bodyRes));
        if(!isSuccess(rightRes)) {
            return fail<T>(input, ParseError::parserFailed("delimited", input, errorOf(rightRes)));
        }
        return succeed(remainingOf(rightRes), std::get<0>(bodyRes).moveValue());
    }
    [[nodiscard]] std::string dump() const override {
        return mLeft->dump() + " " + mBody->dump() + " " + mRight->dump();
    }

private:
    Parser<L> mLeft;
    Parser<T> mBody;
    Parser<R> mRight;
};

// The affix runs before the kept child when `prefixFirst` is set, after it otherwise.
template<typename T, typename A>
class AffixedCombinator final : public Combinator<T> {
public:
    AffixedCombinator(Parser<T> child, Parser<A> affix, bool prefixFirst)
    : mChild(requireParser(child, "affixed element")), mAffix(requireParser(affix, prefixFirst ? "prefix" : "suffix")), mPrefixFirst(prefixFirst) {
    }
    [[nodiscard]] Result<T> match(Text input) const override {
        const char* type = mPrefixFirst ? "prefixed" : "suffixed";
        Text rest = input;
        if(mPrefixFirst) {
            auto affixRes = mAffix->match(rest);
            if(!isSuccess(affixRes)) {
                return fail<T>(input, ParseError::parserFailed(type, input, errorOf(affixRes)));
            }
            rest = remainingOf(affixRes);
        }
        auto childRes = mChild->match(rest);
        if(!isSuccess(childRes)) {
            return fail<T>(input, ParseError::parserFailed(type, input, errorOf(childRes)));
        }
        rest = remainingOf(childRes);
        if(!mPrefixFirst) {
            auto affixRes = mAffix->match(rest);
            if(!isSuccess(affixRes)) {
                return fail<T>(input, ParseError::parserFailed(type, input, errorOf(affixRes)));
            }
            rest = remainingOf(affixRes);
        }
        return succeed(rest, std::get<0>(childRes).moveValue());
    }
    [[nodiscard]] std::string dump() const override {
        if(mPrefixFirst) {
            return mAffix->dump() + " " + mChild->dump();
        }
        return mChild->dump() + " " + mAffix->dump();
    }

private:
    Parser<T> mChild;
    Parser<A> mAffix;
    bool mPrefixFirst;
};

template<typename T>
class FirstCombinator final : public Combinator<T> {
public:
    explicit FirstCombinator(std::vector<Parser<T>> children)
    : mChildren(std::move(children)) {
        for(const auto& child : mChildren) {
            requireParser(child, "choice alternative");
        }
    }
    [[nodiscard]] Result<T> match(Text input) const override {
        for(const auto& child : mChildren) {
            auto childRes = child->match(input);
            if(isSuccess(childRes)) {
                return childRes;
            }
            if(errorOf(childRes)->isFatal()) {
                // a cut inside the alternative commits the whole choice
                return fail<T>(input, errorOf(childRes));
            }
        }
        return fail<T>(input, ParseError::combinatorFailed("first", input));
    }
    [[nodiscard]] std::string dump() const override {
        std::string ret = "(";
        for(auto it = mChildren.cbegin(); it != mChildren.cend(); it++) {
            ret += (*it)->dump();
            if(std::next(it) != mChildren.cend()) {
                ret += " | ";
            }
        }
        ret += ')';
        return ret;
    }

private:
    std::vector<Parser<T>> mChildren;
};

template<typename T>
class AllCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T>, "all can only collect text or sequence outputs");

public:
    explicit AllCombinator(std::vector<Parser<T>> children)
    : mChildren(std::move(children)) {
        for(const auto& child : mChildren) {
            requireParser(child, "sequence element");
        }
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        Seq out;
        Text rest = input;
        for(const auto& child : mChildren) {
            auto childRes = child->match(rest);
            if(!isSuccess(childRes)) {
                return fail<Seq>(input, ParseError::parserFailed("all", input, errorOf(childRes)));
            }
            rest = remainingOf(childRes);
            appendFlattened(out, std::get<0>(childRes).moveValue());
        }
        return succeed(rest, std::move(out));
    }
    [[nodiscard]] std::string dump() const override {
        std::string ret;
        for(auto it = mChildren.cbegin(); it != mChildren.cend(); it++) {
            ret += (*it)->dump();
            if(std::next(it) != mChildren.cend()) {
                ret += " ";
            }
        }
        return ret;
    }

private:
    std::vector<Parser<T>> mChildren;
};

// Greedy repetition folded into an accumulator. An iteration that matches
// without consuming anything ends the repetition and is not folded, so a
// child that can match the empty string never loops forever.
template<typename T, typename A>
class FoldManyCombinator final : public Combinator<A> {
public:
    using Reducer = std::function<A(A, T)>;

    FoldManyCombinator(std::string type, Parser<T> child, size_t minimum, A init, Reducer reducer)
    : mType(std::move(type)), mChild(requireParser(child, "repeated element")), mMinimum(minimum), mInit(std::move(init)), mReducer(std::move(reducer)) {
    }
    [[nodiscard]] Result<A> match(Text input) const override {
        A acc = mInit;
        Text rest = input;
        size_t count = 0;
        while(true) {
            auto childRes = mChild->match(rest);
            if(!isSuccess(childRes)) {
                if(errorOf(childRes)->isFatal()) {
                    return fail<A>(input, ParseError::parserFailed(mType, input, errorOf(childRes)));
                }
                if(count < mMinimum) {
                    return fail<A>(input, ParseError::rangeFailed(mType, input, count, mMinimum, std::nullopt, errorOf(childRes)));
                }
                break;
            }
            if(remainingOf(childRes).size() == rest.size()) {
                if(count < mMinimum) {
                    return fail<A>(input, ParseError::rangeFailed(mType, input, count, mMinimum, std::nullopt));
                }
                break;
            }
            rest = remainingOf(childRes);
            acc = mReducer(std::move(acc), std::get<0>(childRes).moveValue());
            count += 1;
        }
        return succeed(rest, std::move(acc));
    }
    [[nodiscard]] std::string dump() const override {
        return "(" + mChild->dump() + (mMinimum == 0 ? ")*" : ")+");
    }

private:
    std::string mType;
    Parser<T> mChild;
    size_t mMinimum;
    A mInit;
    Reducer mReducer;
};

template<typename T>
class ManyCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T>, "many can only collect text or sequence outputs");

public:
    ManyCombinator(std::string type, Parser<T> child, size_t minimum)
    : mFold(std::move(type), std::move(child), minimum, Seq{}, [](Seq acc, T value) {
          appendFlattened(acc, std::move(value));
          return acc;
      }) {
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        return mFold.match(input);
    }
    [[nodiscard]] std::string dump() const override {
        return mFold.dump();
    }

private:
    FoldManyCombinator<T, Seq> mFold;
};

template<typename T, typename S>
class SeparatedListCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T>, "separatedList can only collect text or sequence outputs");

public:
    SeparatedListCombinator(Parser<T> element, Parser<S> separator, size_t minimum)
    : mElement(requireParser(element, "list element")), mSeparator(requireParser(separator, "list separator")), mMinimum(minimum) {
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        const char* type = mMinimum == 0 ? "separated_list0" : "separated_list";
        Seq out;
        auto firstRes = mElement->match(input);
        if(!isSuccess(firstRes)) {
            if(mMinimum > 0 || errorOf(firstRes)->isFatal()) {
                return fail<Seq>(input, ParseError::rangeFailed(type, input, 0, mMinimum, std::nullopt, errorOf(firstRes)));
            }
            return succeed(input, std::move(out));
        }
        Text rest = remainingOf(firstRes);
        appendFlattened(out, std::get<0>(firstRes).moveValue());
        while(true) {
            auto sepRes = mSeparator->match(rest);
            if(!isSuccess(sepRes)) {
                if(errorOf(sepRes)->isFatal()) {
                    return fail<Seq>(input, ParseError::parserFailed(type, input, errorOf(sepRes)));
                }
                break;
            }
            auto elementRes = mElement->match(remainingOf(sepRes));
            if(!isSuccess(elementRes)) {
                if(errorOf(elementRes)->isFatal()) {
                    return fail<Seq>(input, ParseError::parserFailed(type, input, errorOf(elementRes)));
                }
                // the dangling separator is left unconsumed
                break;
            }
            if(remainingOf(elementRes).size() == rest.size()) {
                break;
            }
            rest = remainingOf(elementRes);
            appendFlattened(out, std::get<0>(elementRes).moveValue());
        }
        return succeed(rest, std::move(out));
    }
    [[nodiscard]] std::string dump() const override {
        return mElement->dump() + " (" + mSeparator->dump() + " " + mElement->dump() + ")*";
    }

private:
    Parser<T> mElement;
    Parser<S> mSeparator;
    size_t mMinimum;
};

template<typename T, typename E>
class ManyTillCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T>, "manyTill can only collect text or sequence outputs");

public:
    ManyTillCombinator(Parser<T> element, Parser<E> terminator, size_t minimum)
    : mElement(requireParser(element, "repeated element")), mTerminator(requireParser(terminator, "terminator")), mMinimum(minimum) {
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        const char* type = mMinimum == 0 ? "many_till0" : "many_till";
        Seq out;
        Text rest = input;
        size_t count = 0;
        while(true) {
            if(count >= mMinimum) {
                auto terminatorRes = mTerminator->match(rest);
                if(isSuccess(terminatorRes)) {
                    return succeed(remainingOf(terminatorRes), std::move(out));
                }
                if(errorOf(terminatorRes)->isFatal()) {
                    return fail<Seq>(input, ParseError::parserFailed(type, input, errorOf(terminatorRes)));
                }
            }
            auto elementRes = mElement->match(rest);
            if(!isSuccess(elementRes)) {
                return fail<Seq>(input, ParseError::parserFailed(type, input, errorOf(elementRes)));
            }
            if(remainingOf(elementRes).size() == rest.size()) {
                // no progress and no terminator, the element would repeat forever
                return fail<Seq>(input, ParseError::parserFailed(type, input, ParseError::combinatorFailed(type, rest, mTerminator->dump())));
            }
            rest = remainingOf(elementRes);
            appendFlattened(out, std::get<0>(elementRes).moveValue());
            count += 1;
        }
    }
    [[nodiscard]] std::string dump() const override {
        return "(" + mElement->dump() + ")" + (mMinimum == 0 ? "*" : "+") + " " + mTerminator->dump();
    }

private:
    Parser<T> mElement;
    Parser<E> mTerminator;
    size_t mMinimum;
};

// Reads a count with `length`, then repeats the element exactly that often.
template<typename L, typename T>
class LengthCountCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T>, "lengthCount can only collect text or sequence outputs");
    static_assert(std::is_integral_v<L> || std::is_same_v<L, Text> || std::is_same_v<L, std::string>, "the length must be an integer or decimal text");

public:
    LengthCountCombinator(Parser<L> length, Parser<T> element)
    : mLength(requireParser(length, "length")), mElement(requireParser(element, "counted element")) {
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        auto lengthRes = mLength->match(input);
        if(!isSuccess(lengthRes)) {
            return fail<Seq>(input, ParseError::parserFailed("length_count", input, errorOf(lengthRes)));
        }
        auto count = toCount(valueOf(lengthRes));
        if(!count) {
            return fail<Seq>(input, ParseError::combinatorFailed("length_count", input, "a non-negative decimal count"));
        }
        Seq out;
        Text rest = remainingOf(lengthRes);
        for(size_t i = 0; i < *count; ++i) {
            auto elementRes = mElement->match(rest);
            if(!isSuccess(elementRes)) {
                return fail<Seq>(input, ParseError::rangeFailed("length_count", input, i, *count, *count, errorOf(elementRes)));
            }
            // the count comes from the input, so an element must consume something
            if(remainingOf(elementRes).size() == rest.size()) {
                return fail<Seq>(input, ParseError::rangeFailed("length_count", input, i, *count, *count));
            }
            rest = remainingOf(elementRes);
            appendFlattened(out, std::get<0>(elementRes).moveValue());
        }
        return succeed(rest, std::move(out));
    }
    [[nodiscard]] std::string dump() const override {
        return mLength->dump() + " (" + mElement->dump() + "){n}";
    }

private:
    static std::optional<size_t> toCount(const L& length) {
        if constexpr(std::is_integral_v<L>) {
            if constexpr(std::is_signed_v<L>) {
                if(length < 0)
                    return {};
            }
            return static_cast<size_t>(length);
        } else {
            size_t count = 0;
            auto [ptr, ec] = std::from_chars(length.data(), length.data() + length.size(), count);
            if(ec != std::errc{} || ptr != length.data() + length.size()) {
                return {};
            }
            return count;
        }
    }

    Parser<L> mLength;
    Parser<T> mElement;
};

template<typename T, typename U>
[[nodiscard]] Parser<Seq> pair(Parser<T> first, Parser<U> second) {
    return std::make_shared<PairCombinator<T, U>>(std::move(first), std::move(second));
}

// As pair, but `separator` must match between the two and is discarded.
template<typename T, typename S, typename U>
[[nodiscard]] Parser<Seq> sepPair(Parser<T> first, Parser<S> separator, Parser<U> second) {
    return std::make_shared<SepPairCombinator<T, S, U>>(std::move(first), std::move(separator), std::move(second));
}

template<typename T>
[[nodiscard]] Parser<Seq> repeat(Parser<T> child, size_t n) {
    return std::make_shared<RepeatCombinator<T>>("repeat", std::move(child), n, n);
}

// Between n and m repetitions; n and m are swapped if n > m.
template<typename T>
[[nodiscard]] Parser<Seq> repeatRange(Parser<T> child, size_t n, size_t m) {
    return std::make_shared<RepeatCombinator<T>>("repeat_range", std::move(child), n, m);
}

template<typename T>
[[nodiscard]] Parser<Seq> fill(Parser<T> child, size_t n) {
    return std::make_shared<RepeatCombinator<T>>("fill", std::move(child), n, n);
}

template<typename L, typename T, typename R>
[[nodiscard]] Parser<T> delimited(Parser<L> left, Parser<T> body, Parser<R> right) {
    return std::make_shared<DelimitedCombinator<L, T, R>>(std::move(left), std::move(body), std::move(right));
}

[[nodiscard]] Parser<Text> quoteDouble();
[[nodiscard]] Parser<Text> quoteSingle();
[[nodiscard]] Parser<Text> bracketSquare();
[[nodiscard]] Parser<Text> bracketAngled();
[[nodiscard]] Parser<Text> parentheses();

template<typename T, typename P>
[[nodiscard]] Parser<T> prefixed(Parser<T> child, Parser<P> prefix) {
    return std::make_shared<AffixedCombinator<T, P>>(std::move(child), std::move(prefix), true);
}

template<typename T, typename S>
[[nodiscard]] Parser<T> suffixed(Parser<T> child, Parser<S> suffix) {
    return std::make_shared<AffixedCombinator<T, S>>(std::move(child), std::move(suffix), false);
}

// Ordered choice: the first alternative that matches wins. A cut failure in
// any alternative stops the search.
template<typename T>
[[nodiscard]] Parser<T> first(std::vector<Parser<T>> children) {
    return std::make_shared<FirstCombinator<T>>(std::move(children));
}

template<typename T, typename... Rest>
[[nodiscard]] Parser<T> first(Parser<T> head, Rest... tail) {
    return first(std::vector<Parser<T>>{ std::move(head), Parser<T>{ std::move(tail) }... });
}

template<typename T>
[[nodiscard]] Parser<Seq> all(std::vector<Parser<T>> children) {
    return std::make_shared<AllCombinator<T>>(std::move(children));
}

template<typename T, typename... Rest>
[[nodiscard]] Parser<Seq> all(Parser<T> head, Rest... tail) {
    return all(std::vector<Parser<T>>{ std::move(head), Parser<T>{ std::move(tail) }... });
}

template<typename T>
[[nodiscard]] Parser<Seq> many(Parser<T> child) {
    return std::make_shared<ManyCombinator<T>>("many", std::move(child), 1);
}

template<typename T>
[[nodiscard]] Parser<Seq> manyN(Parser<T> child, size_t n) {
    return std::make_shared<ManyCombinator<T>>("many_n", std::move(child), n);
}

template<typename T, typename S>
[[nodiscard]] Parser<Seq> separatedList(Parser<T> element, Parser<S> separator) {
    return std::make_shared<SeparatedListCombinator<T, S>>(std::move(element), std::move(separator), 1);
}

template<typename T, typename S>
[[nodiscard]] Parser<Seq> separatedList0(Parser<T> element, Parser<S> separator) {
    return std::make_shared<SeparatedListCombinator<T, S>>(std::move(element), std::move(separator), 0);
}

template<typename T, typename E>
[[nodiscard]] Parser<Seq> manyTill(Parser<T> element, Parser<E> terminator) {
    return std::make_shared<ManyTillCombinator<T, E>>(std::move(element), std::move(terminator), 1);
}

template<typename T, typename E>
[[nodiscard]] Parser<Seq> manyTill0(Parser<T> element, Parser<E> terminator) {
    return std::make_shared<ManyTillCombinator<T, E>>(std::move(element), std::move(terminator), 0);
}

template<typename T, typename A, typename F>
[[nodiscard]] Parser<A> foldMany(Parser<T> child, A init, F reducer) {
    return std::make_shared<FoldManyCombinator<T, A>>("fold_many", std::move(child), 1, std::move(init), std::move(reducer));
}

template<typename T, typename A, typename F>
[[nodiscard]] Parser<A> foldMany0(Parser<T> child, A init, F reducer) {
    return std::make_shared<FoldManyCombinator<T, A>>("fold_many0", std::move(child), 0, std::move(init), std::move(reducer));
}

template<typename T>
[[nodiscard]] Parser<size_t> manyCount(Parser<T> child) {
    return std::make_shared<FoldManyCombinator<T, size_t>>("many_count", std::move(child), 1, 0, [](size_t count, const T&) { return count + 1; });
}

template<typename T>
[[nodiscard]] Parser<size_t> manyCount0(Parser<T> child) {
    return std::make_shared<FoldManyCombinator<T, size_t>>("many_count0", std::move(child), 0, 0, [](size_t count, const T&) { return count + 1; });
}

template<typename L, typename T>
[[nodiscard]] Parser<Seq> lengthCount(Parser<L> length, Parser<T> element) {
    return std::make_shared<LengthCountCombinator<L, T>>(std::move(length), std::move(element));
}

}
