#pragma once

#include <functional>
#include <string>
#include <type_traits>

#include "chomp/ChompResult.hpp"

namespace chomp {

template<typename T, typename U>
class MapCombinator final : public Combinator<U> {
public:
    using Mapper = std::function<U(T)>;

    MapCombinator(Parser<T> child, Mapper mapper)
    : mChild(requireParser(child, "mapped element")), mMapper(std::move(mapper)) {
    }
    [[nodiscard]] Result<U> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return fail<U>(input, errorOf(childRes));
        }
        return succeed(remainingOf(childRes), mMapper(std::get<0>(childRes).moveValue()));
    }
    [[nodiscard]] std::string dump() const override {
        return mChild->dump();
    }

private:
    Parser<T> mChild;
    Mapper mMapper;
};

// Never fails; a failing child yields a default constructed value and leaves
// the input untouched.
template<typename T>
class OptCombinator final : public Combinator<T> {
public:
    explicit OptCombinator(Parser<T> child)
    : mChild(requireParser(child, "optional element")) {
    }
    [[nodiscard]] Result<T> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return succeed(input, T{});
        }
        return childRes;
    }
    [[nodiscard]] std::string dump() const override {
        return "(" + mChild->dump() + ")?";
    }

private:
    Parser<T> mChild;
};

template<typename T>
class SeqCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T>, "seq can only wrap text or sequence outputs");

public:
    explicit SeqCombinator(Parser<T> child)
    : mChild(requireParser(child, "wrapped element")) {
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return fail<Seq>(input, errorOf(childRes));
        }
        Seq out;
        appendFlattened(out, std::get<0>(childRes).moveValue());
        return succeed(remainingOf(childRes), std::move(out));
    }
    [[nodiscard]] std::string dump() const override {
        return mChild->dump();
    }

private:
    Parser<T> mChild;
};

class PickCombinator final : public Combinator<std::string> {
public:
    PickCombinator(Parser<Seq> child, long index);
    [[nodiscard]] Result<std::string> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    Parser<Seq> mChild;
    long mIndex;
};

template<typename T>
class PeekCombinator final : public Combinator<T> {
public:
    explicit PeekCombinator(Parser<T> child)
    : mChild(requireParser(child, "lookahead")) {
    }
    [[nodiscard]] Result<T> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return fail<T>(input, errorOf(childRes));
        }
        return succeed(input, std::get<0>(childRes).moveValue());
    }
    [[nodiscard]] std::string dump() const override {
        return "&" + mChild->dump();
    }

private:
    Parser<T> mChild;
};

template<typename T>
class PeekNotCombinator final : public Combinator<Text> {
public:
    explicit PeekNotCombinator(Parser<T> child)
    : mChild(requireParser(child, "negative lookahead")) {
    }
    [[nodiscard]] Result<Text> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(isSuccess(childRes)) {
            return fail<Text>(input, ParseError::combinatorFailed("peek_not", input, mChild->dump()));
        }
        return succeed(input, input.substr(0, 0));
    }
    [[nodiscard]] std::string dump() const override {
        return "!" + mChild->dump();
    }

private:
    Parser<T> mChild;
};

template<typename T>
class VerifyCombinator final : public Combinator<T> {
public:
    using Check = std::function<bool(const T&)>;

    VerifyCombinator(Parser<T> child, Check check)
    : mChild(requireParser(child, "verified element")), mCheck(std::move(check)) {
    }
    [[nodiscard]] Result<T> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return fail<T>(input, ParseError::parserFailed("verify", input, errorOf(childRes)));
        }
        if(!mCheck(valueOf(childRes))) {
            return fail<T>(input, ParseError::combinatorFailed("verify", input));
        }
        return childRes;
    }
    [[nodiscard]] std::string dump() const override {
        return mChild->dump();
    }

private:
    Parser<T> mChild;
    Check mCheck;
};

template<typename T>
class RecognizeCombinator final : public Combinator<Text> {
public:
    explicit RecognizeCombinator(Parser<T> child)
    : mChild(requireParser(child, "recognized element")) {
    }
    [[nodiscard]] Result<Text> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return fail<Text>(input, ParseError::parserFailed("recognize", input, errorOf(childRes)));
        }
        return succeed(remainingOf(childRes), consumedPrefix(input, remainingOf(childRes)));
    }
    [[nodiscard]] std::string dump() const override {
        return mChild->dump();
    }

private:
    Parser<T> mChild;
};

// The consumed span followed by the child's own output.
template<typename T>
class ConsumedCombinator final : public Combinator<Seq> {
    static_assert(isFlattenable<T>, "consumed can only wrap text or sequence outputs");

public:
    explicit ConsumedCombinator(Parser<T> child)
    : mChild(requireParser(child, "consumed element")) {
    }
    [[nodiscard]] Result<Seq> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return fail<Seq>(input, ParseError::parserFailed("consumed", input, errorOf(childRes)));
        }
        Seq out;
        appendFlattened(out, consumedPrefix(input, remainingOf(childRes)));
        appendFlattened(out, std::get<0>(childRes).moveValue());
        return succeed(remainingOf(childRes), std::move(out));
    }
    [[nodiscard]] std::string dump() const override {
        return mChild->dump();
    }

private:
    Parser<T> mChild;
};

template<typename T>
class AllConsumingCombinator final : public Combinator<T> {
public:
    explicit AllConsumingCombinator(Parser<T> child)
    : mChild(requireParser(child, "consuming element")) {
    }
    [[nodiscard]] Result<T> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return fail<T>(input, ParseError::parserFailed("all_consuming", input, errorOf(childRes)));
        }
        if(!remainingOf(childRes).empty()) {
            return fail<T>(input, ParseError::combinatorFailed("all_consuming", remainingOf(childRes), "end of input"));
        }
        return childRes;
    }
    [[nodiscard]] std::string dump() const override {
        return mChild->dump() + " $";
    }

private:
    Parser<T> mChild;
};

template<typename T, typename V>
class ValueCombinator final : public Combinator<V> {
public:
    ValueCombinator(Parser<T> child, V value)
    : mChild(requireParser(child, "replaced element")), mValue(std::move(value)) {
    }
    [[nodiscard]] Result<V> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return fail<V>(input, errorOf(childRes));
        }
        return succeed(remainingOf(childRes), mValue);
    }
    [[nodiscard]] std::string dump() const override {
        return mChild->dump();
    }

private:
    Parser<T> mChild;
    V mValue;
};

template<typename T>
class CondCombinator final : public Combinator<T> {
public:
    CondCombinator(bool enabled, Parser<T> child)
    : mEnabled(enabled), mChild(requireParser(child, "conditional element")) {
    }
    [[nodiscard]] Result<T> match(Text input) const override {
        if(!mEnabled) {
            return succeed(input, T{});
        }
        return mChild->match(input);
    }
    [[nodiscard]] std::string dump() const override {
        return mEnabled ? mChild->dump() : std::string{ "()" };
    }

private:
    bool mEnabled;
    Parser<T> mChild;
};

// Marks any failure of the child as fatal, so that no enclosing choice tries
// another alternative.
template<typename T>
class CutCombinator final : public Combinator<T> {
public:
    explicit CutCombinator(Parser<T> child)
    : mChild(requireParser(child, "committed element")) {
    }
    [[nodiscard]] Result<T> match(Text input) const override {
        auto childRes = mChild->match(input);
        if(!isSuccess(childRes)) {
            return fail<T>(input, ParseError::cut(input, errorOf(childRes)));
        }
        return childRes;
    }
    [[nodiscard]] std::string dump() const override {
        return "^" + mChild->dump();
    }

private:
    Parser<T> mChild;
};

class EofCombinator final : public Combinator<Text> {
public:
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;
};

class RestCombinator final : public Combinator<Text> {
public:
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;
};

class FlattenCombinator final : public Combinator<std::string> {
public:
    explicit FlattenCombinator(Parser<Seq> child);
    [[nodiscard]] Result<std::string> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;

private:
    Parser<Seq> mChild;
};

template<typename T, typename F>
[[nodiscard]] auto map(Parser<T> child, F mapper) -> Parser<std::decay_t<std::invoke_result_t<F, T>>> {
    using U = std::decay_t<std::invoke_result_t<F, T>>;
    return std::make_shared<MapCombinator<T, U>>(std::move(child), std::move(mapper));
}

template<typename T>
[[nodiscard]] Parser<T> opt(Parser<T> child) {
    return std::make_shared<OptCombinator<T>>(std::move(child));
}

template<typename T>
[[nodiscard]] Parser<Seq> seq(Parser<T> child) {
    return std::make_shared<SeqCombinator<T>>(std::move(child));
}

// Element `index` of a sequence output; out of range indices are an error.
[[nodiscard]] Parser<std::string> pick(Parser<Seq> child, long index);

template<typename T>
[[nodiscard]] Parser<T> peek(Parser<T> child) {
    return std::make_shared<PeekCombinator<T>>(std::move(child));
}

template<typename T>
[[nodiscard]] Parser<Text> peekNot(Parser<T> child) {
    return std::make_shared<PeekNotCombinator<T>>(std::move(child));
}

template<typename T, typename F>
[[nodiscard]] Parser<T> verify(Parser<T> child, F check) {
    return std::make_shared<VerifyCombinator<T>>(std::move(child), std::move(check));
}

template<typename T>
[[nodiscard]] Parser<Text> recognize(Parser<T> child) {
    return std::make_shared<RecognizeCombinator<T>>(std::move(child));
}

template<typename T>
[[nodiscard]] Parser<Seq> consumed(Parser<T> child) {
    return std::make_shared<ConsumedCombinator<T>>(std::move(child));
}

template<typename T>
[[nodiscard]] Parser<T> allConsuming(Parser<T> child) {
    return std::make_shared<AllConsumingCombinator<T>>(std::move(child));
}

template<typename T, typename V>
[[nodiscard]] Parser<V> value(Parser<T> child, V fixed) {
    return std::make_shared<ValueCombinator<T, V>>(std::move(child), std::move(fixed));
}

template<typename T>
[[nodiscard]] Parser<T> cond(bool enabled, Parser<T> child) {
    return std::make_shared<CondCombinator<T>>(enabled, std::move(child));
}

template<typename T>
[[nodiscard]] Parser<T> cut(Parser<T> child) {
    return std::make_shared<CutCombinator<T>>(std::move(child));
}

[[nodiscard]] Parser<Text> eof();
[[nodiscard]] Parser<Text> rest();
// Joins the elements of a sequence output into a single string.
[[nodiscard]] Parser<std::string> flatten(Parser<Seq> child);

}
