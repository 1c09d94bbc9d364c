#include "chomp/ChompModifier.hpp"

namespace chomp {

PickCombinator::PickCombinator(Parser<Seq> child, long index)
: mChild(requireParser(child, "indexed sequence")), mIndex(index) {
}
Result<std::string> PickCombinator::match(Text input) const {
    auto childRes = mChild->match(input);
    if(!isSuccess(childRes)) {
        return fail<std::string>(input, errorOf(childRes));
    }
    const auto& values = valueOf(childRes);
    if(mIndex < 0 || static_cast<size_t>(mIndex) >= values.size()) {
        return fail<std::string>(input, ParseError::indexOutOfBounds("i", input, mIndex, values.size()));
    }
    return succeed(remainingOf(childRes), std::move(std::get<0>(childRes).moveValue().at(mIndex)));
}
std::string PickCombinator::dump() const {
    return mChild->dump() + "[" + std::to_string(mIndex) + "]";
}

Result<Text> EofCombinator::match(Text input) const {
    if(!input.empty()) {
        return fail<Text>(input, ParseError::combinatorFailed("eof", input, "end of input"));
    }
    return succeed(input, input);
}
std::string EofCombinator::dump() const {
    return "$";
}

Result<Text> RestCombinator::match(Text input) const {
    return succeed(input.substr(input.size()), input);
}
std::string RestCombinator::dump() const {
    return ".*";
}

FlattenCombinator::FlattenCombinator(Parser<Seq> child)
: mChild(requireParser(child, "flattened sequence")) {
}
Result<std::string> FlattenCombinator::match(Text input) const {
    auto childRes = mChild->match(input);
    if(!isSuccess(childRes)) {
        return fail<std::string>(input, errorOf(childRes));
    }
    std::string joined;
    for(const auto& value : valueOf(childRes)) {
        joined += value;
    }
    return succeed(remainingOf(childRes), std::move(joined));
}
std::string FlattenCombinator::dump() const {
    return mChild->dump();
}

Parser<std::string> pick(Parser<Seq> child, long index) {
    return std::make_shared<PickCombinator>(std::move(child), index);
}

Parser<Text> eof() {
    return std::make_shared<EofCombinator>();
}

Parser<Text> rest() {
    return std::make_shared<RestCombinator>();
}

Parser<std::string> flatten(Parser<Seq> child) {
    return std::make_shared<FlattenCombinator>(std::move(child));
}

}
