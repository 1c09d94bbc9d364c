#include "chomp/ChompLineEnding.hpp"
#include "chomp/ChompBasic.hpp"
#include "chomp/ChompModifier.hpp"
#include "chomp/ChompSequence.hpp"

namespace chomp {

Result<Text> CrlfCombinator::match(Text input) const {
    size_t len = 0;
    if(input.substr(0, 1) == "\n") {
        len = 1;
    } else if(input.substr(0, 2) == "\r\n") {
        len = 2;
    } else {
        return fail<Text>(input, ParseError::combinatorFailed("crlf", input));
    }
    return succeed(input.substr(len), input.substr(0, len));
}
std::string CrlfCombinator::dump() const {
    return "crlf";
}

Parser<Text> crlf() {
    return std::make_shared<CrlfCombinator>();
}

Parser<Text> eol() {
    return suffixed(takeWhileNot(isLineEnding), opt(crlf()));
}

}
