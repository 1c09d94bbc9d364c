#include "chomp/ChompSequence.hpp"

namespace chomp {

Parser<Text> quoteDouble() {
    return delimited(tag("\""), until("\""), tag("\""));
}

Parser<Text> quoteSingle() {
    return delimited(tag("'"), until("'"), tag("'"));
}

Parser<Text> bracketSquare() {
    return delimited(tag("["), until("]"), tag("]"));
}

Parser<Text> bracketAngled() {
    return delimited(tag("<"), until(">"), tag(">"));
}

Parser<Text> parentheses() {
    return delimited(tag("("), until(")"), tag(")"));
}

}
