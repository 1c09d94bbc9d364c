#pragma once

#include "chomp/ChompResult.hpp"

namespace chomp {

// "\n" or "\r\n". A carriage return on its own is not a line ending.
class CrlfCombinator final : public Combinator<Text> {
public:
    [[nodiscard]] Result<Text> match(Text input) const override;
    [[nodiscard]] std::string dump() const override;
};

[[nodiscard]] Parser<Text> crlf();
// The rest of the current line. A trailing line ending is consumed but not
// returned; never fails.
[[nodiscard]] Parser<Text> eol();

}
