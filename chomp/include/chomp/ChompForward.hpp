#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "chomp/ChompUtil.hpp"

namespace chomp {

// Input text is always borrowed; a successful match returns a suffix of it.
using Text = std::string_view;
using Seq = std::vector<std::string>;

class ParseError;
class MatchFailure;
struct Predicate;
template<typename T>
class MatchSuccess;
template<typename T>
class Combinator;

template<typename T>
using Parser = sp<const Combinator<T>>;

}
