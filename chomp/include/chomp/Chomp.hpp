#pragma once

#include "chomp/ChompBasic.hpp"
#include "chomp/ChompError.hpp"
#include "chomp/ChompLineEnding.hpp"
#include "chomp/ChompModifier.hpp"
#include "chomp/ChompPredicate.hpp"
#include "chomp/ChompResult.hpp"
#include "chomp/ChompSequence.hpp"
