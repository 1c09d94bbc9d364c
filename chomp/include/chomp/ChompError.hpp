#pragma once

#include <optional>
#include <string>

#include "chomp/ChompForward.hpp"

namespace chomp {

enum class ErrorKind {
    // A single primitive did not match.
    COMBINATOR_FAILED,
    INDEX_OUT_OF_BOUNDS,
    // A combinator failed because one of its children did; always has a cause.
    PARSER_FAILED,
    // A bounded repetition did not execute the required number of times.
    RANGE_FAILED,
    // Wraps any other error and disables backtracking in enclosing choices.
    CUT,
};

// Immutable description of a failed match. Errors are created where a match
// fails and are shared by every composite error that wraps them. They own
// their text, so they may outlive the input they describe.
class ParseError final {
public:
    static constexpr size_t TRUNCATE_PREVIEW_AT = 50;

    [[nodiscard]] static sp<const ParseError> combinatorFailed(std::string type, Text text, std::string input = "");
    [[nodiscard]] static sp<const ParseError> indexOutOfBounds(std::string type, Text text, long index, size_t size);
    [[nodiscard]] static sp<const ParseError> parserFailed(std::string type, Text text, sp<const ParseError> cause);
    [[nodiscard]] static sp<const ParseError> rangeFailed(std::string type, Text text, size_t executions, size_t minimum, std::optional<size_t> maximum, sp<const ParseError> cause = {}, std::string input = "");
    [[nodiscard]] static sp<const ParseError> cut(Text text, sp<const ParseError> cause);

    [[nodiscard]] ErrorKind getKind() const {
        return mKind;
    }
    [[nodiscard]] const std::string& getType() const {
        return mType;
    }
    // Preview of the text that failed to parse, truncated for readability.
    [[nodiscard]] const std::string& getText() const {
        return mText;
    }
    [[nodiscard]] const std::string& getInput() const {
        return mInput;
    }
    [[nodiscard]] const sp<const ParseError>& getCause() const {
        return mCause;
    }
    [[nodiscard]] size_t getExecutions() const {
        return mExecutions;
    }
    [[nodiscard]] size_t getMinimum() const {
        return mMinimum;
    }
    [[nodiscard]] std::optional<size_t> getMaximum() const {
        return mMaximum;
    }
    [[nodiscard]] long getIndex() const {
        return mIndex;
    }
    // Byte length of the input that remained where the error was raised.
    [[nodiscard]] size_t getRemainingLength() const {
        return mRemainingLength;
    }

    [[nodiscard]] bool isLeaf() const {
        return !mCause;
    }
    [[nodiscard]] bool isFatal() const;
    [[nodiscard]] const ParseError& rootCause() const;

    // Message for the whole chain, outermost first.
    [[nodiscard]] std::string dump() const;
    // Message for this level only.
    [[nodiscard]] std::string dumpSelf() const;

private:
    struct Key {
        explicit Key() = default;
    };

public:
    ParseError(Key, ErrorKind kind, std::string type, Text text);

private:

    ErrorKind mKind;
    std::string mType;
    std::string mText;
    std::string mInput;
    sp<const ParseError> mCause;
    size_t mExecutions = 0;
    size_t mMinimum = 0;
    std::optional<size_t> mMaximum;
    long mIndex = 0;
    size_t mRemainingLength = 0;
};

// Renders every level of the chain on its own line, prefixed by the
// line:column at which it was raised within `document`.
std::string errorsToString(const ParseError& error, Text document, bool colored = true);

}
