#include "chomp/ChompError.hpp"

namespace chomp {

ParseError::ParseError(Key, ErrorKind kind, std::string type, Text text)
: mKind(kind), mType(std::move(type)), mText(truncatePreview(text, TRUNCATE_PREVIEW_AT)), mRemainingLength(text.size()) {
}

sp<const ParseError> ParseError::combinatorFailed(std::string type, Text text, std::string input) {
    auto error = std::make_shared<ParseError>(Key{}, ErrorKind::COMBINATOR_FAILED, std::move(type), text);
    error->mInput = std::move(input);
    return error;
}

sp<const ParseError> ParseError::indexOutOfBounds(std::string type, Text text, long index, size_t size) {
    auto error = std::make_shared<ParseError>(Key{}, ErrorKind::INDEX_OUT_OF_BOUNDS, std::move(type), text);
    error->mIndex = index;
    error->mExecutions = size;
    return error;
}

sp<const ParseError> ParseError::parserFailed(std::string type, Text text, sp<const ParseError> cause) {
    auto error = std::make_shared<ParseError>(Key{}, ErrorKind::PARSER_FAILED, std::move(type), text);
    error->mCause = std::move(cause);
    return error;
}

sp<const ParseError> ParseError::rangeFailed(std::string type, Text text, size_t executions, size_t minimum, std::optional<size_t> maximum, sp<const ParseError> cause, std::string input) {
    auto error = std::make_shared<ParseError>(Key{}, ErrorKind::RANGE_FAILED, std::move(type), text);
    error->mExecutions = executions;
    error->mMinimum = minimum;
    error->mMaximum = maximum;
    error->mCause = std::move(cause);
    error->mInput = std::move(input);
    return error;
}

sp<const ParseError> ParseError::cut(Text text, sp<const ParseError> cause) {
    auto error = std::make_shared<ParseError>(Key{}, ErrorKind::CUT, "cut", text);
    error->mCause = std::move(cause);
    return error;
}

bool ParseError::isFatal() const {
    for(const ParseError* error = this; error; error = error->mCause.get()) {
        if(error->mKind == ErrorKind::CUT) {
            return true;
        }
    }
    return false;
}

const ParseError& ParseError::rootCause() const {
    const ParseError* error = this;
    while(error->mCause) {
        error = error->mCause.get();
    }
    return *error;
}

std::string ParseError::dumpSelf() const {
    std::string msg = "(" + mType + ") ";
    switch(mKind) {
    case ErrorKind::COMBINATOR_FAILED:
        msg += "combinator failed to parse text '" + mText + "'";
        if(!mInput.empty()) {
            msg += " with input '" + mInput + "'";
        }
        break;
    case ErrorKind::INDEX_OUT_OF_BOUNDS:
        msg += "index " + std::to_string(mIndex) + " is out of bounds within sequence of " + std::to_string(mExecutions) + " elements";
        break;
    case ErrorKind::PARSER_FAILED:
        msg += "parser failed.";
        break;
    case ErrorKind::RANGE_FAILED:
        msg += "ranged execution failed on text '" + mText + "'";
        if(!mInput.empty()) {
            msg += " with input '" + mInput + "'";
        }
        msg += ", executed " + std::to_string(mExecutions) + " times, expected ";
        if(mMaximum && *mMaximum == mMinimum) {
            msg += "exactly " + std::to_string(mMinimum);
        } else if(mMaximum) {
            msg += "between " + std::to_string(mMinimum) + " and " + std::to_string(*mMaximum);
        } else {
            msg += "at least " + std::to_string(mMinimum);
        }
        if(mCause) {
            msg += ".";
        }
        break;
    case ErrorKind::CUT:
        msg += "fatal error, backtracking disabled.";
        break;
    }
    return msg;
}

std::string ParseError::dump() const {
    std::string msg = dumpSelf();
    if(mCause) {
        msg += " " + mCause->dump();
    }
    return msg;
}

std::string errorsToString(const ParseError& error, Text document, bool colored) {
    std::string ret;
    size_t depth = 0;
    for(const ParseError* node = &error; node; node = node->getCause().get()) {
        size_t offset = 0;
        if(node->getRemainingLength() <= document.size()) {
            offset = document.size() - node->getRemainingLength();
        }
        auto [line, column] = getPosition(document, offset);
        for(size_t i = 0; i < depth; ++i) {
            ret += " ";
        }
        if(colored) {
            switch(node->getKind()) {
            case ErrorKind::PARSER_FAILED:
                ret += "\033[36m";
                break;
            case ErrorKind::RANGE_FAILED:
                ret += "\033[34m";
                break;
            case ErrorKind::CUT:
                ret += "\033[31m";
                break;
            default:
                break;
            }
        }
        ret += std::to_string(line) + ":" + std::to_string(column) + ": " + node->dumpSelf();
        if(colored && !node->isLeaf()) {
            ret += "\033[0m";
        }
        ret += "\n";
        depth += 1;
    }
    return ret;
}

}
