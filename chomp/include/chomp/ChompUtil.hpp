#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chomp {

template<typename T>
using sp = std::shared_ptr<T>;

constexpr int32_t REPLACEMENT_CODEPOINT = 0xFFFD;

struct UTF8Result {
    int32_t utf32Value;
    size_t len;
};

// Returns an empty optional for truncated or malformed sequences.
std::optional<UTF8Result> decodeUTF8Codepoint(std::string_view bytes);

// Decodes the first codepoint of a non-empty string. Malformed bytes decode
// to U+FFFD with a length of one, so scanning always makes progress.
UTF8Result nextCodepoint(std::string_view bytes);

std::string encodeUTF8Codepoint(int32_t codepoint);

size_t countCodepoints(std::string_view bytes);

// Byte length of the first `count` codepoints, or nothing if fewer remain.
std::optional<size_t> codepointPrefixLength(std::string_view bytes, size_t count);

// Copies at most `maxCodepoints` codepoints, marking the copy if it was cut short.
std::string truncatePreview(std::string_view bytes, size_t maxCodepoints);

// 1-based line and column (in codepoints) of `offset` within `document`.
std::pair<size_t, size_t> getPosition(std::string_view document, size_t offset);

class Stopwatch final {
public:
    explicit Stopwatch(const char* name) {
        mStart = std::chrono::high_resolution_clock::now();
        mName = name;
    }
    void stop() {
        if(mStopped)
            return;
        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::high_resolution_clock::now() - mStart).count();
        if(strlen(mName) > 0) {
            printf("%s took %0.2fµs\n", mName, duration / 1000.0);
        } else {
            printf("Something took %0.2fµs\n", duration / 1000.0);
        }
        mStopped = true;
    }
    ~Stopwatch() {
        stop();
    }

private:
    const char* mName;
    std::chrono::high_resolution_clock::time_point mStart;
    bool mStopped = false;
};

}
