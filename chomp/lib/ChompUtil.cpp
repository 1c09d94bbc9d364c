#include "chomp/ChompUtil.hpp"

namespace chomp {

std::optional<UTF8Result> decodeUTF8Codepoint(std::string_view bytes) {
    if(bytes.empty())
        return {};
    unsigned char firstChar = bytes.at(0);
    if(!(firstChar & 0b1000'0000)) {
        // single byte codepoint
        return UTF8Result{ firstChar, 1 };
    }
    size_t len = 0;
    int32_t value = 0;
    if((firstChar & 0b1110'0000) == 0b1100'0000) {
        len = 2;
        value = firstChar & 0b0001'1111;
    } else if((firstChar & 0b1111'0000) == 0b1110'0000) {
        len = 3;
        value = firstChar & 0b0000'1111;
    } else if((firstChar & 0b1111'1000) == 0b1111'0000) {
        len = 4;
        value = firstChar & 0b0000'0111;
    } else {
        return {};
    }
    if(bytes.length() < len)
        return {};
    for(size_t i = 1; i < len; ++i) {
        unsigned char continuation = bytes.at(i);
        if((continuation & 0b1100'0000) != 0b1000'0000)
            return {};
        value = (value << 6) | (continuation & 0b0011'1111);
    }
    // overlong forms, surrogates and values past the last plane
    constexpr int32_t minimumForLength[] = { 0, 0, 0x80, 0x800, 0x10000 };
    if(value < minimumForLength[len] || (value >= 0xD800 && value <= 0xDFFF) || value > 0x10FFFF)
        return {};
    return UTF8Result{ value, len };
}

UTF8Result nextCodepoint(std::string_view bytes) {
    if(bytes.empty())
        return UTF8Result{ 0, 0 };
    auto decoded = decodeUTF8Codepoint(bytes);
    if(!decoded)
        return UTF8Result{ REPLACEMENT_CODEPOINT, 1 };
    return *decoded;
}

std::string encodeUTF8Codepoint(int32_t codepoint) {
    std::string ret;
    auto cp = static_cast<uint32_t>(codepoint);
    if(cp < 0x80) {
        ret += static_cast<char>(cp);
    } else if(cp < 0x800) {
        ret += static_cast<char>(0b1100'0000 | (cp >> 6));
        ret += static_cast<char>(0b1000'0000 | (cp & 0b0011'1111));
    } else if(cp < 0x10000) {
        ret += static_cast<char>(0b1110'0000 | (cp >> 12));
        ret += static_cast<char>(0b1000'0000 | ((cp >> 6) & 0b0011'1111));
        ret += static_cast<char>(0b1000'0000 | (cp & 0b0011'1111));
    } else if(cp < 0x110000) {
        ret += static_cast<char>(0b1111'0000 | (cp >> 18));
        ret += static_cast<char>(0b1000'0000 | ((cp >> 12) & 0b0011'1111));
        ret += static_cast<char>(0b1000'0000 | ((cp >> 6) & 0b0011'1111));
        ret += static_cast<char>(0b1000'0000 | (cp & 0b0011'1111));
    } else {
        return encodeUTF8Codepoint(REPLACEMENT_CODEPOINT);
    }
    return ret;
}

size_t countCodepoints(std::string_view bytes) {
    size_t count = 0;
    while(!bytes.empty()) {
        bytes.remove_prefix(nextCodepoint(bytes).len);
        count += 1;
    }
    return count;
}

std::optional<size_t> codepointPrefixLength(std::string_view bytes, size_t count) {
    size_t pos = 0;
    for(size_t i = 0; i < count; ++i) {
        if(pos >= bytes.size())
            return {};
        pos += nextCodepoint(bytes.substr(pos)).len;
    }
    return pos;
}

std::string truncatePreview(std::string_view bytes, size_t maxCodepoints) {
    auto len = codepointPrefixLength(bytes, maxCodepoints);
    if(!len || *len == bytes.size()) {
        return std::string{ bytes };
    }
    return std::string{ bytes.substr(0, *len) } + "...(truncated)";
}

std::pair<size_t, size_t> getPosition(std::string_view document, size_t offset) {
    size_t line = 1, column = 1;
    size_t i = 0;
    while(i < offset && i < document.size()) {
        auto cp = nextCodepoint(document.substr(i));
        if(cp.utf32Value == '\n') {
            line += 1;
            column = 1;
        } else {
            column += 1;
        }
        i += cp.len;
    }
    return std::make_pair(line, column);
}

}
