#include "git_diff/GitDiff.hpp"

#include <charconv>

namespace git_diff {

using namespace chomp;

namespace {

constexpr const char* RED = "\033[31m";
constexpr const char* GREEN = "\033[32m";
constexpr const char* RESET = "\033[0m";

int toInt(const std::string& str, int fallback) {
    int ret = fallback;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), ret);
    if(ec != std::errc{} || ptr != str.data() + str.size()) {
        return fallback;
    }
    return ret;
}

std::string join(const Seq& lines) {
    std::string ret;
    for(size_t i = 0; i < lines.size(); ++i) {
        if(i > 0)
            ret += '\n';
        ret += lines.at(i);
    }
    return ret;
}

// -25 or +3,3; line numbers must fit into an int
Parser<Seq> headerChange(const char* prefix) {
    return prefixed(
        all(
            verify(digit(), [](Text lineNo) { return lineNo.size() <= 9; }),
            opt(prefixed(digit(), tag(",")))),
        tag(prefix));
}

// @@ -25 +3,3 @@ package scan
Parser<Seq> chunkHeader() {
    return delimited(tag("@@ "), sepPair(headerChange("-"), tag(" "), headerChange("+")), eol());
}

Parser<std::string> changedLines(const char* marker) {
    return map(manyN(prefixed(eol(), tag(marker)), 0), join);
}

Parser<Seq> chunk() {
    return pair(pair(chunkHeader(), changedLines("-")), changedLines("+"));
}

std::string paint(const std::string& text, const char* color, bool colored) {
    if(!colored)
        return text;
    return color + text + RESET;
}

}

std::string DiffChunk::dump(bool colored) const {
    std::string ret = "(";
    ret += paint("-", RED, colored) + std::to_string(removed.lineNo) + "," + std::to_string(removed.count) + " ";
    ret += paint("+", GREEN, colored) + std::to_string(added.lineNo) + "," + std::to_string(added.count) + ")\n";
    if(!removed.change.empty()) {
        ret += paint(removed.change, RED, colored) + "\n";
    }
    if(!added.change.empty()) {
        ret += paint(added.change, GREEN, colored) + "\n";
    }
    return ret;
}

std::string FileDiff::dump(bool colored) const {
    std::string ret = "path: " + path + "\n";
    for(auto& chunk : chunks) {
        ret += chunk.dump(colored);
    }
    return ret;
}

GitDiffParser::GitDiffParser() {
    // diff --git a/scan/scanner.go b/scan/scanner.go
    mPath = suffixed(
        prefixed(
            map(recognize(pair(tag("a/"), until(" "))), [](Text raw) { return std::string{ raw.substr(2) }; }),
            tag("diff --git ")),
        eol());
    mHeader = until("@@");
    mChunks = map(many(chunk()), [](const Seq& values) {
        std::vector<DiffChunk> chunks;
        // every chunk flattens into exactly six values
        for(size_t i = 0; i + 5 < values.size(); i += 6) {
            DiffChunk chunk;
            chunk.removed.lineNo = toInt(values.at(i), 0);
            // an omitted count means a single line
            chunk.removed.count = toInt(values.at(i + 1), 1);
            chunk.added.lineNo = toInt(values.at(i + 2), 0);
            chunk.added.count = toInt(values.at(i + 3), 1);
            chunk.removed.change = values.at(i + 4);
            chunk.added.change = values.at(i + 5);
            chunks.push_back(std::move(chunk));
        }
        return chunks;
    });
}

Result<FileDiff> GitDiffParser::parse(Text diff) const {
    Stopwatch stopwatch{ "Parsing the diff" };
    auto pathRes = mPath->match(diff);
    if(!isSuccess(pathRes)) {
        return fail<FileDiff>(diff, errorOf(pathRes));
    }
    auto headerRes = mHeader->match(remainingOf(pathRes));
    if(!isSuccess(headerRes)) {
        return fail<FileDiff>(diff, errorOf(headerRes));
    }
    auto chunksRes = mChunks->match(remainingOf(headerRes));
    if(!isSuccess(chunksRes)) {
        return fail<FileDiff>(diff, errorOf(chunksRes));
    }
    FileDiff ret;
    ret.path = std::get<0>(pathRes).moveValue();
    ret.chunks = std::get<0>(chunksRes).moveValue();
    return succeed(remainingOf(chunksRes), std::move(ret));
}

}
