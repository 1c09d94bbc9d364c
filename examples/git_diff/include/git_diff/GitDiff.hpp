#pragma once

#include "chomp/Chomp.hpp"

#include <string>
#include <vector>

namespace git_diff {

using chomp::Parser;
using chomp::Seq;
using chomp::Text;

struct DiffChange {
    int lineNo = 0;
    int count = 0;
    // Changed lines without their +/- marker, joined by newlines.
    std::string change;
};

struct DiffChunk {
    DiffChange removed;
    DiffChange added;

    [[nodiscard]] std::string dump(bool colored = true) const;
};

struct FileDiff {
    std::string path;
    std::vector<DiffChunk> chunks;

    [[nodiscard]] std::string dump(bool colored = true) const;
};

// Parses the unified diff of a single file as printed by `git diff`.
class GitDiffParser {
public:
    GitDiffParser();
    [[nodiscard]] chomp::Result<FileDiff> parse(Text diff) const;

private:
    Parser<std::string> mPath;
    Parser<Text> mHeader;
    Parser<std::vector<DiffChunk>> mChunks;
};

}
