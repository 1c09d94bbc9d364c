#include "git_diff/GitDiff.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

const char* SAMPLE_DIFF = R"(diff --git a/scan/scanner.go b/scan/scanner.go
index fdf8e52..02d20e5 100644
--- a/scan/scanner.go
+++ b/scan/scanner.go
@@ -25 +3,3 @@ package scan
-import "bytes"
+import (
+       "bytes"
+)
@@ -57,0 +38,6 @@ func eat(prefix byte, data []byte) []byte {
+
+// DiffLines is a split function for a [bufio.Scanner] that splits a git diff output
+// into multiple blocks of text, each prefixed by the diff --git marker.
+func DiffLines() func(data []byte, atEOF bool) (advance int, token []byte, err error) {
+       prefix := []byte("\ndiff --git")
+})";

}

int main(int argc, char** argv) {
    std::string diff = SAMPLE_DIFF;
    if(argc > 1) {
        std::string path = argv[1];
        if(path == "-") {
            std::stringstream buffer;
            buffer << std::cin.rdbuf();
            diff = buffer.str();
        } else {
            if(!std::filesystem::is_regular_file(path)) {
                std::cerr << "Not a file: " << path << "\n";
                return 1;
            }
            std::ifstream file(path);
            if(!file) {
                std::cerr << "Unable to open " << path << "\n";
                return 1;
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            diff = buffer.str();
        }
    }

    git_diff::GitDiffParser parser;
    auto res = parser.parse(diff);
    if(!chomp::isSuccess(res)) {
        std::cerr << chomp::errorsToString(*chomp::errorOf(res), diff);
        return 1;
    }
    std::cout << chomp::valueOf(res).dump();
    return 0;
}
