// =================================================================
// tests/ChunkParserTest.cpp
// =================================================================
// Unit tests for hunk header parsing and line numbering.

#include "DiffLens/ChunkParser.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using DiffLens::LineType;

class ChunkParserTest {
public:
    void testHunkHeader() {
        std::cout << "Testing hunk header parsing..." << std::endl;

        auto header = DiffLens::parseHunkHeader("@@ -1,3 +1,4 @@");
        assert(header && "Standard header should parse");
        assert(header->oldStart == 1 && header->oldLines == 3 && "Old range should parse");
        assert(header->newStart == 1 && header->newLines == 4 && "New range should parse");

        auto implicit = DiffLens::parseHunkHeader("@@ -5 +7 @@ int main()");
        assert(implicit && "Header without counts should parse");
        assert(implicit->oldLines == 1 && implicit->newLines == 1 && "Missing counts default to 1");
        assert(implicit->oldStart == 5 && implicit->newStart == 7 && "Starts should parse");

        auto empty_side = DiffLens::parseHunkHeader("@@ -0,0 +1,2 @@");
        assert(empty_side && empty_side->oldStart == 0 && empty_side->oldLines == 0 &&
               "Zero ranges should parse");

        assert(!DiffLens::parseHunkHeader("@@ garbage @@") && "Malformed header should be rejected");
        assert(!DiffLens::parseHunkHeader("@@ -1,x +1 @@") && "Non-numeric count should be rejected");
        assert(!DiffLens::parseHunkHeader("@@@ -1,2 -1,2 +1,3 @@@") && "Combined diff header should be rejected");

        std::cout << "✓ Hunk header test passed" << std::endl;
    }

    void testLineNumbering() {
        std::cout << "Testing line numbering..." << std::endl;

        std::vector<std::string> lines = {
            "diff --git a/t.txt b/t.txt",
            "@@ -1,3 +1,4 @@",
            " line1",
            "-line2",
            "+line2 modified",
            "+inserted",
            " line3"
        };
        auto chunks = DiffLens::parseChunks(lines);
        assert(chunks.size() == 1 && "Should produce one chunk");
        const auto& chunk = chunks[0];
        assert(chunk.header == "@@ -1,3 +1,4 @@" && "Header text should be kept");
        assert(chunk.lines.size() == 5 && "Should keep five lines");

        assert(chunk.lines[0].type == LineType::NORMAL && "First line is context");
        assert(chunk.lines[0].oldLineNumber == size_t(1) && chunk.lines[0].newLineNumber == size_t(1) &&
               "Context line carries both numbers starting at 1");

        assert(chunk.lines[1].type == LineType::DELETE && "Second line is a deletion");
        assert(chunk.lines[1].oldLineNumber == size_t(2) && !chunk.lines[1].newLineNumber &&
               "Deletion carries only the old number");

        assert(chunk.lines[2].type == LineType::ADD && "Third line is an addition");
        assert(!chunk.lines[2].oldLineNumber && chunk.lines[2].newLineNumber == size_t(2) &&
               "Addition carries only the new number");
        assert(chunk.lines[2].content == "line2 modified" && "Prefix should be stripped");

        assert(chunk.lines[3].newLineNumber == size_t(3) && "New numbers keep counting");
        assert(chunk.lines[4].oldLineNumber == size_t(3) && chunk.lines[4].newLineNumber == size_t(4) &&
               "Context after changes resumes both counters");

        std::cout << "✓ Line numbering test passed" << std::endl;
    }

    void testMultipleChunksAndNoise() {
        std::cout << "Testing multiple chunks and non-content lines..." << std::endl;

        std::vector<std::string> lines = {
            "index 1..2 100644",
            "--- a/f",
            "+++ b/f",
            "@@ -1,2 +1,2 @@",
            "-a",
            "+b",
            "\\ No newline at end of file",
            "",
            "@@ -10,1 +10,2 @@ context",
            " x",
            "+y"
        };
        auto chunks = DiffLens::parseChunks(lines);
        assert(chunks.size() == 2 && "Should produce two chunks");
        assert(chunks[0].lines.size() == 2 && "Marker and empty lines should be skipped");
        assert(chunks[1].lines.size() == 2 && "Second chunk should have two lines");
        assert(chunks[1].lines[0].oldLineNumber == size_t(10) && "Second chunk restarts numbering");
        assert(chunks[1].lines[1].newLineNumber == size_t(11) && "Addition numbered after context");

        auto counts = DiffLens::countLines(chunks);
        assert(counts.additions == 2 && counts.deletions == 1 && "Counts should cover all chunks");

        std::cout << "✓ Multiple chunk test passed" << std::endl;
    }

    void testMalformedHeaderSkipsHunk() {
        std::cout << "Testing malformed hunk header..." << std::endl;

        std::vector<std::string> lines = {
            "@@ -1,1 +1,1 @@",
            "-old",
            "+new",
            "@@ broken @@",
            "+lost",
            "@@ -5,1 +5,1 @@",
            " kept"
        };
        auto chunks = DiffLens::parseChunks(lines);
        assert(chunks.size() == 2 && "The malformed hunk should not produce a chunk");
        assert(chunks[0].lines.size() == 2 && "Lines after a malformed header are not appended to the previous chunk");
        assert(chunks[1].lines[0].content == "kept" && "Parsing resumes at the next valid header");

        std::cout << "✓ Malformed header test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ChunkParser unit tests..." << std::endl;

        testHunkHeader();
        testLineNumbering();
        testMultipleChunksAndNoise();
        testMalformedHeaderSkipsHunk();

        std::cout << "All ChunkParser tests passed!" << std::endl;
    }
};

int main() {
    try {
        ChunkParserTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
