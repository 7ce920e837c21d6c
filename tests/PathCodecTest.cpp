// =================================================================
// tests/PathCodecTest.cpp
// =================================================================
// Unit tests for git path decoding.

#include "DiffLens/PathCodec.hpp"
#include <cassert>
#include <iostream>
#include <string>

class PathCodecTest {
public:
    void testPrefixStripping() {
        std::cout << "Testing diff prefix stripping..." << std::endl;

        assert(DiffLens::decodeGitPath("a/src/main.cpp") == std::string("src/main.cpp") &&
               "Should strip a/ prefix");
        assert(DiffLens::decodeGitPath("b/src/main.cpp") == std::string("src/main.cpp") &&
               "Should strip b/ prefix");
        assert(DiffLens::decodeGitPath("w/notes.txt") == std::string("notes.txt") &&
               "Should strip w/ prefix");
        assert(DiffLens::decodeGitPath("src/a/file.c") == std::string("src/a/file.c") &&
               "Should only strip an anchored prefix");
        assert(DiffLens::decodeGitPath("a/b/c.txt") == std::string("b/c.txt") &&
               "Should strip exactly one prefix");

        std::cout << "✓ Prefix stripping test passed" << std::endl;
    }

    void testDevNull() {
        std::cout << "Testing /dev/null handling..." << std::endl;

        assert(!DiffLens::decodeGitPath("/dev/null") && "/dev/null should decode to nothing");
        assert(!DiffLens::decodeGitPath("/dev/null\t") && "Trailing tab should not hide /dev/null");
        assert(!DiffLens::unquoteGitPath("/dev/null") && "unquote should also recognize /dev/null");

        std::cout << "✓ /dev/null test passed" << std::endl;
    }

    void testQuotedPaths() {
        std::cout << "Testing quoted paths with escapes..." << std::endl;

        assert(DiffLens::decodeGitPath("\"a/test\\040file.py\"") == std::string("test file.py") &&
               "Octal escape should decode to a space after prefix stripping");
        assert(DiffLens::unquoteGitPath("\"a/test\\040file.py\"") == std::string("a/test file.py") &&
               "unquote keeps the leading directory");
        assert(DiffLens::decodeGitPath("\"b/tab\\there\"") == std::string("tab\there") &&
               "\\t should decode to a tab");
        assert(DiffLens::decodeGitPath("\"b/say \\\"hi\\\"\"") == std::string("say \"hi\"") &&
               "Escaped quotes should be unescaped");
        assert(DiffLens::decodeGitPath("\"b/back\\\\slash\"") == std::string("back\\slash") &&
               "Escaped backslash should decode to one backslash");

        // UTF-8 bytes are written by git as octal escapes.
        auto decoded = DiffLens::decodeGitPath("\"b/caf\\303\\251.txt\"");
        assert(decoded == std::string("caf\xc3\xa9.txt") && "Octal escapes should rebuild UTF-8 bytes");

        std::cout << "✓ Quoted path test passed" << std::endl;
    }

    void testTrailingTab() {
        std::cout << "Testing trailing tab stripping..." << std::endl;

        assert(DiffLens::decodeGitPath("b/file with space.txt\t") == std::string("file with space.txt") &&
               "Trailing tab should be removed");
        assert(DiffLens::decodeGitPath("a/old.txt\t2024-01-01 10:00:00") == std::string("old.txt") &&
               "Everything after the tab should be removed");

        std::cout << "✓ Trailing tab test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PathCodec unit tests..." << std::endl;

        testPrefixStripping();
        testDevNull();
        testQuotedPaths();
        testTrailingTab();

        std::cout << "All PathCodec tests passed!" << std::endl;
    }
};

int main() {
    try {
        PathCodecTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
