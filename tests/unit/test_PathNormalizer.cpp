#include <gtest/gtest.h>
#include "util/path.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace cairn::util;

namespace {

std::string normalized(const std::string& raw) {
    std::string out = "<unset>";
    EXPECT_EQ(normalizePath(raw, out), PathStatus::Ok) << "for input: " << raw;
    return out;
}

PathStatus status(const std::string& raw) {
    std::string out;
    return normalizePath(raw, out);
}

}

TEST(PathNormalizerTest, CollapsesDotsAndSlashes) {
    EXPECT_EQ(normalized("a/b/../c"), "a/c");
    EXPECT_EQ(normalized("./a//b/."), "a/b");
    EXPECT_EQ(normalized("/leading/slash"), "leading/slash");
    EXPECT_EQ(normalized("trailing/"), "trailing");
    EXPECT_EQ(normalized("a/b/c/../../d"), "a/d");
}

TEST(PathNormalizerTest, BackslashesBecomeSlashes) {
    EXPECT_EQ(normalized("\\a\\b"), "a/b");
    EXPECT_EQ(normalized("dir\\..\\file.txt"), "file.txt");
}

TEST(PathNormalizerTest, EmptyAndRootNormalizeToEmpty) {
    EXPECT_EQ(normalized(""), "");
    EXPECT_EQ(normalized("/"), "");
    EXPECT_EQ(normalized("a/.."), "");
    EXPECT_EQ(normalized("././"), "");
}

TEST(PathNormalizerTest, PoppingPastRootIsTraversal) {
    EXPECT_EQ(status(".."), PathStatus::Traversal);
    EXPECT_EQ(status("../etc/passwd"), PathStatus::Traversal);
    EXPECT_EQ(status("a/../../x"), PathStatus::Traversal);
    EXPECT_EQ(status("..\\secret"), PathStatus::Traversal);
    EXPECT_EQ(status("/a/b/../../.."), PathStatus::Traversal);
}

TEST(PathNormalizerTest, RejectsControlAndFormatCharacters) {
    EXPECT_EQ(status("a/\x01" "b"), PathStatus::InvalidCharacter);
    EXPECT_EQ(status("tab\there"), PathStatus::InvalidCharacter);
    EXPECT_EQ(status("new\nline"), PathStatus::InvalidCharacter);
    EXPECT_EQ(status("del\x7f"), PathStatus::InvalidCharacter);
    EXPECT_EQ(status("nel\xC2\x85"), PathStatus::InvalidCharacter);          // U+0085
    EXPECT_EQ(status("zero\xE2\x80\x8Bwidth"), PathStatus::InvalidCharacter); // U+200B
    EXPECT_EQ(status("\xEF\xBB\xBF" "bom.txt"), PathStatus::InvalidCharacter); // U+FEFF
    EXPECT_EQ(status("rtl\xE2\x80\xAE.txt"), PathStatus::InvalidCharacter);   // U+202E
    EXPECT_EQ(status("private\xEE\x80\x80"), PathStatus::InvalidCharacter);   // U+E000
    EXPECT_EQ(status("nonchar\xEF\xBF\xBF"), PathStatus::InvalidCharacter);   // U+FFFF
}

TEST(PathNormalizerTest, RejectsUnassignedCodePoints) {
    EXPECT_EQ(status("a\xCD\xB8" "b"), PathStatus::InvalidCharacter);        // U+0378
    EXPECT_EQ(status("x\xF3\xA0\x82\x80"), PathStatus::InvalidCharacter);   // U+E0080
    EXPECT_EQ(status("y\xE0\xA2\x90"), PathStatus::InvalidCharacter);       // U+0890
    EXPECT_EQ(status("nonchar\xEF\xB7\x90"), PathStatus::InvalidCharacter); // U+FDD0
    EXPECT_TRUE(isForbiddenCodePoint(0x0378));
    EXPECT_TRUE(isForbiddenCodePoint(0xE0080));
    EXPECT_TRUE(isForbiddenCodePoint(0x110000));
    EXPECT_FALSE(isForbiddenCodePoint(U'a'));
    EXPECT_FALSE(isForbiddenCodePoint(0x1F600));
}

TEST(PathNormalizerTest, StatusNames) {
    EXPECT_EQ(to_string(PathStatus::Ok), "ok");
    EXPECT_EQ(to_string(PathStatus::InvalidCharacter), "invalid character");
    EXPECT_EQ(to_string(PathStatus::Traversal), "directory traversal");
}

TEST(PathNormalizerTest, RejectsMalformedUtf8) {
    EXPECT_EQ(status("truncated\xC3"), PathStatus::InvalidCharacter);
    EXPECT_EQ(status("overlong\xC0\xAF"), PathStatus::InvalidCharacter);
    EXPECT_EQ(status("stray\x80"), PathStatus::InvalidCharacter);
    EXPECT_EQ(status("surrogate\xED\xA0\x80"), PathStatus::InvalidCharacter);
}

TEST(PathNormalizerTest, AcceptsPrintableUnicode) {
    EXPECT_EQ(normalized("caf\xC3\xA9/\xE6\x97\xA5\xE6\x9C\xAC.txt"), "caf\xC3\xA9/\xE6\x97\xA5\xE6\x9C\xAC.txt");
    EXPECT_EQ(normalized("my file (1).txt"), "my file (1).txt");
    EXPECT_EQ(normalized("emoji/\xF0\x9F\x98\x80"), "emoji/\xF0\x9F\x98\x80");
}

TEST(PathNormalizerTest, OutputUntouchedOnFailure) {
    std::string out = "previous";
    EXPECT_EQ(normalizePath("../x", out), PathStatus::Traversal);
    EXPECT_EQ(out, "previous");
    EXPECT_EQ(normalizePath("bad\x01", out), PathStatus::InvalidCharacter);
    EXPECT_EQ(out, "previous");
}

TEST(PathNormalizerTest, NormalizedFormHasNoEmptyOrDotSegments) {
    const std::vector<std::string> inputs = {
        "a//b", "./x/./y/", "\\\\server\\share", "p/q/../r/./s//", "one/two/three/../..", "x/.../y"
    };

    for (const auto& in : inputs) {
        const auto out = normalized(in);
        EXPECT_FALSE(out.starts_with('/')) << out;
        EXPECT_FALSE(out.ends_with('/')) << out;
        EXPECT_EQ(out.find("//"), std::string::npos) << out;

        size_t start = 0;
        while (start <= out.size() && !out.empty()) {
            auto end = out.find('/', start);
            if (end == std::string::npos) end = out.size();
            const auto seg = out.substr(start, end - start);
            EXPECT_NE(seg, ".") << out;
            EXPECT_NE(seg, "..") << out;
            start = end + 1;
        }

        // normalizing again is a no-op
        EXPECT_EQ(normalized(out), out);
    }
}

TEST(PathNormalizerTest, TripleDotIsAnOrdinaryName) {
    EXPECT_EQ(normalized("x/.../y"), "x/.../y");
}

TEST(NaturalOrderTest, NumbersCompareByValue) {
    EXPECT_TRUE(naturalCaseLess("file2.txt", "file10.txt"));
    EXPECT_FALSE(naturalCaseLess("file10.txt", "file2.txt"));
    EXPECT_TRUE(naturalCaseLess("v1.9", "v1.10"));
}

TEST(NaturalOrderTest, IgnoresCase) {
    EXPECT_TRUE(naturalCaseLess("apple", "Banana"));
    EXPECT_TRUE(naturalCaseLess("Apple", "banana"));
    EXPECT_LT(naturalCaseCompare("ABC", "abd"), 0);
}

TEST(NaturalOrderTest, IsATotalOrder) {
    EXPECT_NE(naturalCaseCompare("File", "file"), 0);
    EXPECT_NE(naturalCaseCompare("x01", "x1"), 0);
    EXPECT_EQ(naturalCaseCompare("same", "same"), 0);
    EXPECT_EQ(naturalCaseCompare("", ""), 0);
    EXPECT_LT(naturalCaseCompare("", "a"), 0);
}

TEST(NaturalOrderTest, SortsListings) {
    std::vector<std::string> names = {"b10", "B2", "a", "c1"};
    std::ranges::sort(names, naturalCaseLess);
    EXPECT_EQ(names, (std::vector<std::string>{"a", "B2", "b10", "c1"}));
}
