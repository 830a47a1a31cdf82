#include "gtest/gtest.h"
#include "common/fingerprint.hpp"

using namespace std;
using namespace runbox;

TEST(FingerprintTest, Md5PrefixTest) {
    EXPECT_EQ(fingerprint("print('hi')"), "701bf4a4");
    EXPECT_EQ(fingerprint("hello world"), "5eb63bbb");
    EXPECT_EQ(fingerprint(""), "d41d8cd9");
}

TEST(FingerprintTest, DeterministicTest) {
    string code = "int main() { return 1; }";
    EXPECT_EQ(fingerprint(code), fingerprint(code));
    EXPECT_NE(fingerprint(code), fingerprint(code + " "));
    EXPECT_EQ(fingerprint(code).size(), 8u);
}
