#include <gtest/gtest.h>
#include <execbox/policy.h>
#include <execbox/capture.h>

TEST(PolicyTest, BlankInput) {
  EXPECT_TRUE(IsBlankInput(""));
  EXPECT_TRUE(IsBlankInput(" \t\n\r\v\f"));
  EXPECT_FALSE(IsBlankInput("  x"));
  EXPECT_FALSE(IsBlankInput("#"));
  // str.strip() also removes separators and Unicode spaces
  EXPECT_TRUE(IsBlankInput("\x1c\x1d\x1e\x1f"));
  EXPECT_TRUE(IsBlankInput("\xc2\x85\xc2\xa0 \xe2\x80\x83\xe3\x80\x80"));
  EXPECT_FALSE(IsBlankInput("\xc2\xa0x"));
  EXPECT_FALSE(IsBlankInput("\xe2\x80\x8b"));
}

TEST(PolicyTest, Allowed) {
  EXPECT_FALSE(CheckPolicy("print('hi')"));
  EXPECT_FALSE(CheckPolicy("import json\nfrom datetime import date"));
  EXPECT_FALSE(CheckPolicy("importos = 1"));
}

TEST(PolicyTest, DeniedModules) {
  for (auto& module : kDeniedModules) {
    auto res = CheckPolicy("import " + module);
    ASSERT_TRUE(res) << module;
    EXPECT_EQ(res->module, module);
    EXPECT_EQ(res->Reason(), "Import of " + module + " is not allowed for security reasons");
    res = CheckPolicy("x = 1\nfrom " + module + " import path");
    ASSERT_TRUE(res) << module;
    EXPECT_EQ(res->module, module);
  }
}

TEST(PolicyTest, FirstMatchInDenylistOrder) {
  auto res = CheckPolicy("import sys\nimport os");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->module, "os");
  res = CheckPolicy("from glob import glob; import shutil");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->module, "shutil");
}

TEST(PolicyTest, SubstringMatching) {
  // matched as text, not as a statement
  auto res = CheckPolicy("import osmosis");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->module, "os");
  res = CheckPolicy("print('from system')");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->module, "sys");
  EXPECT_FALSE(CheckPolicy("import  os"));
}

TEST(CaptureTest, Limit) {
  CapturedStream stream;
  stream.SetLimit(5);
  EXPECT_TRUE(stream.Append("abc"));
  EXPECT_FALSE(stream.Append("defg"));
  EXPECT_TRUE(stream.truncated());
  EXPECT_EQ(stream.str(), "abcde");
  EXPECT_FALSE(stream.Append("x"));
  EXPECT_EQ(stream.Release(), "abcde");
  EXPECT_TRUE(stream.empty());
}

TEST(CaptureTest, KeepsUtf8Sequences) {
  CapturedStream stream;
  stream.SetLimit(4);
  // "a" followed by two 2-byte characters
  EXPECT_FALSE(stream.Append("a\xc3\xa9\xc3\xa9"));
  EXPECT_EQ(stream.str(), "a\xc3\xa9");
}

TEST(CaptureTest, Unlimited) {
  CapturedStream stream;
  EXPECT_TRUE(stream.Append(std::string(1 << 16, 'x')));
  EXPECT_EQ(stream.str().size(), 1u << 16);
  EXPECT_FALSE(stream.truncated());
}
