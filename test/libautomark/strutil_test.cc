#include <config.h>

#include <automark-pkg/strutl.h>

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

TEST(StrUtilTest,Strip)
{
   EXPECT_EQ("libfoo1", AutoMark::String::Strip("  libfoo1\t\n"));
   EXPECT_EQ("a b", AutoMark::String::Strip("a b"));
   EXPECT_EQ("", AutoMark::String::Strip(" \t "));
   EXPECT_EQ("", AutoMark::String::Strip(""));
}
TEST(StrUtilTest,StartAndEnd)
{
   EXPECT_TRUE(AutoMark::String::Startswith("automark.conf", "automark"));
   EXPECT_FALSE(AutoMark::String::Startswith("auto", "automark"));
   EXPECT_TRUE(AutoMark::String::Endswith("automark.conf", ".conf"));
   EXPECT_FALSE(AutoMark::String::Endswith("conf", "automark.conf"));
   EXPECT_TRUE(AutoMark::String::Endswith("conf", ""));
}
TEST(StrUtilTest,Join)
{
   EXPECT_EQ("a, b, c", AutoMark::String::Join({"a", "b", "c"}, ", "));
   EXPECT_EQ("a", AutoMark::String::Join({"a"}, ", "));
   EXPECT_EQ("", AutoMark::String::Join({}, ", "));
}
TEST(StrUtilTest,VectorizeString)
{
   std::vector<std::string> vec = VectorizeString("Depends,Recommends", ',');
   ASSERT_EQ(2u, vec.size());
   EXPECT_EQ("Depends", vec[0]);
   EXPECT_EQ("Recommends", vec[1]);

   vec = VectorizeString("a,,b,", ',');
   ASSERT_EQ(3u, vec.size());
   EXPECT_EQ("a", vec[0]);
   EXPECT_EQ("", vec[1]);
   EXPECT_EQ("b", vec[2]);

   EXPECT_TRUE(VectorizeString("", ',').empty());
}
TEST(StrUtilTest,ParseQuoteWord)
{
   char const * const input = "Tag \"a quoted value\"   rest";
   char const *pos = input;
   std::string word;
   EXPECT_TRUE(ParseQuoteWord(pos, word));
   EXPECT_EQ("Tag", word);
   EXPECT_TRUE(ParseQuoteWord(pos, word));
   EXPECT_EQ("a quoted value", word);
   EXPECT_TRUE(ParseQuoteWord(pos, word));
   EXPECT_EQ("rest", word);
   EXPECT_FALSE(ParseQuoteWord(pos, word));

   char const *unclosed = "\"no end";
   EXPECT_FALSE(ParseQuoteWord(unclosed, word));
}
TEST(StrUtilTest,StringToBool)
{
   EXPECT_EQ(1, StringToBool("yes"));
   EXPECT_EQ(1, StringToBool("TRUE"));
   EXPECT_EQ(1, StringToBool("1"));
   EXPECT_EQ(1, StringToBool("enable"));
   EXPECT_EQ(0, StringToBool("no"));
   EXPECT_EQ(0, StringToBool("Off"));
   EXPECT_EQ(0, StringToBool("0"));
   EXPECT_EQ(-1, StringToBool("maybe"));
   EXPECT_EQ(42, StringToBool("maybe", 42));
}
TEST(StrUtilTest,Printf)
{
   std::ostringstream out;
   ioprintf(out, "%lu packages in %s", 3ul, "cycles");
   EXPECT_EQ("3 packages in cycles", out.str());

   std::string longText(1000, 'x');
   std::string text;
   strprintf(text, "%s!", longText.c_str());
   EXPECT_EQ(longText + "!", text);
}
TEST(StrUtilTest,SubstVar)
{
   EXPECT_EQ("a  b", SubstVar("a\tb", "\t", "  "));
   EXPECT_EQ("abc", SubstVar("abc", "", "x"));
   EXPECT_EQ("x-x-x", SubstVar("a-a-a", "a", "x"));
}
TEST(StrUtilTest,StringCaseCmp)
{
   EXPECT_EQ(0, stringcasecmp("Pre-Depends", "pre-depends"));
   EXPECT_EQ(0, stringcasecmp(std::string("PROVIDES"), std::string("Provides")));
   EXPECT_GT(0, stringcasecmp("Depends", "Provides"));
   EXPECT_LT(0, stringcasecmp("Recommends", "Depends"));
}
