#include "filters.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

static bool passes(const MetadataFilter& f, const Metadata& m) {
  return FilterMatcher(f).matches(m);
}

TEST(FilterTest, EmptyFilterPassesEverything) {
  EXPECT_TRUE(passes(MetadataFilter{}, make_meta("a")));
  EXPECT_TRUE(passes(MetadataFilter{}, Metadata{}));
}

TEST(FilterTest, AbsentMarksAreNeverExcluded) {
  MetadataFilter f;
  f.min_marks = 8;
  f.max_marks = 9;
  EXPECT_TRUE(passes(f, make_meta("a", "Thermo", std::nullopt)));
}

TEST(FilterTest, MarksRange) {
  auto m = make_meta("a", "Thermo", 7);

  MetadataFilter above;
  above.min_marks = 8;
  EXPECT_FALSE(passes(above, m));

  MetadataFilter around;
  around.min_marks = 5;
  around.max_marks = 10;
  EXPECT_TRUE(passes(around, m));

  MetadataFilter below;
  below.max_marks = 6;
  EXPECT_FALSE(passes(below, m));

  MetadataFilter inclusive;
  inclusive.min_marks = 7;
  inclusive.max_marks = 7;
  EXPECT_TRUE(passes(inclusive, m));
}

TEST(FilterTest, TopicIsCaseInsensitiveSubstringOfAny) {
  auto m = make_meta("a", "Thermodynamics II");
  MetadataFilter f;
  f.topics = {"optics", "THERMO"};
  EXPECT_TRUE(passes(f, m));

  f.topics = {"optics", "waves"};
  EXPECT_FALSE(passes(f, m));
}

TEST(FilterTest, TypeAndPaperAreExact) {
  auto m = make_meta("a", "Optics", 3, "MCQ", "2019-P1");
  MetadataFilter f;
  f.types = {"mcq"};
  EXPECT_FALSE(passes(f, m));
  f.types = {"Essay", "MCQ"};
  EXPECT_TRUE(passes(f, m));

  f.paper_ids = {"2019-P2"};
  EXPECT_FALSE(passes(f, m));
  f.paper_ids = {"2019-P1"};
  EXPECT_TRUE(passes(f, m));
}

TEST(FilterTest, ClausesAreConjoined) {
  auto m = make_meta("a", "Optics", 4, "MCQ");
  MetadataFilter f;
  f.topics = {"optics"};
  f.types = {"MCQ"};
  f.min_marks = 5;
  EXPECT_FALSE(passes(f, m));
  f.min_marks = 4;
  EXPECT_TRUE(passes(f, m));
}

TEST(FilterTest, TextPatternsMatchAny) {
  auto m = make_meta("a");
  m.text = "Calculate the entropy change of 2 kg of water";
  MetadataFilter f;
  f.text_patterns = {"enthalpy", R"(\d+ kg)"};
  EXPECT_TRUE(passes(f, m));
  f.text_patterns = {"enthalpy"};
  EXPECT_FALSE(passes(f, m));
}

TEST(FilterTest, BadPatternIsRejected) {
  MetadataFilter f;
  f.text_patterns = {"(unclosed"};
  EXPECT_THROW(FilterMatcher{f}, std::invalid_argument);
}
