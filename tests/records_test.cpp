#include "records.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <fstream>

TEST(CleanTextTest, CollapsesWhitespaceAndTrims) {
  EXPECT_EQ(clean_text("  What is\t\tthe\n\nspecific   heat?  "), "What is the specific heat?");
  EXPECT_EQ(clean_text("a\x01" "b\x7f" "c"), "abc");
  EXPECT_EQ(clean_text(" \n\t "), "");
  EXPECT_EQ(clean_text(""), "");
}

TEST(ParseRecordsTest, SnakeCaseKeys) {
  auto recs = parse_records(R"([
    {"id": "q1", "text": "Define entropy.", "topic": "Thermodynamics", "type": "Short",
     "marks": 3, "paper_id": "p-2019", "page_number": 4,
     "main_question_number": "2", "sub_question_label": "a"}
  ])");
  ASSERT_EQ(recs.size(), 1u);
  const auto& r = recs[0];
  EXPECT_EQ(r.id, "q1");
  EXPECT_EQ(r.text, "Define entropy.");
  EXPECT_EQ(r.topic, "Thermodynamics");
  EXPECT_EQ(r.type, "Short");
  EXPECT_EQ(r.marks, std::optional<int>(3));
  EXPECT_EQ(r.paper_id, "p-2019");
  EXPECT_EQ(r.page_number, std::optional<int>(4));
  EXPECT_EQ(r.main_question_number, std::optional<std::string>("2"));
  EXPECT_EQ(r.sub_question_label, std::optional<std::string>("a"));
}

TEST(ParseRecordsTest, CamelCaseKeysAndDefaults) {
  auto recs = parse_records(R"([
    {"id": "q2", "fullText": "State Ohm's law.", "sourcePaperId": "p-2020",
     "pageNumber": 7, "mainQuestionNumber": 5, "subQuestionLabel": "ii", "marks": null}
  ])");
  ASSERT_EQ(recs.size(), 1u);
  const auto& r = recs[0];
  EXPECT_EQ(r.text, "State Ohm's law.");
  EXPECT_EQ(r.paper_id, "p-2020");
  EXPECT_EQ(r.page_number, std::optional<int>(7));
  EXPECT_EQ(r.main_question_number, std::optional<std::string>("5"));
  EXPECT_EQ(r.sub_question_label, std::optional<std::string>("ii"));
  EXPECT_EQ(r.topic, "General");
  EXPECT_EQ(r.type, "Unknown");
  EXPECT_FALSE(r.marks.has_value());
}

TEST(ParseRecordsTest, QuestionsWrapper) {
  auto recs = parse_records(R"({"questions": [{"id": "a", "text": "x"}, {"id": "b", "text": "y"}]})");
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[1].id, "b");
}

TEST(ParseRecordsTest, RejectsMalformedInput) {
  EXPECT_THROW(parse_records("[{\"id\": "), std::invalid_argument);
  EXPECT_THROW(parse_records(R"({"id": "q1"})"), std::invalid_argument);
  EXPECT_THROW(parse_records(R"([{"text": "no id"}])"), std::invalid_argument);
  EXPECT_THROW(parse_records(R"([{"id": "q1", "marks": "three"}])"), std::invalid_argument);
  EXPECT_THROW(parse_records(R"([42])"), std::invalid_argument);
}

TEST(ParseRecordsTest, RejectsIntegersOutsideIntRange) {
  EXPECT_THROW(parse_records(R"([{"id": "q1", "marks": 4294967297}])"), std::invalid_argument);
  EXPECT_THROW(parse_records(R"([{"id": "q1", "pageNumber": -3000000000}])"), std::invalid_argument);
  EXPECT_THROW(parse_records(R"([{"id": "q1", "marks": 18446744073709551615}])"), std::invalid_argument);
  auto recs = parse_records(R"([{"id": "q1", "marks": 2147483647, "page_number": -2147483648}])");
  EXPECT_EQ(recs[0].marks, std::optional<int>(2147483647));
  EXPECT_EQ(recs[0].page_number, std::optional<int>(-2147483648));
}

TEST(ParseRecordsTest, EmptyArray) {
  EXPECT_TRUE(parse_records("[]").empty());
}

TEST(LoadRecordsTest, ReadsFile) {
  TempDir dir;
  std::string path = dir.file("questions.json");
  std::ofstream(path) << R"([{"id": "q9", "text": "Explain diffraction."}])";
  auto recs = load_records(path);
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].id, "q9");
  EXPECT_THROW(load_records(dir.file("absent.json")), std::invalid_argument);
}
