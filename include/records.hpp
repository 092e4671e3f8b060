#pragma once
#include <optional>
#include <string>
#include <vector>

// One exam question as handed to ingest.
struct QuestionRecord {
  std::string id;
  std::string text;
  std::string topic = "General";
  std::string type = "Unknown";
  std::optional<int> marks;
  std::string paper_id;
  std::optional<int> page_number;
  std::optional<std::string> main_question_number;
  std::optional<std::string> sub_question_label;
};

// Trim, collapse whitespace runs to one space, drop control characters.
std::string clean_text(const std::string& raw);

// JSON array of question objects; snake_case or camelCase keys
// (fullText, sourcePaperId, pageNumber, mainQuestionNumber, subQuestionLabel).
// Throws std::invalid_argument on malformed input.
std::vector<QuestionRecord> parse_records(const std::string& json_text);
std::vector<QuestionRecord> load_records(const std::string& path);
