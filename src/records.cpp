#include "records.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

std::string clean_text(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  bool space = false;
  for (unsigned char c : raw) {
    if (std::isspace(c)) { space = true; continue; }
    if (c < 0x20 || c == 0x7f) continue;
    if (space && !out.empty()) out.push_back(' ');
    space = false;
    out.push_back((char)c);
  }
  return out;
}

namespace {
const json* field(const json& o, const char* snake, const char* camel) {
  auto it = o.find(snake);
  if (it == o.end() && camel) it = o.find(camel);
  if (it == o.end() || it->is_null()) return nullptr;
  return &*it;
}

std::string str(const json& o, const char* snake, const char* camel, const std::string& dflt) {
  auto* v = field(o, snake, camel);
  if (!v) return dflt;
  if (v->is_string()) return v->get<std::string>();
  if (v->is_number()) return v->dump();
  throw std::invalid_argument(std::string("field '") + snake + "' must be a string");
}

std::optional<int> opt_int(const json& o, const char* snake, const char* camel) {
  auto* v = field(o, snake, camel);
  if (!v) return std::nullopt;
  if (!v->is_number_integer()) throw std::invalid_argument(std::string("field '") + snake + "' must be an integer");
  bool in_range = v->is_number_unsigned()
    ? v->get<uint64_t>() <= (uint64_t)std::numeric_limits<int>::max()
    : v->get<int64_t>() >= std::numeric_limits<int>::min() && v->get<int64_t>() <= std::numeric_limits<int>::max();
  if (!in_range) throw std::invalid_argument(std::string("field '") + snake + "' is out of range");
  return v->get<int>();
}

std::optional<std::string> opt_str(const json& o, const char* snake, const char* camel) {
  if (!field(o, snake, camel)) return std::nullopt;
  return str(o, snake, camel, "");
}
}  // namespace

std::vector<QuestionRecord> parse_records(const std::string& json_text) {
  json doc = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) throw std::invalid_argument("records: invalid JSON");
  // {"questions": [...]} is accepted as well
  if (doc.is_object() && doc.contains("questions")) doc = doc["questions"];
  if (!doc.is_array()) throw std::invalid_argument("records: expected a JSON array");

  std::vector<QuestionRecord> out;
  out.reserve(doc.size());
  for (auto& o : doc) {
    if (!o.is_object()) throw std::invalid_argument("records: every entry must be an object");
    QuestionRecord r;
    r.id = str(o, "id", nullptr, "");
    if (r.id.empty()) throw std::invalid_argument("records: entry without an id");
    r.text = str(o, "text", "fullText", "");
    r.topic = str(o, "topic", nullptr, r.topic);
    r.type = str(o, "type", nullptr, r.type);
    r.marks = opt_int(o, "marks", nullptr);
    r.paper_id = str(o, "paper_id", "sourcePaperId", "");
    r.page_number = opt_int(o, "page_number", "pageNumber");
    r.main_question_number = opt_str(o, "main_question_number", "mainQuestionNumber");
    r.sub_question_label = opt_str(o, "sub_question_label", "subQuestionLabel");
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<QuestionRecord> load_records(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::invalid_argument("records: cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return parse_records(ss.str());
}
