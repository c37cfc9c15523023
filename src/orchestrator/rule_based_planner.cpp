#include "sceneseek/rule_based_planner.hpp"

#include "sceneseek/catalog_tools.hpp"
#include "sceneseek/ranking.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sceneseek {
namespace {

constexpr std::array<std::string_view, 6> kCountPhrases = {
    "how many", "count", "total", "number of", "statistics", "stats",
};

constexpr std::array<std::string_view, 14> kVisualPhrases = {
    "looks like", "look like", "visually", "visual", "similar", "showing",  "depicting",
    "containing", "color",     "colour",   "lighting", "sunset", "at night", "scene with",
};

constexpr std::array<std::string_view, 12> kRequestPhrases = {
    "show me", "find", "get", "search for", "look for", "list", "give me", "please", "can you", "i want", "i need", "all",
};

struct ResolutionWord {
  std::string_view word;
  int width;
  int height;
};

constexpr std::array<ResolutionWord, 8> kResolutionWords = {{
    {"8k", 7680, 4320},
    {"4k", 3840, 2160},
    {"uhd", 3840, 2160},
    {"2160p", 3840, 2160},
    {"1080p", 1920, 1080},
    {"full hd", 1920, 1080},
    {"hd", 1920, 1080},
    {"720p", 1280, 720},
}};

struct TypeWord {
  std::string_view word;
  FileType type;
};

constexpr std::array<TypeWord, 18> kTypeWords = {{
    {"images", FileType::kImage},       {"image", FileType::kImage},
    {"photos", FileType::kImage},       {"pictures", FileType::kImage},
    {"videos", FileType::kVideo},       {"video", FileType::kVideo},
    {"clips", FileType::kVideo},        {"blender", FileType::kBlend},
    {"blend files", FileType::kBlend},  {"audio", FileType::kAudio},
    {"sounds", FileType::kAudio},       {"music", FileType::kAudio},
    {"scripts", FileType::kCode},       {"code", FileType::kCode},
    {"spreadsheets", FileType::kSpreadsheet}, {"excel", FileType::kSpreadsheet},
    {"documents", FileType::kDocument}, {"pdfs", FileType::kDocument},
}};

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

bool IsWordChar(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

// Whole-word (or whole-phrase) occurrence.
std::size_t FindWord(std::string_view haystack, std::string_view needle, std::size_t from = 0) {
  std::size_t pos = haystack.find(needle, from);
  while (pos != std::string_view::npos) {
    const bool left = pos == 0 || !IsWordChar(haystack[pos - 1]);
    const auto end = pos + needle.size();
    const bool right = end >= haystack.size() || !IsWordChar(haystack[end]);
    if (left && right) {
      return pos;
    }
    pos = haystack.find(needle, pos + 1);
  }
  return std::string_view::npos;
}

bool ContainsWord(std::string_view haystack, std::string_view needle) {
  return FindWord(haystack, needle) != std::string_view::npos;
}

template <std::size_t N>
bool ContainsAny(std::string_view haystack, const std::array<std::string_view, N>& needles) {
  return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view needle) {
    return ContainsWord(haystack, needle);
  });
}

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

// "Show me all forest renders" -> "forest renders".
std::string StripRequestPhrases(std::string_view query) {
  auto text = TrimView(query);
  bool stripped = true;
  while (stripped && !text.empty()) {
    stripped = false;
    const auto lower = Lower(text);
    for (const auto phrase : kRequestPhrases) {
      if (FindWord(lower, phrase) == 0) {
        text = TrimView(text.substr(phrase.size()));
        stripped = true;
        break;
      }
    }
  }
  return std::string(text);
}

// "file 42", "file #42", "id 42".
std::optional<std::int64_t> FindFileId(std::string_view lower) {
  for (const std::string_view marker : {std::string_view("file"), std::string_view("id")}) {
    auto pos = FindWord(lower, marker);
    while (pos != std::string_view::npos) {
      const auto after_marker = pos + marker.size();
      auto at = after_marker;
      while (at < lower.size() && (lower[at] == ' ' || lower[at] == '#')) {
        ++at;
      }
      if (at > after_marker && at < lower.size() && std::isdigit(static_cast<unsigned char>(lower[at])) != 0) {
        std::int64_t value = 0;
        while (at < lower.size() && std::isdigit(static_cast<unsigned char>(lower[at])) != 0) {
          value = value * 10 + (lower[at] - '0');
          ++at;
        }
        if (value > 0) {
          return value;
        }
      }
      pos = FindWord(lower, marker, pos + 1);
    }
  }
  return std::nullopt;
}

std::optional<std::string> FindExtension(std::string_view lower) {
  for (std::size_t i = 0; i + 1 < lower.size(); ++i) {
    if (lower[i] != '.' || (i > 0 && IsWordChar(lower[i - 1])) || !IsWordChar(lower[i + 1])) {
      continue;
    }
    std::size_t end = i + 1;
    while (end < lower.size() && IsWordChar(lower[end])) {
      ++end;
    }
    return std::string(lower.substr(i, end - i));
  }
  return std::nullopt;
}

bool HasData(const std::vector<ToolExchange>& history) {
  return std::any_of(history.begin(), history.end(), [](const ToolExchange& exchange) {
    return exchange.outcome.ok && exchange.outcome.result_count() > 0;
  });
}

bool Tried(const std::vector<ToolExchange>& history, std::string_view tool) {
  return std::any_of(history.begin(), history.end(), [tool](const ToolExchange& exchange) {
    return exchange.call.name == tool;
  });
}

std::string DescribeStats(const Json& data) {
  std::ostringstream out;
  out << "The catalog holds " << data.value("total_files", 0) << " files";
  const auto& counts = data.contains("counts") ? data["counts"] : Json::array();
  if (!counts.empty()) {
    out << " (by " << data.value("group_by", std::string("type")) << ": ";
    bool first = true;
    for (const auto& row : counts) {
      if (!first) {
        out << ", ";
      }
      first = false;
      out << row.value("count", 0) << " " << row.value("key", std::string());
    }
    out << ")";
  }
  out << ".";
  return out.str();
}

std::string DescribeDetails(const Json& data) {
  std::ostringstream out;
  out << data.value("name", std::string()) << " is a " << data.value("type", std::string("unknown")) << " file at "
      << data.value("path", std::string()) << " (" << data.value("size", 0) << " bytes";
  if (data.contains("show") && data["show"].is_string()) {
    out << ", show " << data["show"].get<std::string>();
  }
  const auto& details = data.contains("details") ? data["details"] : Json();
  if (details.is_object() && details.contains("width") && details.contains("height")) {
    out << ", " << details["width"].get<int>() << "x" << details["height"].get<int>();
  }
  out << ").";
  return out.str();
}

}  // namespace

RuleBasedPlanner::RuleBasedPlanner(RuleBasedPlannerOptions options) : options_(options) {}

ToolCall RuleBasedPlanner::Route(const std::string& query, bool has_image) const {
  const auto lower = Lower(query);
  const Json limit = options_.search_limit;

  if (has_image) {
    return ToolCall{tool_names::kUploadedImageSearch, {{"limit", limit}}};
  }
  if (ContainsAny(lower, kCountPhrases)) {
    std::string group_by = "type";
    if (ContainsWord(lower, "by show") || ContainsWord(lower, "per show")) {
      group_by = "show";
    } else if (ContainsWord(lower, "extension") || ContainsWord(lower, "extensions")) {
      group_by = "extension";
    }
    return ToolCall{tool_names::kAnalytics, {{"group_by", group_by}}};
  }
  if (const auto file_id = FindFileId(lower)) {
    return ToolCall{tool_names::kFileDetails, {{"file_id", *file_id}}};
  }

  Json filter = Json::object();
  for (const auto& entry : kResolutionWords) {
    if (ContainsWord(lower, entry.word)) {
      filter["min_resolution_x"] = entry.width;
      filter["min_resolution_y"] = entry.height;
      break;
    }
  }
  if (const auto extension = FindExtension(lower)) {
    filter["extension"] = *extension;
  }
  std::optional<FileType> type_word;
  std::string remainder = lower;
  for (const auto& entry : kTypeWords) {
    const auto pos = FindWord(remainder, entry.word);
    if (pos != std::string::npos) {
      type_word = entry.type;
      remainder.erase(pos, entry.word.size());
      break;
    }
  }
  const bool only_type = type_word.has_value() && StripRequestPhrases(remainder).empty();
  if (!filter.empty() || only_type) {
    if (type_word.has_value()) {
      filter["file_type"] = std::string(FileTypeName(*type_word));
    }
    filter["limit"] = limit;
    return ToolCall{tool_names::kFilterSearch, std::move(filter)};
  }

  if (ContainsAny(lower, kVisualPhrases)) {
    return ToolCall{tool_names::kVisualSearch, {{"description", StripRequestPhrases(query)}, {"limit", limit}}};
  }
  return ToolCall{tool_names::kSemanticSearch, {{"query", StripRequestPhrases(query)}, {"limit", limit}}};
}

Decision RuleBasedPlanner::Decide(const DecisionRequest& request) {
  Decision decision{};
  if (request.tool_history.empty()) {
    decision.tool_calls.push_back(Route(request.query, request.has_image));
    decision.thought = "route query to " + decision.tool_calls.back().name;
    return decision;
  }
  if (HasData(request.tool_history)) {
    decision.thought = "results gathered";
    decision.final_answer = std::string();
    return decision;
  }
  if (!Tried(request.tool_history, tool_names::kKeywordSearch)) {
    decision.thought = "previous strategy produced nothing, falling back to keyword search";
    decision.tool_calls.push_back(ToolCall{tool_names::kKeywordSearch,
                                           {{"query", request.query}, {"limit", options_.search_limit}}});
    return decision;
  }
  decision.thought = "no strategy left";
  decision.final_answer = std::string();
  return decision;
}

void RuleBasedPlanner::StreamAnswer(const AnswerRequest& request, const ChunkCallback& on_chunk) {
  std::vector<std::vector<SearchResult>> file_lists{};
  std::vector<std::string> facts{};
  for (const auto& exchange : request.tool_history) {
    if (!exchange.outcome.ok) {
      continue;
    }
    const auto& data = exchange.outcome.data;
    if (data.contains("results") && data["results"].is_array()) {
      std::vector<SearchResult> results{};
      for (const auto& item : data["results"]) {
        results.push_back(SearchResultFromJson(item));
      }
      file_lists.push_back(std::move(results));
    } else if (data.contains("total_files")) {
      facts.push_back(DescribeStats(data));
    } else if (data.contains("name")) {
      facts.push_back(DescribeDetails(data));
    }
  }
  const auto top = MergeResults(file_lists, options_.answer_items);

  std::ostringstream text;
  if (request.best_effort) {
    text << "Partial answer, the search stopped before finishing. ";
  }
  if (request.draft_answer.has_value() && !request.draft_answer->empty()) {
    text << *request.draft_answer << " ";
  }
  for (const auto& fact : facts) {
    text << fact << " ";
  }
  if (!top.empty()) {
    text << "Top matches for \"" << request.query << "\":";
    for (std::size_t i = 0; i < top.size(); ++i) {
      text << "\n" << (i + 1) << ". " << top[i].name << " (" << top[i].path << ")";
    }
  } else if (facts.empty()) {
    text << "I could not find any files matching \"" << request.query << "\".";
  }

  for (const auto& chunk : ChunkWords(text.str())) {
    if (!on_chunk(chunk)) {
      spdlog::debug("answer stream stopped by consumer");
      return;
    }
  }
}

std::vector<std::string> ChunkWords(std::string_view text) {
  std::vector<std::string> chunks{};
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = start;
    while (end < text.size() && std::isspace(static_cast<unsigned char>(text[end])) == 0) {
      ++end;
    }
    while (end < text.size() && std::isspace(static_cast<unsigned char>(text[end])) != 0) {
      ++end;
    }
    chunks.emplace_back(text.substr(start, end - start));
    start = end;
  }
  return chunks;
}

}  // namespace sceneseek
