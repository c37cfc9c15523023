#include "sceneseek/conversation_store.hpp"

#include "../core/sqlite_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace sceneseek {
namespace {

using sqlite::Statement;

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS conversations (
  conversation_id TEXT PRIMARY KEY,
  user_id TEXT NOT NULL,
  title TEXT NOT NULL,
  created_at_ms INTEGER NOT NULL,
  updated_at_ms INTEGER NOT NULL,
  message_count INTEGER NOT NULL DEFAULT 0,
  activity_seq INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_conversations_user
  ON conversations(user_id, updated_at_ms DESC, activity_seq DESC);
CREATE TABLE IF NOT EXISTS turns (
  conversation_id TEXT NOT NULL REFERENCES conversations(conversation_id) ON DELETE CASCADE,
  seq INTEGER NOT NULL,
  kind TEXT NOT NULL,
  content TEXT NOT NULL,
  tool_calls TEXT NOT NULL DEFAULT '[]',
  timestamp_ms INTEGER NOT NULL,
  PRIMARY KEY (conversation_id, seq)
);
)sql";

constexpr std::size_t kMaxTitleLength = 50;
constexpr const char* kDefaultTitle = "New Conversation";
constexpr std::array<std::string_view, 7> kTitlePrefixes = {
    "show me", "find", "get", "what", "where", "how", "can you",
};

bool StartsWithWord(std::string_view text, std::string_view prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[i])) != prefix[i]) {
      return false;
    }
  }
  return text.size() == prefix.size() || std::isspace(static_cast<unsigned char>(text[prefix.size()])) != 0;
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

std::string EncodeToolCalls(const std::vector<ToolCall>& calls) {
  Json out = Json::array();
  for (const auto& call : calls) {
    out.push_back(ToJson(call));
  }
  return out.dump();
}

std::vector<ToolCall> DecodeToolCalls(const std::string& text) {
  std::vector<ToolCall> calls{};
  const auto parsed = Json::parse(text);
  for (const auto& entry : parsed) {
    calls.push_back(ToolCallFromJson(entry));
  }
  return calls;
}

Turn ReadTurn(const Statement& stmt) {
  Turn turn{};
  const auto kind = ParseTurnKind(stmt.ColumnText(0));
  if (!kind.has_value()) {
    throw std::runtime_error("stored turn has unknown kind: " + stmt.ColumnText(0));
  }
  turn.kind = *kind;
  turn.content = stmt.ColumnText(1);
  turn.tool_calls = DecodeToolCalls(stmt.ColumnText(2));
  turn.timestamp_ms = stmt.ColumnInt64(3);
  return turn;
}

ConversationSummary ReadSummary(const Statement& stmt) {
  ConversationSummary summary{};
  summary.conversation_id = stmt.ColumnText(0);
  summary.user_id = stmt.ColumnText(1);
  summary.title = stmt.ColumnText(2);
  summary.created_at_ms = stmt.ColumnInt64(3);
  summary.updated_at_ms = stmt.ColumnInt64(4);
  summary.message_count = static_cast<std::size_t>(stmt.ColumnInt64(5));
  return summary;
}

}  // namespace

std::string DeriveTitle(std::string_view first_user_message) {
  auto title = TrimView(first_user_message);
  bool stripped = true;
  while (stripped) {
    stripped = false;
    for (const auto prefix : kTitlePrefixes) {
      if (StartsWithWord(title, prefix)) {
        title = TrimView(title.substr(prefix.size()));
        stripped = true;
      }
    }
  }
  if (title.empty()) {
    return kDefaultTitle;
  }
  std::string out(title);
  out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  if (out.size() > kMaxTitleLength) {
    std::size_t cut = kMaxTitleLength;
    // Never split a UTF-8 sequence.
    while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    out.resize(cut);
    out.append("...");
  }
  return out;
}

std::string GenerateConversationId() {
  static std::random_device rd;
  static std::mt19937_64 gen(rd());
  static std::uniform_int_distribution<std::uint64_t> dis;
  static std::mutex gen_mutex;

  std::uint64_t ab = 0;
  std::uint64_t cd = 0;
  {
    std::lock_guard<std::mutex> lock(gen_mutex);
    ab = dis(gen);
    cd = dis(gen);
  }

  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  ss << std::setw(8) << (ab >> 32U);
  ss << '-';
  ss << std::setw(4) << ((ab >> 16U) & 0xFFFFU);
  ss << '-';
  ss << std::setw(4) << ((4U << 12U) | (ab & 0x0FFFU));
  ss << '-';
  ss << std::setw(4) << (0x8000U | ((cd >> 48U) & 0x3FFFU));
  ss << '-';
  ss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);
  return ss.str();
}

std::int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

SqliteConversationStore::SqliteConversationStore(std::string path) : path_(std::move(path)) {
  db_ = sqlite::Open(path_);
  try {
    sqlite::Exec(db_, kSchema);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  spdlog::info("conversation store opened: {}", path_);
}

SqliteConversationStore::~SqliteConversationStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

ConversationAccess SqliteConversationStore::CheckAccess(const std::string& conversation_id,
                                                        const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CheckAccessLocked(conversation_id, user_id);
}

ConversationAccess SqliteConversationStore::CheckAccessLocked(const std::string& conversation_id,
                                                              const std::string& user_id) const {
  Statement stmt(db_, "SELECT user_id FROM conversations WHERE conversation_id = ?1;");
  stmt.BindText(1, conversation_id);
  if (!stmt.Step()) {
    return ConversationAccess::kAbsent;
  }
  return stmt.ColumnText(0) == user_id ? ConversationAccess::kOwned : ConversationAccess::kForbidden;
}

AppendReceipt SqliteConversationStore::AppendTurn(const std::string& conversation_id,
                                                  const std::string& user_id,
                                                  const Turn& turn) {
  return AppendTurns(conversation_id, user_id, std::vector<Turn>{turn});
}

AppendReceipt SqliteConversationStore::AppendTurns(const std::string& conversation_id,
                                                   const std::string& user_id,
                                                   const std::vector<Turn>& turns) {
  if (conversation_id.empty() || user_id.empty()) {
    throw std::invalid_argument("conversation id and user id are required");
  }
  if (turns.empty()) {
    throw std::invalid_argument("append requires at least one turn");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite::Transaction tx(db_);
  AppendReceipt receipt{};
  const auto now = NowMillis();

  switch (CheckAccessLocked(conversation_id, user_id)) {
    case ConversationAccess::kForbidden:
      throw std::invalid_argument("conversation not found: " + conversation_id);
    case ConversationAccess::kAbsent: {
      std::string title = kDefaultTitle;
      const auto first_user =
          std::find_if(turns.begin(), turns.end(), [](const Turn& t) { return t.kind == TurnKind::kUser; });
      if (first_user != turns.end()) {
        title = DeriveTitle(first_user->content);
      }
      Statement insert(db_,
                       "INSERT INTO conversations(conversation_id, user_id, title, created_at_ms, updated_at_ms, "
                       "message_count, activity_seq) VALUES(?1, ?2, ?3, ?4, ?4, 0, 0);");
      insert.BindText(1, conversation_id);
      insert.BindText(2, user_id);
      insert.BindText(3, title);
      insert.BindInt64(4, now);
      insert.Step();
      receipt.created = true;
      break;
    }
    case ConversationAccess::kOwned:
      break;
  }

  {
    Statement count(db_, "SELECT message_count FROM conversations WHERE conversation_id = ?1;");
    count.BindText(1, conversation_id);
    if (count.Step()) {
      receipt.message_count_before = static_cast<std::size_t>(count.ColumnInt64(0));
    }
  }

  Statement insert_turn(db_,
                        "INSERT INTO turns(conversation_id, seq, kind, content, tool_calls, timestamp_ms) "
                        "VALUES(?1, ?2, ?3, ?4, ?5, ?6);");
  std::size_t seq = receipt.message_count_before;
  for (const auto& turn : turns) {
    insert_turn.Reset();
    insert_turn.BindText(1, conversation_id);
    insert_turn.BindInt64(2, static_cast<std::int64_t>(seq++));
    insert_turn.BindText(3, TurnKindName(turn.kind));
    insert_turn.BindText(4, turn.content);
    insert_turn.BindText(5, EncodeToolCalls(turn.tool_calls));
    insert_turn.BindInt64(6, turn.timestamp_ms);
    insert_turn.Step();
  }
  receipt.message_count_after = seq;

  Statement update(db_,
                   "UPDATE conversations SET message_count = ?2, updated_at_ms = MAX(updated_at_ms, ?3), "
                   "activity_seq = (SELECT COALESCE(MAX(activity_seq), 0) + 1 FROM conversations) "
                   "WHERE conversation_id = ?1;");
  update.BindText(1, conversation_id);
  update.BindInt64(2, static_cast<std::int64_t>(receipt.message_count_after));
  update.BindInt64(3, now);
  update.Step();

  tx.Commit();
  spdlog::debug("conversation {} appended {} turns ({} -> {})",
                conversation_id,
                turns.size(),
                receipt.message_count_before,
                receipt.message_count_after);
  return receipt;
}

std::vector<ConversationSummary> SqliteConversationStore::ListConversations(const std::string& user_id,
                                                                            int limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_,
                 "SELECT conversation_id, user_id, title, created_at_ms, updated_at_ms, message_count "
                 "FROM conversations WHERE user_id = ?1 "
                 "ORDER BY updated_at_ms DESC, activity_seq DESC, conversation_id ASC LIMIT ?2;");
  stmt.BindText(1, user_id);
  stmt.BindInt64(2, limit > 0 ? limit : -1);
  std::vector<ConversationSummary> out{};
  while (stmt.Step()) {
    out.push_back(ReadSummary(stmt));
  }
  return out;
}

std::optional<Conversation> SqliteConversationStore::GetConversation(const std::string& conversation_id,
                                                                     const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement head(db_,
                 "SELECT conversation_id, user_id, title, created_at_ms, updated_at_ms, message_count "
                 "FROM conversations WHERE conversation_id = ?1 AND user_id = ?2;");
  head.BindText(1, conversation_id);
  head.BindText(2, user_id);
  if (!head.Step()) {
    return std::nullopt;
  }
  const auto summary = ReadSummary(head);

  Conversation conversation{};
  conversation.conversation_id = summary.conversation_id;
  conversation.user_id = summary.user_id;
  conversation.title = summary.title;
  conversation.created_at_ms = summary.created_at_ms;
  conversation.updated_at_ms = summary.updated_at_ms;

  Statement turns(db_,
                  "SELECT kind, content, tool_calls, timestamp_ms FROM turns WHERE conversation_id = ?1 ORDER BY seq;");
  turns.BindText(1, conversation_id);
  while (turns.Step()) {
    conversation.turns.push_back(ReadTurn(turns));
  }
  return conversation;
}

std::vector<Turn> SqliteConversationStore::RecentTurns(const std::string& conversation_id,
                                                       const std::string& user_id,
                                                       std::size_t max_turns) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (max_turns == 0 || CheckAccessLocked(conversation_id, user_id) != ConversationAccess::kOwned) {
    return {};
  }
  Statement stmt(db_,
                 "SELECT kind, content, tool_calls, timestamp_ms FROM turns WHERE conversation_id = ?1 "
                 "ORDER BY seq DESC LIMIT ?2;");
  stmt.BindText(1, conversation_id);
  stmt.BindInt64(2, static_cast<std::int64_t>(max_turns));
  std::vector<Turn> out{};
  while (stmt.Step()) {
    out.push_back(ReadTurn(stmt));
  }
  std::reverse(out.begin(), out.end());
  return out;
}

bool SqliteConversationStore::DeleteConversation(const std::string& conversation_id, const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "DELETE FROM conversations WHERE conversation_id = ?1 AND user_id = ?2;");
  stmt.BindText(1, conversation_id);
  stmt.BindText(2, user_id);
  stmt.Step();
  const bool deleted = sqlite3_changes(db_) > 0;
  if (deleted) {
    spdlog::info("conversation {} deleted", conversation_id);
  }
  return deleted;
}

}  // namespace sceneseek
