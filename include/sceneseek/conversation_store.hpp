#pragma once

#include "sceneseek/types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace sceneseek {

// Message counts around one append.
struct AppendReceipt {
  std::size_t message_count_before = 0;
  std::size_t message_count_after = 0;
  bool created = false;
};

enum class ConversationAccess {
  kAbsent,
  kOwned,
  kForbidden,
};

// Append-only turn log per conversation. Every operation checks that
// `user_id` owns the conversation; a foreign conversation looks absent.
class ConversationStore {
 public:
  virtual ~ConversationStore() = default;

  // Creates the conversation on first append and derives its title once from
  // the first user turn. Throws std::invalid_argument for a foreign id.
  virtual AppendReceipt AppendTurn(const std::string& conversation_id, const std::string& user_id, const Turn& turn) = 0;
  // All turns land atomically, in order.
  virtual AppendReceipt AppendTurns(const std::string& conversation_id,
                                    const std::string& user_id,
                                    const std::vector<Turn>& turns) = 0;

  // Most recently updated first.
  virtual std::vector<ConversationSummary> ListConversations(const std::string& user_id, int limit) const = 0;
  virtual std::optional<Conversation> GetConversation(const std::string& conversation_id,
                                                      const std::string& user_id) const = 0;
  // Last `max_turns` turns, oldest first.
  virtual std::vector<Turn> RecentTurns(const std::string& conversation_id,
                                        const std::string& user_id,
                                        std::size_t max_turns) const = 0;
  virtual bool DeleteConversation(const std::string& conversation_id, const std::string& user_id) = 0;
  virtual ConversationAccess CheckAccess(const std::string& conversation_id, const std::string& user_id) const = 0;
};

class SqliteConversationStore final : public ConversationStore {
 public:
  explicit SqliteConversationStore(std::string path);
  ~SqliteConversationStore() override;

  SqliteConversationStore(const SqliteConversationStore&) = delete;
  SqliteConversationStore& operator=(const SqliteConversationStore&) = delete;

  AppendReceipt AppendTurn(const std::string& conversation_id, const std::string& user_id, const Turn& turn) override;
  AppendReceipt AppendTurns(const std::string& conversation_id,
                            const std::string& user_id,
                            const std::vector<Turn>& turns) override;
  std::vector<ConversationSummary> ListConversations(const std::string& user_id, int limit) const override;
  std::optional<Conversation> GetConversation(const std::string& conversation_id,
                                              const std::string& user_id) const override;
  std::vector<Turn> RecentTurns(const std::string& conversation_id,
                                const std::string& user_id,
                                std::size_t max_turns) const override;
  bool DeleteConversation(const std::string& conversation_id, const std::string& user_id) override;
  ConversationAccess CheckAccess(const std::string& conversation_id, const std::string& user_id) const override;

 private:
  ConversationAccess CheckAccessLocked(const std::string& conversation_id, const std::string& user_id) const;

  std::string path_;
  sqlite3* db_ = nullptr;
  mutable std::mutex mutex_;
};

// Strips a leading request phrase, capitalizes and caps at 50 characters.
std::string DeriveTitle(std::string_view first_user_message);
// Random version-4 UUID.
std::string GenerateConversationId();
std::int64_t NowMillis();

}  // namespace sceneseek
