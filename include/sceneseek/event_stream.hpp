#pragma once

#include "sceneseek/events.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace sceneseek {

// "event: <type>\ndata: <json>\n\n". Pure serialization; keeps no state.
std::string EncodeSseFrame(const StreamEvent& event);

// Inverse of EncodeSseFrame for one complete frame. Returns nullopt for
// malformed frames or unknown event types.
std::optional<StreamEvent> DecodeSseFrame(std::string_view frame);

// Ordered event consumer. Send returns false once the transport is gone.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual bool Send(const StreamEvent& event) = 0;
  virtual bool IsOpen() const = 0;
};

class OstreamEventSink final : public EventSink {
 public:
  explicit OstreamEventSink(std::ostream& out) : out_(out) {}

  bool Send(const StreamEvent& event) override;
  bool IsOpen() const override;

 private:
  std::ostream& out_;
};

// Hands encoded frames from the loop thread to a transport thread. The
// producer calls Finish when done; the consumer calls Close when the client
// goes away, after which Send fails.
class FrameQueue final : public EventSink {
 public:
  bool Send(const StreamEvent& event) override;
  bool IsOpen() const override;

  // Waits up to `wait` for a frame. nullopt on timeout or once drained.
  std::optional<std::string> Pop(std::chrono::milliseconds wait);
  void Finish();
  void Close();
  // Finished and every frame consumed.
  [[nodiscard]] bool drained() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> frames_{};
  bool finished_ = false;
  bool closed_ = false;
};

}  // namespace sceneseek
