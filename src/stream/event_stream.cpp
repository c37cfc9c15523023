#include "sceneseek/event_stream.hpp"

#include <string>
#include <utility>

namespace sceneseek {

std::string EncodeSseFrame(const StreamEvent& event) {
  std::string frame = "event: ";
  frame.append(EventTypeName(event.type));
  frame.append("\ndata: ");
  // dump() escapes control characters, so the payload stays on one line.
  frame.append(event.data.dump());
  frame.append("\n\n");
  return frame;
}

std::optional<StreamEvent> DecodeSseFrame(std::string_view frame) {
  std::optional<EventType> type;
  std::string data{};
  while (!frame.empty()) {
    const auto newline = frame.find('\n');
    const auto line = frame.substr(0, newline);
    frame = newline == std::string_view::npos ? std::string_view{} : frame.substr(newline + 1);
    if (line.rfind("event: ", 0) == 0) {
      type = ParseEventType(line.substr(7));
    } else if (line.rfind("data: ", 0) == 0) {
      data.append(line.substr(6));
    }
  }
  if (!type.has_value()) {
    return std::nullopt;
  }
  auto payload = Json::parse(data, nullptr, false);
  if (payload.is_discarded()) {
    return std::nullopt;
  }
  return StreamEvent{*type, std::move(payload)};
}

bool OstreamEventSink::Send(const StreamEvent& event) {
  if (!IsOpen()) {
    return false;
  }
  out_ << EncodeSseFrame(event);
  out_.flush();
  return IsOpen();
}

bool OstreamEventSink::IsOpen() const {
  return out_.good();
}

bool FrameQueue::Send(const StreamEvent& event) {
  auto frame = EncodeSseFrame(event);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    frames_.push_back(std::move(frame));
  }
  cv_.notify_one();
  return true;
}

bool FrameQueue::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !closed_;
}

std::optional<std::string> FrameQueue::Pop(std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, wait, [this]() { return !frames_.empty() || finished_ || closed_; });
  if (frames_.empty()) {
    return std::nullopt;
  }
  auto frame = std::move(frames_.front());
  frames_.pop_front();
  return frame;
}

void FrameQueue::Finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
  }
  cv_.notify_all();
}

void FrameQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    frames_.clear();
  }
  cv_.notify_all();
}

bool FrameQueue::drained() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return (finished_ || closed_) && frames_.empty();
}

}  // namespace sceneseek
