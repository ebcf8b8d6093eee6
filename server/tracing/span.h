#pragma once

// W3C trace ids and an RAII span timer for backend attempts.
//
// No tracing SDK is linked. Span::OnEnd is the export hook: the orchestrator
// logs finished spans with their trace id and duration.
//
// Ids follow W3C Trace Context (https://www.w3.org/TR/trace-context/):
// trace-id is 16 bytes, span-id 8 bytes, both lowercase hex.

#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <map>
#include <random>
#include <sstream>
#include <string>

namespace switchyard {

struct SpanContext {
  std::string trace_id;  // 32 hex chars
  std::string span_id;   // 16 hex chars

  bool valid() const { return trace_id.size() == 32 && span_id.size() == 16; }
};

namespace tracing {

namespace detail {
inline uint64_t RandomU64() {
  // Seeded from the steady clock; random_device may block in containers.
  static thread_local std::mt19937_64 rng{static_cast<uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count())};
  return rng();
}

inline bool IsTraceId(const std::string& id) {
  if (id.size() != 32) return false;
  for (char c : id) {
    bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex) return false;
  }
  return id != std::string(32, '0');
}
}  // namespace detail

// `words` random 64-bit words as lowercase hex (16 chars each).
inline std::string RandomHex(std::size_t words) {
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < words; ++i) {
    out << std::setw(16) << detail::RandomU64();
  }
  return out.str();
}

// Root context for a request. The caller's trace id is kept when it is a
// valid W3C trace id (32 lowercase hex, not all zero); otherwise a new trace
// starts.
inline SpanContext ContextForTraceId(const std::string& trace_id) {
  return SpanContext{detail::IsTraceId(trace_id) ? trace_id : RandomHex(2),
                     RandomHex(1)};
}

// Same trace, fresh span id.
inline SpanContext ChildContext(const SpanContext& parent) {
  return SpanContext{
      detail::IsTraceId(parent.trace_id) ? parent.trace_id : RandomHex(2),
      RandomHex(1)};
}

}  // namespace tracing

// Times one backend attempt. OnEnd receives the span and its duration in
// milliseconds exactly once, from Finish() or the destructor.
class Span {
 public:
  using OnEnd = std::function<void(const Span&, double)>;

  Span(std::string name, SpanContext context, OnEnd on_end = nullptr)
      : name_(std::move(name)),
        context_(std::move(context)),
        on_end_(std::move(on_end)),
        start_(std::chrono::steady_clock::now()) {}

  ~Span() { Finish(); }

  Span(const Span&) = delete;
  Span& operator=(const Span&) = delete;

  void SetAttribute(const std::string& key, std::string value) {
    attributes_[key] = std::move(value);
  }

  void Finish() {
    if (finished_) return;
    finished_ = true;
    double ms = std::chrono::duration<double, std::milli>(
                    std::chrono::steady_clock::now() - start_)
                    .count();
    if (on_end_) on_end_(*this, ms);
  }

  const std::string& name() const { return name_; }
  const SpanContext& context() const { return context_; }
  const std::map<std::string, std::string>& attributes() const {
    return attributes_;
  }

  // "k1=v1 k2=v2", sorted by key.
  std::string AttributeString() const {
    std::string out;
    for (const auto& [key, value] : attributes_) {
      if (!out.empty()) out += ' ';
      out += key + "=" + value;
    }
    return out;
  }

 private:
  std::string name_;
  SpanContext context_;
  OnEnd on_end_;
  std::chrono::steady_clock::time_point start_;
  std::map<std::string, std::string> attributes_;
  bool finished_{false};
};

}  // namespace switchyard
