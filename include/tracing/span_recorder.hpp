#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace tracesdk {

class Span;

inline constexpr size_t kDefaultMaxSpans = 1000;

/**
 * @brief Bounded, ordered store of the spans belonging to one transaction
 *
 * Owns its spans; the transaction's root span is added first and is never
 * evicted. Once more than `maxlen` spans are stored, further additions are
 * dropped and the dropped span's recorder link is cleared, so its own
 * children are not recorded either.
 */
class SpanRecorder {
public:
    explicit SpanRecorder(size_t maxlen = kDefaultMaxSpans);

    /// Append in insertion order. Returns false when the span was dropped.
    bool add(const std::shared_ptr<Span>& span);

    [[nodiscard]] const std::vector<std::shared_ptr<Span>>& spans() const { return spans_; }
    [[nodiscard]] size_t size() const { return spans_.size(); }
    [[nodiscard]] size_t maxlen() const { return maxlen_; }

    /// True once the recorder is full and rejecting new spans
    [[nodiscard]] bool is_dropping() const { return spans_.size() > maxlen_; }

    /// Spans rejected since the recorder filled up
    [[nodiscard]] size_t dropped_count() const { return dropped_count_; }

private:
    size_t maxlen_;
    std::vector<std::shared_ptr<Span>> spans_;
    size_t dropped_count_ = 0;
};

} // namespace tracesdk
