#pragma once

#include "tracing/span_context.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace tracesdk {

class Span;
class Transaction;

/**
 * @brief Per-context state: the active span and scope-level tags
 */
class Scope {
public:
    /// Make `span` the active span
    void set_span(std::shared_ptr<Span> span) { span_ = std::move(span); }

    /// Make the transaction's root span the active span
    void set_span(const std::shared_ptr<Transaction>& transaction);

    [[nodiscard]] const std::shared_ptr<Span>& get_span() const { return span_; }

    /// Transaction owning the active span, or nullptr
    [[nodiscard]] std::shared_ptr<Transaction> get_transaction() const;

    void set_tag(const std::string& key, const std::string& value) { tags_[key] = value; }
    [[nodiscard]] const TagMap& tags() const { return tags_; }

    void clear();

    /// Merge scope tags into the event; tags already on the event win.
    void apply_to_event(nlohmann::json& event) const;

private:
    std::shared_ptr<Span> span_;
    TagMap tags_;
};

} // namespace tracesdk
