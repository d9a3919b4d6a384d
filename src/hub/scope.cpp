#include "hub/scope.hpp"
#include "tracing/span.hpp"
#include "tracing/transaction.hpp"

namespace tracesdk {

void Scope::set_span(const std::shared_ptr<Transaction>& transaction) {
    span_ = transaction ? transaction->span() : nullptr;
}

std::shared_ptr<Transaction> Scope::get_transaction() const {
    return span_ ? span_->transaction() : nullptr;
}

void Scope::clear() {
    span_.reset();
    tags_.clear();
}

void Scope::apply_to_event(nlohmann::json& event) const {
    if (tags_.empty() || !event.is_object()) return;

    auto& event_tags = event["tags"];
    if (!event_tags.is_object()) {
        event_tags = nlohmann::json::object();
    }
    for (const auto& [key, value] : tags_) {
        if (!event_tags.contains(key)) {
            event_tags[key] = value;
        }
    }
}

} // namespace tracesdk
