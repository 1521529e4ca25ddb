#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace craftiax {

struct TierPolicy {
  std::uint64_t min_price = 0;
  std::uint64_t max_price = 0;
  std::size_t max_tiers = 10;
};

// Event and tier definitions, lifecycle and ticket ownership. Mutations only
// touch the store tables; the caller owns the transaction boundary.
class EventLedger {
public:
  EventLedger(Store& store, TierPolicy policy);

  Result create_event(const EventDraft& draft, std::string_view organizer, EventStatus initial_status,
                      std::int64_t now_unix, EventRecord& out);

  Result update_tier_price(std::string_view event_id, std::string_view tier_id, std::uint64_t new_price);
  Result set_tier_active(std::string_view event_id, std::string_view tier_id, bool active);
  Result transition(std::string_view event_id, EventStatus target);

  // Organizer of the event or an administrator.
  Result require_manager(std::string_view event_id, std::string_view caller, bool caller_is_admin) const;

  // Event published and inside its window, tier active and not sold out.
  Result check_issuable(std::string_view event_id, std::string_view tier_id, std::int64_t now_unix) const;
  Result record_issuance(std::string_view event_id, std::string_view tier_id, std::string_view recipient,
                         std::uint64_t& out_sold_count);

  static std::string ticket_token_id(std::string_view event_id, std::string_view tier_id);

  [[nodiscard]] std::optional<EventRecord> event(std::string_view event_id) const;
  [[nodiscard]] std::optional<TierRecord> tier(std::string_view event_id, std::string_view tier_id) const;
  [[nodiscard]] std::vector<TierRecord> tiers(std::string_view event_id) const;
  [[nodiscard]] std::vector<EventRecord> events() const;
  [[nodiscard]] std::uint64_t tickets_owned(std::string_view owner, std::string_view token_id) const;

  [[nodiscard]] const TierPolicy& policy() const { return policy_; }

private:
  Result validate_draft(const EventDraft& draft) const;
  TierRecord* find_tier(std::string_view event_id, std::string_view tier_id);

  Store& store_;
  TierPolicy policy_;
};

}  // namespace craftiax
