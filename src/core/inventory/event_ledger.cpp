#include "core/inventory/event_ledger.hpp"

#include <set>

#include "core/model/app_meta.hpp"
#include "core/model/enum_names.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace craftiax {
namespace {

bool transition_allowed(EventStatus from, EventStatus to) {
  switch (to) {
    case EventStatus::Published:
      return from == EventStatus::Draft || from == EventStatus::Cancelled;
    case EventStatus::Cancelled:
      return from == EventStatus::Draft || from == EventStatus::Published;
    case EventStatus::Completed:
      return from == EventStatus::Published;
    case EventStatus::Draft:
      return false;
  }
  return false;
}

}  // namespace

EventLedger::EventLedger(Store& store, TierPolicy policy) : store_(store), policy_(policy) {}

Result EventLedger::validate_draft(const EventDraft& draft) const {
  if (draft.event_id.empty()) {
    return Result::failure(ErrorCode::InvalidArgument, "Event id is required.");
  }
  if (draft.name.empty()) {
    return Result::failure(ErrorCode::InvalidArgument, "Event name is required.");
  }
  if (store_.tables().events.count(draft.event_id) > 0) {
    return Result::failure(ErrorCode::EventAlreadyExists, "Event `" + draft.event_id + "` already exists.");
  }
  if (draft.start_unix >= draft.end_unix) {
    return Result::failure(ErrorCode::InvalidArgument, "Event start time must precede its end time.");
  }
  if (draft.tier_ids.size() != draft.prices.size() || draft.tier_ids.size() != draft.max_quantities.size()) {
    return Result::failure(ErrorCode::InvalidArgument, "Tier ids, prices and quantities length mismatch.");
  }
  if (draft.tier_ids.empty() || draft.tier_ids.size() > policy_.max_tiers) {
    return Result::failure(ErrorCode::InvalidArgument,
                           "Tier count must be between 1 and " + std::to_string(policy_.max_tiers) + ".");
  }
  if (draft.commission_percent > kMaxCommissionPercent) {
    return Result::failure(ErrorCode::CommissionOutOfRange, "Commission percentage exceeds 100.");
  }
  if (draft.commission_recipient.empty()) {
    return Result::failure(ErrorCode::ZeroAddress, "Commission recipient is required.");
  }

  std::set<std::string> seen;
  for (std::size_t i = 0; i < draft.tier_ids.size(); ++i) {
    const std::string& tier_id = draft.tier_ids[i];
    if (tier_id.empty()) {
      return Result::failure(ErrorCode::InvalidArgument, "Tier id is required.");
    }
    // Tier lists are stored comma separated and trimmed.
    if (tier_id.find(',') != std::string::npos || util::trim_copy(tier_id) != tier_id) {
      return Result::failure(ErrorCode::InvalidArgument,
                             "Tier id `" + tier_id + "` must not contain ',' or surrounding spaces.");
    }
    if (!seen.insert(tier_id).second) {
      return Result::failure(ErrorCode::InvalidArgument, "Duplicate tier id `" + tier_id + "`.");
    }
    if (draft.prices[i] < policy_.min_price || draft.prices[i] > policy_.max_price) {
      return Result::failure(ErrorCode::PriceOutOfRange, "Price for tier `" + tier_id + "` is out of range.");
    }
    if (draft.max_quantities[i] == 0) {
      return Result::failure(ErrorCode::InvalidArgument, "Supply for tier `" + tier_id + "` must be positive.");
    }
  }
  return Result::success();
}

Result EventLedger::create_event(const EventDraft& draft, std::string_view organizer, EventStatus initial_status,
                                 std::int64_t now_unix, EventRecord& out) {
  if (organizer.empty()) {
    return Result::failure(ErrorCode::ZeroAddress, "Event organizer identity is required.");
  }
  if (const Result valid = validate_draft(draft); !valid.ok) {
    return valid;
  }

  EventRecord record{
      .event_id = draft.event_id,
      .name = draft.name,
      .description = draft.description,
      .start_unix = draft.start_unix,
      .end_unix = draft.end_unix,
      .organizer = std::string{organizer},
      .status = initial_status,
      .currency = draft.currency,
      .commission_percent = draft.commission_percent,
      .commission_recipient = draft.commission_recipient,
      .tier_ids = draft.tier_ids,
      .created_unix = now_unix,
  };

  auto& tables = store_.tables();
  for (std::size_t i = 0; i < draft.tier_ids.size(); ++i) {
    tables.tiers[{draft.event_id, draft.tier_ids[i]}] = TierRecord{
        .event_id = draft.event_id,
        .tier_id = draft.tier_ids[i],
        .price = draft.prices[i],
        .max_quantity = draft.max_quantities[i],
        .sold_count = 0,
        .active = true,
    };
  }
  tables.events[draft.event_id] = record;
  out = std::move(record);
  return Result::success("Event created.", draft.event_id);
}

Result EventLedger::update_tier_price(std::string_view event_id, std::string_view tier_id,
                                      std::uint64_t new_price) {
  TierRecord* tier_record = find_tier(event_id, tier_id);
  if (tier_record == nullptr) {
    return Result::failure(ErrorCode::TierNotFound, "Tier `" + std::string{tier_id} + "` not found.");
  }
  if (new_price == 0 || new_price > policy_.max_price) {
    return Result::failure(ErrorCode::PriceOutOfRange, "Tier price is out of range.");
  }
  tier_record->price = new_price;
  return Result::success("Tier price updated.");
}

Result EventLedger::set_tier_active(std::string_view event_id, std::string_view tier_id, bool active) {
  TierRecord* tier_record = find_tier(event_id, tier_id);
  if (tier_record == nullptr) {
    return Result::failure(ErrorCode::TierNotFound, "Tier `" + std::string{tier_id} + "` not found.");
  }
  tier_record->active = active;
  return Result::success(active ? "Tier activated." : "Tier deactivated.");
}

Result EventLedger::transition(std::string_view event_id, EventStatus target) {
  auto& events_table = store_.tables().events;
  const auto it = events_table.find(std::string{event_id});
  if (it == events_table.end()) {
    return Result::failure(ErrorCode::EventNotFound, "Event `" + std::string{event_id} + "` not found.");
  }
  if (!transition_allowed(it->second.status, target)) {
    return Result::failure(ErrorCode::InvalidStatusTransition,
                           "Cannot move event from " + event_status_name(it->second.status) + " to " +
                               event_status_name(target) + ".");
  }
  it->second.status = target;
  return Result::success("Event is now " + event_status_name(target) + ".");
}

Result EventLedger::require_manager(std::string_view event_id, std::string_view caller,
                                    bool caller_is_admin) const {
  const auto& events_table = store_.tables().events;
  const auto it = events_table.find(std::string{event_id});
  if (it == events_table.end()) {
    return Result::failure(ErrorCode::EventNotFound, "Event `" + std::string{event_id} + "` not found.");
  }
  if (!caller_is_admin && it->second.organizer != caller) {
    return Result::failure(ErrorCode::Unauthorized, "Only the organizer or an administrator may manage this event.");
  }
  return Result::success();
}

Result EventLedger::check_issuable(std::string_view event_id, std::string_view tier_id,
                                   std::int64_t now_unix) const {
  const auto& tables = store_.tables();
  const auto event_it = tables.events.find(std::string{event_id});
  if (event_it == tables.events.end()) {
    return Result::failure(ErrorCode::EventNotFound, "Event `" + std::string{event_id} + "` not found.");
  }
  const EventRecord& record = event_it->second;
  if (record.status != EventStatus::Published || now_unix < record.start_unix || now_unix > record.end_unix) {
    return Result::failure(ErrorCode::EventNotActive, "Event `" + record.event_id + "` is not active.");
  }

  const auto tier_it = tables.tiers.find({std::string{event_id}, std::string{tier_id}});
  if (tier_it == tables.tiers.end()) {
    return Result::failure(ErrorCode::TierNotFound, "Tier `" + std::string{tier_id} + "` not found.");
  }
  if (!tier_it->second.active) {
    return Result::failure(ErrorCode::TierInactive, "Tier `" + std::string{tier_id} + "` is not active.");
  }
  if (tier_it->second.sold_count >= tier_it->second.max_quantity) {
    return Result::failure(ErrorCode::TierSoldOut, "Tier `" + std::string{tier_id} + "` is sold out.");
  }
  return Result::success();
}

Result EventLedger::record_issuance(std::string_view event_id, std::string_view tier_id,
                                    std::string_view recipient, std::uint64_t& out_sold_count) {
  TierRecord* tier_record = find_tier(event_id, tier_id);
  if (tier_record == nullptr) {
    return Result::failure(ErrorCode::TierNotFound, "Tier `" + std::string{tier_id} + "` not found.");
  }
  if (tier_record->sold_count >= tier_record->max_quantity) {
    return Result::failure(ErrorCode::TierSoldOut, "Tier `" + std::string{tier_id} + "` is sold out.");
  }

  ++tier_record->sold_count;
  store_.tables().tickets[{std::string{recipient}, ticket_token_id(event_id, tier_id)}] += 1;
  out_sold_count = tier_record->sold_count;
  return Result::success();
}

std::string EventLedger::ticket_token_id(std::string_view event_id, std::string_view tier_id) {
  return util::sha256_hex(
      util::canonical_join({{"event_id", std::string{event_id}}, {"tier_id", std::string{tier_id}}}));
}

std::optional<EventRecord> EventLedger::event(std::string_view event_id) const {
  const auto& events_table = store_.tables().events;
  const auto it = events_table.find(std::string{event_id});
  if (it == events_table.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<TierRecord> EventLedger::tier(std::string_view event_id, std::string_view tier_id) const {
  const auto& tiers_table = store_.tables().tiers;
  const auto it = tiers_table.find({std::string{event_id}, std::string{tier_id}});
  if (it == tiers_table.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TierRecord> EventLedger::tiers(std::string_view event_id) const {
  std::vector<TierRecord> out;
  const auto record = event(event_id);
  if (!record.has_value()) {
    return out;
  }
  // Creation order, not key order.
  for (const auto& tier_id : record->tier_ids) {
    if (auto found = tier(event_id, tier_id); found.has_value()) {
      out.push_back(std::move(*found));
    }
  }
  return out;
}

std::vector<EventRecord> EventLedger::events() const {
  std::vector<EventRecord> out;
  for (const auto& [id, record] : store_.tables().events) {
    out.push_back(record);
  }
  return out;
}

std::uint64_t EventLedger::tickets_owned(std::string_view owner, std::string_view token_id) const {
  const auto& tickets = store_.tables().tickets;
  const auto it = tickets.find({std::string{owner}, std::string{token_id}});
  return it == tickets.end() ? 0 : it->second;
}

TierRecord* EventLedger::find_tier(std::string_view event_id, std::string_view tier_id) {
  auto& tiers_table = store_.tables().tiers;
  const auto it = tiers_table.find({std::string{event_id}, std::string{tier_id}});
  return it == tiers_table.end() ? nullptr : &it->second;
}

}  // namespace craftiax
