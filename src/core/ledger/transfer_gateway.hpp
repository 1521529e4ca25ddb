#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace craftiax {

// External settlement rail for both currencies. A failed transfer moves
// nothing; callers treat any failure as terminal for the enclosing operation.
class ITransferGateway {
public:
  virtual ~ITransferGateway() = default;

  virtual Result transfer(Currency currency, std::string_view from, std::string_view to,
                          std::uint64_t amount) = 0;
};

class IClock {
public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual std::int64_t now() const = 0;
};

class SystemClock final : public IClock {
public:
  [[nodiscard]] std::int64_t now() const override;
};

class ManualClock final : public IClock {
public:
  explicit ManualClock(std::int64_t start_unix = 0) : now_(start_unix) {}

  [[nodiscard]] std::int64_t now() const override { return now_; }
  void set(std::int64_t unix_ts) { now_ = unix_ts; }
  void advance(std::int64_t seconds) { now_ += seconds; }

private:
  std::int64_t now_ = 0;
};

struct TransferRecord {
  Currency currency = Currency::Native;
  std::string from;
  std::string to;
  std::uint64_t amount = 0;
};

// Account book held in memory. Used by the CLI and the tests; supports
// rejecting transfers to chosen identities and a hook that runs before each
// transfer is applied.
class InMemoryTransferGateway final : public ITransferGateway {
public:
  using TransferHook = std::function<void(const TransferRecord&)>;

  Result transfer(Currency currency, std::string_view from, std::string_view to,
                  std::uint64_t amount) override;

  void deposit(Currency currency, std::string_view owner, std::uint64_t amount);
  [[nodiscard]] std::uint64_t balance_of(Currency currency, std::string_view owner) const;

  void reject_transfers_to(std::string_view identity);
  void clear_rejections();
  void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

  [[nodiscard]] const std::vector<TransferRecord>& history() const { return history_; }

private:
  std::map<std::pair<Currency, std::string>, std::uint64_t> accounts_;
  std::set<std::string> rejected_recipients_;
  std::vector<TransferRecord> history_;
  TransferHook hook_;
};

}  // namespace craftiax
