#pragma once

#include <optional>
#include <utility>

namespace strongbox::execution {

/// Rejects nested entry into vault operations.
///
/// A ledger callback that calls back into the vault on the same thread gets
/// an empty `try_enter` and must be refused. The guard is cleared when the
/// outer scoped entry goes away, on every exit path.
class reentrancy_guard final {
 public:
  class scoped_entry final {
   public:
    explicit scoped_entry(reentrancy_guard& guard) : guard_{guard} {
      guard_.entered_ = true;
    }
    ~scoped_entry() { guard_.entered_ = false; }

    scoped_entry(const scoped_entry&) = delete;
    scoped_entry& operator=(const scoped_entry&) = delete;

   private:
    reentrancy_guard& guard_;
  };

  std::optional<scoped_entry> try_enter() {
    if (entered_) {
      return std::nullopt;
    }
    return std::optional<scoped_entry>{std::in_place, *this};
  }

 private:
  bool entered_{false};
};

}  // namespace strongbox::execution
