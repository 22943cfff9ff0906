#pragma once

#include <strongbox/schema/primitives.hpp>

namespace strongbox::execution {

inline constexpr strongbox::schema::basis_points_t kBasisPointsDenominator =
    10000;
/// Upper bound on the withdrawal fee: 500 bps = 5%.
inline constexpr strongbox::schema::basis_points_t kMaxFeeBasisPoints = 500;

struct fee_split_t final {
  strongbox::schema::amount_t fee{};
  strongbox::schema::amount_t net{};
};

/// fee = floor(amount * fee_percentage / 10000), net = amount - fee.
///
/// The bound on `fee_percentage` is the caller's responsibility; it is
/// validated where the rate is configured.
fee_split_t compute_fee(const strongbox::schema::amount_t& amount,
                        strongbox::schema::basis_points_t fee_percentage);

inline bool is_valid_fee(const strongbox::schema::basis_points_t value) {
  return value <= kMaxFeeBasisPoints;
}

}  // namespace strongbox::execution
