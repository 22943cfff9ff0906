#include <strongbox/execution/fee_engine.hpp>

namespace strongbox::execution {

fee_split_t compute_fee(const strongbox::schema::amount_t& amount,
                        const strongbox::schema::basis_points_t fee_percentage) {
  // Split amount = q * 10000 + r so the product never exceeds 256 bits.
  const auto denominator = strongbox::schema::amount_t{kBasisPointsDenominator};
  const auto rate = strongbox::schema::amount_t{fee_percentage};
  const auto quotient = amount / denominator;
  const auto remainder = amount % denominator;

  auto split = fee_split_t{};
  split.fee = quotient * rate + (remainder * rate) / denominator;
  split.net = amount - split.fee;
  return split;
}

}  // namespace strongbox::execution
