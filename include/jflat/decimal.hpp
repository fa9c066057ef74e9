#pragma once

#include <jflat/value.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jflat {

// Exact decimal: (-1)^neg * digits * 10^-scale.
// Tokens whose exponent exceeds detail::max_exponent throw std::out_of_range;
// the parser never produces them.
// Built straight from a JSON number token; no binary floating point involved,
// so every digit of the source (trailing fraction zeros included) survives.
class decimal {
public:
  decimal() = default;

  static decimal parse(std::string_view token) {
    if (!detail::is_number_token(token)) {
      throw std::invalid_argument("jflat: not a JSON number: " + std::string(token));
    }

    decimal d;
    std::size_t i = 0;
    bool neg = false;
    if (token[i] == '-') {
      neg = true;
      ++i;
    }

    std::string digits;
    digits.reserve(token.size());
    while (i < token.size() && detail::is_digit(token[i])) digits.push_back(token[i++]);

    std::int64_t frac_len = 0;
    if (i < token.size() && token[i] == '.') {
      ++i;
      while (i < token.size() && detail::is_digit(token[i])) {
        digits.push_back(token[i++]);
        ++frac_len;
      }
    }

    std::int64_t exp = 0;
    if (i < token.size() && (token[i] == 'e' || token[i] == 'E')) {
      ++i;
      bool exp_neg = false;
      if (token[i] == '+' || token[i] == '-') {
        exp_neg = token[i] == '-';
        ++i;
      }
      for (; i < token.size(); ++i) {
        exp = exp * 10 + (token[i] - '0');
        if (exp > detail::max_exponent) {
          throw std::out_of_range("jflat: decimal exponent out of range: " + std::string(token));
        }
      }
      if (exp_neg) exp = -exp;
    }

    const std::size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
      d.digits_ = "0";
    } else {
      d.digits_ = digits.substr(first);
      d.neg_ = neg;
    }
    d.scale_ = frac_len - exp;
    return d;
  }

  bool negative() const noexcept { return neg_; }
  bool is_zero() const noexcept { return digits_ == "0"; }
  int signum() const noexcept { return is_zero() ? 0 : (neg_ ? -1 : 1); }

  // Unscaled magnitude, without leading zeros ("0" for zero).
  const std::string& unscaled_digits() const noexcept { return digits_; }
  std::int64_t scale() const noexcept { return scale_; }

  // Canonical form: plain notation while the scale is non-negative and the
  // adjusted exponent is at least -6, scientific (`1.5E-7`, `1E+10`) otherwise.
  std::string to_string() const {
    const std::int64_t len = static_cast<std::int64_t>(digits_.size());
    const std::int64_t adjusted = -scale_ + (len - 1);

    std::string out;
    out.reserve(digits_.size() + 8);
    if (neg_) out.push_back('-');

    if (scale_ >= 0 && adjusted >= -6) {
      if (scale_ == 0) {
        out += digits_;
      } else if (len > scale_) {
        const std::size_t point = static_cast<std::size_t>(len - scale_);
        out.append(digits_, 0, point);
        out.push_back('.');
        out.append(digits_, point, std::string::npos);
      } else {
        out += "0.";
        out.append(static_cast<std::size_t>(scale_ - len), '0');
        out += digits_;
      }
      return out;
    }

    out.push_back(digits_[0]);
    if (len > 1) {
      out.push_back('.');
      out.append(digits_, 1, std::string::npos);
    }
    if (adjusted != 0) {
      out.push_back('E');
      if (adjusted > 0) out.push_back('+');
      out += std::to_string(adjusted);
    }
    return out;
  }

  friend bool operator==(const decimal& a, const decimal& b) {
    return a.neg_ == b.neg_ && a.scale_ == b.scale_ && a.digits_ == b.digits_;
  }
  friend bool operator!=(const decimal& a, const decimal& b) { return !(a == b); }

private:
  bool neg_{false};
  std::string digits_{"0"};
  std::int64_t scale_{0};
};

} // namespace jflat
