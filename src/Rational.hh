#pragma once

#include <stdint.h>

#include <string>

namespace WadGfx {

// Exact fraction used for all scale factors, so that composing a user scale
// with the pixel aspect correction never rounds. Always stored in lowest
// terms with a positive denominator.
class Rational {
public:
  Rational() : num(0), den(1) {}
  Rational(int64_t value) : num(value), den(1) {}
  Rational(int64_t numerator, int64_t denominator);
  Rational(const Rational&) = default;
  Rational& operator=(const Rational&) = default;
  ~Rational() = default;

  inline int64_t numerator() const {
    return this->num;
  }
  inline int64_t denominator() const {
    return this->den;
  }

  // Truncates toward zero
  int64_t to_integer() const;
  // Smallest integer not less than this value
  int64_t ceil() const;

  Rational operator+(const Rational& other) const;
  Rational operator-(const Rational& other) const;
  Rational operator*(const Rational& other) const;
  Rational operator/(const Rational& other) const;

  bool operator==(const Rational& other) const;
  bool operator!=(const Rational& other) const;
  bool operator<(const Rational& other) const;
  bool operator<=(const Rational& other) const;
  bool operator>(const Rational& other) const;
  bool operator>=(const Rational& other) const;

  std::string str() const;

private:
  int64_t num;
  int64_t den;
};

} // namespace WadGfx
