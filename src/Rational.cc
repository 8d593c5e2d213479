#include "Rational.hh"

#include <format>
#include <numeric>
#include <stdexcept>

using namespace std;

namespace WadGfx {

Rational::Rational(int64_t numerator, int64_t denominator) {
  if (denominator == 0) {
    throw invalid_argument("rational denominator is zero");
  }
  if (denominator < 0) {
    numerator = -numerator;
    denominator = -denominator;
  }
  int64_t g = std::gcd(numerator, denominator);
  this->num = numerator / g;
  this->den = denominator / g;
}

int64_t Rational::to_integer() const {
  // C++ integer division already truncates toward zero
  return this->num / this->den;
}

int64_t Rational::ceil() const {
  int64_t q = this->num / this->den;
  if ((this->num % this->den != 0) && (this->num > 0)) {
    q++;
  }
  return q;
}

Rational Rational::operator+(const Rational& other) const {
  return Rational(this->num * other.den + other.num * this->den, this->den * other.den);
}

Rational Rational::operator-(const Rational& other) const {
  return Rational(this->num * other.den - other.num * this->den, this->den * other.den);
}

Rational Rational::operator*(const Rational& other) const {
  // Cross-reduce first to keep intermediate products small
  int64_t g1 = std::gcd(this->num, other.den);
  int64_t g2 = std::gcd(other.num, this->den);
  return Rational((this->num / g1) * (other.num / g2), (this->den / g2) * (other.den / g1));
}

Rational Rational::operator/(const Rational& other) const {
  if (other.num == 0) {
    throw invalid_argument("division by zero rational");
  }
  return *this * Rational(other.den, other.num);
}

bool Rational::operator==(const Rational& other) const {
  return (this->num == other.num) && (this->den == other.den);
}

bool Rational::operator!=(const Rational& other) const {
  return !(*this == other);
}

bool Rational::operator<(const Rational& other) const {
  return this->num * other.den < other.num * this->den;
}

bool Rational::operator<=(const Rational& other) const {
  return !(other < *this);
}

bool Rational::operator>(const Rational& other) const {
  return other < *this;
}

bool Rational::operator>=(const Rational& other) const {
  return !(*this < other);
}

string Rational::str() const {
  return std::format("{}/{}", this->num, this->den);
}

} // namespace WadGfx
