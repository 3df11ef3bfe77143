#include "util/GmpUtils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

namespace util {

mpz_class parseBigInt(const std::string& text) {
  std::string s = text;
  s.erase(std::remove_if(s.begin(), s.end(),
                         [](unsigned char c) { return std::isspace(c) || c == '_'; }),
          s.end());
  int base = 10;
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    s = s.substr(2);
  }
  if (s.empty()) {
    throw std::invalid_argument("empty integer literal '" + text + "'");
  }
  mpz_class value;
  if (value.set_str(s, base) != 0 || value < 0) {
    throw std::invalid_argument("not a non-negative integer: '" + text + "'");
  }
  return value;
}

std::vector<uint64_t> toLimbs64(const mpz_class& value) {
  size_t wordCount = (mpz_sizeinbase(value.get_mpz_t(), 2) + 63) / 64;
  std::vector<uint64_t> data(wordCount, 0);
  size_t actualWords = 0;
  mpz_export(data.data(), &actualWords, -1 /*order: LSWord first*/, sizeof(uint64_t), 0 /*endian: native*/, 0 /*nails*/, value.get_mpz_t());
  // zero exports no word at all
  data.resize(std::max<size_t>(actualWords, 1));
  return data;
}

mpz_class fromLimbs64(const std::vector<uint64_t>& limbs) {
  mpz_class result;
  mpz_import(result.get_mpz_t(), limbs.size(), -1 /*order: LSWord first*/, sizeof(uint64_t), 0 /*endian: native*/, 0 /*nails*/, limbs.data());
  return result;
}

bool fitsU64(const mpz_class& value) {
  return value >= 0 && mpz_sizeinbase(value.get_mpz_t(), 2) <= 64;
}

uint64_t toU64(const mpz_class& value) {
  if (!fitsU64(value)) {
    throw std::out_of_range("value does not fit in 64 bits: " + value.get_str());
  }
#if ULONG_MAX == 0xFFFFFFFFFFFFFFFFULL
  return static_cast<uint64_t>(value.get_ui());
#else
  return toLimbs64(value)[0];
#endif
}

mpz_class ceilSqrt(const mpz_class& n) {
  if (n <= 0) return 0;
  mpz_class r;
  mpz_sqrt(r.get_mpz_t(), n.get_mpz_t());
  if (r * r < n) ++r;
  return r;
}

mpz_class ipow(uint32_t base, uint32_t exp) {
  mpz_class result;
  mpz_ui_pow_ui(result.get_mpz_t(), base, exp);
  return result;
}

mpz_class ceilDiv(const mpz_class& a, const mpz_class& b) {
  mpz_class q;
  mpz_cdiv_q(q.get_mpz_t(), a.get_mpz_t(), b.get_mpz_t());
  return q;
}

}
