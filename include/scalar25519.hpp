#ifndef _SCALAR_25519_HPP_
#define _SCALAR_25519_HPP_
/* scalar25519.hpp - the exponent ring Z_P, a thin layer around libsodium
 * 
 * Copyright (C) 2021, LWE-PVSS
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS
 * OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL
 * THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR
 * OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE,
 * ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 * OTHER DEALINGS IN THE SOFTWARE.
 **/
#include <string>
#include <vector>
#include <cstring>
#include <stdexcept>
#include <iostream>
extern "C" {
    #include <sodium.h>
}

namespace CRV25519 {
// A class that holds a scalar (modulo P = 2^{252}+ZZZ), these are the
// exponents of the group and also the challenges of our Sigma protocols
class Scalar {
public:
    unsigned char bytes[crypto_core_ed25519_SCALARBYTES];

    Scalar() { std::memset(bytes, 0, crypto_core_ed25519_SCALARBYTES); }

    const unsigned char* dataBytes() const { return bytes; }

    // returns true if two scalars are equal
    bool operator==(const Scalar& other) const {
        return sodium_memcmp(bytes, other.bytes, crypto_core_ed25519_SCALARBYTES) == 0;
    }
    bool operator!=(const Scalar& other) const { return !(*this == other); }
    bool isZero() const { return sodium_is_zero(bytes, crypto_core_ed25519_SCALARBYTES)==1; }

    // A canonical encoding is the little-endian representation of an
    // integer in [0,P). Scalars that come out of arithmetic are always
    // canonical, ones that come off the wire need not be.
    bool isCanonical() const {
        unsigned char wide[crypto_core_ed25519_NONREDUCEDSCALARBYTES];
        unsigned char reduced[crypto_core_ed25519_SCALARBYTES];
        std::memset(wide, 0, sizeof wide);
        std::memcpy(wide, bytes, crypto_core_ed25519_SCALARBYTES);
        crypto_core_ed25519_scalar_reduce(reduced, wide);
        return sodium_memcmp(reduced, bytes, crypto_core_ed25519_SCALARBYTES) == 0;
    }

    // select a random scalar in the range [0, P), P is group order
    Scalar& randomize() {
        crypto_core_ed25519_scalar_random(bytes);
        return *this;
    }

    // Computes the additive inverse of a scalar mod P, where P
    // is the order of the main subgroup
    Scalar& negate() {
    	crypto_core_ed25519_scalar_negate(bytes, bytes);
        return *this;
    }

    // Add two scalars mod P
    Scalar& operator+=(const Scalar& other) {
        crypto_core_ed25519_scalar_add(bytes, bytes, other.bytes);
        return *this;
    }
    Scalar operator+(const Scalar& other) const {
        return Scalar(*this).operator+=(other);
    }

    // Subtract two scalars mod P
    Scalar& operator-=(const Scalar& other) {
        crypto_core_ed25519_scalar_sub(bytes, bytes, other.bytes);
        return *this;
    }
    Scalar operator-(const Scalar& other) const {
        return Scalar(*this).operator-=(other);
    }
    Scalar operator-() const { return Scalar(*this).negate(); }

    // Computes the product of two scalars mod P
    Scalar& operator*=(const Scalar& other) {
        crypto_core_ed25519_scalar_mul(bytes, bytes, other.bytes);
        return *this;
    }
    Scalar operator*(const Scalar& other) const {
        return Scalar(*this).operator*=(other);
    }

    // Convert a signed integer to a scalar (useful for tests and debugging)
    Scalar& setInteger(long n) {
        std::memset(bytes, 0, crypto_core_ed25519_SCALARBYTES); // reset to zero
        bool negated = (n < 0);
        unsigned long u = negated? -(unsigned long)n : (unsigned long)n;
        for (size_t i=0; i < sizeof(long); i++) {
            bytes[i] = (unsigned char)(u & 0xff);
            u >>= 8;
        }
        if (negated) {
            negate();
        }
        return *this;
    }

    // Reduce a 64-byte string modulo P, used to get (almost) uniform
    // scalars out of hash outputs
    Scalar& setFromWideBytes(const unsigned char* wide) {
        crypto_core_ed25519_scalar_reduce(bytes, wide);
        return *this;
    }
};

// A factory method, returning a random scalar in the
// range [0, P), where P is the order of the main subgroup
inline Scalar randomScalar() { return Scalar().randomize(); }

// I/O. Reading does not check the encoding, use Scalar::isCanonical
// on anything that was not produced locally.
inline std::ostream& operator<<(std::ostream& os, const Scalar& s) {
  os.write((const char*)s.dataBytes(), crypto_core_ed25519_SCALARBYTES);
  return os;
}
inline std::istream& operator>>(std::istream& is, Scalar& s) {
  is.read((char*)s.bytes, crypto_core_ed25519_SCALARBYTES);
  return is;
}

// Hash arbitrary byte array to a scalar, the digest is 64 bytes long
// so the result is statistically close to uniform in Z_P
inline Scalar hashToScalar(const unsigned char* bytes, size_t len,
                           const unsigned char* key=nullptr, size_t keylen=0) {
    unsigned char h[crypto_core_ed25519_NONREDUCEDSCALARBYTES];
    crypto_generichash(h, sizeof h, bytes, len, key, keylen);
    return Scalar().setFromWideBytes(h);
}
inline Scalar hashToScalar(const std::string& str) {
    return hashToScalar((const unsigned char*)str.data(), str.size());
}

// Human-readable (hex, most significant byte first), for debugging
std::string toHexString(const Scalar& s);

} /* end of namespace CRV25519 */
#endif // ifndef _SCALAR_25519_HPP_
