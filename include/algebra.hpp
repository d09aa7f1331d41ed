#ifndef _ALGEBRA_HPP_
#define _ALGEBRA_HPP_
/* algebra.hpp - an NTL compatibility layer for big integers
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
#include <iostream>
#include <NTL/ZZ.h>

#include "scalar25519.hpp"

/* This header provides compatibility with NTL, inside the ALGEBRA namespace.
 * Modules that use it should use the names that it provides rather than
 * directly use NTL. We only need big integers, to talk about the size of
 * challenge spaces and to map arbitrary byte strings to challenges:
 * - BigInt  -> NTL::ZZ
 *
 * Conversions to/from the libsodium scalars of CRV25519 are provided by
 * the conv(x,y) functions below, both use little-endian byte order.
 */
namespace ALGEBRA {
typedef NTL::ZZ BigInt;

// The order of the main subgroup of Curve25519,
// P = 2^{252} + 27742317777372353535851937790883648493
inline const BigInt& groupOrder() {
    static const BigInt P = (NTL::to_ZZ(1L)<<252)
                + NTL::conv<NTL::ZZ>("27742317777372353535851937790883648493");
    return P;
}

inline size_t numBits(const BigInt& n) { return NTL::NumBits(n); }

inline BigInt toBigInt(long n) {
    NTL::ZZ num(NTL::INIT_SIZE,4);
    conv(num, n);
    return num;
}

inline void bigIntBytes(unsigned char *buf, const BigInt& bi, size_t bufSize){
    NTL::BytesFromZZ(buf, bi, bufSize);
}
inline void bigIntFromBytes(BigInt& bi, const unsigned char *buf, size_t bufSize){
    NTL::ZZFromBytes(bi, buf, bufSize);
}

// some conversions, the BigInt is reduced modulo the group order
inline void conv(CRV25519::Scalar& to, const BigInt& from) {
    BigInt r = from % groupOrder(); // in [0,P) also for negative inputs
    bigIntBytes(to.bytes, r, sizeof(to.bytes));
}
inline void conv(BigInt& to, const CRV25519::Scalar& from) {
    bigIntFromBytes(to, from.bytes, sizeof(from.bytes));
}

// The representative of s in the range [-P/2, P/2)
inline BigInt balanced(const CRV25519::Scalar& s) {
    BigInt x;
    conv(x, s);
    if (x >= groupOrder()/2)
        x -= groupOrder();
    return x;
}

inline std::ostream& printScalar(std::ostream& st, const CRV25519::Scalar& sc) {
    return (st << balanced(sc));
}

} // end of namespace ALGEBRA
#endif // ifndef _ALGEBRA_HPP_
