/* curve25519.cpp - a thin layer around libsodium low-level interfaces
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
#include <stdexcept>
#include <string>

#include "scalar25519.hpp"
#include "point25519.hpp"

namespace CRV25519 {

std::atomic<size_t> Point::counter{0};
Point Point::basePoint;
Point Point::identityPoint = Point::init(); // forcing a run of the init function

Point Point::init() {
    static bool firstTime = true; // ensure that init only happens once
    // FIXME: not thread safe
    if (!firstTime) // return a dummy point
        return Point();
    firstTime = false;

    int ret = sodium_init();
    if (ret < 0) { // 1 means that it was already initialized
        throw std::runtime_error("libsodium failed to initialize, #errno="+std::to_string(ret));
    }

    // initialize the point base
    Scalar one = Scalar().setInteger(1);
    ret = crypto_scalarmult_ed25519_base_noclamp(basePoint.bytes, one.bytes);
    if (ret != 0) {
        throw std::runtime_error("failed to initialize basePoint, #errno="+std::to_string(ret));
    }
    return basePoint - basePoint; // this will be assigned to the global identityPoint
}

static std::string hexOf(const unsigned char* bytes, size_t len, bool reversed) {
    static const char digits[] = "0123456789abcdef";
    std::string str;
    str.reserve(2*len);
    for (size_t i=0; i<len; i++) {
        unsigned char b = reversed? bytes[len-1-i] : bytes[i];
        str.push_back(digits[b >> 4]);
        str.push_back(digits[b & 0xf]);
    }
    return str;
}

std::string toHexString(const Scalar& s) {
    return hexOf(s.bytes, crypto_core_ed25519_SCALARBYTES, true);
}
std::string toHexString(const Point& p) {
    return hexOf(p.bytes, crypto_core_ed25519_BYTES, false);
}

} /* end of namespace CRV25519 */
