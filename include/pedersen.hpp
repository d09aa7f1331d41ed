#ifndef _PEDERSEN_HPP_
#define _PEDERSEN_HPP_
/* pedersen.hpp - Pedersen commitments
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
#include <utility>

#include "scalar25519.hpp"
#include "point25519.hpp"

/* Pedersen commitments are defined relative to some generators. We use
 * the "base" generator for the randomness and a second generator G that
 * is derived from a string tag,
 *
 *   G = hashToCurve(tag+"G"),
 *
 * so nobody knows the discrete log of G with respect to base. A commitment
 * to a scalar m with opening r is the point
 *
 *   C = r*base + m*G.
 *
 * This is perfectly hiding and computationally binding (under discrete
 * log). Damgard's technique commits to the hash of an announcement this
 * way, see damgard.hpp.
 */
namespace SIGMA {
using CRV25519::Scalar, CRV25519::Point;

typedef Point Commitment;
typedef Scalar Opening;

class PedersenCommitment {
    std::string tag;
    Point G;
public:
    explicit PedersenCommitment(const std::string& t=std::string()):
        tag(t), G(CRV25519::hashToCurve(t+"G")) {}

    const std::string& getTag() const { return tag; }
    const Point& getG() const { return G; }

    Commitment commit(const Scalar& m, const Opening& r) const {
        return CRV25519::baseTimesScalar(r) + G*m;
    }
    // Commit with fresh randomness, returns the commitment and the opening
    std::pair<Commitment,Opening> commit(const Scalar& m) const {
        Opening r = CRV25519::randomScalar();
        return std::make_pair(commit(m, r), r);
    }
    bool verify(const Commitment& c, const Scalar& m, const Opening& r) const {
        return (commit(m, r)==c);
    }
};

} // end of namespace SIGMA
#endif // ifndef _PEDERSEN_HPP_
