/* test_expressions.cpp - testing assignments, expressions and linearization
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
#include <iostream>
#include <stdexcept>
#include "sigmaErrors.hpp"
#include "variables.hpp"
#include "expressions.hpp"
#include "tests.hpp" // define strings SIGMA_TESTS::passed and SIGMA_TESTS::failed

using namespace SIGMA;
using CRV25519::Scalar, CRV25519::Point;

static bool testAssignment() {
    Scalar x = CRV25519::randomScalar(), y = CRV25519::randomScalar();
    VariableAssignment a{{"x", x}};
    VariableAssignment b{{"y", y}};
    if (a["x"] != x || a.contains("y") || a.size() != 1)
        return false;

    auto ab = a.merged(b);
    if (ab.size() != 2 || ab["y"] != y || a.size() != 1)
        return false;
    if (ab != VariableAssignment{{"y", y}, {"x", x}})
        return false;

    try { // duplicate keys
        a.set("x", y);
        return false;
    } catch (const std::runtime_error&) {}
    try { // overlapping merge
        ab.merge(a);
        return false;
    } catch (const std::runtime_error&) {}
    try { // missing key
        a.get("z");
        return false;
    } catch (const std::runtime_error&) {}
    return true;
}

static bool testExponentExpr() {
    Scalar x = CRV25519::randomScalar(), y = CRV25519::randomScalar();
    VariableAssignment vals{{"x", x}, {"y", y}};
    Scalar three = Scalar().setInteger(3);

    auto e = var("x")*three + var("y")*var("x") - constant(5);
    if (e.degree() != 2 || e.variables().size() != 2)
        return false;
    if (e.evaluate(vals) != three*x + x*y - Scalar().setInteger(5))
        return false;
    if (e.constantTerm() != Scalar().setInteger(-5))
        return false;

    // terms cancel out
    auto zero = var("x")*var("y") - var("y")*var("x");
    if (!zero.isZero() || zero.degree() != 0)
        return false;
    if (!(var("x") + (-var("x"))).isZero())
        return false;
    return true;
}

static bool testGroupExpr() {
    Point G = CRV25519::hashToCurve("G"), H = CRV25519::hashToCurve("H");
    Scalar x = CRV25519::randomScalar(), y = CRV25519::randomScalar();
    VariableAssignment vals{{"x", x}, {"y", y}};

    auto ge = G*var("x") + H*(var("y") + constant(2)) - GroupExpr(G);
    Point expected = G*x + H*(y + Scalar().setInteger(2)) - G;
    if (ge.evaluate(vals) != expected || ge.variables().size() != 2)
        return false;
    return true;
}

static bool testLinearization() {
    Point G = CRV25519::hashToCurve("G"), H = CRV25519::hashToCurve("H");
    Scalar x = CRV25519::randomScalar(), y = CRV25519::randomScalar();
    VariableAssignment vals{{"x", x}, {"y", y}};

    // x*G + (y+1)*H = T  becomes  x*G + y*H = T - H
    Point T = G*x + H*(y + Scalar().setInteger(1));
    LinearRelation rel(equals(G*var("x") + H*(var("y") + constant(1)), T));
    if (!rel.isGroup() || rel.groupTerms.size() != 2 || rel.groupTarget != T - H)
        return false;
    if (!rel.isSatisfiedBy(vals) || rel.isSatisfiedBy(VariableAssignment{{"x", x}}))
        return false;
    if (rel.isSatisfiedBy(VariableAssignment{{"x", y}, {"y", x}}))
        return false;

    // x appears on both sides: x*G + x*H = x*H + T  becomes  x*G = T
    LinearRelation rel2(equals(G*var("x") + H*var("x"), H*var("x") + GroupExpr(G*x)));
    if (rel2.groupTerms.size() != 1 || rel2.groupTerms.at("x") != G || rel2.groupTarget != G*x)
        return false;

    // 2x + 3y - 1 = 7 over the exponents
    LinearRelation rel3(equals(constant(2)*var("x") + constant(3)*var("y") - constant(1),
                               constant(7)));
    Scalar target = Scalar().setInteger(8);
    if (rel3.isGroup() || rel3.expTarget != target || rel3.expTerms.size() != 2)
        return false;
    if (rel3.isSatisfiedBy(vals))
        return false;
    // x = 4-3k, y = 2k
    Scalar k = CRV25519::randomScalar();
    Scalar x3 = Scalar().setInteger(4) - Scalar().setInteger(3)*k;
    if (!rel3.isSatisfiedBy(VariableAssignment{{"x", x3}, {"y", Scalar().setInteger(2)*k}}))
        return false;
    return true;
}

static bool testInvalid() {
    Point G = CRV25519::hashToCurve("G");
    try { // not linear
        LinearRelation rel(equals(G*(var("x")*var("y")), G));
        return false;
    } catch (const InvalidStatement&) {}
    try { // not linear in the exponent
        LinearRelation rel(equals(var("x")*var("x"), constant(4)));
        return false;
    } catch (const InvalidStatement&) {}
    try { // no variables
        LinearRelation rel(equals(G*constant(3), G*Scalar().setInteger(3)));
        return false;
    } catch (const InvalidStatement&) {}
    try { // variables that cancel out
        LinearRelation rel(equals(G*var("x"), G*var("x")));
        return false;
    } catch (const InvalidStatement&) {}
    try {
        LinearRelation::group({{"x", Point::identity()}}, G);
        return false;
    } catch (const InvalidStatement&) {}
    return true;
}

// The point (0,-1) of order 2, on the curve but not in the prime-order group
static Point orderTwoPoint() {
    Point t;
    t.bytes[0] = 0xec;
    for (size_t i=1; i<31; i++)
        t.bytes[i] = 0xff;
    t.bytes[31] = 0x7f;
    return t;
}

static bool testSmallOrderPoints() {
    Point G = CRV25519::hashToCurve("G");
    Scalar x = CRV25519::randomScalar();
    Point T = orderTwoPoint();
    if (T.isGroupElement())
        return false;
    try { // a target shifted by a small-order point
        LinearRelation rel(equals(G*var("x"), G*x + T));
        return false;
    } catch (const InvalidStatement&) {}
    try { // a small-order base
        LinearRelation rel(equals(T*var("x") + G*var("y"), G*x));
        return false;
    } catch (const InvalidStatement&) {}
    try {
        LinearRelation::group({{"x", G}}, G*x + T);
        return false;
    } catch (const InvalidStatement&) {}

    // the same shift on both sides cancels out
    LinearRelation rel(equals(G*var("x") + GroupExpr(T), G*x + T));
    return rel.groupTarget == G*x && rel.isSatisfiedBy(VariableAssignment{{"x", x}});
}

int main(int, char**) {
    if (!testAssignment() || !testExponentExpr() || !testGroupExpr()
        || !testLinearization() || !testInvalid() || !testSmallOrderPoints())
        std::cout << SIGMA_TESTS::failed << std::endl;
    else
        std::cout << SIGMA_TESTS::passed << std::endl;        
}
