#ifndef _EXPRESSIONS_HPP_
#define _EXPRESSIONS_HPP_
/* expressions.hpp - algebraic expressions over witness variables
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
#include <set>
#include <map>
#include <vector>
#include <string>
#include <utility>
#include <iostream>

#include "scalar25519.hpp"
#include "point25519.hpp"
#include "variables.hpp"

/* Statements are written as equations between expressions in named
 * witness variables. We manipulate two types of expressions:
 *
 * 1. Exponent expressions, polynomials over Z_P of the form
 *
 *    \sum_i a_i * x_{i,1} * x_{i,2} * ... * x_{i,k_i}  (+ constant)
 *
 *    represented by a map from the monomial (the sorted list of variable
 *    names, with repetitions, empty for the constant term) to its
 *    coefficient a_i. Zero coefficients are never stored.
 *
 * 2. Group expressions, sums of group bases "raised" to exponent
 *    expressions (in our additive notation, multiplied by them)
 *
 *    \sum_i e_i(x) * B_i  (+ constant point).
 *
 * An equation lhs = rhs can be proven with a Schnorr-like protocol if it
 * can be written in the canonical form
 *
 *    homomorphicPart(x) = target,
 *
 * where homomorphicPart is linear in the variables and target is public.
 * The LinearRelation class below holds this canonical form, its
 * constructors "linearize" an equation by moving all the constant terms
 * to the right-hand side, and throw InvalidStatement if that fails (when
 * some monomial has degree larger than one).
 */
namespace SIGMA {
using CRV25519::Scalar, CRV25519::Point;

class MerlinAccumulator;

typedef std::vector<std::string> Monomial; // sorted, empty for constants

class ExponentExpr {
public:
    std::map<Monomial, Scalar> terms;

    ExponentExpr() = default; // the zero polynomial
    explicit ExponentExpr(const Scalar& constant) { addTerm(Monomial(), constant); }

    // Add coeff*monomial, dropping the term if the result is zero
    ExponentExpr& addTerm(const Monomial& m, const Scalar& coeff);

    ExponentExpr& operator+=(const ExponentExpr& other);
    ExponentExpr& operator-=(const ExponentExpr& other);
    ExponentExpr& operator*=(const ExponentExpr& other);
    ExponentExpr& operator*=(const Scalar& s);

    ExponentExpr operator+(const ExponentExpr& other) const { return ExponentExpr(*this) += other; }
    ExponentExpr operator-(const ExponentExpr& other) const { return ExponentExpr(*this) -= other; }
    ExponentExpr operator*(const ExponentExpr& other) const { return ExponentExpr(*this) *= other; }
    ExponentExpr operator*(const Scalar& s) const { return ExponentExpr(*this) *= s; }
    ExponentExpr operator-() const { return ExponentExpr() -= *this; }

    bool isZero() const { return terms.empty(); }
    size_t degree() const; // the largest monomial size, 0 for constants
    Scalar constantTerm() const;
    std::set<std::string> variables() const;

    // throws if a variable is missing from the assignment
    Scalar evaluate(const VariableAssignment& values) const;
};

// The expression that consists of just the variable name
inline ExponentExpr var(const std::string& name) {
    return ExponentExpr().addTerm(Monomial{name}, Scalar().setInteger(1));
}
inline ExponentExpr constant(const Scalar& s) { return ExponentExpr(s); }
inline ExponentExpr constant(long n) { return ExponentExpr(Scalar().setInteger(n)); }
inline ExponentExpr operator*(const Scalar& s, const ExponentExpr& e) { return e*s; }

class GroupExpr {
public:
    std::vector<std::pair<Point, ExponentExpr> > terms; // e_i * B_i
    Point constant;                                     // identity by default

    GroupExpr() = default;
    explicit GroupExpr(const Point& c): constant(c) {}
    GroupExpr(const Point& base, const ExponentExpr& e) {
        terms.push_back(std::make_pair(base, e));
    }

    GroupExpr& operator+=(const GroupExpr& other);
    GroupExpr& operator-=(const GroupExpr& other);
    GroupExpr operator+(const GroupExpr& other) const { return GroupExpr(*this) += other; }
    GroupExpr operator-(const GroupExpr& other) const { return GroupExpr(*this) -= other; }
    GroupExpr operator-() const { return GroupExpr() -= *this; }

    std::set<std::string> variables() const;
    Point evaluate(const VariableAssignment& values) const;
};

// B*e is the group expression e*B ("B^e" in multiplicative notation)
inline GroupExpr operator*(const Point& base, const ExponentExpr& e) { return GroupExpr(base, e); }
inline GroupExpr operator*(const ExponentExpr& e, const Point& base) { return GroupExpr(base, e); }

struct ExponentEquation {
    ExponentExpr lhs, rhs;
};
struct GroupEquation {
    GroupExpr lhs, rhs;
};
inline ExponentEquation equals(const ExponentExpr& lhs, const ExponentExpr& rhs) {
    return ExponentEquation{lhs, rhs};
}
inline GroupEquation equals(const GroupExpr& lhs, const GroupExpr& rhs) {
    return GroupEquation{lhs, rhs};
}
inline GroupEquation equals(const GroupExpr& lhs, const Point& rhs) {
    return GroupEquation{lhs, GroupExpr(rhs)};
}

// The canonical form homomorphicPart(x) = target of a linear statement,
// either over the exponent ring Z_P or over the group.
class LinearRelation {
public:
    enum class Domain { EXPONENT, GROUP };
    Domain domain = Domain::EXPONENT;

    std::map<std::string, Scalar> expTerms; // EXPONENT: x -> a_x
    Scalar expTarget;                       // sum_x a_x*x = expTarget

    std::map<std::string, Point> groupTerms;// GROUP: x -> B_x
    Point groupTarget;                      // sum_x x*B_x = groupTarget

    LinearRelation() = default;

    // Linearize an equation, throws InvalidStatement if the equation is
    // not linear in its variables or if it has no variables at all
    explicit LinearRelation(const ExponentEquation& eq);
    explicit LinearRelation(const GroupEquation& eq);

    // Build the canonical form directly, throws InvalidStatement if
    // there are no (non-trivial) terms
    static LinearRelation exponent(const std::map<std::string, Scalar>& terms, const Scalar& target);
    static LinearRelation group(const std::map<std::string, Point>& terms, const Point& target);

    bool isGroup() const { return domain==Domain::GROUP; }
    std::set<std::string> variables() const;

    // Evaluate the homomorphic part, throws if a variable is missing
    Scalar evalExponent(const VariableAssignment& values) const;
    Point evalGroup(const VariableAssignment& values) const;

    // Returns false also when some variable is missing
    bool isSatisfiedBy(const VariableAssignment& values) const;

    void updateAccumulator(MerlinAccumulator& acc) const;
};

// Debugging
std::ostream& prettyPrint(std::ostream& st, const ExponentExpr& e);
std::ostream& prettyPrint(std::ostream& st, const LinearRelation& r);

} // end of namespace SIGMA
#endif // ifndef _EXPRESSIONS_HPP_
