/* expressions.cpp - manipulating expressions and linearizing equations
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
#include <algorithm>
#include <iostream>
#include <vector>

#include "algebra.hpp"
#include "sigmaErrors.hpp"
#include "expressions.hpp"
#include "merlinAccumulator.hpp"

namespace SIGMA {

ExponentExpr& ExponentExpr::addTerm(const Monomial& m, const Scalar& coeff) {
    Monomial key = m;
    std::sort(key.begin(), key.end());
    auto it = terms.find(key);
    if (it == terms.end()) {
        if (!coeff.isZero())
            terms.insert(std::make_pair(key, coeff));
    }
    else {
        it->second += coeff;
        if (it->second.isZero())
            terms.erase(it);
    }
    return *this;
}

ExponentExpr& ExponentExpr::operator+=(const ExponentExpr& other) {
    for (auto& t : other.terms)
        addTerm(t.first, t.second);
    return *this;
}

ExponentExpr& ExponentExpr::operator-=(const ExponentExpr& other) {
    for (auto& t : other.terms)
        addTerm(t.first, -t.second);
    return *this;
}

ExponentExpr& ExponentExpr::operator*=(const Scalar& s) {
    if (s.isZero()) {
        terms.clear();
        return *this;
    }
    for (auto& t : terms)
        t.second *= s;
    return *this;
}

// The product of two polynomials, term by term
ExponentExpr& ExponentExpr::operator*=(const ExponentExpr& other) {
    ExponentExpr prod;
    for (auto& t1 : terms) for (auto& t2 : other.terms) {
        Monomial m = t1.first;
        m.insert(m.end(), t2.first.begin(), t2.first.end());
        prod.addTerm(m, t1.second * t2.second);
    }
    terms.swap(prod.terms);
    return *this;
}

size_t ExponentExpr::degree() const {
    size_t d = 0;
    for (auto& t : terms)
        d = std::max(d, t.first.size());
    return d;
}

Scalar ExponentExpr::constantTerm() const {
    auto it = terms.find(Monomial());
    return (it==terms.end())? Scalar() : it->second;
}

std::set<std::string> ExponentExpr::variables() const {
    std::set<std::string> vars;
    for (auto& t : terms)
        vars.insert(t.first.begin(), t.first.end());
    return vars;
}

Scalar ExponentExpr::evaluate(const VariableAssignment& values) const {
    Scalar sum;
    for (auto& t : terms) {
        Scalar prod = t.second;
        for (auto& x : t.first)
            prod *= values[x];
        sum += prod;
    }
    return sum;
}

GroupExpr& GroupExpr::operator+=(const GroupExpr& other) {
    terms.insert(terms.end(), other.terms.begin(), other.terms.end());
    constant += other.constant;
    return *this;
}

GroupExpr& GroupExpr::operator-=(const GroupExpr& other) {
    for (auto& t : other.terms)
        terms.push_back(std::make_pair(t.first, -t.second));
    constant -= other.constant;
    return *this;
}

std::set<std::string> GroupExpr::variables() const {
    std::set<std::string> vars;
    for (auto& t : terms) {
        auto v = t.second.variables();
        vars.insert(v.begin(), v.end());
    }
    return vars;
}

Point GroupExpr::evaluate(const VariableAssignment& values) const {
    std::vector<Point> bases;
    std::vector<Scalar> exps;
    bases.reserve(terms.size());
    exps.reserve(terms.size());
    for (auto& t : terms) {
        bases.push_back(t.first);
        exps.push_back(t.second.evaluate(values));
    }
    return CRV25519::multiExp(bases.data(), bases.size(), exps.data()) + constant;
}

// Linearizing lhs = rhs: every term of lhs-rhs must be either constant
// (and then it moves to the right-hand side) or a*x for a variable x
LinearRelation::LinearRelation(const ExponentEquation& eq) {
    domain = Domain::EXPONENT;
    ExponentExpr diff = eq.lhs - eq.rhs;
    for (auto& t : diff.terms) {
        if (t.first.size() > 1)
            throw InvalidStatement("the exponent equation is not linear in "
                                   + t.first[0] + "," + t.first[1]);
        if (t.first.empty())
            expTarget = -t.second;
        else
            expTerms[t.first[0]] = t.second;
    }
    if (expTerms.empty())
        throw InvalidStatement("the exponent equation has no variables");
}

LinearRelation::LinearRelation(const GroupEquation& eq) {
    domain = Domain::GROUP;
    GroupExpr diff = eq.lhs - eq.rhs;
    // points that are off the prime-order subgroup cannot be multiplied
    if (!diff.constant.isGroupElement())
        throw InvalidStatement("the constant of the group equation is not a group element");
    groupTarget = -diff.constant;
    for (auto& t : diff.terms) {
        const Point& base = t.first;
        if (!base.isGroupElement())
            throw InvalidStatement("a base of the group equation is not a group element");
        for (auto& mono : t.second.terms) {
            if (mono.first.size() > 1)
                throw InvalidStatement("the group equation is not linear in "
                                       + mono.first[0] + "," + mono.first[1]);
            Point p = base * mono.second;
            if (mono.first.empty()) {
                groupTarget -= p;
                continue;
            }
            auto it = groupTerms.find(mono.first[0]);
            if (it == groupTerms.end())
                groupTerms.insert(std::make_pair(mono.first[0], p));
            else
                it->second += p;
        }
    }
    // terms may cancel out, e.g. x*B - x*B
    for (auto it = groupTerms.begin(); it != groupTerms.end(); ) {
        if (it->second == Point::identity())
            it = groupTerms.erase(it);
        else
            ++it;
    }
    if (groupTerms.empty())
        throw InvalidStatement("the group equation has no variables");
}

LinearRelation LinearRelation::exponent(const std::map<std::string, Scalar>& terms,
                                        const Scalar& target) {
    LinearRelation r;
    r.domain = Domain::EXPONENT;
    for (auto& t : terms)
        if (!t.second.isZero())
            r.expTerms.insert(t);
    if (r.expTerms.empty())
        throw InvalidStatement("the exponent relation has no variables");
    r.expTarget = target;
    return r;
}

LinearRelation LinearRelation::group(const std::map<std::string, Point>& terms,
                                     const Point& target) {
    LinearRelation r;
    r.domain = Domain::GROUP;
    for (auto& t : terms) {
        if (!t.second.isGroupElement())
            throw InvalidStatement("the base of "+t.first+" is not a group element");
        if (t.second != Point::identity())
            r.groupTerms.insert(t);
    }
    if (r.groupTerms.empty())
        throw InvalidStatement("the group relation has no variables");
    if (!target.isGroupElement())
        throw InvalidStatement("the target is not a group element");
    r.groupTarget = target;
    return r;
}

std::set<std::string> LinearRelation::variables() const {
    std::set<std::string> vars;
    if (isGroup())
        for (auto& t : groupTerms) vars.insert(t.first);
    else
        for (auto& t : expTerms) vars.insert(t.first);
    return vars;
}

Scalar LinearRelation::evalExponent(const VariableAssignment& values) const {
    Scalar sum;
    for (auto& t : expTerms)
        sum += t.second * values[t.first];
    return sum;
}

Point LinearRelation::evalGroup(const VariableAssignment& values) const {
    std::vector<Point> bases;
    std::vector<Scalar> exps;
    bases.reserve(groupTerms.size());
    exps.reserve(groupTerms.size());
    for (auto& t : groupTerms) {
        bases.push_back(t.second);
        exps.push_back(values[t.first]);
    }
    return CRV25519::multiExp(bases.data(), bases.size(), exps.data());
}

bool LinearRelation::isSatisfiedBy(const VariableAssignment& values) const {
    for (auto& x : variables())
        if (!values.contains(x))
            return false;
    if (isGroup())
        return evalGroup(values) == groupTarget;
    return evalExponent(values) == expTarget;
}

void LinearRelation::updateAccumulator(MerlinAccumulator& acc) const {
    if (isGroup()) {
        acc.processString("relation", "group");
        acc.processInteger("terms", groupTerms.size());
        for (auto& t : groupTerms) {
            acc.processString("variable", t.first);
            acc.processPoint("base", t.second);
        }
        acc.processPoint("target", groupTarget);
    }
    else {
        acc.processString("relation", "exponent");
        acc.processInteger("terms", expTerms.size());
        for (auto& t : expTerms) {
            acc.processString("variable", t.first);
            acc.processScalar("coefficient", t.second);
        }
        acc.processScalar("target", expTarget);
    }
}

std::ostream& prettyPrint(std::ostream& st, const ExponentExpr& e) {
    if (e.isZero())
        return st << "0";
    bool first = true;
    for (auto& t : e.terms) {
        if (!first) st << " + ";
        first = false;
        ALGEBRA::printScalar(st, t.second);
        for (auto& x : t.first)
            st << "*" << x;
    }
    return st;
}

std::ostream& prettyPrint(std::ostream& st, const LinearRelation& r) {
    bool first = true;
    if (r.isGroup()) {
        for (auto& t : r.groupTerms) {
            if (!first) st << " + ";
            first = false;
            st << t.first << "*[" << CRV25519::toHexString(t.second).substr(0,8) << "]";
        }
        return st << " = [" << CRV25519::toHexString(r.groupTarget).substr(0,8) << "]";
    }
    for (auto& t : r.expTerms) {
        if (!first) st << " + ";
        first = false;
        ALGEBRA::printScalar(st, t.second) << "*" << t.first;
    }
    st << " = ";
    return ALGEBRA::printScalar(st, r.expTarget);
}

} // end of namespace SIGMA
