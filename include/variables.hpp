#ifndef _VARIABLES_HPP_
#define _VARIABLES_HPP_
/* variables.hpp - assigning scalar values to symbolic variables
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
#include <map>
#include <string>
#include <utility>
#include <stdexcept>
#include <iostream>
#include <initializer_list>

#include "scalar25519.hpp"

/* A VariableAssignment binds symbolic variables (witnesses, or the
 * randomness/responses that stand for them) to scalars. The same class
 * is used for the secret witness of the prover, for the Schnorr
 * randomness r_x behind an announcement, and for the responses
 * z_x = r_x + c*x that the verifier sees.
 *
 * Keys are unique: setting a variable that is already bound, or merging
 * two assignments that share a variable, throws. Looking up a variable
 * that is not bound throws too.
 */
namespace SIGMA {
using CRV25519::Scalar;

class VariableAssignment {
    std::map<std::string, Scalar> values;
public:
    typedef std::map<std::string, Scalar>::const_iterator const_iterator;

    VariableAssignment() = default;
    VariableAssignment(std::initializer_list<std::pair<std::string,Scalar>> lst) {
        for (auto& p : lst) set(p.first, p.second);
    }

    VariableAssignment& set(const std::string& name, const Scalar& value) {
        auto ret = values.insert(std::make_pair(name, value));
        if (!ret.second) { // variable was already there
            throw std::runtime_error("VariableAssignment::set: variable "+name+" already assigned");
        }
        return *this;
    }
    const Scalar& get(const std::string& name) const {
        auto it = values.find(name);
        if (it == values.end()) {
            throw std::runtime_error("VariableAssignment::get: no value for variable "+name);
        }
        return it->second;
    }
    const Scalar& operator[](const std::string& name) const { return get(name); }

    bool contains(const std::string& name) const { return values.count(name) > 0; }
    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    const_iterator begin() const { return values.begin(); }
    const_iterator end() const { return values.end(); }

    // Union of two assignments, throws if they share a variable
    VariableAssignment& merge(const VariableAssignment& other) {
        for (auto& v : other.values) set(v.first, v.second);
        return *this;
    }
    VariableAssignment merged(const VariableAssignment& other) const {
        return VariableAssignment(*this).merge(other);
    }

    bool operator==(const VariableAssignment& other) const {
        return values == other.values;
    }
    bool operator!=(const VariableAssignment& other) const { return !(*this==other); }
};

std::ostream& prettyPrint(std::ostream& st, const VariableAssignment& a);

} // end of namespace SIGMA
#endif // ifndef _VARIABLES_HPP_
