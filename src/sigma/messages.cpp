/* messages.cpp - the wire encoding of Sigma-protocol messages
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
#include <sstream>
#include <iostream>
#include <string>

#include "algebra.hpp"
#include "sigmaErrors.hpp"
#include "messages.hpp"
#include "merlinAccumulator.hpp"

namespace SIGMA {

size_t MessageShape::byteSize() const {
    size_t sz = crypto_core_ed25519_BYTES * nPoints
              + crypto_core_ed25519_SCALARBYTES * nScalars;
    for (auto& ch : children)
        sz += ch.byteSize();
    return sz;
}

MessageShape Message::shape() const {
    MessageShape sh(points.size(), scalars.size());
    sh.children.reserve(children.size());
    for (auto& ch : children)
        sh.children.push_back(ch.shape());
    return sh;
}

void AnnouncementSecret::consume() {
    if (spent)
        throw ProtocolViolation("announcement secret was already used for a response");
    spent = true;
}

void writeMessage(std::ostream& os, const Message& m) {
    for (auto& p : m.points) os << p;
    for (auto& s : m.scalars) os << s;
    for (auto& ch : m.children) writeMessage(os, ch);
}

Scalar readScalar(std::istream& is) {
    Scalar s;
    if (!(is >> s))
        throw EncodingError("truncated scalar");
    if (!s.isCanonical())
        throw EncodingError("non-canonical scalar "+CRV25519::toHexString(s));
    return s;
}

Point readPoint(std::istream& is) {
    Point p;
    if (!(is >> p))
        throw EncodingError("truncated point");
    if (!p.isGroupElement())
        throw EncodingError("not a group element "+CRV25519::toHexString(p));
    return p;
}

Message readMessage(std::istream& is, const MessageShape& shape) {
    Message m;
    m.points.reserve(shape.nPoints);
    for (size_t i=0; i<shape.nPoints; i++)
        m.points.push_back(readPoint(is));
    m.scalars.reserve(shape.nScalars);
    for (size_t i=0; i<shape.nScalars; i++)
        m.scalars.push_back(readScalar(is));
    m.children.reserve(shape.children.size());
    for (auto& sh : shape.children)
        m.children.push_back(readMessage(is, sh));
    return m;
}

std::string encodeMessage(const Message& m) {
    std::stringstream ss;
    writeMessage(ss, m);
    return ss.str();
}

Message decodeMessage(const std::string& bytes, const MessageShape& shape) {
    if (bytes.size() != shape.byteSize())
        throw EncodingError("expected "+std::to_string(shape.byteSize())
                    +" bytes, got "+std::to_string(bytes.size()));
    std::stringstream ss(bytes);
    return readMessage(ss, shape);
}

std::string encodeScalar(const Scalar& s) {
    return std::string((const char*)s.bytes, sizeof(s.bytes));
}

Scalar decodeScalar(const std::string& bytes) {
    if (bytes.size() != crypto_core_ed25519_SCALARBYTES)
        throw EncodingError("a scalar takes "+std::to_string(crypto_core_ed25519_SCALARBYTES)
                    +" bytes, got "+std::to_string(bytes.size()));
    std::stringstream ss(bytes);
    return readScalar(ss);
}

// The shape is absorbed before the elements, so two messages of
// different shapes never produce the same sequence of items
void MerlinAccumulator::processMessage(const std::string& label, const Message& m) {
    processString("message", label);
    processInteger("points", m.points.size());
    processInteger("scalars", m.scalars.size());
    processInteger("children", m.children.size());
    for (auto& p : m.points)
        processPoint("point", p);
    for (auto& s : m.scalars)
        processScalar("scalar", s);
    for (auto& ch : m.children)
        processMessage(label, ch);
}

static void printIndented(std::ostream& st, const Message& m, int indent) {
    std::string pad(2*indent, ' ');
    st << pad << "[" << m.points.size() << " points, "
       << m.scalars.size() << " scalars]\n";
    for (auto& p : m.points)
        st << pad << "  P " << CRV25519::toHexString(p) << "\n";
    for (auto& s : m.scalars) {
        st << pad << "  S ";
        ALGEBRA::printScalar(st, s) << "\n";
    }
    for (auto& ch : m.children)
        printIndented(st, ch, indent+1);
}

std::ostream& prettyPrint(std::ostream& st, const Message& m) {
    printIndented(st, m, 0);
    return st;
}

std::ostream& prettyPrint(std::ostream& st, const SigmaTranscript& t) {
    st << "announcement:\n";
    prettyPrint(st, t.announcement);
    st << "challenge: " << CRV25519::toHexString(t.challenge) << "\n";
    st << "response:\n";
    return prettyPrint(st, t.response);
}

} // end of namespace SIGMA
