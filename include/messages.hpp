#ifndef _MESSAGES_HPP_
#define _MESSAGES_HPP_
/* messages.hpp - announcements, responses, transcripts and their encoding
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
#include <iostream>

#include "scalar25519.hpp"
#include "point25519.hpp"
#include "challengeSpace.hpp"
#include "variables.hpp"

/* All the messages of our Sigma protocols have the same tree shape: a
 * node holds some group elements, then some scalars, then the messages
 * of its children (in order). A leaf statement over the group announces
 * a single point, a leaf over the exponents announces a single scalar,
 * composite statements just nest the messages of their children.
 *
 * The wire encoding has no length prefixes or tags. Points and scalars
 * take 32 bytes each and are written in pre-order, and the receiver gets
 * the expected MessageShape from the protocol that it runs (so the
 * encoding is only meaningful relative to that protocol).
 */
namespace SIGMA {
using CRV25519::Scalar, CRV25519::Point;

// The shape of a message, what a reader needs to know to decode it
struct MessageShape {
    size_t nPoints=0, nScalars=0;
    std::vector<MessageShape> children;

    MessageShape() = default;
    MessageShape(size_t p, size_t s): nPoints(p), nScalars(s) {}

    bool operator==(const MessageShape& other) const {
        return nPoints==other.nPoints && nScalars==other.nScalars
            && children==other.children;
    }
    bool operator!=(const MessageShape& other) const { return !(*this==other); }

    size_t byteSize() const; // the size of the wire encoding
};

class Message {
public:
    std::vector<Point> points;
    std::vector<Scalar> scalars;
    std::vector<Message> children;

    bool operator==(const Message& other) const {
        return points==other.points && scalars==other.scalars
            && children==other.children;
    }
    bool operator!=(const Message& other) const { return !(*this==other); }

    bool isEmpty() const {
        return points.empty() && scalars.empty() && children.empty();
    }
    MessageShape shape() const;
};
typedef Message Announcement;
typedef Message Response;

struct SigmaTranscript {
    Announcement announcement;
    Challenge challenge;
    Response response;

    SigmaTranscript() = default;
    SigmaTranscript(const Announcement& a, const Challenge& c, const Response& z):
        announcement(a), challenge(c), response(z) {}

    bool operator==(const SigmaTranscript& other) const {
        return announcement==other.announcement
            && challenge==other.challenge && response==other.response;
    }
    bool operator!=(const SigmaTranscript& other) const { return !(*this==other); }
};

// The prover-side secret state between announcement and response. It
// has the same tree shape as the statement that it belongs to. It may
// be used for generating exactly one response, the response generation
// calls consume() which throws if it was already called before.
class AnnouncementSecret {
    bool spent = false;
public:
    VariableAssignment randomness;   // r_x for the variables declared by a node
    std::vector<Scalar> scalars;     // other secret scalars (e.g. openings)
    std::vector<Message> messages;   // cached messages (e.g. inner announcements)
    std::vector<SigmaTranscript> simulated; // simulated OR branches
    std::vector<AnnouncementSecret> children;
    size_t realBranch = 0;           // OR nodes: the branch with a witness

    bool isSpent() const { return spent; }
    void consume();
};

// Wire encoding, readers throw EncodingError on malformed input
void writeMessage(std::ostream& os, const Message& m);
Message readMessage(std::istream& is, const MessageShape& shape);
Scalar readScalar(std::istream& is); // must be canonical
Point readPoint(std::istream& is);   // must be in the prime-order group

std::string encodeMessage(const Message& m);
Message decodeMessage(const std::string& bytes, const MessageShape& shape);
std::string encodeScalar(const Scalar& s);
Scalar decodeScalar(const std::string& bytes);

// Debugging
std::ostream& prettyPrint(std::ostream& st, const Message& m);
std::ostream& prettyPrint(std::ostream& st, const SigmaTranscript& t);

} // end of namespace SIGMA
#endif // ifndef _MESSAGES_HPP_
