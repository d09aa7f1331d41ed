#ifndef _FRAGMENTS_HPP_
#define _FRAGMENTS_HPP_
/* fragments.hpp - statement trees of linear relations, AND and OR
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
#include <vector>
#include <memory>
#include <string>
#include <iostream>

#include "scalar25519.hpp"
#include "point25519.hpp"
#include "variables.hpp"
#include "expressions.hpp"
#include "messages.hpp"

/* A statement is a tree of fragments. A leaf holds a single linear
 * relation, an AND node requires all of its children to hold, and an OR
 * node requires at least one of them to hold. The nodes are immutable
 * once built and are shared through FragmentPtr, so the same sub-tree
 * can be reused in many statements and many proofs.
 *
 * Every node may "declare" some of the variables in its sub-tree. The
 * node that declares x owns the Schnorr randomness r_x and sends the
 * response z_x = r_x + c*x, and all the relations below it use these
 * values. This is how an AND node proves that two equations share the
 * same witness:
 *
 *   andOf({leaf(rel1,{}), leaf(rel2,{})}, {"x"})
 *
 * A variable that is used but not declared in a sub-tree is free in that
 * sub-tree, its randomness/response is passed down from an ancestor.
 * OR branches must be closed (no free variables), since each branch is
 * proven under its own challenge. The root of a protocol must be closed
 * too. Violations of these rules throw InvalidStatement when the node is
 * built, so a FragmentPtr always points to a well-formed tree.
 *
 * The evaluator functions below implement the Sigma-protocol operations
 * by a single recursion over the tree. The external assignment carries
 * the randomness (for announcements) or responses (for verification) of
 * the free variables of the node.
 *
 * Messages follow the tree:
 * - Leaf: announcement = one point (group relation) or one scalar
 *   (exponent relation), response = z_x for the declared variables, in
 *   sorted order.
 * - AND: announcement = the children's announcements, response = z_x for
 *   the declared variables, then the children's responses.
 * - OR: announcement = the children's announcements, response = the n
 *   challenges c_1..c_n of the branches, then the children's responses.
 *   The verifier checks that c_1+...+c_n = c.
 */
namespace SIGMA {
using CRV25519::Scalar, CRV25519::Point;

class MerlinAccumulator;
class Fragment;
typedef std::shared_ptr<const Fragment> FragmentPtr;

class Fragment {
public:
    enum class Kind { LEAF, AND, OR };

private:
    Kind nodeKind;
    LinearRelation rel;                 // only for leaves
    std::vector<FragmentPtr> kids;      // only for AND/OR
    std::set<std::string> declaredVars; // owned by this node
    std::set<std::string> freeVars;     // used below but declared above
    std::set<std::string> allVars;      // everything used in the sub-tree
    std::set<std::string> allDeclared;  // declared anywhere in the sub-tree

    explicit Fragment(Kind k): nodeKind(k) {}
    void setDeclared(const std::set<std::string>& declared,
                     const std::set<std::string>& used);

public:
    // The factories throw InvalidStatement on malformed trees
    static FragmentPtr leaf(const LinearRelation& relation,
                            const std::set<std::string>& declared);
    static FragmentPtr andOf(const std::vector<FragmentPtr>& children,
                             const std::set<std::string>& declared);
    static FragmentPtr orOf(const std::vector<FragmentPtr>& children);

    Kind kind() const { return nodeKind; }
    const LinearRelation& relation() const { return rel; }
    const std::vector<FragmentPtr>& children() const { return kids; }
    const std::set<std::string>& declared() const { return declaredVars; }
    const std::set<std::string>& freeVariables() const { return freeVars; }
    const std::set<std::string>& variables() const { return allVars; }
    bool isClosed() const { return freeVars.empty(); }
};

// A leaf that declares all of its variables
inline FragmentPtr leaf(const LinearRelation& relation) {
    return Fragment::leaf(relation, relation.variables());
}
inline FragmentPtr leaf(const LinearRelation& relation,
                        const std::set<std::string>& declared) {
    return Fragment::leaf(relation, declared);
}
inline FragmentPtr andOf(const std::vector<FragmentPtr>& children,
                         const std::set<std::string>& declared = {}) {
    return Fragment::andOf(children, declared);
}
inline FragmentPtr orOf(const std::vector<FragmentPtr>& children) {
    return Fragment::orOf(children);
}

// The operations of the recursive evaluator

// Fresh randomness for the tree, and for OR nodes also the choice of the
// real branch and simulated transcripts for all the other branches
AnnouncementSecret generateAnnouncementSecret(const Fragment& f,
                                              const VariableAssignment& witness);

Announcement generateAnnouncement(const Fragment& f,
        const VariableAssignment& witness, const AnnouncementSecret& secret,
        const VariableAssignment& externalRandomness);

Response generateResponse(const Fragment& f, const VariableAssignment& witness,
        const AnnouncementSecret& secret, const Challenge& c);

// Returns false also when the messages have the wrong shape
bool checkTranscript(const Fragment& f, const Announcement& a,
        const Challenge& c, const Response& z,
        const VariableAssignment& externalResponses);

SigmaTranscript generateSimulatedTranscript(const Fragment& f,
        const Challenge& c, const VariableAssignment& externalResponses);

// The unique announcement for which (a,c,z) is accepting, if there is
// one. Throws EncodingError if z does not have the shape of a response.
Announcement recomputeAnnouncement(const Fragment& f, const Challenge& c,
        const Response& z, const VariableAssignment& externalResponses);

MessageShape announcementShape(const Fragment& f);
MessageShape responseShape(const Fragment& f);

bool isSatisfiedBy(const Fragment& f, const VariableAssignment& witness);

// Throws std::runtime_error describing the first relation that the
// witness does not satisfy, for debugging
void debugFragment(const Fragment& f, const VariableAssignment& witness);

void updateAccumulator(const Fragment& f, MerlinAccumulator& acc);

std::ostream& prettyPrint(std::ostream& st, const Fragment& f, int indent=0);

} // end of namespace SIGMA
#endif // ifndef _FRAGMENTS_HPP_
