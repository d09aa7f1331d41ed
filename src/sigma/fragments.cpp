/* fragments.cpp - the recursive evaluator of statement trees
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
#include <iterator>
#include <stdexcept>
#include <iostream>
#include <sstream>

#include "sigmaErrors.hpp"
#include "challengeSpace.hpp"
#include "fragments.hpp"
#include "merlinAccumulator.hpp"

//#define DEBUGGING

namespace SIGMA {

static std::string listOf(const std::set<std::string>& vars) {
    std::string str;
    for (auto& v : vars) {
        if (!str.empty()) str += ",";
        str += v;
    }
    return str;
}

static std::set<std::string> intersect(const std::set<std::string>& a,
                                       const std::set<std::string>& b) {
    std::set<std::string> both;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                          std::inserter(both, both.begin()));
    return both;
}

// Every declared variable must be used below this node, and the free
// variables of the node are the used ones that are not declared
void Fragment::setDeclared(const std::set<std::string>& declared,
                           const std::set<std::string>& used) {
    for (auto& x : declared)
        if (used.count(x)==0)
            throw InvalidStatement("variable "+x+" is declared but never used");
    declaredVars = declared;
    allDeclared.insert(declared.begin(), declared.end());
    std::set_difference(used.begin(), used.end(), declared.begin(), declared.end(),
                        std::inserter(freeVars, freeVars.begin()));
}

FragmentPtr Fragment::leaf(const LinearRelation& relation,
                           const std::set<std::string>& declared) {
    std::shared_ptr<Fragment> f(new Fragment(Kind::LEAF));
    f->rel = relation;
    f->allVars = relation.variables();
    if (f->allVars.empty())
        throw InvalidStatement("a leaf relation must have variables");
    f->setDeclared(declared, f->allVars);
    return f;
}

FragmentPtr Fragment::andOf(const std::vector<FragmentPtr>& children,
                            const std::set<std::string>& declared) {
    if (children.empty())
        throw InvalidStatement("an AND node needs at least one child");
    std::shared_ptr<Fragment> f(new Fragment(Kind::AND));
    std::set<std::string> usedFree; // free variables of the children
    for (auto& ch : children) {
        if (!ch)
            throw InvalidStatement("null child in an AND node");
        auto shadowed = intersect(declared, ch->allDeclared);
        if (!shadowed.empty())
            throw InvalidStatement("variables "+listOf(shadowed)+" are declared twice on a path");
        auto twice = intersect(f->allDeclared, ch->allDeclared);
        if (!twice.empty())
            throw InvalidStatement("variables "+listOf(twice)+" are declared by two siblings");
        f->allDeclared.insert(ch->allDeclared.begin(), ch->allDeclared.end());
        f->allVars.insert(ch->allVars.begin(), ch->allVars.end());
        usedFree.insert(ch->freeVars.begin(), ch->freeVars.end());
    }
    f->kids = children;
    f->setDeclared(declared, usedFree);
    return f;
}

FragmentPtr Fragment::orOf(const std::vector<FragmentPtr>& children) {
    if (children.size() < 2)
        throw InvalidStatement("an OR node needs at least two children");
    std::shared_ptr<Fragment> f(new Fragment(Kind::OR));
    for (auto& ch : children) {
        if (!ch)
            throw InvalidStatement("null child in an OR node");
        if (!ch->isClosed())
            throw InvalidStatement("OR branch has free variables "+listOf(ch->freeVars));
        f->allDeclared.insert(ch->allDeclared.begin(), ch->allDeclared.end());
        f->allVars.insert(ch->allVars.begin(), ch->allVars.end());
    }
    f->kids = children;
    return f;
}

// The real branch of an OR node is the first one that the witness
// satisfies. If there is no such branch we still produce a proof (that
// will not verify) using the first branch with all its variables set.
static size_t chooseRealBranch(const Fragment& f, const VariableAssignment& witness) {
    const auto& kids = f.children();
    for (size_t i=0; i<kids.size(); i++)
        if (isSatisfiedBy(*kids[i], witness))
            return i;
    for (size_t i=0; i<kids.size(); i++) {
        bool allSet = true;
        for (auto& x : kids[i]->variables())
            if (!witness.contains(x)) { allSet = false; break; }
        if (allSet) {
#ifdef DEBUGGING
            std::cerr << "chooseRealBranch: no branch is satisfied, using branch "
                      << i << std::endl;
#endif
            return i;
        }
    }
    throw std::runtime_error("OR node: the witness does not cover any of the branches");
}

static VariableAssignment randomFor(const std::set<std::string>& vars) {
    VariableAssignment a;
    for (auto& x : vars)
        a.set(x, CRV25519::randomScalar());
    return a;
}

AnnouncementSecret generateAnnouncementSecret(const Fragment& f,
                                              const VariableAssignment& witness) {
    AnnouncementSecret s;
    s.randomness = randomFor(f.declared());
    const auto& kids = f.children();
    switch (f.kind()) {
    case Fragment::Kind::LEAF:
        break;
    case Fragment::Kind::AND:
        s.children.reserve(kids.size());
        for (auto& ch : kids)
            s.children.push_back(generateAnnouncementSecret(*ch, witness));
        break;
    case Fragment::Kind::OR:
        s.realBranch = chooseRealBranch(f, witness);
        s.children.resize(kids.size());
        s.simulated.resize(kids.size());
        for (size_t i=0; i<kids.size(); i++) {
            if (i == s.realBranch)
                s.children[i] = generateAnnouncementSecret(*kids[i], witness);
            else
                s.simulated[i] = generateSimulatedTranscript(*kids[i],
                        ChallengeSpace::randomChallenge(), VariableAssignment());
        }
        break;
    }
    return s;
}

Announcement generateAnnouncement(const Fragment& f,
        const VariableAssignment& witness, const AnnouncementSecret& secret,
        const VariableAssignment& externalRandomness) {
    Announcement a;
    VariableAssignment rand = externalRandomness.merged(secret.randomness);
    const auto& kids = f.children();
    switch (f.kind()) {
    case Fragment::Kind::LEAF:
        if (f.relation().isGroup())
            a.points.push_back(f.relation().evalGroup(rand));
        else
            a.scalars.push_back(f.relation().evalExponent(rand));
        break;
    case Fragment::Kind::AND:
        for (size_t i=0; i<kids.size(); i++)
            a.children.push_back(generateAnnouncement(*kids[i], witness,
                                        secret.children.at(i), rand));
        break;
    case Fragment::Kind::OR:
        for (size_t i=0; i<kids.size(); i++) {
            if (i == secret.realBranch)
                a.children.push_back(generateAnnouncement(*kids[i], witness,
                                secret.children.at(i), VariableAssignment()));
            else
                a.children.push_back(secret.simulated.at(i).announcement);
        }
        break;
    }
    return a;
}

// z_x = r_x + c*w_x for the variables that the node declares
static void addResponses(Response& z, const Fragment& f, const VariableAssignment& witness,
                         const AnnouncementSecret& secret, const Challenge& c) {
    for (auto& x : f.declared())
        z.scalars.push_back(secret.randomness[x] + c * witness[x]);
}

Response generateResponse(const Fragment& f, const VariableAssignment& witness,
                          const AnnouncementSecret& secret, const Challenge& c) {
    Response z;
    const auto& kids = f.children();
    switch (f.kind()) {
    case Fragment::Kind::LEAF:
        addResponses(z, f, witness, secret, c);
        break;
    case Fragment::Kind::AND:
        addResponses(z, f, witness, secret, c);
        for (size_t i=0; i<kids.size(); i++)
            z.children.push_back(generateResponse(*kids[i], witness,
                                                  secret.children.at(i), c));
        break;
    case Fragment::Kind::OR: {
        // the real challenge is c minus the simulated ones
        Challenge real = c;
        for (size_t i=0; i<kids.size(); i++)
            if (i != secret.realBranch)
                real -= secret.simulated.at(i).challenge;
        for (size_t i=0; i<kids.size(); i++)
            z.scalars.push_back(i==secret.realBranch? real : secret.simulated[i].challenge);
        for (size_t i=0; i<kids.size(); i++) {
            if (i == secret.realBranch)
                z.children.push_back(generateResponse(*kids[i], witness,
                                                      secret.children.at(i), real));
            else
                z.children.push_back(secret.simulated[i].response);
        }
        break;
    }
    }
    return z;
}

// The responses of the variables that a node declares, on top of the
// external ones that came from above
static VariableAssignment responsesOf(const Fragment& f, const Response& z,
                                      const VariableAssignment& external) {
    VariableAssignment resp = external;
    size_t i = 0;
    for (auto& x : f.declared())
        resp.set(x, z.scalars.at(i++));
    return resp;
}

// The homomorphic part on the responses, minus c times the target
static Announcement leafAnnouncement(const LinearRelation& rel, const Challenge& c,
                                     const VariableAssignment& resp) {
    Announcement a;
    if (rel.isGroup())
        a.points.push_back(rel.evalGroup(resp) - rel.groupTarget * c);
    else
        a.scalars.push_back(rel.evalExponent(resp) - c * rel.expTarget);
    return a;
}

bool checkTranscript(const Fragment& f, const Announcement& a,
        const Challenge& c, const Response& z,
        const VariableAssignment& externalResponses) {
    const auto& kids = f.children();
    switch (f.kind()) {
    case Fragment::Kind::LEAF: {
        if (z.scalars.size() != f.declared().size() || !z.children.empty())
            return false;
        const LinearRelation& rel = f.relation();
        size_t nPoints = rel.isGroup()? 1 : 0;
        if (a.points.size() != nPoints || a.scalars.size() != 1-nPoints
            || !a.children.empty())
            return false;
        if (rel.isGroup() && !a.points[0].isGroupElement())
            return false;
        VariableAssignment resp = responsesOf(f, z, externalResponses);
        if (rel.isGroup())
            return rel.evalGroup(resp) == a.points[0] + rel.groupTarget * c;
        return rel.evalExponent(resp) == a.scalars[0] + c * rel.expTarget;
    }
    case Fragment::Kind::AND: {
        if (z.scalars.size() != f.declared().size()
            || z.children.size() != kids.size() || a.children.size() != kids.size()
            || !a.points.empty() || !a.scalars.empty())
            return false;
        VariableAssignment resp = responsesOf(f, z, externalResponses);
        for (size_t i=0; i<kids.size(); i++)
            if (!checkTranscript(*kids[i], a.children[i], c, z.children[i], resp))
                return false;
        return true;
    }
    case Fragment::Kind::OR: {
        if (z.scalars.size() != kids.size()
            || z.children.size() != kids.size() || a.children.size() != kids.size()
            || !a.points.empty() || !a.scalars.empty())
            return false;
        Challenge sum;
        for (auto& ci : z.scalars)
            sum += ci;
        if (sum != c) {
#ifdef DEBUGGING
            std::cerr << "checkTranscript: OR challenges do not add up\n";
#endif
            return false;
        }
        for (size_t i=0; i<kids.size(); i++)
            if (!checkTranscript(*kids[i], a.children[i], z.scalars[i],
                                 z.children[i], VariableAssignment()))
                return false;
        return true;
    }
    }
    return false;
}

SigmaTranscript generateSimulatedTranscript(const Fragment& f,
        const Challenge& c, const VariableAssignment& externalResponses) {
    SigmaTranscript t;
    t.challenge = c;
    const auto& kids = f.children();
    switch (f.kind()) {
    case Fragment::Kind::LEAF:
    case Fragment::Kind::AND: {
        VariableAssignment own = randomFor(f.declared());
        for (auto& v : own) // sorted, same order as in responsesOf
            t.response.scalars.push_back(v.second);
        VariableAssignment resp = externalResponses.merged(own);
        if (f.kind()==Fragment::Kind::LEAF) {
            t.announcement = leafAnnouncement(f.relation(), c, resp);
            break;
        }
        for (auto& ch : kids) {
            SigmaTranscript sub = generateSimulatedTranscript(*ch, c, resp);
            t.announcement.children.push_back(sub.announcement);
            t.response.children.push_back(sub.response);
        }
        break;
    }
    case Fragment::Kind::OR: {
        // random challenges for all but the last branch, which gets the rest
        Challenge last = c;
        for (size_t i=0; i+1<kids.size(); i++) {
            Challenge ci = ChallengeSpace::randomChallenge();
            last -= ci;
            t.response.scalars.push_back(ci);
        }
        t.response.scalars.push_back(last);
        for (size_t i=0; i<kids.size(); i++) {
            SigmaTranscript sub = generateSimulatedTranscript(*kids[i],
                                    t.response.scalars[i], VariableAssignment());
            t.announcement.children.push_back(sub.announcement);
            t.response.children.push_back(sub.response);
        }
        break;
    }
    }
    return t;
}

Announcement recomputeAnnouncement(const Fragment& f, const Challenge& c,
        const Response& z, const VariableAssignment& externalResponses) {
    const auto& kids = f.children();
    size_t nScalars = (f.kind()==Fragment::Kind::OR)? kids.size() : f.declared().size();
    if (z.scalars.size() != nScalars || z.children.size() != kids.size() || !z.points.empty())
        throw EncodingError("the response does not match the statement");

    if (f.kind()==Fragment::Kind::LEAF)
        return leafAnnouncement(f.relation(), c, responsesOf(f, z, externalResponses));

    Announcement a;
    if (f.kind()==Fragment::Kind::AND) {
        VariableAssignment resp = responsesOf(f, z, externalResponses);
        for (size_t i=0; i<kids.size(); i++)
            a.children.push_back(recomputeAnnouncement(*kids[i], c, z.children[i], resp));
    }
    else for (size_t i=0; i<kids.size(); i++) {
        a.children.push_back(recomputeAnnouncement(*kids[i], z.scalars[i],
                                        z.children[i], VariableAssignment()));
    }
    return a;
}

MessageShape announcementShape(const Fragment& f) {
    if (f.kind()==Fragment::Kind::LEAF) {
        if (f.relation().isGroup())
            return MessageShape(1,0);
        return MessageShape(0,1);
    }
    MessageShape sh;
    for (auto& ch : f.children())
        sh.children.push_back(announcementShape(*ch));
    return sh;
}

MessageShape responseShape(const Fragment& f) {
    MessageShape sh(0, f.declared().size());
    if (f.kind()==Fragment::Kind::OR)
        sh.nScalars = f.children().size();
    for (auto& ch : f.children())
        sh.children.push_back(responseShape(*ch));
    return sh;
}

bool isSatisfiedBy(const Fragment& f, const VariableAssignment& witness) {
    switch (f.kind()) {
    case Fragment::Kind::LEAF:
        return f.relation().isSatisfiedBy(witness);
    case Fragment::Kind::AND:
        for (auto& ch : f.children())
            if (!isSatisfiedBy(*ch, witness))
                return false;
        return true;
    case Fragment::Kind::OR:
        for (auto& ch : f.children())
            if (isSatisfiedBy(*ch, witness))
                return true;
        return false;
    }
    return false;
}

void debugFragment(const Fragment& f, const VariableAssignment& witness) {
    switch (f.kind()) {
    case Fragment::Kind::LEAF:
        if (!f.relation().isSatisfiedBy(witness)) {
            std::stringstream ss;
            ss << "relation ";
            prettyPrint(ss, f.relation()) << " is not satisfied by ";
            prettyPrint(ss, witness);
            throw std::runtime_error(ss.str());
        }
        break;
    case Fragment::Kind::AND:
        for (auto& ch : f.children())
            debugFragment(*ch, witness);
        break;
    case Fragment::Kind::OR:
        if (!isSatisfiedBy(f, witness)) {
            std::stringstream ss;
            ss << "none of the " << f.children().size()
               << " OR branches is satisfied by ";
            prettyPrint(ss, witness);
            throw std::runtime_error(ss.str());
        }
        break;
    }
}

void updateAccumulator(const Fragment& f, MerlinAccumulator& acc) {
    static const char* kindNames[] = {"leaf", "and", "or"};
    acc.processString("fragment", kindNames[(int)f.kind()]);
    acc.processInteger("declared", f.declared().size());
    for (auto& x : f.declared())
        acc.processString("variable", x);
    if (f.kind()==Fragment::Kind::LEAF) {
        f.relation().updateAccumulator(acc);
        return;
    }
    acc.processInteger("children", f.children().size());
    for (auto& ch : f.children())
        updateAccumulator(*ch, acc);
}

std::ostream& prettyPrint(std::ostream& st, const Fragment& f, int indent) {
    std::string pad(2*indent, ' ');
    st << pad;
    switch (f.kind()) {
    case Fragment::Kind::LEAF: st << "LEAF "; prettyPrint(st, f.relation()); break;
    case Fragment::Kind::AND:  st << "AND"; break;
    case Fragment::Kind::OR:   st << "OR"; break;
    }
    if (!f.declared().empty())
        st << " declares {" << listOf(f.declared()) << "}";
    st << "\n";
    for (auto& ch : f.children())
        prettyPrint(st, *ch, indent+1);
    return st;
}

} // end of namespace SIGMA
