#ifndef _PROTOCOL_INSTANCE_HPP_
#define _PROTOCOL_INSTANCE_HPP_
/* protocolInstance.hpp - one run of a two-party protocol, in one role
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
#include <memory>

#include "variables.hpp"
#include "messages.hpp"
#include "sigmaProtocol.hpp"

/* A ProtocolInstance is the state machine of one party in one run of a
 * two-party protocol with a fixed number of messages and alternating
 * turns. The states are
 *
 *   NOT_STARTED -> AWAITING_OWN_MESSAGE <-> AWAITING_PEER_MESSAGE -> DONE
 *
 * The caller asks isMyTurn(), then either calls nextMessage() to get the
 * bytes to send or receiveMessage() with the bytes from the peer. Calling
 * the wrong one, or calling anything after DONE, throws ProtocolViolation.
 * An exception thrown while handling a message (e.g., an EncodingError on
 * a garbled message) terminates the run, the instance moves to DONE and
 * a verifier instance rejects.
 *
 * Instances are single-use and own all of their state, so separate runs
 * can be driven from separate threads.
 */
namespace SIGMA {

class ProtocolInstance {
public:
    enum class State { NOT_STARTED, AWAITING_OWN_MESSAGE, AWAITING_PEER_MESSAGE, DONE };

private:
    Role myRole, firstRole;
    size_t nMessages;
    size_t nextRound = 0; // index of the next message to be exchanged
    State st = State::NOT_STARTED;
    bool accepting = false;

    Role senderOf(size_t round) const {
        if (round % 2 == 0) return firstRole;
        return (firstRole==Role::PROVER)? Role::VERIFIER : Role::PROVER;
    }
    void advance();
    void fail();

public:
    ProtocolInstance(Role me, Role first, size_t numMessages):
        myRole(me), firstRole(first), nMessages(numMessages) {}
    virtual ~ProtocolInstance() = default;

    Role role() const { return myRole; }
    State state() const { return st; }
    size_t numRounds() const { return nMessages; }
    size_t round() const { return nextRound; }
    bool hasTerminated() const { return st==State::DONE; }
    bool isMyTurn() const { return !hasTerminated() && senderOf(nextRound)==myRole; }

    std::string nextMessage();
    void receiveMessage(const std::string& msg);

    // Only for verifiers, and only once the run is DONE
    bool isAccepting() const;

protected:
    virtual std::string produceMessage(size_t round) = 0;
    virtual void consumeMessage(size_t round, const std::string& msg) = 0;
    void setVerdict(bool v) { accepting = v; }
};

// The prover of a Sigma protocol: announcement, (challenge), response
class SigmaProverInstance: public ProtocolInstance {
    std::shared_ptr<const SigmaProtocol> protocol;
    VariableAssignment witness;
    AnnouncementSecret secret;
    Challenge challenge;
public:
    SigmaProverInstance(const std::shared_ptr<const SigmaProtocol>& p,
                        const VariableAssignment& w):
        ProtocolInstance(Role::PROVER, p->getFirstMessageRole(), 3),
        protocol(p), witness(w) {}
protected:
    std::string produceMessage(size_t round) override;
    void consumeMessage(size_t round, const std::string& msg) override;
};

// The verifier of a Sigma protocol: (announcement), challenge, (response)
class SigmaVerifierInstance: public ProtocolInstance {
    std::shared_ptr<const SigmaProtocol> protocol;
    SigmaTranscript trans;
public:
    explicit SigmaVerifierInstance(const std::shared_ptr<const SigmaProtocol>& p):
        ProtocolInstance(Role::VERIFIER, p->getFirstMessageRole(), 3),
        protocol(p) {}

    // The messages exchanged so far
    const SigmaTranscript& transcript() const { return trans; }
protected:
    std::string produceMessage(size_t round) override;
    void consumeMessage(size_t round, const std::string& msg) override;
};

inline std::unique_ptr<ProtocolInstance> proverInstance(
        const std::shared_ptr<const SigmaProtocol>& p, const VariableAssignment& w) {
    return std::make_unique<SigmaProverInstance>(p, w);
}
inline std::unique_ptr<ProtocolInstance> verifierInstance(
        const std::shared_ptr<const SigmaProtocol>& p) {
    return std::make_unique<SigmaVerifierInstance>(p);
}

// Pass messages between the two instances until both are done, returns
// the verdict of the verifier. Throws ProtocolViolation if the two are
// not a prover/verifier pair or if neither of them can move.
bool runProtocol(ProtocolInstance& prover, ProtocolInstance& verifier);

} // end of namespace SIGMA
#endif // ifndef _PROTOCOL_INSTANCE_HPP_
