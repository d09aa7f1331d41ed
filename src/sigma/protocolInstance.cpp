/* protocolInstance.cpp - the state machine of a protocol run
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
#include <stdexcept>

#include "sigmaErrors.hpp"
#include "protocolInstance.hpp"

namespace SIGMA {

static const char* nameOf(Role r) {
    return (r==Role::PROVER)? "prover" : "verifier";
}

void ProtocolInstance::advance() {
    nextRound++;
    if (nextRound >= nMessages)
        st = State::DONE;
    else
        st = isMyTurn()? State::AWAITING_OWN_MESSAGE : State::AWAITING_PEER_MESSAGE;
}

// A run in which something went wrong cannot continue
void ProtocolInstance::fail() {
    st = State::DONE;
    accepting = false;
}

std::string ProtocolInstance::nextMessage() {
    if (hasTerminated())
        throw ProtocolViolation(std::string(nameOf(myRole))+" instance already terminated");
    if (!isMyTurn())
        throw ProtocolViolation(std::string(nameOf(myRole))+" asked to send message #"
                    +std::to_string(nextRound)+" but it is the peer's turn");
    std::string msg;
    try {
        msg = produceMessage(nextRound);
    } catch (const std::exception&) {
        fail();
        throw;
    }
    advance();
    return msg;
}

void ProtocolInstance::receiveMessage(const std::string& msg) {
    if (hasTerminated())
        throw ProtocolViolation(std::string(nameOf(myRole))+" instance already terminated");
    if (isMyTurn())
        throw ProtocolViolation(std::string(nameOf(myRole))+" received message #"
                    +std::to_string(nextRound)+" but it is its own turn to send");
    try {
        consumeMessage(nextRound, msg);
    } catch (const std::exception&) {
        fail();
        throw;
    }
    advance();
}

bool ProtocolInstance::isAccepting() const {
    if (myRole != Role::VERIFIER)
        throw ProtocolViolation("only a verifier has a verdict");
    if (!hasTerminated())
        throw ProtocolViolation("verdict requested before the run is done");
    return accepting;
}

// Round 0: announcement, round 1: challenge, round 2: response
std::string SigmaProverInstance::produceMessage(size_t round) {
    if (round == 0) {
        secret = protocol->generateAnnouncementSecret(witness);
        return encodeMessage(protocol->generateAnnouncement(witness, secret));
    }
    if (round == 2)
        return encodeMessage(protocol->generateResponse(witness, secret, challenge));
    throw ProtocolViolation("prover has no message #"+std::to_string(round));
}

void SigmaProverInstance::consumeMessage(size_t round, const std::string& msg) {
    if (round != 1)
        throw ProtocolViolation("prover expects no message #"+std::to_string(round));
    challenge = decodeScalar(msg);
}

std::string SigmaVerifierInstance::produceMessage(size_t round) {
    if (round != 1)
        throw ProtocolViolation("verifier has no message #"+std::to_string(round));
    trans.challenge = protocol->generateChallenge();
    return encodeScalar(trans.challenge);
}

void SigmaVerifierInstance::consumeMessage(size_t round, const std::string& msg) {
    if (round == 0) {
        trans.announcement = decodeMessage(msg, protocol->announcementShape());
        return;
    }
    if (round == 2) {
        trans.response = decodeMessage(msg, protocol->responseShape());
        setVerdict(protocol->checkTranscript(trans));
        return;
    }
    throw ProtocolViolation("verifier expects no message #"+std::to_string(round));
}

bool runProtocol(ProtocolInstance& prover, ProtocolInstance& verifier) {
    if (prover.role() != Role::PROVER || verifier.role() != Role::VERIFIER)
        throw ProtocolViolation("runProtocol needs a prover and a verifier");
    while (!prover.hasTerminated() || !verifier.hasTerminated()) {
        if (prover.isMyTurn() && !verifier.hasTerminated())
            verifier.receiveMessage(prover.nextMessage());
        else if (verifier.isMyTurn() && !prover.hasTerminated())
            prover.receiveMessage(verifier.nextMessage());
        else
            throw ProtocolViolation("runProtocol: neither party can move");
    }
    return verifier.isAccepting();
}

} // end of namespace SIGMA
