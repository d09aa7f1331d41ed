#ifndef _SIGMA_ERRORS_HPP_
#define _SIGMA_ERRORS_HPP_
/* sigmaErrors.hpp - the exceptions thrown by the Sigma-protocol engine
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

/* A failed verification is never an exception, checkTranscript and its
 * relatives just return false. The exceptions below signal that the
 * caller did something that cannot be part of a protocol run:
 *
 * - InvalidStatement: a relation that cannot be written as
 *   linear(witnesses) = public constant, or a fragment tree that is
 *   malformed. Thrown when the statement is constructed, never later.
 * - ProtocolViolation: messages produced/consumed out of order, reuse of
 *   a terminated protocol instance or of a spent announcement secret.
 * - EncodingError: bytes that do not decode to the expected structure.
 * - DecompressionError: a compressed transcript that does not expand to
 *   an accepting transcript.
 */
namespace SIGMA {

class InvalidStatement: public std::invalid_argument {
public:
    explicit InvalidStatement(const std::string& what):
        std::invalid_argument("invalid statement: "+what) {}
};

class ProtocolViolation: public std::logic_error {
public:
    explicit ProtocolViolation(const std::string& what):
        std::logic_error("protocol violation: "+what) {}
};

class EncodingError: public std::runtime_error {
public:
    explicit EncodingError(const std::string& what):
        std::runtime_error("encoding error: "+what) {}
};

class DecompressionError: public std::runtime_error {
public:
    explicit DecompressionError(const std::string& what):
        std::runtime_error("decompression error: "+what) {}
};

} // end of namespace SIGMA
#endif // ifndef _SIGMA_ERRORS_HPP_
