#ifndef DOCXFER_CORE_ERRORS_HPP
#define DOCXFER_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace docxfer::core {

class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message) 
        : std::runtime_error(message) {}
};

// Object or bucket is absent
class NotFoundError : public TransferError {
public:
    explicit NotFoundError(const std::string& message) 
        : TransferError("Not found: " + message) {}
};

// Namespace path or object key cannot be used
class InvalidNameError : public TransferError {
public:
    explicit InvalidNameError(const std::string& message) 
        : TransferError("Invalid name: " + message) {}
};

// I/O failure while writing, committing or reading an object
class TransferFailure : public TransferError {
public:
    explicit TransferFailure(const std::string& message) 
        : TransferError("Transfer failure: " + message) {}
};

// Document stream cannot be encoded or decoded
class CodecError : public TransferError {
public:
    explicit CodecError(const std::string& message) 
        : TransferError("Codec error: " + message) {}
};

} // namespace docxfer::core

#endif // DOCXFER_CORE_ERRORS_HPP
