#pragma once
#include <stdexcept>
#include <string>

// Base of every error kind the query log reports.
class QueryLogError : public std::runtime_error {
public:
    explicit QueryLogError(const std::string &msg) : std::runtime_error(msg) {}
};

// Malformed persisted record. Readers skip the record and continue.
class DecodeError : public QueryLogError {
public:
    explicit DecodeError(const std::string &msg) : QueryLogError("decode: " + msg) {}
};

// Entry cannot be serialized. The batch is aborted and kept by the caller.
class EncodeError : public QueryLogError {
public:
    explicit EncodeError(const std::string &msg) : QueryLogError("encode: " + msg) {}
};

// I/O failure during append / rotate / clear.
class PersistenceError : public QueryLogError {
public:
    explicit PersistenceError(const std::string &msg) : QueryLogError("persist: " + msg) {}
protected:
    PersistenceError(const std::string &prefix, const std::string &msg) : QueryLogError(prefix + msg) {}
};

// Written bytes do not decode back to the source entries; not durable.
class ConsistencyError : public PersistenceError {
public:
    explicit ConsistencyError(const std::string &msg) : PersistenceError("consistency: ", msg) {}
};

// Missing required fields or unsupported configuration value.
class ValidationError : public QueryLogError {
public:
    explicit ValidationError(const std::string &msg) : QueryLogError("invalid: " + msg) {}
};
