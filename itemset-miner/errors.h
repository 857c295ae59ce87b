#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Row or file could not be turned into transactions.
class DataIngestionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised only when the caller asked for a non-empty collection.
class EmptyInputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidThresholdError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MiningInterruptedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif // ERRORS_H
