#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind : int { Schema, Domain, Consistency, Shape };

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Schema: return "schema error";
        case ErrorKind::Domain: return "domain error";
        case ErrorKind::Consistency: return "consistency error";
        case ErrorKind::Shape: return "shape error";
    }
    return "error";
}

class VelcorrError : public std::runtime_error {
public:
    VelcorrError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const { return kind_; }
private:
    ErrorKind kind_;
};

// A required column is absent, or a table is malformed
class SchemaError : public VelcorrError {
public:
    explicit SchemaError(const std::string& msg) : VelcorrError(ErrorKind::Schema, msg) {}
};

// A value lies outside its admissible range (positions, factors, radii)
class DomainError : public VelcorrError {
public:
    explicit DomainError(const std::string& msg) : VelcorrError(ErrorKind::Domain, msg) {}
};

// Two derived quantities that must agree do not
class ConsistencyError : public VelcorrError {
public:
    explicit ConsistencyError(const std::string& msg) : VelcorrError(ErrorKind::Consistency, msg) {}
};

// An array does not have the (H, W, 2) layout of a vector field
class ShapeError : public VelcorrError {
public:
    explicit ShapeError(const std::string& msg) : VelcorrError(ErrorKind::Shape, msg) {}
};
