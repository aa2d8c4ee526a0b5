#pragma once
// Elaboration errors. All of them abort the current elaboration; nothing in
// the core catches them.

#include <stdexcept>
#include <string>

namespace lazy {

class ElabError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Scope enter/exit mismatch, close while an inner scope is open, or a
// registration with no (or the wrong) open scope.
class ScopeViolation : public ElabError {
  public:
    using ElabError::ElabError;
};

// A container finalized twice, or instantiated while already instantiating
// or done.
class DoubleApplicationError : public ElabError {
  public:
    using ElabError::ElabError;
};

// Two dangles sharing a source key with the same direction.
class ConnectionDirectionError : public ElabError {
  public:
    using ElabError::ElabError;
};

// More than two dangles sharing a source key.
class PairingInvariantError : public ElabError {
  public:
    using ElabError::ElabError;
};

// An instantiation-only value read before it exists.
class PrematureAccessError : public ElabError {
  public:
    using ElabError::ElabError;
};

class BindingError : public ElabError {
  public:
    using ElabError::ElabError;
};

class SignalError : public ElabError {
  public:
    using ElabError::ElabError;
};

// Root left with unresolved dangles under UnresolvedPolicy::Error.
class UnresolvedBoundaryError : public ElabError {
  public:
    using ElabError::ElabError;
};

} // namespace lazy
