#ifndef _CORPUS_ERRORS_H_
#define _CORPUS_ERRORS_H_

#include <stdexcept>
#include <string>

namespace arcdp {

// Base of all errors raised by the parsing pipeline. A failure in any batch
// aborts the whole predict or evaluate call with the original error.
class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

// No sentences were supplied.
class EmptyInputError : public ParseError {
 public:
  explicit EmptyInputError(const std::string& what) : ParseError(what) {}
};

// Score tensors and mask disagree in shape: the scorer or masking contract
// was violated.
class ShapeMismatchError : public ParseError {
 public:
  explicit ShapeMismatchError(const std::string& what) : ParseError(what) {}
};

// A tree-enforced decode produced an ill-formed tree. This is an internal
// invariant violation and is never caught by the pipeline.
class CycleDetectionError : public ParseError {
 public:
  explicit CycleDetectionError(const std::string& what) : ParseError(what) {}
};

// Incompatible configuration flags, e.g. projective decoding without tree
// decoding.
class ConfigConflictError : public ParseError {
 public:
  explicit ConfigConflictError(const std::string& what) : ParseError(what) {}
};

// Unreadable input file or malformed CoNLL line.
class CorpusFormatError : public ParseError {
 public:
  explicit CorpusFormatError(const std::string& what) : ParseError(what) {}
};

// The caller's cancellation flag was raised between batches.
class CancelledError : public ParseError {
 public:
  explicit CancelledError(const std::string& what) : ParseError(what) {}
};

}  // namespace arcdp

#endif
