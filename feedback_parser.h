#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "constraint_set.h"

enum class FeedbackError {
  kNone,
  kInputFormat,   // wrong length, disallowed character
  kContradiction, // inconsistent with the guess, itself or earlier rounds
};

const char *feedback_error_name(FeedbackError error);

struct FeedbackResult {
  FeedbackError error = FeedbackError::kNone;
  std::string message;
  ConstraintSet constraints;

  bool ok() const { return error == FeedbackError::kNone; }
};

// Field validators. Each returns the reason the field is rejected, or nullopt.
std::optional<std::string> validate_guess(std::string_view guess);
std::optional<std::string> validate_pattern(std::string_view pattern,
                                            std::string_view name,
                                            bool allow_empty);
std::optional<std::string> validate_grey(std::string_view greys);

// Merges one round of feedback into `current` and returns the new set. On
// error `constraints` is a copy of `current`; nothing is partially applied.
//
// `green` and `yellow` are kWordLength characters over [a-zA-Z.]; an empty
// `yellow` means no yellow letters. `greys` is whitespace-separated single
// letters. A grey letter already known to be present only rules out the
// guess positions where it came back grey.
FeedbackResult apply_feedback(const ConstraintSet &current,
                              std::string_view guess, std::string_view green,
                              std::string_view yellow, std::string_view greys);
