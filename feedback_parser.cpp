#include "feedback_parser.h"

#include <cctype>
#include <sstream>

namespace {

FeedbackResult reject(const ConstraintSet &current, FeedbackError error,
                      std::string message) {
  FeedbackResult result;
  result.error = error;
  result.message = std::move(message);
  result.constraints = current;
  return result;
}

std::string quoted(char c) {
  return std::string("'") + static_cast<char>(std::toupper(
                                static_cast<unsigned char>(c))) +
         "'";
}

std::string at_position(int pos) {
  return " at position " + std::to_string(pos + 1);
}

} // namespace

const char *feedback_error_name(FeedbackError error) {
  switch (error) {
  case FeedbackError::kNone:
    return "ok";
  case FeedbackError::kInputFormat:
    return "input-format";
  case FeedbackError::kContradiction:
    return "contradiction";
  }
  return "unknown";
}

std::optional<std::string> validate_guess(std::string_view guess) {
  if (guess.empty())
    return std::string("Guess cannot be empty.");
  if (guess.size() != kWordLength) {
    return "Guess must be exactly " + std::to_string(kWordLength) +
           " letters (got " + std::to_string(guess.size()) + ").";
  }
  if (!is_word_token(guess))
    return std::string("Guess must contain only letters.");
  return std::nullopt;
}

std::optional<std::string> validate_pattern(std::string_view pattern,
                                            std::string_view name,
                                            bool allow_empty) {
  const std::string label(name);
  if (pattern.empty()) {
    if (allow_empty)
      return std::nullopt;
    return label + " letters feedback cannot be empty.";
  }
  if (pattern.size() != kWordLength) {
    return label + " letters must be exactly " + std::to_string(kWordLength) +
           " characters (got " + std::to_string(pattern.size()) + ").";
  }
  for (const char c : pattern) {
    if (c != '.' && !std::isalpha(static_cast<unsigned char>(c)))
      return label + " letters must contain only letters and dots.";
  }
  return std::nullopt;
}

std::optional<std::string> validate_grey(std::string_view greys) {
  for (const char c : greys) {
    if (!std::isalpha(static_cast<unsigned char>(c)) &&
        !std::isspace(static_cast<unsigned char>(c)))
      return std::string("Grey letters must contain only letters and spaces.");
  }
  std::istringstream in{std::string(greys)};
  std::string token;
  while (in >> token) {
    if (token.size() != 1) {
      return "Each grey letter must be a single character (got '" + token +
             "').";
    }
  }
  return std::nullopt;
}

FeedbackResult apply_feedback(const ConstraintSet &current,
                              std::string_view guess, std::string_view green,
                              std::string_view yellow,
                              std::string_view greys) {
  if (auto reason = validate_guess(guess))
    return reject(current, FeedbackError::kInputFormat, *reason);
  if (auto reason = validate_pattern(green, "Green", false))
    return reject(current, FeedbackError::kInputFormat, *reason);
  if (auto reason = validate_pattern(yellow, "Yellow", true))
    return reject(current, FeedbackError::kInputFormat, *reason);
  if (auto reason = validate_grey(greys))
    return reject(current, FeedbackError::kInputFormat, *reason);

  const std::string word = to_lower_ascii(guess);
  const std::string green_row = to_lower_ascii(green);
  const std::string yellow_row = yellow.empty()
                                     ? std::string(kWordLength, '.')
                                     : to_lower_ascii(yellow);

  ConstraintSet next = current;
  position_mask marked = 0; // positions reported green or yellow this round

  for (int pos = 0; pos < kWordLength; ++pos) {
    const char c = green_row[pos];
    if (c == '.')
      continue;
    if (c != word[pos]) {
      return reject(current, FeedbackError::kContradiction,
                    "Green " + quoted(c) + at_position(pos) +
                        " does not match the guessed letter " +
                        quoted(word[pos]) + ".");
    }
    const uint8_t code = letter_code(c);
    if (next.fixed[pos] != 0 && next.fixed[pos] != code) {
      return reject(current, FeedbackError::kContradiction,
                    "Position " + std::to_string(pos + 1) +
                        " is already fixed to " +
                        quoted(letter_char(next.fixed[pos])) + ".");
    }
    if (next.is_excluded(code)) {
      return reject(current, FeedbackError::kContradiction,
                    "Green " + quoted(c) +
                        " was reported grey in an earlier round.");
    }
    if (next.is_excluded_at(code, pos)) {
      return reject(current, FeedbackError::kContradiction,
                    "Green " + quoted(c) + at_position(pos) +
                        " is already known to be wrong there.");
    }
    next.fixed[pos] = code;
    marked |= static_cast<position_mask>(1u << pos);
  }

  for (int pos = 0; pos < kWordLength; ++pos) {
    const char c = yellow_row[pos];
    if (c == '.')
      continue;
    if (green_row[pos] != '.') {
      return reject(current, FeedbackError::kContradiction,
                    "Position " + std::to_string(pos + 1) +
                        " cannot be both green and yellow.");
    }
    if (c != word[pos]) {
      return reject(current, FeedbackError::kContradiction,
                    "Yellow " + quoted(c) + at_position(pos) +
                        " does not match the guessed letter " +
                        quoted(word[pos]) + ".");
    }
    const uint8_t code = letter_code(c);
    if (next.fixed[pos] != 0) {
      return reject(current, FeedbackError::kContradiction,
                    "Yellow " + quoted(c) + at_position(pos) +
                        " conflicts with fixed letter " +
                        quoted(letter_char(next.fixed[pos])) + ".");
    }
    if (next.is_excluded(code)) {
      return reject(current, FeedbackError::kContradiction,
                    "Yellow " + quoted(c) +
                        " was reported grey in an earlier round.");
    }
    next.excluded_positions[code] |= static_cast<position_mask>(1u << pos);
    marked |= static_cast<position_mask>(1u << pos);
  }

  std::istringstream in{std::string(greys)};
  std::string token;
  while (in >> token) {
    const char c =
        static_cast<char>(std::tolower(static_cast<unsigned char>(token[0])));
    const uint8_t code = letter_code(c);
    if (!next.known_present(code)) {
      next.excluded_letters |= letter_bit(code);
      continue;
    }
    // No extra copies: the letter is only ruled out where it came back grey.
    position_mask grey_positions = 0;
    for (int pos = 0; pos < kWordLength; ++pos) {
      if (word[pos] != c || ((marked >> pos) & 1u) || next.fixed[pos] == code)
        continue;
      grey_positions |= static_cast<position_mask>(1u << pos);
    }
    if (grey_positions == 0) {
      return reject(current, FeedbackError::kContradiction,
                    "Grey " + quoted(c) +
                        " conflicts with the same letter already confirmed "
                        "present.");
    }
    next.excluded_positions[code] |= grey_positions;
  }

  FeedbackResult result;
  result.constraints = next;
  return result;
}
