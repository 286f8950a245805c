#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "feedback_parser.h"
#include "frequency_table.h"
#include "solver_core.h"
#include "solver_runtime.h"
#include "words_data.h"

constexpr size_t kWordsPerLine = 10;

void print_usage(const char *prog_name) {
  std::cout
      << "Usage:\n"
      << "  " << prog_name << " play [flags]\n"
      << "  " << prog_name
      << " filter <guess> <green> <yellow> <grey> [<guess> ...] [flags]\n"
      << "  " << prog_name << " help\n\n"
      << "Each filter round takes four arguments: the guess, the green and\n"
         "yellow patterns (dots for unknown positions) and the grey letters\n"
         "as one quoted, space-separated argument (\"\" for none).\n\n"
      << "Flags:\n"
      << "  --words FILE       Word list, one word per line (default: "
      << kDefaultWordsPath << ").\n"
      << "  --freq-dir DIR     Directory holding pos1.txt..pos5.txt "
         "(default: "
      << kDefaultFrequencyDir << ").\n"
      << "  --first-guess WORD Suggested opening guess (default: "
      << kDefaultFirstGuess << ").\n"
      << "  --dump-json        Emit the filter result as JSON.\n"
      << "  --debug            Constraint, filter and timing diagnostics on "
         "stderr.\n"
      << "  --help             Show this summary.\n";
}

void print_word_rows(const std::vector<encoded_word> &words) {
  for (size_t i = 0; i < words.size(); i += kWordsPerLine) {
    std::cout << " ";
    const size_t end = std::min(words.size(), i + kWordsPerLine);
    for (size_t j = i; j < end; ++j) {
      std::cout << ' ' << to_upper_ascii(decode_word(words[j]));
    }
    std::cout << "\n";
  }
}

void print_outcome(const RoundOutcome &outcome) {
  const FilteredResult &result = outcome.result;
  if (outcome.used_first_guess) {
    std::cout << "\nNo feedback yet.\n";
  } else if (result.empty()) {
    std::cout << "No candidate words found.\n";
  } else {
    std::cout << "\nFound " << result.size() << " candidate word(s)"
              << (result.expanded ? " by expanding the letter pool" : "")
              << ":\n";
    if (!result.unique.empty()) {
      std::cout << "\nSection 1 - Unique letters (" << result.unique.size()
                << " word(s)):\n";
      print_word_rows(result.unique);
    }
    if (!result.repeated.empty()) {
      std::cout << "\nSection 2 - Repeated letters ("
                << result.repeated.size() << " word(s)):\n";
      print_word_rows(result.repeated);
    }
  }

  if (!outcome.recommendation) {
    std::cout << "\nNo suggestion available.\n";
    return;
  }
  std::cout << "\nSuggested next guess: "
            << to_upper_ascii(decode_word(*outcome.recommendation)) << "\n";
  if (outcome.suggestions.size() > 1) {
    std::cout << "Ranked by vowels and letter frequency:\n";
    for (const auto &scored : outcome.suggestions) {
      std::cout << "  " << to_upper_ascii(decode_word(scored.word))
                << " (score: " << scored.score << ")\n";
    }
  }
}

int run_filter(const std::vector<std::string> &rounds, const WordCorpus &corpus,
               const FrequencyTable &frequencies, const SolverConfig &config,
               bool dump_json) {
  const ReplayResult replay = replay_feedback(rounds, config.debug);
  if (!replay.ok()) {
    std::cerr << "Error (" << feedback_error_name(replay.error)
              << ") in round " << (replay.rounds_applied + 1) << ": "
              << replay.message << "\n";
    return 1;
  }

  const RoundOutcome outcome =
      recommend_round(replay.constraints, corpus, frequencies, config);
  if (dump_json) {
    std::cout << outcome_to_json(outcome) << "\n";
  } else {
    print_outcome(outcome);
  }
  return 0;
}

int run_play(const WordCorpus &corpus, const FrequencyTable &frequencies,
             const SolverConfig &config) {
  std::cout << "Welcome to Wordle Filter!\n"
            << "Enter 'quit' at any time to exit.\n\n"
            << "Suggested first guess: "
            << to_upper_ascii(decode_word(config.first_guess)) << "\n";

  RoundSession session(corpus, frequencies, config);
  std::cout << "\n--- Round " << session.round() << " ---\n";
  std::string line;
  while (true) {
    std::cout << session.prompt() << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\nExiting Wordle Filter. Goodbye!\n";
      return 0;
    }
    std::string command = to_lower_ascii(line);
    command.erase(std::remove_if(command.begin(), command.end(),
                                 [](unsigned char c) { return std::isspace(c); }),
                  command.end());
    if (command == "quit") {
      std::cout << "Exiting Wordle Filter. Goodbye!\n";
      return 0;
    }

    const RoundState before = session.state();
    if (auto reason = session.submit(line)) {
      std::cout << "Error: " << *reason << "\n";
      if (session.state() == RoundState::kAwaitGuess &&
          before != RoundState::kAwaitGuess) {
        std::cout << "The round was discarded; enter the guess again.\n";
      } else {
        std::cout << "Please try again.\n";
      }
      continue;
    }
    if (session.state() != RoundState::kDisplay)
      continue;

    const RoundReport &report = session.report();
    if (report.solved) {
      std::cout << "\nCongratulations! Puzzle solved!\n";
      return 0;
    }
    print_outcome(report.outcome);
    session.next_round();
    std::cout << "\n--- Round " << session.round() << " ---\n";
  }
}

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);
  std::cin.tie(nullptr);

  bool debug_flag = false;
  bool dump_json = false;
  std::string words_path(kDefaultWordsPath);
  std::string frequency_dir(kDefaultFrequencyDir);
  std::string first_guess(kDefaultFirstGuess);

  std::string mode;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "--debug") {
      debug_flag = true;
      continue;
    }
    if (arg == "--dump-json") {
      dump_json = true;
      continue;
    }
    if (arg == "--words") {
      if (i + 1 >= argc) {
        std::cerr << "--words requires a path.\n";
        return 1;
      }
      words_path = argv[++i];
      continue;
    }
    if (arg == "--freq-dir") {
      if (i + 1 >= argc) {
        std::cerr << "--freq-dir requires a directory.\n";
        return 1;
      }
      frequency_dir = argv[++i];
      continue;
    }
    if (arg == "--first-guess") {
      if (i + 1 >= argc) {
        std::cerr << "--first-guess requires a word.\n";
        return 1;
      }
      first_guess = argv[++i];
      if (!is_word_token(first_guess)) {
        std::cerr << "--first-guess requires a " << kWordLength
                  << "-letter word.\n";
        return 1;
      }
      continue;
    }
    // Dots-only patterns and grey lists are data, not flags.
    if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
      std::cerr << "Unknown flag: " << arg << "\n";
      return 1;
    }
    if (mode.empty()) {
      mode = arg;
    } else {
      positional.push_back(arg);
    }
  }

  if (mode.empty()) {
    std::cerr << "No mode specified.\n";
    print_usage(argv[0]);
    return 1;
  }

  const std::string normalized_mode = to_lower_ascii(mode);
  if (normalized_mode == "help") {
    print_usage(argv[0]);
    return 0;
  }

  const bool play_mode = normalized_mode == "play";
  const bool filter_mode = normalized_mode == "filter";
  if (!play_mode && !filter_mode) {
    std::cerr << "Unknown mode '" << mode << "'.\n";
    print_usage(argv[0]);
    return 1;
  }
  if (dump_json && !filter_mode) {
    std::cerr << "--dump-json is only valid in filter mode.\n";
    return 1;
  }
  if (play_mode && !positional.empty()) {
    std::cerr << "Unexpected positional arguments.\n";
    return 1;
  }
  if (filter_mode && (positional.empty() || positional.size() % 4 != 0)) {
    std::cerr << "filter mode requires rounds of four arguments: "
                 "<guess> <green> <yellow> <grey>.\n";
    return 1;
  }

  const auto load_start = std::chrono::high_resolution_clock::now();
  const WordCorpus corpus = build_corpus(load_words_from_file(words_path));
  if (corpus.empty()) {
    std::cerr << "Error: word list '" << words_path
              << "' could not be loaded. Exiting.\n";
    return 1;
  }
  const FrequencyTable frequencies = load_frequency_table(frequency_dir);
  if (!frequencies.loaded()) {
    std::cerr << "Error: frequency files in '" << frequency_dir
              << "' could not be loaded. Exiting.\n";
    return 1;
  }
  if (debug_flag) {
    const auto end = std::chrono::high_resolution_clock::now();
    const auto ms =
        std::chrono::duration<double, std::milli>(end - load_start).count();
    std::cerr << "[timer] load " << ms << " ms (" << corpus.size()
              << " words)\n";
  }

  SolverConfig config;
  config.first_guess = encode_word(to_lower_ascii(first_guess));
  config.debug = debug_flag;

  if (filter_mode) {
    return run_filter(positional, corpus, frequencies, config, dump_json);
  }
  return run_play(corpus, frequencies, config);
}
