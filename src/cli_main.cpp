/// @file
/// @brief CLI entry point for the music_text notation parser.

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "core/basic_types.h"
#include "core/version_info.h"
#include "music_text.h"
#include "render/render_options.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  mtext::OutputFormat format = mtext::OutputFormat::Lilypond;
  mtext::RenderOptions render;
  std::string input = "-";
  std::string output;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("music_text_cli - plain-text music notation parser (v%s)\n\n", MTEXT_VERSION);
  std::printf("Usage: music_text_cli [options] [FILE]\n\n");
  std::printf("Reads FILE, or stdin when FILE is '-' or omitted.\n\n");
  std::printf("Options:\n");
  std::printf("  --lilypond       LilyPond source output (default)\n");
  std::printf("  --json           2-D score JSON output\n");
  std::printf("  --spans          Editor span and style JSON output\n");
  std::printf("  --document       Resolved document dump (debug)\n");
  std::printf("  --no-header      Omit the LilyPond \\header block\n");
  std::printf("  --pretty         Indent JSON output\n");
  std::printf("  --verbose        Print per-stave summaries on stderr\n");
  std::printf("  -o FILE          Output file path (default: stdout)\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @param exit_code Set when the caller should exit immediately.
/// @return False if the program should exit (help or bad arguments).
bool parseArgs(int argc, char* argv[], CliOptions& opts, int& exit_code) {
  bool input_seen = false;
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 ||
        std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      exit_code = 0;
      return false;
    }
    if (std::strcmp(argv[idx], "--lilypond") == 0) {
      opts.format = mtext::OutputFormat::Lilypond;
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.format = mtext::OutputFormat::ScoreJson;
    } else if (std::strcmp(argv[idx], "--spans") == 0) {
      opts.format = mtext::OutputFormat::EditorSpans;
    } else if (std::strcmp(argv[idx], "--document") == 0) {
      opts.format = mtext::OutputFormat::DocumentJson;
    } else if (std::strcmp(argv[idx], "--no-header") == 0) {
      opts.render.include_header = false;
    } else if (std::strcmp(argv[idx], "--pretty") == 0) {
      opts.render.pretty_json = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(argv[idx], "-") == 0 || argv[idx][0] != '-') {
      if (input_seen) {
        std::fprintf(stderr, "Error: more than one input file given\n");
        exit_code = 2;
        return false;
      }
      opts.input = argv[idx];
      input_seen = true;
    } else {
      std::fprintf(stderr, "Error: unknown option '%s'\n", argv[idx]);
      printUsage();
      exit_code = 2;
      return false;
    }
  }
  return true;
}

/// @brief Read the whole input file, or stdin for "-".
/// @return False if the file cannot be opened.
bool readInput(const std::string& path, std::string& text) {
  if (path == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  text = buffer.str();
  return true;
}

/// @brief Print one summary line per stave on stderr.
void printStaveSummaries(const mtext::Document& document) {
  int index = 1;
  for (const mtext::Stave* stave : document.staves()) {
    int beats = 0;
    int barlines = 0;
    if (stave->rhythm_items.has_value()) {
      for (const auto& item : *stave->rhythm_items) {
        if (item.kind == mtext::ItemKind::Beat) ++beats;
        if (item.kind == mtext::ItemKind::Barline) ++barlines;
      }
    }
    std::fprintf(stderr, "[music_text] stave %d: system=%s beats=%d barlines=%d\n", index,
                 mtext::notationSystemToString(stave->notation_system), beats, barlines);
    ++index;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  int exit_code = 0;
  if (!parseArgs(argc, argv, opts, exit_code)) {
    return exit_code;
  }

  std::string text;
  if (!readInput(opts.input, text)) {
    std::fprintf(stderr, "Error: failed to read %s\n", opts.input.c_str());
    return 1;
  }

  mtext::ParseResult result = mtext::parse(text);
  for (const auto& warning : result.warnings) {
    std::fprintf(stderr, "[music_text] WARNING: %s\n", warning.c_str());
  }
  if (opts.verbose) {
    printStaveSummaries(result.document);
  }
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  std::string rendered = mtext::render(result.document, opts.format, opts.render);
  if (opts.output.empty()) {
    std::fwrite(rendered.data(), 1, rendered.size(), stdout);
    if (rendered.empty() || rendered.back() != '\n') std::fputc('\n', stdout);
    return 0;
  }

  std::ofstream out_file(opts.output, std::ios::binary);
  if (!out_file.is_open()) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  out_file << rendered;
  if (opts.verbose) {
    std::fprintf(stderr, "[music_text] %s output: %s\n",
                 mtext::outputFormatToString(opts.format), opts.output.c_str());
  }
  return 0;
}
