#pragma once

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace tvlink::cli {

// ANSI escape sequences used by the console.
namespace colors {
constexpr const char* kReset = "\033[0m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kDim = "\033[2m";
constexpr const char* kBrightRed = "\033[91m";
constexpr const char* kBrightGreen = "\033[92m";
constexpr const char* kBrightYellow = "\033[93m";
constexpr const char* kBrightCyan = "\033[96m";
constexpr const char* kBrightWhite = "\033[97m";
}  // namespace colors

// Message markers with a plain ASCII form for non-UTF-8 terminals.
struct Marker {
  const char* unicode;
  const char* ascii;
};

namespace markers {
constexpr Marker kSuccess{"✔", "[OK]"};
constexpr Marker kError{"✘", "[FAIL]"};
constexpr Marker kWarning{"⚠", "[!]"};
constexpr Marker kInfo{"ℹ", "[i]"};
}  // namespace markers

inline bool stream_supports_color(int fd) {
  if (isatty(fd) == 0) {
    return false;
  }
  const char* term = std::getenv("TERM");
  return term != nullptr && *term != '\0' && std::string_view(term) != "dumb";
}

inline bool locale_is_utf8() {
  for (const char* name : {"LC_ALL", "LC_CTYPE", "LANG"}) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
      continue;
    }
    const std::string_view locale(value);
    return locale.find("UTF-8") != std::string_view::npos ||
           locale.find("utf-8") != std::string_view::npos ||
           locale.find("utf8") != std::string_view::npos;
  }
  return false;
}

// Terminal capabilities, probed once.
struct TerminalInfo {
  bool stdout_color = stream_supports_color(STDOUT_FILENO);
  bool stderr_color = stream_supports_color(STDERR_FILENO);
  bool unicode = locale_is_utf8();
};

inline const TerminalInfo& terminal() {
  static const TerminalInfo info;
  return info;
}

// Wrap text in a color for stdout.
inline std::string colorize(const std::string& text, const char* color) {
  if (!terminal().stdout_color) {
    return text;
  }
  return std::string(color) + text + colors::kReset;
}

inline void print_marked(std::ostream& out, bool color, const char* marker_color,
                         const Marker& marker, const std::string& message) {
  const char* symbol = terminal().unicode ? marker.unicode : marker.ascii;
  if (color) {
    out << marker_color << symbol << colors::kReset;
  } else {
    out << symbol;
  }
  out << ' ' << message << '\n';
}

inline void print_success(const std::string& message) {
  print_marked(std::cout, terminal().stdout_color, colors::kBrightGreen, markers::kSuccess,
               message);
}

inline void print_info(const std::string& message) {
  print_marked(std::cout, terminal().stdout_color, colors::kBrightCyan, markers::kInfo, message);
}

// Warnings and errors go to stderr.
inline void print_warning(const std::string& message) {
  print_marked(std::cerr, terminal().stderr_color, colors::kBrightYellow, markers::kWarning,
               message);
}

inline void print_error(const std::string& message) {
  print_marked(std::cerr, terminal().stderr_color, colors::kBrightRed, markers::kError, message);
}

inline void print_banner(const std::string& title, const std::string& version) {
  const std::string heading = title + " v" + version;
  const std::string rule(heading.size() + 4, '=');
  std::cout << colorize(rule, colors::kBrightCyan) << '\n'
            << "  " << colorize(title, colors::kBold) << colorize(" v" + version, colors::kDim)
            << '\n'
            << colorize(rule, colors::kBrightCyan) << '\n';
}

inline void print_section(const std::string& title) {
  std::cout << '\n'
            << colorize(title, colors::kBold) << '\n'
            << colorize(std::string(title.size(), '-'), colors::kDim) << '\n';
}

// Key-value row; value_color is optional.
inline void print_row_colored(const std::string& key, const std::string& value,
                              const char* value_color, std::size_t key_width = 20) {
  std::string padded = key;
  if (padded.size() < key_width) {
    padded.append(key_width - padded.size(), ' ');
  }
  std::cout << "  " << colorize(padded, colors::kDim) << " : "
            << (value_color != nullptr ? colorize(value, value_color) : value) << '\n';
}

inline void print_row(const std::string& key, const std::string& value,
                      std::size_t key_width = 20) {
  print_row_colored(key, value, nullptr, key_width);
}

}  // namespace tvlink::cli
