#pragma once

#include <functional>
#include <optional>
#include <string_view>

#if defined(__clang__) || defined(__GNUC__)
#define ANVIL_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define ANVIL_TUI_PRINTF(idx, first)
#endif

namespace anvil::tui {

enum class level { TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

// "debug", "info", "warn"/"warning", "error" (case-insensitive). nullopt otherwise.
std::optional<level> level_from_string(std::string_view value);

void init();
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

void debug(char const *fmt, ...) ANVIL_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) ANVIL_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) ANVIL_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) ANVIL_TUI_PRINTF(1, 2);

// Command results (search hits, lists, submission links) go to stdout unprefixed.
void print_stdout(char const *fmt, ...) ANVIL_TUI_PRINTF(1, 2);

bool is_tty();

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace anvil::tui

#undef ANVIL_TUI_PRINTF
