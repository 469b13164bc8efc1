#pragma once

#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace tessera::app {

enum class ErrorPhase { Init, Mount, Render, Layout, Rasterize, Diff, Write, Effect, Key, Tick, Resize, Unmount, Lifecycle };

[[nodiscard]] std::string_view phase_name(ErrorPhase phase);

struct ErrorContext {
  ErrorPhase phase{ErrorPhase::Render};
  std::string message;
  std::exception_ptr error;
  std::map<std::string, std::string> metadata;
};

[[nodiscard]] ErrorContext make_error_context(ErrorPhase phase, std::exception_ptr error,
                                              std::map<std::string, std::string> metadata = {});

using ErrorHandler = std::function<void(const ErrorContext&)>;

// Builds the handler every boundary reports through. Lines go to
// `error_log` when set ("[YYYY-mm-dd HH:MM:SS] phase: message"); the user
// handler runs with its own failures logged and contained. With neither,
// the error is printed to stderr.
[[nodiscard]] ErrorHandler make_error_handler(ErrorHandler user_handler, std::filesystem::path error_log = {});

// Runs `fn`, routing any exception to `handler` tagged with `phase`.
// Returns false when `fn` threw.
bool guarded(ErrorPhase phase, const ErrorHandler& handler, const std::function<void()>& fn);

} // namespace tessera::app
