#include "app/ErrorBoundary.hpp"
#include <chrono>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <fstream>
#include <memory>

namespace tessera::app {

namespace {

std::string describe(const std::exception_ptr& ep) {
  if (!ep) return "unknown error";
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return e.what();
  } catch (const std::string& s) {
    return s;
  } catch (const char* s) {
    return s ? s : "unknown error";
  } catch (...) {
    return "unknown error";
  }
}

std::string timestamp() {
  auto now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

void print_to_stderr(const ErrorContext& ctx) {
  const auto phase = phase_name(ctx.phase);
  std::fprintf(stderr, "tessera: error(%.*s): %s\n", static_cast<int>(phase.size()), phase.data(),
               ctx.message.c_str());
}

class ErrorLog {
public:
  explicit ErrorLog(std::filesystem::path path) : path_(std::move(path)) {
    std::error_code ec;
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      std::fprintf(stderr, "tessera: ErrorBoundary: failed to create %s: %s\n",
                   path_.parent_path().c_str(), ec.message().c_str());
    }
  }

  bool append(const ErrorContext& ctx) {
    std::ofstream file(path_, std::ios::app);
    if (!file) {
      std::fprintf(stderr, "tessera: ErrorBoundary: failed to open %s: %s\n", path_.c_str(),
                   std::strerror(errno));
      return false;
    }
    file << '[' << timestamp() << "] " << phase_name(ctx.phase) << ": " << ctx.message;
    for (const auto& [k, v] : ctx.metadata) file << ' ' << k << '=' << v;
    file << '\n';
    return static_cast<bool>(file);
  }

private:
  std::filesystem::path path_;
};

} // namespace

std::string_view phase_name(ErrorPhase phase) {
  switch (phase) {
    case ErrorPhase::Init: return "init";
    case ErrorPhase::Mount: return "mount";
    case ErrorPhase::Render: return "render";
    case ErrorPhase::Layout: return "layout";
    case ErrorPhase::Rasterize: return "rasterize";
    case ErrorPhase::Diff: return "diff";
    case ErrorPhase::Write: return "write";
    case ErrorPhase::Effect: return "effect";
    case ErrorPhase::Key: return "key";
    case ErrorPhase::Tick: return "tick";
    case ErrorPhase::Resize: return "resize";
    case ErrorPhase::Unmount: return "unmount";
    case ErrorPhase::Lifecycle: return "lifecycle";
  }
  return "unknown";
}

ErrorContext make_error_context(ErrorPhase phase, std::exception_ptr error,
                                std::map<std::string, std::string> metadata) {
  ErrorContext ctx;
  ctx.phase = phase;
  ctx.message = describe(error);
  ctx.error = std::move(error);
  ctx.metadata = std::move(metadata);
  return ctx;
}

ErrorHandler make_error_handler(ErrorHandler user_handler, std::filesystem::path error_log) {
  std::shared_ptr<ErrorLog> log;
  if (!error_log.empty()) log = std::make_shared<ErrorLog>(std::move(error_log));

  return [user = std::move(user_handler), log](const ErrorContext& ctx) {
    bool logged = false;
    if (log) logged = log->append(ctx);
    if (user) {
      try {
        user(ctx);
        return;
      } catch (const std::exception& e) {
        std::fprintf(stderr, "tessera: ErrorBoundary: error handler threw: %s\n", e.what());
      } catch (...) {
        std::fprintf(stderr, "tessera: ErrorBoundary: error handler threw a non-standard exception\n");
      }
    }
    if (!logged) print_to_stderr(ctx);
  };
}

bool guarded(ErrorPhase phase, const ErrorHandler& handler, const std::function<void()>& fn) {
  try {
    fn();
    return true;
  } catch (...) {
    auto ctx = make_error_context(phase, std::current_exception());
    if (handler) handler(ctx);
    else print_to_stderr(ctx);
    return false;
  }
}

} // namespace tessera::app
