// Repository: Toolshed
// Component: Interactive Front-End
// Purpose: Line-oriented shell over one Session with a cooperative tick loop
//          that picks up execution results while waiting for input.
// Copyright (c) 2025 Toolshed
//
// COMMANDS:
//   ls                  List the current location
//   cd N|NAME|..        Enter a group (.. goes back)
//   back                Go back one level
//   tab [NAME]          List categories, or switch to NAME
//   search [TEXT]       Filter the listing (no text clears the filter)
//   select N            Move the cursor
//   mark N              Toggle N in the multi-selection
//   run [N]             Run N (default: cursor)
//   run-marked          Run every marked entry
//   preview [N]         Show what N would run
//   refresh             Reload the catalog
//   info                Show host information
//   quit                Exit once running commands finish

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "toolshed/app/AppConfig.hpp"
#include "toolshed/app/SystemInfo.hpp"
#include "toolshed/catalog/CatalogCache.hpp"
#include "toolshed/catalog/ScriptDirectoryProvider.hpp"
#include "toolshed/execution/ExecutionCoordinator.hpp"
#include "toolshed/execution/ProcessCommandRunner.hpp"
#include "toolshed/session/Session.hpp"
#include "toolshed/util/Logger.hpp"

namespace {

using toolshed::session::ItemView;
using toolshed::session::Session;
using toolshed::session::SessionResult;
using toolshed::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// Input
// Reads stdin through poll() so the loop can tick while the user types.
// =============================================================================
class LineReader {
 public:
  enum class Status { kLine, kTimeout, kEof, kInterrupted };

  Status Next(std::string* line, int timeout_ms) {
    while (true) {
      size_t newline = buffer_.find('\n');
      if (newline != std::string::npos) {
        *line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);
        return Status::kLine;
      }
      if (eof_) {
        if (buffer_.empty()) return Status::kEof;
        *line = buffer_;
        buffer_.clear();
        return Status::kLine;
      }

      pollfd fd{STDIN_FILENO, POLLIN, 0};
      int ready = poll(&fd, 1, timeout_ms);
      if (ready < 0) {
        if (errno == EINTR) return Status::kInterrupted;
        eof_ = true;
        continue;
      }
      if (ready == 0) return Status::kTimeout;

      char chunk[1024];
      ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
      if (n > 0) {
        buffer_.append(chunk, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        eof_ = true;
      }
    }
  }

 private:
  std::string buffer_;
  bool eof_ = false;
};

// =============================================================================
// Rendering
// =============================================================================

void PrintResult(const toolshed::execution::ExecutionResult& result) {
  std::cout << "\n[" << (result.success ? "done" : "failed") << "] #" << result.sequence
            << " " << result.category << " / " << result.node_name;
  if (result.exit_code) std::cout << " (exit " << *result.exit_code << ")";
  std::cout << "\n" << result.output;
  if (!result.output.empty() && result.output.back() != '\n') std::cout << "\n";
  std::cout << std::flush;
}

void PrintListing(Session& session) {
  std::vector<std::string> crumbs = session.Breadcrumb();
  std::ostringstream path;
  for (size_t i = 0; i < crumbs.size(); ++i) {
    if (i > 0) path << " > ";
    path << crumbs[i];
  }
  std::cout << path.str();
  if (!session.SearchText().empty()) std::cout << "   [search: " << session.SearchText() << "]";
  std::cout << "\n";

  std::vector<ItemView> items = session.CurrentItems();
  if (items.empty()) {
    std::cout << "  (no entries)\n";
    return;
  }
  std::optional<size_t> cursor = session.SelectedIndex();
  for (size_t i = 0; i < items.size(); ++i) {
    const ItemView& item = items[i];
    std::cout << (cursor && *cursor == i ? "> " : "  ")
              << (item.is_multi_selected ? "[x] " : (item.multi_select ? "[ ] " : "    "))
              << i << ". " << item.name << (item.has_children ? "/" : "");
    if (!item.description.empty()) std::cout << "  - " << item.description;
    std::cout << "\n";
  }
}

std::string Lower(std::string text) {
  for (char& c : text) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return text;
}

// Resolves an index or a case-insensitive name in the current listing.
// Empty argument means the cursor.
std::optional<ItemView> ResolveItem(Session& session, const std::string& arg) {
  std::vector<ItemView> items = session.CurrentItems();
  if (arg.empty()) {
    std::optional<size_t> cursor = session.SelectedIndex();
    if (cursor && *cursor < items.size()) return items[*cursor];
    return std::nullopt;
  }
  bool numeric = arg.size() < 10;
  for (char c : arg) {
    if (!std::isdigit(static_cast<unsigned char>(c))) numeric = false;
  }
  if (numeric) {
    size_t index = std::stoul(arg);
    if (index < items.size()) return items[index];
    return std::nullopt;
  }
  for (const auto& item : items) {
    if (Lower(item.name) == Lower(arg)) return item;
  }
  return std::nullopt;
}

void PrintFailure(const SessionResult& result) {
  std::cout << "error: " << toolshed::session::SessionErrorToString(result.error);
  if (!result.message.empty()) std::cout << ": " << result.message;
  std::cout << "\n";
}

// =============================================================================
// Shell
// =============================================================================
class Shell {
 public:
  Shell(Session& session, const toolshed::app::AppConfig& config)
      : session_(session), config_(config) {}

  int Run() {
    SessionResult loaded = session_.EnsureLoaded();
    if (!loaded.success) {
      std::cerr << "Cannot load catalog from " << config_.catalog_dir << ": "
                << loaded.message << "\n";
      return 1;
    }

    std::cout << "toolshed: type 'help' for commands\n";
    PrintListing(session_);
    Prompt();

    bool quitting = false;
    while (!g_termination_requested.load(std::memory_order_acquire)) {
      DrainResults();
      if (quitting) {
        if (!session_.IsExecuting()) break;
        // Input typed while draining is discarded; Next() doubles as the tick wait.
        std::string discarded;
        if (reader_.Next(&discarded, config_.tick_ms) == LineReader::Status::kEof) {
          usleep(static_cast<useconds_t>(config_.tick_ms) * 1000);
        }
        continue;
      }

      std::string line;
      LineReader::Status status = reader_.Next(&line, config_.tick_ms);
      if (status == LineReader::Status::kTimeout ||
          status == LineReader::Status::kInterrupted) {
        continue;
      }
      if (status == LineReader::Status::kEof) {
        quitting = true;
        continue;
      }
      if (!Dispatch(line)) {
        quitting = true;
        if (session_.IsExecuting()) std::cout << "waiting for running commands...\n";
        continue;
      }
      Prompt();
    }
    DrainResults();
    return 0;
  }

 private:
  void Prompt() {
    std::cout << (session_.IsExecuting() ? "toolshed (running)> " : "toolshed> ") << std::flush;
  }

  void DrainResults() {
    bool printed = false;
    while (auto result = session_.PollResult()) {
      PrintResult(*result);
      printed = true;
    }
    if (printed) Prompt();
  }

  bool Confirm(const std::string& what) {
    if (config_.skip_confirmation) return true;
    std::cout << "Run " << what << "? [y/N] " << std::flush;
    std::string answer;
    while (true) {
      LineReader::Status status = reader_.Next(&answer, config_.tick_ms);
      if (status == LineReader::Status::kLine) break;
      if (status == LineReader::Status::kEof) return false;
      if (g_termination_requested.load(std::memory_order_acquire)) return false;
      DrainResults();
    }
    answer = Lower(answer);
    return answer == "y" || answer == "yes";
  }

  // Returns false when the user asked to quit.
  bool Dispatch(const std::string& line) {
    std::istringstream in(line);
    std::string command;
    in >> command;
    std::string arg;
    std::getline(in >> std::ws, arg);

    if (command.empty()) {
      return true;
    } else if (command == "quit" || command == "exit" || command == "q") {
      return false;
    } else if (command == "help" || command == "?") {
      PrintHelp();
    } else if (command == "ls") {
      PrintListing(session_);
    } else if (command == "cd") {
      if (arg == "..") {
        session_.GoBack();
      } else {
        std::optional<ItemView> item = ResolveItem(session_, arg);
        if (!item) {
          std::cout << "no such entry: " << arg << "\n";
          return true;
        }
        SessionResult result = session_.Enter(item->id);
        if (!result.success) PrintFailure(result);
      }
      PrintListing(session_);
    } else if (command == "back") {
      if (!session_.GoBack()) std::cout << "already at the top\n";
      PrintListing(session_);
    } else if (command == "tab") {
      if (arg.empty()) {
        for (const auto& name : session_.ListCategories()) {
          std::cout << (name == session_.CurrentCategory() ? "* " : "  ") << name << "\n";
        }
      } else {
        SessionResult result = session_.SwitchCategory(arg);
        if (!result.success) {
          PrintFailure(result);
        } else {
          PrintListing(session_);
        }
      }
    } else if (command == "search") {
      session_.SetSearch(arg);
      PrintListing(session_);
    } else if (command == "select") {
      std::optional<ItemView> item = ResolveItem(session_, arg);
      std::vector<ItemView> items = session_.CurrentItems();
      for (size_t i = 0; item && i < items.size(); ++i) {
        if (items[i].id == item->id) session_.Select(i);
      }
      PrintListing(session_);
    } else if (command == "mark") {
      std::optional<ItemView> item = ResolveItem(session_, arg);
      if (!item) {
        std::cout << "no such entry: " << arg << "\n";
        return true;
      }
      SessionResult result = session_.ToggleSelection(item->id);
      if (!result.success) {
        PrintFailure(result);
      } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
      }
      PrintListing(session_);
    } else if (command == "run") {
      std::optional<ItemView> item = ResolveItem(session_, arg);
      if (!item) {
        std::cout << "no such entry: " << arg << "\n";
        return true;
      }
      if (!item->is_executable) {
        std::cout << item->name << " is a directory\n";
        return true;
      }
      if (!Confirm(item->name)) return true;
      SessionResult result = session_.Execute(item->id);
      if (!result.success) {
        PrintFailure(result);
      } else {
        std::cout << "started #" << result.sequence << " " << item->name << "\n";
      }
    } else if (command == "run-marked") {
      if (session_.SelectionSize() == 0) {
        std::cout << "nothing marked\n";
        return true;
      }
      std::ostringstream what;
      what << session_.SelectionSize() << " marked entries";
      if (!Confirm(what.str())) return true;
      size_t submitted = session_.ExecuteSelected();
      std::cout << "started " << submitted << " commands\n";
    } else if (command == "preview") {
      std::optional<ItemView> item = ResolveItem(session_, arg);
      if (!item) {
        std::cout << "no such entry: " << arg << "\n";
        return true;
      }
      std::string text;
      SessionResult result = session_.Preview(item->id, &text);
      if (!result.success) {
        PrintFailure(result);
      } else {
        std::cout << text << "\n";
      }
    } else if (command == "refresh") {
      SessionResult result = session_.RefreshCatalog();
      if (!result.success) PrintFailure(result);
      PrintListing(session_);
    } else if (command == "info") {
      toolshed::app::SystemInfo info = toolshed::app::CollectSystemInfo();
      std::cout << "System:       " << info.system << "\n"
                << "Distribution: " << info.distribution << "\n"
                << "Architecture: " << info.architecture << "\n";
    } else {
      std::cout << "unknown command: " << command << " (try 'help')\n";
    }
    return true;
  }

  void PrintHelp() {
    std::cout << "  ls                  list the current location\n"
              << "  cd N|NAME|..        enter a group\n"
              << "  back                go back one level\n"
              << "  tab [NAME]          list categories or switch\n"
              << "  search [TEXT]       filter entries (empty clears)\n"
              << "  select N            move the cursor\n"
              << "  mark N              toggle multi-selection\n"
              << "  run [N]             run an entry (default: cursor)\n"
              << "  run-marked          run all marked entries\n"
              << "  preview [N]         show what an entry runs\n"
              << "  refresh             reload the catalog\n"
              << "  info                show host information\n"
              << "  quit                exit\n";
  }

  Session& session_;
  const toolshed::app::AppConfig& config_;
  LineReader reader_;
};

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  toolshed::app::AppConfig config = toolshed::app::ParseArgs(argc, argv);

  if (config.help) {
    toolshed::app::PrintUsage(argv[0], std::cout);
    return 0;
  }

  if (!config.valid) {
    std::cerr << "Error: " << config.error << "\n\n";
    toolshed::app::PrintUsage(argv[0], std::cerr);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  // Log lines would interleave with the listing.
  Logger::SetQuiet(true);
  toolshed::app::WarnIfRoot(config.bypass_root);

  auto provider =
      std::make_shared<toolshed::catalog::ScriptDirectoryProvider>(config.catalog_dir);
  auto cache = std::make_shared<toolshed::catalog::CatalogCache>(provider);
  auto coordinator = std::make_shared<toolshed::execution::ExecutionCoordinator>(
      std::make_shared<toolshed::execution::ProcessCommandRunner>());

  Session session(cache, coordinator, config.Validate());
  Shell shell(session, config);
  return shell.Run();
}
