#include "conductor/cli/commands.hpp"

#include "conductor/common/frontmatter.hpp"
#include "conductor/common/fs.hpp"
#include "conductor/config/config.hpp"
#include "conductor/observability/factory.hpp"
#include "conductor/observability/global.hpp"
#include "conductor/prompt/agent_profile.hpp"
#include "conductor/prompt/resolver.hpp"
#include "conductor/session/bootstrap.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace conductor::cli {

namespace {

std::string version_string() {
#ifdef CONDUCTOR_VERSION
  return std::string("conductor ") + CONDUCTOR_VERSION;
#else
  return "conductor 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

/// Every occurrence of a repeatable option, in order.
std::vector<std::string> take_repeated(std::vector<std::string> &args,
                                       const std::string &long_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, "", value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

struct GlobalOptions {
  std::string root;
};

bool apply_global_options(std::vector<std::string> &args, GlobalOptions &options,
                          std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    const bool is_config = args[i] == "--config";
    const bool is_root = args[i] == "--root";
    if (is_config || is_root) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + args[i];
        return false;
      }
      if (is_config) {
        config::set_config_path_override(args[i + 1]);
      } else {
        options.root = args[i + 1];
      }
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

common::Result<config::Config> load_effective_config(const GlobalOptions &options) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  if (!options.root.empty()) {
    loaded.value().root = options.root;
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));
  return loaded;
}

common::Result<std::unique_ptr<session::Orchestrator>> open_orchestrator(const GlobalOptions &options) {
  auto cfg = load_effective_config(options);
  if (!cfg.ok()) {
    return common::Result<std::unique_ptr<session::Orchestrator>>::failure(cfg.status());
  }
  return session::build_orchestrator(cfg.value());
}

int usage_error(const std::string &usage) {
  std::cerr << "usage: conductor " << usage << "\n";
  return 2;
}

int run_route(std::vector<std::string> args, const GlobalOptions &options) {
  const auto history = take_repeated(args, "--history");
  if (args.empty()) {
    return usage_error("route <query> [--history LINE]...");
  }
  auto orchestrator = open_orchestrator(options);
  if (!orchestrator.ok()) {
    std::cerr << orchestrator.error() << "\n";
    return 1;
  }
  const auto decision = orchestrator.value()->route(join_tokens(args), history);
  std::cout << session::decision_to_json(decision) << "\n";
  return 0;
}

int run_process(std::vector<std::string> args, const GlobalOptions &options) {
  const auto history = take_repeated(args, "--history");
  const bool execute = take_flag(args, "--execute");
  if (args.empty()) {
    return usage_error("process <query> [--execute] [--history LINE]...");
  }
  auto orchestrator = open_orchestrator(options);
  if (!orchestrator.ok()) {
    std::cerr << orchestrator.error() << "\n";
    return 1;
  }
  auto result = orchestrator.value()->process(join_tokens(args), history, execute);
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 1;
  }
  std::cout << result.value().to_json() << "\n";
  return 0;
}

int run_context(std::vector<std::string> args, const GlobalOptions &options) {
  const auto history = take_repeated(args, "--history");
  std::string reasoning = "Selected by Cursor Model";
  take_option(args, "--reasoning", "", reasoning);
  if (args.size() < 2) {
    return usage_error("context <agent> <query> [--reasoning TEXT] [--history LINE]...");
  }
  auto orchestrator = open_orchestrator(options);
  if (!orchestrator.ok()) {
    std::cerr << orchestrator.error() << "\n";
    return 1;
  }
  const auto response =
      orchestrator.value()->agent_context(args[0], join_tokens(args, 1), reasoning, history);
  std::cout << response.to_json() << "\n";
  return response.ok() ? 0 : 1;
}

int run_dynamic(std::vector<std::string> args, const GlobalOptions &options) {
  const auto history = take_repeated(args, "--history");
  const auto preferred = take_repeated(args, "--skill");
  if (args.size() < 2) {
    return usage_error("dynamic <agent> <query> [--skill ID]... [--history LINE]...");
  }
  auto orchestrator = open_orchestrator(options);
  if (!orchestrator.ok()) {
    std::cerr << orchestrator.error() << "\n";
    return 1;
  }
  std::cout << orchestrator.value()->dynamic_context(args[0], join_tokens(args, 1), history,
                                                     preferred)
            << "\n";
  return 0;
}

int run_info(std::vector<std::string> args, const GlobalOptions &options) {
  const auto history = take_repeated(args, "--history");
  if (args.empty()) {
    return usage_error("info <query> [--history LINE]...");
  }
  auto orchestrator = open_orchestrator(options);
  if (!orchestrator.ok()) {
    std::cerr << orchestrator.error() << "\n";
    return 1;
  }
  const auto response = orchestrator.value()->routing_info(join_tokens(args), history);
  std::cout << response.to_json() << "\n";
  return response.status == "ERROR" ? 1 : 0;
}

int run_resolve(std::vector<std::string> args, const GlobalOptions &options) {
  if (args.size() != 1) {
    return usage_error("resolve <agent>");
  }
  auto cfg = load_effective_config(options);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const prompt::PromptResolver resolver(config::resolve_root(cfg.value()));
  try {
    std::cout << resolver.load_agent_prompt(args[0]) << "\n";
  } catch (const prompt::SecurityError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const prompt::NotFoundError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}

int run_implants(std::vector<std::string> args, const GlobalOptions &options) {
  std::string role;
  std::string limit_raw = "5";
  const bool has_role = take_option(args, "--role", "", role);
  take_option(args, "--limit", "-n", limit_raw);
  if (args.empty()) {
    return usage_error("implants <query> [--role AGENT] [--limit N]");
  }
  std::size_t limit = 0;
  const auto parsed = std::from_chars(limit_raw.data(), limit_raw.data() + limit_raw.size(), limit);
  if (parsed.ec != std::errc() || parsed.ptr != limit_raw.data() + limit_raw.size() || limit == 0) {
    std::cerr << "invalid limit: " << limit_raw << "\n";
    return 1;
  }
  auto orchestrator = open_orchestrator(options);
  if (!orchestrator.ok()) {
    std::cerr << orchestrator.error() << "\n";
    return 1;
  }
  std::cout << orchestrator.value()->relevant_implants(
                   join_tokens(args), has_role ? std::optional<std::string>(role) : std::nullopt,
                   limit)
            << "\n";
  return 0;
}

int run_strategy(std::vector<std::string> args, const GlobalOptions &options) {
  if (args.size() != 1) {
    return usage_error("strategy <debugging|analysis|creative|planning>");
  }
  auto orchestrator = open_orchestrator(options);
  if (!orchestrator.ok()) {
    std::cerr << orchestrator.error() << "\n";
    return 1;
  }
  std::cout << orchestrator.value()->reasoning_strategy(args[0]) << "\n";
  return 0;
}

int run_agents(const GlobalOptions &options) {
  auto cfg = load_effective_config(options);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto root = config::resolve_root(cfg.value());
  const std::filesystem::path agents_dir(cfg.value().router.agents_directory);
  for (const auto &agent :
       prompt::scan_agents(agents_dir.is_absolute() ? agents_dir : root / agents_dir)) {
    std::cout << agent << "\n";
  }
  return 0;
}

/// Config checks followed by a schema check of every agent's frontmatter.
int run_validate(const GlobalOptions &options) {
  auto cfg = load_effective_config(options);
  if (!cfg.ok()) {
    std::cerr << "[FAIL] Config load: " << cfg.error() << "\n";
    return 1;
  }
  bool ok = true;
  auto config_check = config::validate_config(cfg.value());
  if (!config_check.ok()) {
    std::cout << "[FAIL] config: " << config_check.error() << "\n";
    ok = false;
  } else {
    for (const auto &warning : config_check.value()) {
      std::cout << "[WARN] config: " << warning << "\n";
    }
  }

  const auto root = config::resolve_root(cfg.value());
  const std::filesystem::path agents_dir(cfg.value().router.agents_directory);
  const auto agents_path = agents_dir.is_absolute() ? agents_dir : root / agents_dir;
  const auto agents = prompt::scan_agents(agents_path);
  if (agents.empty()) {
    std::cout << "[WARN] no agents found in " << agents_path.string() << "\n";
    return 1;
  }

  std::size_t valid = 0;
  for (const auto &agent : agents) {
    auto content = common::read_text_file(agents_path / agent / "system_prompt.mdc");
    if (!content.ok()) {
      std::cout << "[FAIL] " << agent << ": " << content.error() << "\n";
      ok = false;
      continue;
    }
    const auto split = common::split_frontmatter(content.value());
    if (!split.has_frontmatter) {
      std::cout << "[FAIL] " << agent << ": No valid frontmatter\n";
      ok = false;
      continue;
    }
    const auto report = prompt::validate_agent_profile(split.frontmatter);
    std::cout << (report.valid() ? "[ OK ] " : "[FAIL] ") << agent << "\n";
    for (const auto &error : report.errors) {
      std::cout << "       error: " << error << "\n";
    }
    for (const auto &warning : report.warnings) {
      std::cout << "       warning: " << warning << "\n";
    }
    if (report.valid()) {
      ++valid;
    } else {
      ok = false;
    }
  }
  std::cout << "Results: " << valid << "/" << agents.size() << " agents valid\n";
  return ok ? 0 : 1;
}

int run_reindex(const GlobalOptions &options) {
  auto orchestrator = open_orchestrator(options);
  if (!orchestrator.ok()) {
    std::cerr << orchestrator.error() << "\n";
    return 1;
  }
  auto counts = orchestrator.value()->reindex();
  if (!counts.ok()) {
    std::cerr << counts.error() << "\n";
    return 1;
  }
  std::cout << "Indexed " << counts.value().first << " skills and " << counts.value().second
            << " implants\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  conductor [--config PATH] [--root DIR] <command> [options]\n\n";
  std::cout << "ROUTING\n";
  std::cout << "  route <query>            Pick an agent (cache, then classifier)\n";
  std::cout << "  info <query>             Cache-only routing check\n";
  std::cout << "  process <query>          Compose the full system prompt [--execute]\n\n";
  std::cout << "PROMPTS\n";
  std::cout << "  context <agent> <query>  Enriched prompt for a chosen agent\n";
  std::cout << "  dynamic <agent> <query>  Skills and implants block only\n";
  std::cout << "  resolve <agent>          Expand an agent's system prompt\n";
  std::cout << "  implants <query>         Relevant implants [--role AGENT] [--limit N]\n";
  std::cout << "  strategy <task>          Implants for debugging|analysis|creative|planning\n\n";
  std::cout << "MAINTENANCE\n";
  std::cout << "  agents                   List known agents\n";
  std::cout << "  validate                 Check config and agent frontmatter\n";
  std::cout << "  reindex                  Re-index skills and implants\n";
  std::cout << "  config-path              Print the config file location\n";
  std::cout << "  version                  Show version\n\n";
  std::cout << "Most commands accept --history LINE (repeatable) for prior turns.\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  GlobalOptions options;
  std::string global_error;
  if (!apply_global_options(args, options, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "route") {
    return run_route(std::move(args), options);
  }
  if (subcommand == "process") {
    return run_process(std::move(args), options);
  }
  if (subcommand == "context") {
    return run_context(std::move(args), options);
  }
  if (subcommand == "dynamic") {
    return run_dynamic(std::move(args), options);
  }
  if (subcommand == "info") {
    return run_info(std::move(args), options);
  }
  if (subcommand == "resolve") {
    return run_resolve(std::move(args), options);
  }
  if (subcommand == "implants") {
    return run_implants(std::move(args), options);
  }
  if (subcommand == "strategy") {
    return run_strategy(std::move(args), options);
  }
  if (subcommand == "agents") {
    return run_agents(options);
  }
  if (subcommand == "validate") {
    return run_validate(options);
  }
  if (subcommand == "reindex") {
    return run_reindex(options);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace conductor::cli
