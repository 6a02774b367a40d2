#include "gitusr/git_config.hpp"

#include "gitusr/consts.hpp"
#include "gitusr/errors.hpp"
#include "gitusr/util.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <cstdlib>
#include <future>
#include <utility>

namespace bp = boost::process;

namespace {

std::string default_executable() {
  const char *v = std::getenv(std::string(gitusr::consts::kEnvGit).c_str());
  return (v && *v) ? std::string(v) : std::string(gitusr::consts::kGitExecutable);
}

} // namespace

namespace gitusr {

std::string_view scope_flag(Scope scope) {
  return scope == Scope::Global ? "--global" : "--local";
}

GitConfig::GitConfig() : GitConfig(std::filesystem::current_path(), default_executable()) {}

GitConfig::GitConfig(std::filesystem::path work_dir, std::string executable)
    : work_dir_(std::move(work_dir)), executable_(std::move(executable)) {}

GitConfig::RunResult GitConfig::run(const std::vector<std::string> &args) const {
  boost::filesystem::path exe;
  if (executable_.find('/') != std::string::npos || executable_.find('\\') != std::string::npos)
    exe = executable_;
  else
    exe = bp::search_path(executable_);
  if (exe.empty())
    throw ExternalToolError("'" + executable_ + "' not found in PATH");

  try {
    // drain stdout and stderr concurrently
    boost::asio::io_context ios;
    std::future<std::string> out;
    std::future<std::string> err;
    bp::child c(exe, bp::args(args), bp::start_dir(work_dir_.string()), bp::std_in < bp::null,
                bp::std_out > out, bp::std_err > err, ios);
    ios.run();
    c.wait();
    return RunResult{.status = c.exit_code(), .out = out.get(), .err = err.get()};
  } catch (const bp::process_error &e) {
    throw ExternalToolError("failed to run " + executable_ + ": " + e.what());
  }
}

std::optional<std::string> GitConfig::get(std::string_view key,
                                          std::optional<Scope> scope) const {
  std::vector<std::string> args{"config"};
  if (scope)
    args.emplace_back(scope_flag(*scope));
  args.emplace_back(key);

  auto r = run(args);
  // git exits 1 for an unset key; outside a repository --local fails with 128
  if (r.status != 0)
    return std::nullopt;
  strutil::rstrip_newlines(r.out);
  return r.out;
}

void GitConfig::set(std::string_view key, std::string_view value, Scope scope) {
  const auto r = run({"config", std::string(scope_flag(scope)), std::string(key),
                      std::string(value)});
  if (r.status != 0) {
    std::string msg = "failed to set " + std::string(key) + ": " + executable_ +
                      " exited with status " + std::to_string(r.status);
    if (auto detail = strutil::trim(r.err); !detail.empty())
      msg += ": " + detail;
    throw ExternalToolError(msg);
  }
}

Identity read_identity(const ConfigBackend &backend, std::optional<Scope> scope) {
  Identity id{};
  if (auto v = backend.get(consts::kKeyUserName, scope))
    id.name = *v;
  if (auto v = backend.get(consts::kKeyUserEmail, scope))
    id.email = *v;
  return id;
}

void write_identity(ConfigBackend &backend, const Identity &id, Scope scope) {
  backend.set(consts::kKeyUserName, id.name, scope);
  backend.set(consts::kKeyUserEmail, id.email, scope);
}

} // namespace gitusr
