#include "api/device_api.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"

namespace sle_agent::api {
namespace {

constexpr int kCurlNotFound = 127;
constexpr std::chrono::seconds kCredentialCheckTimeout{10};

struct HttpResponse {
  int status_code{0};
  std::string body{};
};

std::string errno_message(const char* what) { return std::string(what) + ": " + std::strerror(errno); }

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Runs the system curl binary in a child process. The Authorization header is
// passed on stdin so the token never appears in the process table.
HttpResponse run_curl(const std::string& method, const std::string& url, const std::string& auth_header,
                      const std::string& body, const std::chrono::seconds timeout) {
  int stdin_fds[2]{-1, -1};
  int stdout_fds[2]{-1, -1};
  if (pipe(stdin_fds) != 0) {
    throw core::TransportError(errno_message("pipe failed"));
  }
  if (pipe(stdout_fds) != 0) {
    const std::string message = errno_message("pipe failed");
    close_fd(stdin_fds[0]);
    close_fd(stdin_fds[1]);
    throw core::TransportError(message);
  }

  const std::string max_time = std::to_string(timeout.count());
  std::vector<const char*> argv = {"curl",     "--silent",  "--show-error", "--request",
                                   method.c_str(), "--header", "@-",        "--header",
                                   "Content-Type: application/json",        "--max-time",
                                   max_time.c_str(), "--write-out", "\n%{http_code}"};
  if (!body.empty()) {
    argv.push_back("--data");
    argv.push_back(body.c_str());
  }
  argv.push_back(url.c_str());
  argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    const std::string message = errno_message("fork failed");
    close_fd(stdin_fds[0]);
    close_fd(stdin_fds[1]);
    close_fd(stdout_fds[0]);
    close_fd(stdout_fds[1]);
    throw core::TransportError(message);
  }

  if (pid == 0) {
    dup2(stdin_fds[0], STDIN_FILENO);
    dup2(stdout_fds[1], STDOUT_FILENO);
    close(stdin_fds[0]);
    close(stdin_fds[1]);
    close(stdout_fds[0]);
    close(stdout_fds[1]);
    execvp("curl", const_cast<char* const*>(argv.data()));
    _exit(kCurlNotFound);
  }

  close_fd(stdin_fds[0]);
  close_fd(stdout_fds[1]);

  const std::string header = auth_header + "\n";
  std::size_t written = 0;
  while (written < header.size()) {
    const ssize_t n = ::write(stdin_fds[1], header.data() + written, header.size() - written);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    written += static_cast<std::size_t>(n);
  }
  close_fd(stdin_fds[1]);

  std::string output;
  char chunk[4096]{};
  while (true) {
    const ssize_t bytes_read = ::read(stdout_fds[0], chunk, sizeof(chunk));
    if (bytes_read > 0) {
      output.append(chunk, static_cast<std::size_t>(bytes_read));
      continue;
    }
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  close_fd(stdout_fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw core::TransportError(errno_message("waitpid failed"));
    }
  }

  if (!WIFEXITED(status)) {
    throw core::TransportError("curl terminated abnormally for " + method + " " + url);
  }
  const int exit_code = WEXITSTATUS(status);
  if (exit_code == kCurlNotFound) {
    throw core::TransportError("curl binary not available");
  }
  if (exit_code != 0) {
    throw core::TransportError("curl exited with code " + std::to_string(exit_code) + " for " + method + " " + url);
  }

  const auto split = output.rfind('\n');
  if (split == std::string::npos) {
    throw core::TransportError("missing HTTP status from " + method + " " + url);
  }

  HttpResponse response{};
  try {
    response.status_code = std::stoi(output.substr(split + 1));
  } catch (const std::logic_error&) {
    throw core::TransportError("malformed HTTP status from " + method + " " + url);
  }
  response.body = output.substr(0, split);
  return response;
}

std::string string_field(const nlohmann::json& document, const char* key, const std::string& fallback) {
  const auto it = document.find(key);
  if (it != document.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return fallback;
}

double number_field(const nlohmann::json& document, const char* key, const double fallback) {
  const auto it = document.find(key);
  if (it != document.end() && it->is_number()) {
    return it->get<double>();
  }
  return fallback;
}

class MistApi final : public DeviceApi {
 public:
  MistApi(core::Credentials credentials, const std::chrono::seconds timeout)
      : credentials_(std::move(credentials)), timeout_(timeout) {}

  model::ap_stats get_ap_stats(const std::string& ap_id) override {
    return parse_ap_stats(get_json(site_url(credentials_.site_id) + "/stats/aps/" + ap_id));
  }

  model::ap_details get_ap_details(const std::string& ap_id) override {
    return parse_ap_details(get_json(site_url(credentials_.site_id) + "/devices/" + ap_id));
  }

  nlohmann::json reboot_ap(const std::string& ap_id) override {
    std::cerr << "[mist] issuing reboot command to AP " << ap_id << '\n';
    (void)request("POST", site_url(credentials_.site_id) + "/devices/" + ap_id + "/restart", "{}", timeout_);
    return nlohmann::json{{"status", "reboot_issued"}, {"ap_id", ap_id}};
  }

  nlohmann::json get_sle_metrics(const std::string& site_id) override {
    return get_json(site_url(site_id.empty() ? credentials_.site_id : site_id) + "/sle");
  }

  bool validate_credentials() override {
    const auto response = run_curl("GET", credentials_.api_base + "/self", auth_header(), "",
                                   std::min(timeout_, kCredentialCheckTimeout));
    if (response.status_code == 401 || response.status_code == 403) {
      throw core::AuthError("Mist API rejected credentials (HTTP " + std::to_string(response.status_code) + ")");
    }
    if (response.status_code >= 400) {
      throw core::TransportError("credential check failed with HTTP " + std::to_string(response.status_code));
    }
    std::cerr << "[mist] API credentials validated\n";
    return true;
  }

 private:
  std::string site_url(const std::string& site_id) const { return credentials_.api_base + "/sites/" + site_id; }

  std::string auth_header() const { return "Authorization: Token " + credentials_.api_token; }

  HttpResponse request(const std::string& method, const std::string& url, const std::string& body,
                       const std::chrono::seconds timeout) const {
    auto response = run_curl(method, url, auth_header(), body, timeout);
    if (response.status_code < 200 || response.status_code >= 300) {
      std::cerr << "[mist] " << method << ' ' << url << " failed with HTTP " << response.status_code << '\n';
      throw core::TransportError("HTTP " + std::to_string(response.status_code) + " from " + method + " " + url);
    }
    return response;
  }

  nlohmann::json get_json(const std::string& url) const {
    const auto response = request("GET", url, "", timeout_);
    try {
      return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& ex) {
      throw core::TransportError("malformed JSON from " + url + ": " + ex.what());
    }
  }

  core::Credentials credentials_;
  std::chrono::seconds timeout_;
};

}  // namespace

model::ap_stats parse_ap_stats(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw core::TransportError("AP stats payload must be a JSON object");
  }

  model::ap_stats stats{};
  stats.status = string_field(document, "status", stats.status);
  stats.uptime_s = static_cast<std::int64_t>(number_field(document, "uptime", 0.0));
  stats.num_clients = static_cast<std::int64_t>(number_field(document, "num_clients", 0.0));
  stats.cpu_util = number_field(document, "cpu_util", 0.0);
  stats.mem_util = number_field(document, "mem_util", 0.0);
  stats.ip = string_field(document, "ip", stats.ip);
  stats.version = string_field(document, "version", stats.version);
  return stats;
}

model::ap_details parse_ap_details(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw core::TransportError("AP details payload must be a JSON object");
  }

  model::ap_details details{};
  details.model = string_field(document, "model", details.model);
  details.name = string_field(document, "name", details.name);
  details.raw = document;
  return details;
}

std::unique_ptr<DeviceApi> make_mist_api(core::Credentials credentials, const std::chrono::seconds timeout) {
  return std::make_unique<MistApi>(std::move(credentials), timeout);
}

}  // namespace sle_agent::api
