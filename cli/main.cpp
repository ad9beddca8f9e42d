/**
 * @file main.cpp
 * @brief scpicore-sim: Linux runner that serves a simulated instrument over stdio, a TTY or TCP.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) layered over a JSON config file (nlohmann/json).
 *  - Build the command interface, error queue and interpreter.
 *  - Open the selected transport and run the buffered processing loop on it.
 *  - Log one-line key=value records to stderr (status=ok|error ...).
 *
 * Notes:
 *  - Config file: $XDG_CONFIG_HOME/scpicore/sim.json (or ~/.config/scpicore/sim.json).
 *    Keys: identity, transport, device, baud, port, voltage_min, voltage_max.
 *  - CLI options override the file. --write-config persists the merged result.
 *  - TCP serves one client at a time; the error queue survives reconnects.
 */

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h> // STDIN_FILENO, STDOUT_FILENO

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "scpicore/adapter/adapter_posix.hpp"
#include "scpicore/error_queue.hpp"
#include "scpicore/interpreter.hpp"
#include "scpicore/processor.hpp"
#include "bench_supply.hpp"
#include "serial_io.hpp"
#include "socket_io.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace scpicore;

// ---------- config ----------

struct SimConfig {
  std::string identity{"SCPICORE,BenchSupply-Sim,0,1.0"};
  std::string transport{"stdio"};   // stdio|serial|tcp
  std::string device{"/dev/ttyGS0"};
  int         baud{115200};
  uint16_t    port{5025};
  double      voltage_min{0.0};
  double      voltage_max{10.0};
};

static void to_json(json& j, const SimConfig& c) {
  j = json{{"identity", c.identity}, {"transport", c.transport}, {"device", c.device},
           {"baud", c.baud}, {"port", c.port},
           {"voltage_min", c.voltage_min}, {"voltage_max", c.voltage_max}};
}

// Missing keys keep their defaults.
static void from_json(const json& j, SimConfig& c) {
  c.identity    = j.value("identity", c.identity);
  c.transport   = j.value("transport", c.transport);
  c.device      = j.value("device", c.device);
  c.baud        = j.value("baud", c.baud);
  c.port        = j.value("port", c.port);
  c.voltage_min = j.value("voltage_min", c.voltage_min);
  c.voltage_max = j.value("voltage_max", c.voltage_max);
}

static fs::path default_config_path() {
  const char* xdg  = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home ? home : ".") / ".config";
  return base / "scpicore" / "sim.json";
}

// Returns false (with a reason) only for a file that exists but cannot be used.
static bool read_config(const fs::path& p, SimConfig& cfg, std::string& reason) {
  std::error_code ec;
  if (!fs::exists(p, ec)) return true;
  std::ifstream in(p);
  if (!in) { reason = "config_unreadable"; return false; }
  try {
    json j;
    in >> j;
    if (!j.is_object()) { reason = "config_not_object"; return false; }
    from_json(j, cfg);
  } catch (const json::exception& e) {
    reason = std::string("config_invalid detail=\"") + e.what() + "\"";
    return false;
  }
  return true;
}

static bool atomic_write_json(const fs::path& p, const json& j) {
  std::error_code ec;
  fs::create_directories(p.parent_path(), ec);
  if (ec) return false;
  auto tmp = p; tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << j.dump(2) << "\n";
    if (!out.flush()) return false;
  }
  fs::rename(tmp, p, ec);
  return !ec;
}

// ---------- logging ----------

struct Log {
  bool quiet{false};
  void info(const std::string& kv) const { if (!quiet) std::cerr << "status=ok " << kv << "\n"; }
  void error(const std::string& kv) const { std::cerr << "status=error " << kv << "\n"; }
};

/// Error queue that also logs every entry.
class LoggingErrorQueue : public StaticErrorQueue<16> {
public:
  explicit LoggingErrorQueue(const Log& log) : log_(log) {}

  void handle_error(const Error& error) override {
    if (!log_.quiet) {
      std::cerr << "status=scpi_error code=" << error.number()
                << " message=\"" << error.message() << "\"\n";
    }
    push_error(error);
  }

private:
  const Log& log_;
};

// ---------- serving ----------

using Loop = Processor<1024, 1024>;

static int serve(Loop& loop, adapter::Adapter& io, const Log& log) {
  const adapter::IoStatus st = loop.process(io);
  loop.reset();
  if (st == adapter::IoStatus::Closed) {
    log.info(std::string("event=closed transport=") + io.name());
    return 0;
  }
  log.error(std::string("reason=io_failed transport=") + io.name() + " io=" + adapter::to_string(st));
  return 1;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_identity;
  std::string opt_transport;
  std::string opt_device;
  int         opt_baud = 0;
  uint16_t    opt_port = 0;
  bool        opt_write_config = false;
  bool        opt_quiet = false;

  CLI::App app{"scpicore-sim: simulated SCPI bench supply"};
  app.add_option("--config", opt_config, "Config file (default: XDG config dir)");
  app.add_option("--identity", opt_identity, "*IDN? response");
  app.add_option("--transport", opt_transport, "stdio|serial|tcp")
     ->check(CLI::IsMember({"stdio", "serial", "tcp"}));
  app.add_option("--device", opt_device, "Serial device for --transport serial");
  app.add_option("--baud", opt_baud, "Serial baud rate");
  app.add_option("--port", opt_port, "TCP port for --transport tcp");
  app.add_flag("--write-config", opt_write_config, "Persist the effective config and continue");
  app.add_flag("-q,--quiet", opt_quiet, "Only log errors");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  Log log;
  log.quiet = opt_quiet;

  // A peer closing mid-write must surface as EPIPE, not kill the process.
  if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
    log.error("reason=signal_setup_failed");
    return 1;
  }

  const fs::path config_path = opt_config.empty() ? default_config_path() : fs::path(opt_config);
  SimConfig cfg;
  std::string reason;
  if (!read_config(config_path, cfg, reason)) {
    log.error("reason=" + reason + " path=" + config_path.string());
    return 2;
  }
  if (!opt_identity.empty())  cfg.identity  = opt_identity;
  if (!opt_transport.empty()) cfg.transport = opt_transport;
  if (!opt_device.empty())    cfg.device    = opt_device;
  if (opt_baud > 0)           cfg.baud      = opt_baud;
  if (opt_port > 0)           cfg.port      = opt_port;

  if (cfg.voltage_min > cfg.voltage_max) {
    log.error("reason=bad_voltage_limits");
    return 2;
  }

  if (opt_write_config) {
    json j = cfg;
    if (!atomic_write_json(config_path, j)) {
      log.error("reason=config_write_failed path=" + config_path.string());
      return 2;
    }
    log.info("event=config_written path=" + config_path.string());
  }

  // Instrument
  LoggingErrorQueue errors(log);
  sim::BenchSupply supply(cfg.identity, sim::SupplyLimits{cfg.voltage_min, cfg.voltage_max}, errors);
  sim::SimInterface iface;
  const BuildResult built = supply.install(iface);
  if (built != BuildResult::Ok) {
    log.error(std::string("reason=register_failed detail=") + to_string(built));
    return 3;
  }
  Interpreter interp(iface, errors);
  Loop loop(interp);

  log.info("event=ready commands=" + std::to_string(iface.command_count()) +
           " nodes=" + std::to_string(iface.node_count()) + " transport=" + cfg.transport);

  if (cfg.transport == "stdio") {
    adapter::FdAdapter io(STDIN_FILENO, STDOUT_FILENO, "stdio");
    return serve(loop, io, log);
  }

  if (cfg.transport == "serial") {
    int fd = open_serial(cfg.device, cfg.baud);
    if (fd < 0) {
      log.error("reason=open_failed dev=" + cfg.device);
      return 4;
    }
    adapter::FdAdapter io(fd, fd, "serial");
    const int rc = serve(loop, io, log);
    close_serial(fd);
    return rc;
  }

  // tcp
  int server = listen_tcp(cfg.port);
  if (server < 0) {
    log.error("reason=listen_failed port=" + std::to_string(cfg.port));
    return 4;
  }
  log.info("event=listening port=" + std::to_string(cfg.port));
  for (;;) {
    int client = accept_client(server);
    if (client < 0) {
      log.error("reason=accept_failed");
      close_socket(server);
      return 4;
    }
    log.info("event=client_connected");
    adapter::FdAdapter io(client, client, "tcp");
    const int rc = serve(loop, io, log);
    close_socket(client);
    if (rc != 0) log.info("event=client_dropped");
  }
}
