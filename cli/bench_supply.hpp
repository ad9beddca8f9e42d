/**
 * @file bench_supply.hpp
 * @brief Simulated single-channel bench power supply served by scpicore-sim.
 *
 * Command set:
 *  - `*IDN?`                          identity string (quoted)
 *  - `*RST`                           setpoint 0 V, output off, block cleared
 *  - `SOURce:VOLTage[:LEVel] <v>`     setpoint, DataOutOfRange outside the limits
 *  - `SOURce:VOLTage[:LEVel]?`        setpoint
 *  - `MEASure:VOLTage[:DC]?`          setpoint when the output is on, else 0
 *  - `OUTPut[:STATe] <bool>` / `?`    output relay
 *  - `MATH:MULTiply? <a>,<b>`         a*b as a double
 *  - `DATA:BLOCk <block>` / `?`       stores and returns an arbitrary block
 *  - plus SYSTem:ERRor[:NEXT]?, SYSTem:ERRor:COUNt?, SYSTem:VERSion?
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "scpicore/error_queue.hpp"
#include "scpicore/interface.hpp"
#include "scpicore/standard_commands.hpp"

namespace scpicore::sim {

using SimInterface = Interface<128, 32>;

struct SupplyLimits {
  double voltage_min{0.0};
  double voltage_max{10.0};
};

class BenchSupply {
public:
  BenchSupply(std::string identity, SupplyLimits limits, ErrorQueue& errors);

  BenchSupply(const BenchSupply&) = delete;
  BenchSupply& operator=(const BenchSupply&) = delete;

  /// Register every command; logs nothing, returns the first failure.
  BuildResult install(SimInterface& iface);

  Error idn(const Arguments& args, Write& out);
  Error rst(const Arguments& args, Write& out);
  Error set_voltage(const Arguments& args, Write& out);
  Error voltage(const Arguments& args, Write& out);
  Error measure_voltage(const Arguments& args, Write& out);
  Error set_output(const Arguments& args, Write& out);
  Error output(const Arguments& args, Write& out);
  Error multiply(const Arguments& args, Write& out);
  Error set_block(const Arguments& args, Write& out);
  Error block(const Arguments& args, Write& out);

  double setpoint() const { return setpoint_; }
  bool output_enabled() const { return output_; }

private:
  std::string          identity_;
  SupplyLimits         limits_;
  StandardCommands     standard_;
  double               setpoint_{0.0};
  bool                 output_{false};
  std::vector<uint8_t> block_;
};

} // namespace scpicore::sim
