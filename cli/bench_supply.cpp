// -----------------------------------------------------------------------------
// bench_supply.cpp - handlers of the simulated power supply
// -----------------------------------------------------------------------------
#include "bench_supply.hpp"

#include <utility>

namespace scpicore::sim {

BenchSupply::BenchSupply(std::string identity, SupplyLimits limits, ErrorQueue& errors)
: identity_(std::move(identity)), limits_(limits), standard_(errors) {}

BuildResult BenchSupply::install(SimInterface& iface) {
  struct Entry { const char* path; uint8_t arity; Handler handler; };
  const Entry entries[] = {
    {"*IDN?",                    0, Handler::create<BenchSupply, &BenchSupply::idn>(*this)},
    {"*RST",                     0, Handler::create<BenchSupply, &BenchSupply::rst>(*this)},
    {"SOURce:VOLTage[:LEVel]",   1, Handler::create<BenchSupply, &BenchSupply::set_voltage>(*this)},
    {"SOURce:VOLTage[:LEVel]?",  0, Handler::create<BenchSupply, &BenchSupply::voltage>(*this)},
    {"MEASure:VOLTage[:DC]?",    0, Handler::create<BenchSupply, &BenchSupply::measure_voltage>(*this)},
    {"OUTPut[:STATe]",           1, Handler::create<BenchSupply, &BenchSupply::set_output>(*this)},
    {"OUTPut[:STATe]?",          0, Handler::create<BenchSupply, &BenchSupply::output>(*this)},
    {"MATH:MULTiply?",           2, Handler::create<BenchSupply, &BenchSupply::multiply>(*this)},
    {"DATA:BLOCk",               1, Handler::create<BenchSupply, &BenchSupply::set_block>(*this)},
    {"DATA:BLOCk?",              0, Handler::create<BenchSupply, &BenchSupply::block>(*this)},
  };

  for (const Entry& e : entries) {
    const BuildResult r = iface.add(e.path, e.arity, e.handler);
    if (r != BuildResult::Ok) return r;
  }
  return standard_.install(iface);
}

Error BenchSupply::idn(const Arguments&, Write& out) {
  return write_response(out, etl::string_view(identity_.data(), identity_.size()));
}

Error BenchSupply::rst(const Arguments&, Write&) {
  setpoint_ = 0.0;
  output_   = false;
  block_.clear();
  return Error();
}

Error BenchSupply::set_voltage(const Arguments& args, Write&) {
  double volts = 0.0;
  if (Error e = args.get(0, volts)) return e;
  if (volts < limits_.voltage_min || volts > limits_.voltage_max) return Error::Code::DataOutOfRange;
  setpoint_ = volts;
  return Error();
}

Error BenchSupply::voltage(const Arguments&, Write& out) {
  return write_response(out, setpoint_);
}

Error BenchSupply::measure_voltage(const Arguments&, Write& out) {
  return write_response(out, output_ ? setpoint_ : 0.0);
}

Error BenchSupply::set_output(const Arguments& args, Write&) {
  return args.get(0, output_);
}

Error BenchSupply::output(const Arguments&, Write& out) {
  return write_response(out, output_);
}

Error BenchSupply::multiply(const Arguments& args, Write& out) {
  double a = 0.0, b = 0.0;
  if (Error e = args.get(0, a)) return e;
  if (Error e = args.get(1, b)) return e;
  return write_response(out, a * b);
}

Error BenchSupply::set_block(const Arguments& args, Write&) {
  Bytes data;
  if (Error e = args.get(0, data)) return e;
  block_.assign(data.begin(), data.end());
  return Error();
}

Error BenchSupply::block(const Arguments&, Write& out) {
  return write_response(out, Bytes(block_.data(), block_.size()));
}

} // namespace scpicore::sim
