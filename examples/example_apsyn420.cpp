/**
 * @file example_apsyn420.cpp
 * @brief Configure an APSYN420 and read its settings back
 *
 * Usage:
 *   ./example_apsyn420 <resource> [frequency_hz] [--persistent] [--external-ref]
 *
 * Examples:
 *   ./example_apsyn420 TCPIP0::192.168.15.100::18::SOCKET 2.5e9
 *   ./example_apsyn420 127.0.0.1:5025 1e9 --persistent
 *
 * Run simulated_apsyn420 to try it without hardware.
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>
#include "apsyn/common/status.hpp"
#include "apsyn/instrument/apsyn420.hpp"
#include "apsyn/transport/transport_factory.hpp"

using apsyn::Apsyn420;
using apsyn::PulsePolarity;
using apsyn::ResourceTransportFactory;

int main(int argc, const char *argv[]) {
  if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
    std::cerr << "Usage: " << argv[0] << " <resource> [frequency_hz] [--persistent] [--external-ref]\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << argv[0] << " TCPIP0::192.168.15.100::18::SOCKET 2.5e9\n";
    std::cerr << "  " << argv[0] << " 127.0.0.1:5025 1e9 --persistent\n";
    return argc < 2 ? 1 : 0;
  }

  const std::string resource = argv[1];
  double frequency = 1e9;
  bool persistent = false;
  bool external_reference = false;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--persistent") {
      persistent = true;
    } else if (arg == "--external-ref") {
      external_reference = true;
    } else {
      frequency = std::atof(arg.c_str());
    }
  }

  spdlog::set_level(spdlog::level::debug);

  ResourceTransportFactory factory;
  Apsyn420 apsyn("apsyn", resource, factory, !persistent);

  std::cout << "Setting frequency to " << frequency << " Hz...\n";
  if (!apsyn.SetFrequency(frequency)) {
    std::cerr << "  Failed: " << apsyn::ToString(apsyn.LastStatus().kind) << "\n";
    return 1;
  }

  if (!apsyn.SetPulseModulationPolarity(PulsePolarity::kNormal) || !apsyn.RfOn()) {
    std::cerr << "  Failed: " << apsyn::ToString(apsyn.LastStatus().kind) << "\n";
    return 1;
  }

  if (auto readback = apsyn.Frequency(); readback.has_value()) {
    std::cout << "  Frequency: " << *readback << " Hz\n";
  } else {
    std::cout << "  Frequency read failed: " << apsyn::ToString(apsyn.LastStatus().kind) << "\n";
  }
  if (auto output = apsyn.Output(); output.has_value()) {
    std::cout << "  Output: " << *output << "\n";
  }

  if (external_reference) {
    std::cout << "Locking to external 10 MHz reference...\n";
    auto status = apsyn.SetExternalReference();
    if (!status.Ok()) {
      std::cerr << "  Failed: " << apsyn::ToString(status.kind) << "\n";
      return 1;
    }
    std::cout << "  Locked\n";
  }

  return 0;
}
