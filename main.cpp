#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "cxxopts.hpp"

#include "SimulatorConfig.h"
#include "Simulator.h"
#include "SimClock.h"
#include "CurlHttpClient.h"

namespace {
volatile std::sig_atomic_t signal_received = 0;
}

void signal_handler(int signal)
{
  signal_received = signal;
}

int main(int argc, char **argv)
{
  bool verbose = false;
  bool help = false;
  std::string config_file = "/app/config.tcl";
  std::string camera;

  cxxopts::Options options("rtspsim", "camera feed simulator with RTSP output and event replay");

  options.add_options()
    ("c,config", "Config file (Tcl)", cxxopts::value<std::string>(config_file))
    ("cam", "Camera name from the config", cxxopts::value<std::string>(camera))
    ("v,verbose", "Verbose mode", cxxopts::value<bool>(verbose))
    ("h,help", "Print help", cxxopts::value<bool>(help))
    ;

  try {
    options.parse(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error parsing options: " << e.what() << std::endl;
    return 1;
  }

  if (help) {
    std::cout << options.help({""}) << std::endl;
    return 0;
  }

  if (camera.empty()) {
    std::cerr << "--cam is required" << std::endl;
    std::cerr << options.help({""}) << std::endl;
    return 1;
  }

  SimulatorConfig config;
  try {
    config = loadConfigFile(config_file, camera);
  } catch (const ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  }
  config.verbose = verbose;

  setDisplayTimezone(config.timezone);
  std::cout << "Timestamps in " << displayTimezone() << std::endl;
  CurlHttpClient::globalInit();

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  Simulator simulator(config);
  try {
    simulator.start();
  } catch (const std::exception& e) {
    std::cerr << "Startup failed: " << e.what() << std::endl;
    simulator.stop();
    return 1;
  }

  while (!signal_received && !simulator.stopRequested()) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
    simulator.reportIfDue();
  }

  if (signal_received) {
    std::cout << "Received signal " << signal_received << ", shutting down" << std::endl;
  }
  simulator.stop();

  return simulator.stats().errors > 0 && !signal_received ? 1 : 0;
}
