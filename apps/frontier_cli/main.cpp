#include "frontier/core/Args.h"
#include "frontier/core/JsonWriter.h"
#include "frontier/core/Log.h"
#include "frontier/game/ConfigArgs.h"
#include "frontier/game/Report.h"
#include "frontier/game/Simulation.h"
#include "frontier/sim/TrailRegistry.h"

#include <iostream>
#include <string>

using namespace frontier;

static void printHelp() {
  std::cout << "frontier_cli\n"
            << "  --trail <name>         Trail to travel (default: oregon; see --list-trails)\n"
            << "  --seed <u64|text>      Seed for events and random legs (default: 1848)\n"
            << "  --distance <policy>    Leg distances: fixed | even | random (default: fixed)\n"
            << "  --leg <miles>          Leg length for the fixed policy (default: 1)\n"
            << "  --mileage <miles>      Miles the wagon covers per turn (default: 20)\n"
            << "  --events <scale>       Random event chance multiplier, 0 disables (default: 1)\n"
            << "  --max-turns <n>        Stop after n turns (default: 10000)\n"
            << "  --json                 Print a JSON report to stdout when the game stops\n"
            << "  --out <path>           Write the JSON report to a file instead\n"
            << "  --log <level>          trace | debug | info | warn | error | off (default: warn)\n"
            << "  --list-trails          Print the built-in trails and exit\n"
            << "\n"
            << "Player input is read line by line from stdin; logs go to stderr.\n";
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Warn);

  core::Args args(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  const auto unknown = args.unknown({"help", "h", "log", "list-trails", "trail", "seed", "distance", "leg",
                                     "mileage", "events", "max-turns", "json", "out"});
  if (!unknown.empty()) {
    std::cerr << "frontier_cli: unknown option '" << unknown.front() << "' (see --help)\n";
    return 2;
  }

  std::string levelText;
  if (args.getString("log", levelText)) {
    core::LogLevel level = core::LogLevel::Warn;
    if (!core::parseLogLevel(levelText, level)) {
      std::cerr << "frontier_cli: unknown log level '" << levelText << "'\n";
      return 2;
    }
    core::setLogLevel(level);
  }

  if (args.hasFlag("list-trails")) {
    for (const auto name : sim::trailNames()) {
      sim::Trail t;
      if (!sim::loadTrail(name, t)) continue;
      std::cout << name << "  " << t.locations.size() << " stops, "
                << t.trailLength << " miles\n";
    }
    return 0;
  }

  game::SimulationConfig cfg{};
  std::string err;
  if (!game::applyArgs(args, cfg, &err)) {
    std::cerr << "frontier_cli: " << err << "\n";
    return 2;
  }

  int maxTurns = 10000;
  if (args.has("max-turns") && (!args.getInt("max-turns", maxTurns) || maxTurns < 1)) {
    std::cerr << "frontier_cli: --max-turns expects a positive whole number\n";
    return 2;
  }

  game::Simulation simulation;
  if (!simulation.init(cfg, &err)) {
    std::cerr << "frontier_cli: " << err << "\n";
    return 1;
  }

  std::string line;
  bool inputClosed = false;
  while (!simulation.finished()) {
    if (simulation.awaitingInput()) {
      std::cout << simulation.render() << "\n> " << std::flush;
      if (!std::getline(std::cin, line)) {
        inputClosed = true;
        break;
      }
      simulation.handleInput(line);
      continue;
    }

    if (static_cast<int>(simulation.context().totalTurns) >= maxTurns) {
      core::log(core::LogLevel::Warn, "turn limit reached (" + std::to_string(maxTurns) + ")");
      break;
    }
    if (!simulation.tick()) {
      // Nothing can advance and nothing waits for input.
      core::log(core::LogLevel::Error, "simulation stalled on turn "
                + std::to_string(simulation.context().totalTurns));
      break;
    }
  }

  if (simulation.finished()) {
    std::cout << simulation.render() << "\n";
  } else if (inputClosed) {
    std::cout << "\n";
  }

  int status = 0;
  std::string outPath;
  if (args.getString("out", outPath)) {
    if (!game::writeReportFile(simulation, outPath, &err)) {
      std::cerr << "frontier_cli: " << err << "\n";
      status = 1;
    }
  } else if (args.hasFlag("json")) {
    core::JsonWriter j(std::cout, true);
    game::writeReportJson(j, simulation);
    std::cout << "\n";
  }

  simulation.shutdown();
  return status;
}
