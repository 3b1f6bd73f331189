#include "frontier/game/Report.h"

#include "frontier/core/Log.h"
#include "frontier/game/Simulation.h"

#include <fstream>

namespace frontier::game {

void writeReportJson(core::JsonWriter& j, const Simulation& simulation) {
  j.beginObject();
  if (!simulation.running()) {
    j.field("running", false);
    j.endObject();
    return;
  }

  const sim::SimulationContext& ctx = simulation.context();
  const sim::TrailModule& trail = ctx.trail;

  j.field("running", true);
  j.field("finished", simulation.finished());
  j.field("trail", trail.trailName());
  j.field("turn", static_cast<unsigned long long>(ctx.totalTurns));
  j.field("date", sim::formatDate(ctx.date));
  j.field("locationIndex", static_cast<unsigned long long>(trail.locationIndex()));
  j.field("distanceToNextLocation", trail.distanceToNextLocation());
  j.field("nextLegDistance", trail.nextLegDistance());
  j.field("trailLength", trail.trailLength());
  j.field("odometer", ctx.vehicle.odometer());
  j.field("parked", ctx.vehicle.parked());

  if (const Form* form = simulation.activeForm()) {
    j.field("form", formName(form->id()));
  } else {
    j.key("form");
    j.nullValue();
  }

  j.key("locations");
  j.beginArray();
  for (const auto& loc : trail.locations()) {
    j.beginObject();
    j.field("name", loc.name());
    j.field("status", sim::toString(loc.status()));
    j.field("mode", sim::modeName(loc.mode()));
    j.endObject();
  }
  j.endArray();

  j.key("inventory");
  j.beginObject();
  for (const auto& [id, item] : ctx.vehicle.inventory()) {
    (void)id;
    j.field(item.name, item.quantity);
  }
  j.endObject();

  j.key("events");
  j.beginArray();
  for (const auto& ev : ctx.history.items()) {
    j.beginObject();
    j.field("date", sim::formatDate(ev.timestamp));
    j.field("category", sim::toString(ev.category));
    j.field("name", ev.name);
    if (!ev.detail.empty()) j.field("detail", ev.detail);
    j.endObject();
  }
  j.endArray();

  j.endObject();
}

bool writeReportFile(const Simulation& simulation, const std::string& path, std::string* outError) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    if (outError) *outError = "failed to open " + path + " for writing";
    FRONTIER_LOG_ERROR("Report: failed to open file for writing: " + path);
    return false;
  }

  core::JsonWriter j(f, true);
  writeReportJson(j, simulation);
  f << "\n";
  if (!f) {
    if (outError) *outError = "failed to write " + path;
    return false;
  }
  return true;
}

} // namespace frontier::game
