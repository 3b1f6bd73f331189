#include "frontier/core/Args.h"
#include "frontier/core/Log.h"
#include "frontier/game/ConfigArgs.h"
#include "frontier/game/Report.h"
#include "frontier/game/Simulation.h"
#include "frontier/game/TextFormat.h"
#include "frontier/sim/Item.h"

#include <SDL.h>
#include <SDL_opengl.h>

#include <imgui.h>
#include <backends/imgui_impl_opengl3.h>
#include <backends/imgui_impl_sdl2.h>

#include <array>
#include <string>

using namespace frontier;

// Fixed simulation pulse. Frames in between only deliver system ticks.
static constexpr Uint32 kTurnIntervalMs = 350;

static void drawTrailWindow(game::Simulation& simulation, std::array<char, 128>& inputBuf, bool& focusInput) {
  ImGui::SetNextWindowPos(ImVec2(16, 16), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(620, 520), ImGuiCond_FirstUseEver);
  ImGui::Begin("Trail");

  const std::string text = simulation.render();
  const float footer = ImGui::GetFrameHeightWithSpacing() * 1.5f;
  ImGui::BeginChild("screen", ImVec2(0, -footer), true);
  ImGui::TextUnformatted(text.c_str());
  ImGui::EndChild();

  const bool waiting = simulation.awaitingInput() && !simulation.finished();
  if (!waiting) ImGui::BeginDisabled();

  if (focusInput && waiting) {
    ImGui::SetKeyboardFocusHere();
    focusInput = false;
  }
  ImGui::SetNextItemWidth(-120.0f);
  const bool submitted = ImGui::InputText("##input", inputBuf.data(), inputBuf.size(),
                                          ImGuiInputTextFlags_EnterReturnsTrue);
  ImGui::SameLine();
  const bool pressed = ImGui::Button("Enter", ImVec2(-1, 0));

  if (!waiting) ImGui::EndDisabled();

  if (waiting && (submitted || pressed)) {
    simulation.handleInput(inputBuf.data());
    inputBuf.fill('\0');
    focusInput = true;
  }

  ImGui::End();
}

static void drawSuppliesWindow(const game::Simulation& simulation) {
  ImGui::SetNextWindowPos(ImVec2(652, 16), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(300, 260), ImGuiCond_FirstUseEver);
  ImGui::Begin("Wagon");

  const auto& ctx = simulation.context();
  ImGui::Text("%s", sim::formatDate(ctx.date).c_str());
  ImGui::Text("Miles traveled: %d / %d", ctx.vehicle.odometer(), ctx.trail.trailLength());
  ImGui::Text("%s", ctx.vehicle.parked() ? "Parked" : "Rolling");
  ImGui::Separator();

  if (ImGui::BeginTable("supplies", 2, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
    ImGui::TableSetupColumn("Item");
    ImGui::TableSetupColumn("Quantity");
    ImGui::TableHeadersRow();
    for (const auto& [id, item] : ctx.vehicle.inventory()) {
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0);
      ImGui::TextUnformatted(item.name.c_str());
      ImGui::TableSetColumnIndex(1);
      const std::string qty = (id == sim::ItemId::Cash) ? game::formatCurrency(item.quantity)
                                                        : game::formatCount(item.quantity);
      ImGui::TextUnformatted(qty.c_str());
    }
    ImGui::EndTable();
  }

  ImGui::End();
}

static void drawHistoryWindow(const game::Simulation& simulation) {
  ImGui::SetNextWindowPos(ImVec2(652, 292), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(300, 244), ImGuiCond_FirstUseEver);
  ImGui::Begin("History");

  const auto& items = simulation.context().history.items();
  for (auto it = items.rbegin(); it != items.rend(); ++it) {
    ImGui::TextDisabled("%s", sim::formatDate(it->timestamp).c_str());
    ImGui::SameLine();
    ImGui::TextUnformatted(it->name.c_str());
  }

  ImGui::End();
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args(argc, argv);

  game::SimulationConfig cfg{};
  std::string err;
  if (!game::applyArgs(args, cfg, &err)) {
    core::log(core::LogLevel::Error, "Bad options: " + err);
    return 2;
  }

  game::Simulation simulation;
  if (!simulation.init(cfg, &err)) {
    core::log(core::LogLevel::Error, "Simulation init failed: " + err);
    return 1;
  }

  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
    core::log(core::LogLevel::Error, std::string("SDL_Init failed: ") + SDL_GetError());
    return 1;
  }

  // GL 3.3 core
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

  SDL_Window* window = SDL_CreateWindow(
      "Frontier",
      SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
      980, 560,
      SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE);

  if (!window) {
    core::log(core::LogLevel::Error, std::string("SDL_CreateWindow failed: ") + SDL_GetError());
    SDL_Quit();
    return 1;
  }

  SDL_GLContext glContext = SDL_GL_CreateContext(window);
  if (!glContext) {
    core::log(core::LogLevel::Error, std::string("SDL_GL_CreateContext failed: ") + SDL_GetError());
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 1;
  }
  SDL_GL_MakeCurrent(window, glContext);
  SDL_GL_SetSwapInterval(1);

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO& io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  io.IniFilename = nullptr;
  ImGui::StyleColorsDark();

  ImGui_ImplSDL2_InitForOpenGL(window, glContext);
  ImGui_ImplOpenGL3_Init("#version 330 core");

  std::array<char, 128> inputBuf{};
  bool focusInput = true;
  bool running = true;
  Uint32 lastTurnMs = SDL_GetTicks();

  while (running) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
      ImGui_ImplSDL2_ProcessEvent(&event);

      if (event.type == SDL_QUIT) running = false;
      if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE) running = false;
      if (event.type == SDL_KEYDOWN && !event.key.repeat && event.key.keysym.sym == SDLK_ESCAPE) running = false;
    }

    simulation.tick(true);
    const Uint32 nowMs = SDL_GetTicks();
    if (nowMs - lastTurnMs >= kTurnIntervalMs) {
      lastTurnMs = nowMs;
      simulation.tick(false);
    }

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    drawTrailWindow(simulation, inputBuf, focusInput);
    drawSuppliesWindow(simulation);
    drawHistoryWindow(simulation);

    ImGui::Render();

    int w = 0, h = 0;
    SDL_GL_GetDrawableSize(window, &w, &h);
    glViewport(0, 0, w, h);
    glClearColor(0.10f, 0.09f, 0.07f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    SDL_GL_SwapWindow(window);
  }

  std::string reportPath;
  if (args.getString("out", reportPath) && !game::writeReportFile(simulation, reportPath, &err)) {
    core::log(core::LogLevel::Error, err);
  }

  // Cleanup
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplSDL2_Shutdown();
  ImGui::DestroyContext();

  SDL_GL_DeleteContext(glContext);
  SDL_DestroyWindow(window);
  SDL_Quit();

  simulation.shutdown();
  return 0;
}
