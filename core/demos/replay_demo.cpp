// Replay demo: simulated market feed driving a chart whose frames are
// recorded as JSON draw commands.
//
//   oc_replay_demo [--config chart.json] [--ticks N] [--out frame.json]
//
// Without --out the final frame is printed to stdout.

#include "oc/chart/Chart.hpp"
#include "oc/data/SimulatorDataManager.hpp"
#include "oc/render/CommandCompositor.hpp"
#include "oc/session/ChartConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

static bool readFile(const std::string& path, std::string& out) {
  std::ifstream in(path);
  if (!in) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

static oc::ChartConfig defaultConfig() {
  oc::ChartConfig cfg;
  cfg.width = 1200;
  cfg.height = 800;

  oc::StudySpec sma;
  sma.type = "sma";
  sma.period = 20;
  cfg.studies.push_back(sma);

  oc::StudySpec bb;
  bb.type = "bollinger";
  cfg.studies.push_back(bb);

  oc::StudySpec last;
  last.type = "lastPrice";
  cfg.studies.push_back(last);

  oc::StudySpec vol;
  vol.type = "volume";
  vol.pane = "volume";
  vol.heightPercent = 0.15;
  cfg.studies.push_back(vol);

  oc::StudySpec rsi;
  rsi.type = "rsi";
  rsi.pane = "rsi";
  rsi.heightPercent = 0.2;
  cfg.studies.push_back(rsi);
  return cfg;
}

int main(int argc, char* argv[]) {
  std::string configPath;
  std::string outPath;
  int ticks = 200;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--ticks" && i + 1 < argc) {
      ticks = std::atoi(argv[++i]);
    } else if (arg == "--out" && i + 1 < argc) {
      outPath = argv[++i];
    } else {
      std::fprintf(stderr, "usage: %s [--config file] [--ticks N] [--out file]\n", argv[0]);
      return 2;
    }
  }

  oc::ChartConfig cfg = defaultConfig();
  if (!configPath.empty()) {
    std::string text, err;
    if (!readFile(configPath, text)) {
      std::fprintf(stderr, "Cannot read %s\n", configPath.c_str());
      return 1;
    }
    if (!oc::parseChartConfig(text, cfg, err)) {
      std::fprintf(stderr, "Bad config %s: %s\n", configPath.c_str(), err.c_str());
      return 1;
    }
  }

  oc::SimulatorConfig simCfg;
  oc::SimulatorDataManager sim(simCfg);
  oc::CommandCompositor compositor;

  try {
    oc::Chart chart(sim, compositor, cfg);
    chart.setMetadata("SIM", "1m");
    auto& batcher = chart.renderBatcher();

    chart.initialize();
    batcher.flush();
    std::printf("Loaded %zu candles, visible [%ld, %ld]\n", chart.store().size(),
                chart.visibleIndices().startIndex, chart.visibleIndices().endIndex);

    for (int i = 0; i < ticks; i++) {
      sim.tick();
      if (i % 10 == 9) batcher.flush();
    }
    batcher.flush();

    // Scroll back far enough to pull in another historical batch.
    chart.pan(-static_cast<double>(chart.visibleIndices().startIndex));
    batcher.flush();
    std::printf("After pan: %zu candles, zoom %.1f%%\n", chart.store().size(), chart.zoomLevel());

    const oc::Stats st = chart.stats();
    std::printf("Frames: %llu, requests: %llu, last frame %.3f ms, %u draw calls\n",
                static_cast<unsigned long long>(st.frameCount),
                static_cast<unsigned long long>(st.renderRequests), st.frameMs, st.drawCalls);
    std::printf("Batch cache: %llu rebuilds, %llu reuses\n",
                static_cast<unsigned long long>(st.batchRebuilds),
                static_cast<unsigned long long>(st.batchReuses));
    std::printf("State: %s\n", oc::serializeChartState(chart.state()).c_str());

    const std::string frame = compositor.frameJson();
    if (outPath.empty()) {
      std::printf("%s\n", frame.c_str());
    } else {
      std::ofstream out(outPath);
      out << frame;
      if (!out) {
        std::fprintf(stderr, "Cannot write %s\n", outPath.c_str());
        return 1;
      }
      std::printf("Wrote %s (%zu commands)\n", outPath.c_str(), compositor.commandCount());
    }
  } catch (const std::invalid_argument& e) {
    std::fprintf(stderr, "Chart setup failed: %s\n", e.what());
    return 1;
  }

  std::printf("Replay demo complete\n");
  return 0;
}
