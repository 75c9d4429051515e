#include <mvlabel/annotation/label_session.hpp>
#include <mvlabel/common.hpp>
#include <mvlabel/config.hpp>
#include <mvlabel/io/event_script.hpp>
#include <mvlabel/io/export.hpp>
#include <mvlabel/io/frame_source.hpp>
#include <mvlabel/io/overlay.hpp>
#include <mvlabel/io/session_io.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Args {
  std::vector<std::string> session_paths;
  std::string config_path;
  std::string events_path;
  std::string out_dir;
  std::string frames_dir;
  int render_frame = -1;
  bool triangulate_all = false;
};

void PrintUsage(const char* argv0) {
  std::cerr << "Usage:\n"
            << "  " << argv0
            << " --session <file.yml> [--session <file.yml> ...] [--config <file.yml>]\n"
            << "      [--events <events.yml>] [--triangulate_all] [--out_dir <dir>]\n"
            << "      [--frames_dir <dir> --render_frame <n>]\n";
}

Args ParseArgs(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto need_value = [&](const std::string& name) -> std::string {
      if (i + 1 >= argc) throw mvlabel::Error("Missing value for " + name);
      return argv[++i];
    };

    if (arg == "--session") {
      a.session_paths.push_back(need_value(arg));
    } else if (arg == "--config") {
      a.config_path = need_value(arg);
    } else if (arg == "--events") {
      a.events_path = need_value(arg);
    } else if (arg == "--out_dir") {
      a.out_dir = need_value(arg);
    } else if (arg == "--frames_dir") {
      a.frames_dir = need_value(arg);
    } else if (arg == "--render_frame") {
      a.render_frame = std::stoi(need_value(arg));
    } else if (arg == "--triangulate_all") {
      a.triangulate_all = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else {
      throw mvlabel::Error("Unknown argument: " + arg);
    }
  }

  if (a.session_paths.empty()) {
    PrintUsage(argv[0]);
    throw mvlabel::Error("--session is required");
  }
  if (!a.frames_dir.empty() && a.render_frame < 0) {
    throw mvlabel::Error("--frames_dir needs --render_frame");
  }
  return a;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const Args args = ParseArgs(argc, argv);

    mvlabel::SessionConfig cfg = args.config_path.empty() ? mvlabel::SessionConfig()
                                                          : mvlabel::SessionConfig::FromYAML(args.config_path);

    std::unique_ptr<mvlabel::annotation::LabelSession> session;
    if (args.session_paths.size() == 1) {
      session = mvlabel::io::LoadSession(args.session_paths.front(), cfg);
      MVLABEL_REQUIRE_CODE(session != nullptr, mvlabel::ErrorCode::kIo,
                           "Failed to open session file: " + args.session_paths.front());
    } else {
      std::vector<fs::path> paths(args.session_paths.begin(), args.session_paths.end());
      session = mvlabel::io::LoadMergedSessions(paths, cfg);
    }

    const fs::path out_dir = args.out_dir.empty() ? fs::path(args.session_paths.front()).parent_path()
                                                  : fs::path(args.out_dir);
    mvlabel::io::EnsureDir(out_dir);
    session->config().SaveYAML((out_dir / "effective_config.yml").string());

    // =========================
    // Replay recorded events
    // =========================
    if (!args.events_path.empty()) {
      const auto events = mvlabel::io::LoadEventScript(args.events_path);
      int failed = 0;
      for (std::size_t i = 0; i < events.size(); ++i) {
        const auto& ev = events[i];
        try {
          session->Apply(ev);
        } catch (const mvlabel::Error& e) {
          // A rejected request leaves the session as it was; keep replaying.
          failed++;
          std::cerr << "[mvlabel] event " << i << " (" << mvlabel::annotation::EventTypeName(ev.type)
                    << ") rejected [" << mvlabel::ErrorCodeName(e.code()) << "]: " << e.what() << "\n";
        }
      }
      std::cerr << "[mvlabel] replayed " << events.size() << " events, rejected=" << failed << "\n";
    }

    if (args.triangulate_all) session->TriangulateAll();

    // =========================
    // Save + export
    // =========================
    if (session->config().autosave) {
      const fs::path state_path = out_dir / "session.yml.gz";
      MVLABEL_REQUIRE_CODE(mvlabel::io::SaveSession(state_path, *session), mvlabel::ErrorCode::kIo,
                           "Failed to write " + state_path.string());
      std::cerr << "[mvlabel] saved session to " << state_path.string() << "\n";
    }

    MVLABEL_REQUIRE_CODE(mvlabel::io::ExportCamerasPLY((out_dir / "cameras.ply").string(), session->cameras()),
                         mvlabel::ErrorCode::kIo, "Failed to write cameras.ply");
    MVLABEL_REQUIRE_CODE(mvlabel::io::ExportLabelData((out_dir / "label_data.yml.gz").string(), *session),
                         mvlabel::ErrorCode::kIo, "Failed to write label_data.yml.gz");
    std::cerr << "[mvlabel] labeled frames: " << session->LabeledFrameCount() << " / "
              << session->num_frames() << "\n";

    if (args.render_frame >= 0) {
      const mvlabel::FrameId f = args.render_frame;
      const fs::path ply = out_dir / ("points_frame" + std::to_string(f) + ".ply");
      MVLABEL_REQUIRE_CODE(mvlabel::io::ExportWorldPointsPLY(ply.string(), *session, f), mvlabel::ErrorCode::kIo,
                           "Failed to write " + ply.string());

      if (!args.frames_dir.empty()) {
        const auto source = mvlabel::io::ImageSequenceSource::FromDirectory(args.frames_dir);
        const fs::path overlay_dir = out_dir / "overlays";
        MVLABEL_REQUIRE_CODE(mvlabel::io::ExportOverlayImages(overlay_dir.string(), *session, source, f),
                             mvlabel::ErrorCode::kIo, "Overlay export failed");
        std::cerr << "[mvlabel] overlays written to: " << overlay_dir.string() << "\n";
      }
    }

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[mvlabel] error: " << e.what() << "\n";
    return 1;
  }
}
