/**
 * imgpipe-cli: ingest images, inspect the ledger, drive background jobs.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/imgpipe-cli/imgpipe_cli [--config path] <command> [args]
 * Background jobs run in-process; the CLI waits for them before exiting.
 */

#include <imgpipe/app/config.hpp>
#include <imgpipe/app/logging.hpp>
#include <imgpipe/app/response_json.hpp>
#include <imgpipe/app/service.hpp>
#include <imgpipe/app/stats.hpp>
#include <imgpipe/vision/validator.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: imgpipe_cli [--config <path>] <command> [args]\n"
            << "  upload <file> [--content-type <mime>] [--name <filename>]\n"
            << "  list                      All upload attempts, newest first\n"
            << "  show <image_id>           One upload attempt\n"
            << "  thumbnail <image_id> <small|medium>\n"
            << "  stats                     Processing outcome statistics\n"
            << "  retrigger <sha256>        Re-enqueue jobs for stored content\n"
            << "  warmup                    Load the caption model and run one inference\n"
            << "\nConfig: key=value file (db_path=, media_dir=, caption_backend=, ...);\n"
            << "IMGPIPE_DB_PATH, IMGPIPE_MEDIA_DIR, IMGPIPE_BASE_URL override it.\n";
}

std::string guess_content_type(const std::string& filename) {
  const std::string ext = imgpipe::vision::lowercase_extension(filename);
  if (ext == ".png") return "image/png";
  if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
  return "application/octet-stream";
}

bool read_file(const std::string& path, std::vector<std::byte>& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  out.resize(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) out[i] = static_cast<std::byte>(raw[i]);
  return true;
}

int cmd_upload(imgpipe::app::ImagePipeline& pipeline, const std::vector<std::string>& args) {
  if (args.empty()) {
    std::cerr << "upload: missing <file>\n";
    return 2;
  }
  const std::string path = args[0];
  std::string name = std::filesystem::path(path).filename().string();
  std::string content_type;
  for (std::size_t i = 1; i + 1 < args.size(); i += 2) {
    if (args[i] == "--content-type") content_type = args[i + 1];
    else if (args[i] == "--name") name = args[i + 1];
  }
  if (content_type.empty()) content_type = guess_content_type(name);

  std::vector<std::byte> bytes;
  if (!read_file(path, bytes)) {
    std::cerr << "Failed to read file: " << path << "\n";
    return 1;
  }

  auto response = pipeline.ingest().upload(name, content_type, std::move(bytes));
  if (!response) {
    std::cerr << "Storage error: " << imgpipe::core::to_string(response.error()) << "\n";
    return 1;
  }
  pipeline.queue().wait_idle();

  // Re-read so the printed record includes what the jobs wrote.
  auto latest = pipeline.ingest().get_image(response->data.image_id);
  std::cout << imgpipe::app::write_json(imgpipe::app::to_json(latest ? *latest : *response)) << "\n";
  return response->status == imgpipe::app::UploadStatus::Success ? 0 : 1;
}

int cmd_show(imgpipe::app::ImagePipeline& pipeline, const std::vector<std::string>& args) {
  if (args.empty()) {
    std::cerr << "show: missing <image_id>\n";
    return 2;
  }
  auto image = pipeline.ingest().get_image(args[0]);
  if (!image) {
    std::cerr << "Image not found: " << args[0] << "\n";
    return 1;
  }
  std::cout << imgpipe::app::write_json(imgpipe::app::to_json(*image)) << "\n";
  return 0;
}

int cmd_thumbnail(imgpipe::app::ImagePipeline& pipeline, const std::vector<std::string>& args) {
  if (args.size() < 2) {
    std::cerr << "thumbnail: expected <image_id> <size>\n";
    return 2;
  }
  auto path = pipeline.ingest().get_thumbnail(args[0], args[1]);
  if (!path) {
    std::cerr << "Thumbnail unavailable: " << imgpipe::core::to_string(path.error()) << "\n";
    return 1;
  }
  std::cout << path->string() << "\n";
  return 0;
}

int cmd_retrigger(imgpipe::app::ImagePipeline& pipeline, const std::vector<std::string>& args) {
  if (args.empty()) {
    std::cerr << "retrigger: missing <sha256>\n";
    return 2;
  }
  auto jobs = pipeline.ingest().retrigger(args[0]);
  if (!jobs) {
    std::cerr << "Retrigger failed: " << imgpipe::core::to_string(jobs.error()) << "\n";
    return 1;
  }
  pipeline.queue().wait_idle();
  std::cout << "enqueued " << jobs->thumbnail.id << " " << jobs->exif.id << " " << jobs->caption.id << "\n";
  return 0;
}

int dispatch(imgpipe::app::ImagePipeline& pipeline,
             const std::string& command,
             const std::vector<std::string>& args) {
  if (command == "upload") return cmd_upload(pipeline, args);
  if (command == "list") {
    std::cout << imgpipe::app::write_json(imgpipe::app::to_json(pipeline.ingest().list_images())) << "\n";
    return 0;
  }
  if (command == "show") return cmd_show(pipeline, args);
  if (command == "thumbnail") return cmd_thumbnail(pipeline, args);
  if (command == "stats") {
    std::cout << imgpipe::app::write_json(imgpipe::app::to_json(imgpipe::app::compute_stats(pipeline.ledger())))
              << "\n";
    return 0;
  }
  if (command == "retrigger") return cmd_retrigger(pipeline, args);
  if (command == "warmup") {
    pipeline.captions().warmup();
    std::cout << "caption model ready\n";
    return 0;
  }
  std::cerr << "Unknown command " << command << "\n";
  print_usage();
  return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string command;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (command.empty() && arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (command.empty() && (arg == "--help" || arg == "-h")) {
      print_usage();
      return 0;
    } else if (command.empty()) {
      command = arg;
    } else {
      args.push_back(arg);
    }
  }
  if (command.empty()) {
    print_usage();
    return 2;
  }

  try {
    imgpipe::app::ServiceConfig cfg = config_path.empty() ? imgpipe::app::default_config()
                                                          : imgpipe::app::load_config(config_path);
    imgpipe::app::init_logging(cfg.log_level);

    imgpipe::app::ImagePipeline pipeline(cfg);

    const auto start = std::chrono::steady_clock::now();
    const int rc = dispatch(pipeline, command, args);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start).count();
    spdlog::info("{} -> {} ({}ms)", command, rc == 0 ? "ok" : "error", ms);
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
