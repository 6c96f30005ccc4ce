#include "../server/NodeServer.h"
#include "../lib/Logger.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>

namespace {
std::atomic<bool> g_running{ true };
std::mutex g_mutex;
std::condition_variable g_cv;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
    g_cv.notify_one();
  }
}
} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "hr-node - HyperRAFT consensus node" };

  std::string workDir;
  app.add_option("-d,--work-dir", workDir, "Work directory holding config.json")
      ->required();

  bool initMode = false;
  app.add_flag("--init", initMode,
               "Write a default config.json into the work directory and exit");

  app.footer("The config.json file should contain (all keys optional):\n"
             "  {\n"
             "    \"nodeId\": \"node-A\",\n"
             "    \"host\": \"localhost\", \"port\": 8720,\n"
             "    \"peers\": [{ \"id\": \"node-B\", \"endpoint\": \"host:port\" }],\n"
             "    \"bootstrapLeader\": \"\",\n"
             "    \"logLevel\": \"info\",\n"
             "    \"consensus\": { ... }, \"pipeline\": { ... }, "
             "\"registry\": { ... },\n"
             "    \"validators\": [{ \"node_id\": \"node-A\", \"stake\": 100000 }]\n"
             "  }\n"
             "Run with --init to see every key with its default value.");

  CLI11_PARSE(app, argc, argv);

  auto logger = hr::logging::getLogger("hr-node");

  if (initMode) {
    auto written = hr::NodeServer::writeDefaultConfig(workDir);
    if (!written) {
      std::cerr << "Error: " << written.error().message << "\n";
      return 1;
    }
    std::cout << "Default configuration written to " << workDir << "/"
              << hr::NodeServer::FILE_CONFIG << "\n";
    std::cout << "You can now start the node with: hr-node -d " << workDir
              << "\n";
    return 0;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  hr::NodeServer server;

  auto ready = server.init(workDir);
  if (!ready) {
    logger.error << "Failed to initialize node: " << ready.error().message;
    std::cerr << "Error: " << ready.error().message << "\n";
    return 1;
  }

  auto started = server.start();
  if (!started) {
    logger.error << "Failed to start node: " << started.error().message;
    std::cerr << "Error: " << started.error().message << "\n";
    return 1;
  }

  logger.info << "Node " << server.getConfig().node.engine.nodeId
              << " running on " << server.getEndpoint();
  std::cout << "Node running\n";
  std::cout << "Work directory: " << workDir << "\n";
  std::cout << "Press Ctrl+C to stop the node...\n";

  std::unique_lock<std::mutex> lock(g_mutex);
  g_cv.wait(lock, [] { return !g_running.load(); });

  server.stop();
  logger.info << "Node stopped";
  return 0;
}
