#include "../include/game/config.hpp"
#include "../include/game/game_controller.hpp"
#include "../include/network/scheduler.hpp"
#include "../include/network/server.hpp"
#include "../include/network/thread_pool.hpp"
#include "../include/room/random_source.hpp"
#include "../include/room/room_registry.hpp"
#include "../include/session/disconnect_reaper.hpp"
#include "../include/session/session_index.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> g_shutdown{false};

void onSignal(int) { g_shutdown = true; }
} // namespace

int main(int argc, char *argv[]) {
  game::ServerConfig config;
  try {
    config = game::ServerConfig::fromEnvironment();
    config.applyArguments(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    std::cerr << "Usage: " << argv[0] << " [--port N] [--workers N]"
              << std::endl;
    return 2;
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  std::cout << "Starting spin-the-bottle server...\n";

  try {
    network::ThreadPool pool;
    pool.init(config.worker_threads);
    network::TimerScheduler scheduler(pool);
    scheduler.start();

    room::MersenneRandom random;
    room::RoomRegistry rooms(random);
    session::SessionIndex sessions;
    network::NetworkServer server(config.port);

    session::DisconnectReaper reaper(rooms, server, server, scheduler,
                                     config.disconnect_grace);
    game::GameController controller(rooms, sessions, random, server,
                                    scheduler, reaper,
                                    config.turn_notice_delay);
    server.setHandler(&controller);
    server.start();

    std::cout << "Server running with " << pool.getSize()
              << " worker threads. Press Ctrl+C to exit.\n";
    while (!g_shutdown) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Shutting down...\n";
    server.stop();
    scheduler.stop();
    pool.terminate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
