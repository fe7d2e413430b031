#include "client.hpp"

#include <iostream>
#include <string>

namespace ui {
  constexpr const char* RESET  = "\033[0m";
  constexpr const char* BOLD   = "\033[1m";
  constexpr const char* CYAN   = "\033[36m";
  constexpr const char* GREEN  = "\033[32m";
  constexpr const char* YELLOW = "\033[33m";
  constexpr const char* BLUE   = "\033[34m";
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <username> [room] [host] [port]\n";
    return 2;
  }

  const std::string username = argv[1];
  const std::string room     = argc > 2 ? argv[2] : "";
  const std::string host     = argc > 3 ? argv[3] : "127.0.0.1";
  int port = 6789;
  if (argc > 4) {
    try {
      port = std::stoi(argv[4]);
    } catch (const std::exception&) {
      std::cerr << "invalid port: " << argv[4] << "\n";
      return 2;
    }
  }

  std::cout << ui::CYAN << "\n========================================\n"
            << ui::BOLD  << "            Parley Client\n"
            << ui::RESET << ui::CYAN
            << "========================================\n\n"
            << ui::RESET;

  std::cout << ui::YELLOW << "Connecting to ws://" << host << ":" << port << "/ ..."
            << ui::RESET << std::endl;

  parley_client::Client client;
  if (!client.connect_to(host, port)) {
    std::cerr << ui::YELLOW << "[!] " << ui::RESET
              << "Failed to connect to server. Is the server running?\n";
    return 1;
  }

  std::cout << ui::GREEN << "[✓] " << ui::RESET << "Connected as "
            << ui::BOLD << username << ui::RESET << ".\n\n";

  std::cout << ui::BOLD << "Available Commands:" << ui::RESET << "\n";
  std::cout << "  " << ui::BLUE << "/join <room>" << ui::RESET << "   → join or create a room\n";
  std::cout << "  " << ui::BLUE << "/quit" << ui::RESET << "          → disconnect\n\n";

  std::cout << ui::CYAN
            << "----------------------------------------\n"
            << ui::RESET
            << "Type your message and press Enter to chat.\n"
            << "----------------------------------------\n\n";

  // This blocks until you quit or server disconnects
  return client.run(username, room);
}
