#include "node/config.hpp"
#include "node/node.hpp"

#include <iostream>
#include <optional>
#include <string>

int main(int argc, char** argv) {
	relay::node::NodeConfig config;
	if (argc > 1) {
		const auto loaded = relay::node::loadConfig(argv[1]);
		if (!loaded) {
			std::cerr << "Could not load configuration from '" << argv[1] << "'.\n";
			return 1;
		}
		config = *loaded;
	}

	relay::node::Node node(config);
	if (!node.start()) {
		std::cerr << "Could not start the relay node.\n";
		return 1;
	}

	// Keep the node alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	node.stop();
	return 0;
}
