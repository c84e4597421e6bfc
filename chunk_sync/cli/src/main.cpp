#include "cancellation.hpp"
#include "cli_app.hpp"

#include <csignal>
#include <string>
#include <vector>

namespace {
void handle_signal(int) {
    chunksync::engine::process_cancellation().request();
}
}  // namespace

int main(int argc, char* argv[]) {
    // Constructs the token before a handler can touch it.
    chunksync::engine::process_cancellation().reset();
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::vector<std::string> args(argv + 1, argv + argc);
    chunksync::cli::CliApp app;
    return app.run(args);
}
