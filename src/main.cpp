/*
 * execd C++ - In-sandbox execution daemon
 *
 * Runs shell commands, file operations and stateful code contexts inside
 * one sandbox and exposes them over HTTP.
 *
 * Usage:
 *   ./execd [--config execd.json] [--port N]
 */
#include <execd/core/application.hpp>

int main(int argc, char* argv[]) {
    execd::Application& app = execd::Application::instance();

    if (!app.init(argc, argv)) {
        // --help / --version / fatal startup error
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
