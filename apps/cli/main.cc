#include <exception>
#include <iostream>

#include "session/cli_options.h"
#include "session/probe_session.h"

int main(int argc, char* argv[]) {
    glnt::CliOptions cli;

    try {
        if (!glnt::ParseCliArgs(argc, argv, cli)) {
            glnt::PrintCliUsage(argv[0]);
            return 1;
        }
        if (cli.show_help) {
            glnt::PrintCliUsage(argv[0]);
            return 0;
        }

        glnt::ProbeSession session;
        session.LoadRigFromFile(cli.rig_file);
        glnt::ApplyCliOverrides(cli, session.options());
        session.Render();
        session.Save();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
