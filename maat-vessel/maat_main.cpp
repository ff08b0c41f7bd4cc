// -----------------------------------------------------------------------------
// Maat Vessel — Entry point
// -----------------------------------------------------------------------------
#include "maat_vessel.h"

#include <syslog.h>

int main(int argc, char* argv[]) {
    openlog("maat", LOG_PID | LOG_NDELAY, LOG_USER);

    try {
        auto policy = maat_load_policy(argc, argv);

        Orchestrator orchestrator(policy, stdout);
        RunReport report = orchestrator.run();
        orchestrator.render(report);
    } catch (const MaatFatalWalkError& e) {
        MAAT_LOG_ERROR("maat", "Fatal: %s", e.what());
        closelog();
        return 1;
    } catch (const std::exception& e) {
        MAAT_LOG_ERROR("maat", "Unexpected failure: %s", e.what());
        closelog();
        return 1;
    }

    closelog();
    return 0;
}
