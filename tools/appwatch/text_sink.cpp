/**
 * appwatch CLI - text rendering of supervision events
 */

#include "common.hpp"

namespace appwatch::cli {

void TextEventSink::on_event(const SupervisionEvent& e) {
    std::string pid = e.pid ? std::to_string(*e.pid) : "?";

    switch (e.kind) {
        case EventKind::launch_started:
            std::cout << "Launching " << e.reason << std::endl;
            break;
        case EventKind::activation_failed:
            std::cout << "Activation failed: " << e.reason << std::endl;
            std::cout << "Trying fallback launch method..." << std::endl;
            break;
        case EventKind::launched:
            std::cout << "Launched, process ID " << pid << std::endl;
            break;
        case EventKind::launched_without_pid:
            std::cout << "Launched by fallback method (no process ID available)" << std::endl;
            std::cout << "Process monitoring is not available with the fallback method" << std::endl;
            break;
        case EventKind::launch_failed:
            std::cout << "All launch methods failed: " << e.reason << std::endl;
            break;
        case EventKind::process_resolved:
            if (quiet_) break;
            std::cout << "  Process Name: " << e.name << std::endl;
            std::cout << "  Process Path: " << e.path << std::endl;
            break;
        case EventKind::process_unresolved:
            std::cout << "Could not get process information for " << pid
                      << "; monitoring is not possible" << std::endl;
            break;
        case EventKind::monitoring_started:
            std::cout << "Monitoring directory: " << e.directory << std::endl;
            break;
        case EventKind::waiting:
            if (quiet_) break;
            std::cout << "Waiting for process " << pid << " to terminate..." << std::endl;
            break;
        case EventKind::open_failed:
            std::cout << "Failed to open process " << pid << " for monitoring" << std::endl;
            break;
        case EventKind::terminated:
            std::cout << "Process " << pid << " has terminated" << std::endl;
            break;
        case EventKind::wait_failed:
            std::cout << "Waiting on process " << pid << " failed, error " << e.os_error << std::endl;
            break;
        case EventKind::unexpected_wait_status:
            std::cout << "Unexpected wait result " << e.os_error
                      << " for process " << pid << ", continuing" << std::endl;
            break;
        case EventKind::searching:
            if (quiet_) break;
            std::cout << "Searching for replacement process in " << e.directory << std::endl;
            break;
        case EventKind::successor_found:
            std::cout << "Now monitoring replacement process " << pid << std::endl;
            break;
        case EventKind::no_successor:
            std::cout << "No replacement process found in " << e.directory
                      << "; monitoring finished" << std::endl;
            break;
    }
}

} // namespace appwatch::cli
