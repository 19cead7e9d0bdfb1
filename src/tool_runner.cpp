#include "tool_runner.hpp"
#include "credential_masker.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include "transfer_exceptions.hpp"
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <exception>
#include <filesystem>
#include <future>
#include <signal.h>
#include <thread>
#include <unistd.h>

namespace bp = boost::process;

namespace xfer {

ToolLocator::ToolLocator(std::string mongodumpPath, std::string mongorestorePath)
    : mongodumpPath_(std::move(mongodumpPath)), mongorestorePath_(std::move(mongorestorePath)) {}

std::string ToolLocator::locate(const std::string& tool) const {
    const std::string& configured = tool == MONGODUMP_TOOL     ? mongodumpPath_
                                    : tool == MONGORESTORE_TOOL ? mongorestorePath_
                                                                : std::string();
    if (!configured.empty()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(configured, ec) &&
            ::access(configured.c_str(), X_OK) == 0) {
            return configured;
        }
        PROC_LOG_WARN("Configured path for {} is not executable: {}", tool, configured);
        throw createToolNotFoundError(tool);
    }

    auto found = bp::search_path(tool);
    if (found.empty()) {
        throw createToolNotFoundError(tool);
    }
    return found.string();
}

std::string toolVersion(const std::string& toolPath, std::chrono::milliseconds timeout) {
    try {
        bp::ipstream out;
        bp::child child(bp::exe = toolPath, bp::args = std::vector<std::string>{"--version"},
                        bp::std_out > out, bp::std_err > bp::null, bp::std_in < bp::null);

        if (!child.wait_for(timeout)) {
            child.terminate();
            PROC_LOG_WARN("{} --version timed out after {}ms", toolPath, timeout.count());
            return "";
        }

        std::string line;
        while (std::getline(out, line)) {
            auto trimmed = string_utils::trim(line);
            if (!trimmed.empty()) {
                return std::string(trimmed);
            }
        }
    } catch (const bp::process_error& e) {
        PROC_LOG_WARN("Could not query version of {}: {}", toolPath, e.what());
    }
    return "";
}

ToolAvailability checkToolAvailability(const ToolLocator& locator,
                                       std::chrono::milliseconds timeout) {
    ToolAvailability availability;
    availability.installUrl = TOOL_DOWNLOAD_URL;

    auto check = [&](const char* tool, ToolStatus& status) {
        try {
            status.path = locator.locate(tool);
            status.available = true;
            status.version = toolVersion(status.path, timeout);
        } catch (const EnvironmentException& e) {
            PROC_LOG_DEBUG("{}", e.getMessage());
            status.available = false;
        }
    };

    check(MONGODUMP_TOOL, availability.mongodump);
    check(MONGORESTORE_TOOL, availability.mongorestore);
    return availability;
}

namespace {

// The tool leads its own process group, so helpers it forked go down with it
void terminateGroup(bp::child& child, std::error_code& ec) {
    if (::kill(-child.id(), SIGKILL) != 0) {
        child.terminate(ec);
    }
}

} // namespace

ProcessRunner::ProcessRunner(size_t tailLines, std::chrono::milliseconds pollInterval)
    : tailLines_(tailLines), pollInterval_(pollInterval) {}

ProcessOutcome ProcessRunner::run(const std::string& toolPath,
                                  const std::vector<std::string>& args,
                                  const CancellationToken* token, const LineHandler& onLine,
                                  std::optional<std::chrono::milliseconds> timeout) const {
    ProcessOutcome outcome{0, false, false, DiagnosticTail(tailLines_)};

    std::vector<std::string> maskedArgs;
    maskedArgs.reserve(args.size());
    for (const auto& arg : args) {
        maskedArgs.push_back(maskCredentials(arg));
    }
    PROC_LOG_DEBUG("Starting {} {}", toolPath, string_utils::join(maskedArgs, " "));

    bp::ipstream errStream;
    bp::child child;
    try {
        child = bp::child(bp::exe = toolPath, bp::args = args, bp::std_out > bp::null,
                          bp::std_err > errStream, bp::std_in < bp::null,
                          bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });
    } catch (const bp::process_error& e) {
        throw createSystemError(ErrorCode::PROCESS_ERROR, "ProcessRunner",
                                "failed to start " + toolPath + ": " + e.what());
    }

    std::promise<void> drained;
    auto drainedSignal = drained.get_future();
    std::thread reader([&errStream, &outcome, &onLine, &drained] {
        // Keeps draining after a handler failure so the child never blocks on
        // a full pipe
        std::exception_ptr handlerError;
        std::string line;
        while (std::getline(errStream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            outcome.tail.push(line);
            if (!onLine || handlerError) {
                continue;
            }
            try {
                onLine(line);
            } catch (const std::exception&) {
                handlerError = std::current_exception();
            }
        }
        if (handlerError) {
            drained.set_exception(handlerError);
        } else {
            drained.set_value();
        }
    });

    auto started = std::chrono::steady_clock::now();
    std::error_code ec;
    while (child.running(ec)) {
        if (token && token->isCancelled()) {
            outcome.cancelled = true;
            terminateGroup(child, ec);
            break;
        }
        if (timeout && std::chrono::steady_clock::now() - started >= *timeout) {
            outcome.timedOut = true;
            terminateGroup(child, ec);
            break;
        }
        std::this_thread::sleep_for(pollInterval_);
    }
    if (ec) {
        PROC_LOG_WARN("Lost track of {}: {}", toolPath, ec.message());
    }
    child.wait(ec);

    // The stream reaches EOF once every holder of the pipe has exited
    drainedSignal.wait();
    reader.join();

    outcome.exitCode = child.exit_code();
    if (outcome.cancelled || outcome.timedOut) {
        // terminate() reports the signal, not an exit status
        if (outcome.exitCode == 0) {
            outcome.exitCode = -1;
        }
    } else if (outcome.exitCode != 0 && token && token->isCancelled()) {
        outcome.cancelled = true;
    }

    PROC_LOG_DEBUG("{} exited with code {}{}", toolPath, outcome.exitCode,
                   outcome.cancelled ? " (cancelled)" : outcome.timedOut ? " (timed out)" : "");

    drainedSignal.get();
    return outcome;
}

} // namespace xfer
