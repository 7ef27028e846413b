#include "authentication_resolver.hpp"
#include "console.hpp"
#include "interrupt.hpp"
#include "network_connector.hpp"
#include "pipeline_input.hpp"
#include "plugin_metadata.hpp"
#include "preservation_package.hpp"
#include "ssh_agent.hpp"
#include "staging_config.hpp"
#include "status_reporter.hpp"
#include "transfer_orchestrator.hpp"
#include <curl/curl.h>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace {

constexpr const char* kUsage = R"(Usage: stage-content [OPTIONS]... [URL]

Drains the remote subdirectory into a local timestamped backup, then uploads
the local preservation package in its place.

  URL                     sftp://[user[:pass]@]host/base_dir or ftp://...
  --config=PATH           JSON configuration file (default stage_config.json)
  --host=HOST --port=N --user=USER --password=VALUE --base_dir=PATH
  --local=PATH            local package directory
  --subdirectory=SLUG     remote subdirectory (alias --directory)
  --backup=PATH           root of the local backups (default ./backup)
  --identity=PATH         private key file (sftp only)
  --authentication=agent|keyfile|password
  --dry-run               report what would happen, change nothing
  --skip=STEP[,STEP]      download, backup, upload, package
  --skip-verification     purge downloaded files without comparing sizes
  --counts                add transfer counters to the result
  --timeout=SECONDS       connect and stall timeout (default 30)
  --output=text/plain|application/json|text/tab-separated-values
  --verbose=N | --quiet

Exit codes: 0 staged, 1 connection or login failure, 2 precondition or usage
error, 3 remote not found or transfer failure, 255 interrupted.
)";

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

int fail(const StagingConfig& config, const StagingError& error) {
    config.logError(error.describe());
    return exitCodeFor(error);
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine commandLine = parseCommandLine(argc, argv);
    if (commandLine.has("help")) {
        std::cout << kUsage;
        return 0;
    }
    if (commandLine.arguments.size() > 1) {
        std::cerr << kUsage;
        return 2;
    }

    StagingConfig config;
    try {
        bool explicitConfig = commandLine.has("config");
        std::string configFile = explicitConfig ? commandLine.switches["config"].asString() : StagingConfig::kDefaultConfigFile;
        config = StagingConfig(configFile, explicitConfig);
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return 2;
    }

    CurlGlobal curlGlobal;
    installInterruptHandlers();

    auto pipeline = PipelineInput::readStdin();
    if (!pipeline) {
        return fail(config, pipeline.error());
    }
    config.merge(StagingConfig::pipelineLayer(*pipeline));
    if (!commandLine.arguments.empty()) {
        auto elements = StagingEndpoint::urlElements(commandLine.arguments.front());
        if (!elements) {
            return fail(config, elements.error());
        }
        config.merge(*elements);
    }
    config.merge(commandLine.switches);

    if (auto resolved = config.resolve(); !resolved) {
        return fail(config, resolved.error());
    }
    if (!isSupportedOutput(config.output)) {
        return fail(config, makeError(ErrorKind::Precondition, "Unsupported output type: " + config.output));
    }

    auto endpoint = config.endpoint();
    if (!endpoint) {
        return fail(config, endpoint.error());
    }
    if (!endpoint->subdirectory || endpoint->subdirectory->empty()) {
        endpoint->subdirectory = Console::ask("Subdirectory: ");
    }

    StatusReporter reporter(config.output, config.verbose, std::cout, std::cerr);
    PreservationPackage package(config.local, *pipeline);
    PipelinePluginMetadata plugin(*pipeline);

    const char* home = std::getenv("HOME");
    std::string hostPart = endpoint->hostPart();
    AuthenticationResolver resolver(
        *endpoint,
        std::make_shared<SshAgentClient>(),
        [hostPart]() { return Console::askSecret("Password (" + hostPart + "): "); },
        []() { return Console::askSecret("Passphrase for private key: "); },
        home ? home : "");
    NetworkConnector connector(config.timeout);

    TransferOrchestrator orchestrator(config, *endpoint, [&reporter](const TransferEvent& event) { reporter.report(event); });
    orchestrator.setPackage(&package);
    orchestrator.setPlugin(&plugin);

    if (config.verbose >= 2) {
        config.logMessage("Staging " + config.local + " to " + endpoint->url(endpoint->baseDir) + " (" +
                          endpoint->subdirectory.value_or("") + ")" + (config.dryRun ? " [dry run]" : ""));
    }
    auto result = orchestrator.run(resolver, connector);
    if (!result) {
        return fail(config, result.error());
    }
    if (config.verbose >= 2) {
        config.logMessage("Staged to " + (*result)["Staged To"].asString());
    }
    return 0;
}
