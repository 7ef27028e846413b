#include "authentication_resolver.hpp"
#include "console.hpp"
#include "interrupt.hpp"
#include "network_connector.hpp"
#include "remote_inventory.hpp"
#include "ssh_agent.hpp"
#include "staging_config.hpp"
#include "status_reporter.hpp"
#include <curl/curl.h>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace {

constexpr const char* kUsage = R"(Usage: staged-content-size [OPTIONS]... [URL]

Tallies the size of everything staged under a remote subdirectory.

  URL                     sftp://[user[:pass]@]host/base_dir or ftp://...
  --config=PATH           JSON configuration file (default stage_config.json)
  --host=HOST --port=N --user=USER --password=VALUE --base_dir=PATH
  --subdirectory=SLUG     subdirectory to tally (alias --directory)
  --identity=PATH --authentication=agent|keyfile|password
  --depth=N               directory levels to open (default unlimited)
  --output=text/plain|text/tab-separated-values

Exit codes: 0 printed, 1 login failure, 2 usage error, 3 not found.
)";

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

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

    if (!commandLine.arguments.empty()) {
        auto elements = StagingEndpoint::urlElements(commandLine.arguments.front());
        if (!elements) {
            config.logError(elements.error().describe());
            return exitCodeFor(elements.error());
        }
        config.merge(*elements);
    }
    config.merge(commandLine.switches);
    if (auto resolved = config.resolve(); !resolved) {
        config.logError(resolved.error().describe());
        return exitCodeFor(resolved.error());
    }
    if (config.output != kMimeText && config.output != kMimeTsv) {
        config.logError("Unsupported output type: " + config.output);
        return 2;
    }

    auto endpoint = config.endpoint();
    if (!endpoint) {
        config.logError(endpoint.error().describe());
        return exitCodeFor(endpoint.error());
    }

    const char* home = std::getenv("HOME");
    std::string hostPart = endpoint->hostPart();
    AuthenticationResolver resolver(
        *endpoint,
        std::make_shared<SshAgentClient>(),
        [hostPart]() { return Console::askSecret("Password (" + hostPart + "): "); },
        []() { return Console::askSecret("Passphrase for private key: "); },
        home ? home : "");
    NetworkConnector connector(config.timeout);

    auto session = resolver.openConnection(connector);
    if (!session) {
        config.logError(session.error().describe());
        return exitCodeFor(session.error());
    }

    RemoteInventory inventory(*session);
    std::string target = joinRemotePath(endpoint->baseDir, endpoint->subdirectory.value_or("."));
    auto entries = inventory.list(target, config.maxDepth);
    session->close();
    if (!entries) {
        config.logError(entries.error().describe());
        return exitCodeFor(entries.error());
    }

    std::cout << RemoteInventory::formatTotal(RemoteInventory::totalBytes(*entries), entries->size(), config.output)
              << std::endl;
    return 0;
}
