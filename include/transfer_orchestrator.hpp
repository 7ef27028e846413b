/**
 * @file transfer_orchestrator.hpp
 * @brief Sequences one staging run: checks, connect, back up, upload, report.
 *
 * The remote subdirectory is first drained into a fresh local backup
 * (backup/<YYYYMMDDHHMMSS>/<subdirectory>/), then the local package is
 * uploaded in its place. The connection is closed on every exit path.
 */

#ifndef TRANSFER_ORCHESTRATOR_HPP
#define TRANSFER_ORCHESTRATOR_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <json/json.h>
#include "authentication_resolver.hpp"
#include "directory_mirror.hpp"
#include "plugin_metadata.hpp"
#include "preservation_package.hpp"
#include "staging_config.hpp"
#include "transfer_event.hpp"

class TransferOrchestrator {
public:
    /**
     * @param config Resolved settings (local, backup, steps to skip, dry run ...).
     * @param endpoint Where to stage; must name a subdirectory.
     * @param sink Receives every progress event and the final ok event.
     */
    TransferOrchestrator(const StagingConfig& config, StagingEndpoint endpoint, EventSink sink);

    /**
     * @brief Package checks to run before connecting. Not owned; may be null.
     */
    void setPackage(PackageInspector* package) { package_ = package; }

    /**
     * @brief Plugin details to add to the summary. Not owned; may be null.
     */
    void setPlugin(const PluginMetadataProvider* plugin) { plugin_ = plugin; }

    /**
     * @brief Runs the whole staging sequence.
     *
     * @return The summary carried by the ok event, or the first error.
     */
    std::expected<Json::Value, StagingError> run(const AuthenticationResolver& resolver, Connector& connector);

    /**
     * @brief Local backup directory for a run started at @p stamp.
     */
    std::filesystem::path backupPath(const std::string& stamp) const;

    const MirrorStats& stats() const { return stats_; }

private:
    std::expected<void, StagingError> checkPreconditions();
    std::expected<Json::Value, StagingError> stage(TransferSession& session);
    Json::Value summarize(TransferSession& session, const std::string& stagedTo) const;

    const StagingConfig& config_;
    StagingEndpoint endpoint_;
    EventSink sink_;
    PackageInspector* package_ = nullptr;
    const PluginMetadataProvider* plugin_ = nullptr;
    MirrorStats stats_;
};

/**
 * @brief The local time formatted as YYYYMMDDHHMMSS.
 */
std::string backupTimestamp();

#endif // TRANSFER_ORCHESTRATOR_HPP
