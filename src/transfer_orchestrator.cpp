#include "transfer_orchestrator.hpp"
#include "interrupt.hpp"
#include <chrono>
#include <ctime>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

std::string backupTimestamp() {
    auto timeT = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", std::localtime(&timeT));
    return stamp;
}

TransferOrchestrator::TransferOrchestrator(const StagingConfig& config, StagingEndpoint endpoint, EventSink sink)
    : config_(config), endpoint_(std::move(endpoint)), sink_(std::move(sink)) {}

fs::path TransferOrchestrator::backupPath(const std::string& stamp) const {
    return fs::path(config_.backup) / stamp / endpoint_.subdirectory.value_or(".");
}

std::expected<void, StagingError> TransferOrchestrator::checkPreconditions() {
    if (!endpoint_.subdirectory || endpoint_.subdirectory->empty()) {
        StagingError error = makeError(ErrorKind::Precondition, "No remote subdirectory to stage into");
        error.remedy = "Name one with --subdirectory=SLUG.";
        return std::unexpected(error);
    }

    if (!config_.skips("upload")) {
        std::error_code ec;
        if (!fs::is_directory(config_.local, ec)) {
            StagingError error = makeError(ErrorKind::Precondition, "Local package directory not found: " + config_.local);
            error.remedy = "Point --local at the packaged Archival Unit.";
            return std::unexpected(error);
        }
    }

    if (config_.skips("package") || !package_) {
        return {};
    }
    if (!package_->hasBagitEnclosure()) {
        StagingError error = makeError(ErrorKind::Precondition, "Package is not enclosed in a BagIt bag: " + config_.local);
        error.remedy = "Bag the package first, or use --skip=package to stage it as is.";
        return std::unexpected(error);
    }
    if (!package_->hasValidManifest()) {
        StagingError error = makeError(ErrorKind::Precondition,
            std::string("Manifest ") + PreservationPackage::kManifestFile + " is missing or lacks the LOCKSS permission statement");
        error.remedy = "Generate the manifest page for this Archival Unit before staging.";
        return std::unexpected(error);
    }
    package_->resetFileSize();
    return {};
}

std::expected<Json::Value, StagingError> TransferOrchestrator::run(const AuthenticationResolver& resolver, Connector& connector) {
    auto ready = checkPreconditions();
    if (!ready) {
        return std::unexpected(ready.error());
    }

    auto session = resolver.openConnection(connector);
    if (!session) {
        return std::unexpected(shutdownRequested() ? interrupted() : session.error());
    }
    session->setDryRun(config_.dryRun);

    auto summary = stage(*session);
    session->close();

    if (shutdownRequested()) {
        return std::unexpected(interrupted());
    }
    return summary;
}

std::expected<Json::Value, StagingError> TransferOrchestrator::stage(TransferSession& session) {
    TransportClient& transport = session.transport();
    const std::string& subdirectory = *endpoint_.subdirectory;

    auto base = transport.setRemoteLocation(endpoint_.baseDir, false);
    if (!base) {
        return std::unexpected(base.error());
    }

    DirectoryMirror mirror(session,
                           [this](const std::string& name) { return config_.isExcluded(name); },
                           sink_,
                           MirrorOptions{config_.skipVerification});

    auto emitChdir = [&]() {
        if (!sink_) {
            return;
        }
        Location here = session.location();
        TransferEvent event;
        event.level = 2;
        event.kind = EventKind::Chdir;
        event.payload = Json::Value(Json::arrayValue);
        event.payload.append(here.local.string());
        event.payload.append(here.remote);
        event.dryRun = session.dryRun();
        sink_(event);
    };

    if (!config_.skips("download") && !config_.skips("backup")) {
        LocationGuard guard(session);
        auto entered = session.setLocation(backupPath(backupTimestamp()), subdirectory, true);
        if (!entered) {
            stats_ = mirror.stats();
            return std::unexpected(entered.error());
        }
        emitChdir();
        auto downloaded = mirror.download(".");
        stats_ = mirror.stats();
        if (!downloaded) {
            return std::unexpected(downloaded.error());
        }
    }

    if (!config_.skips("upload")) {
        LocationGuard guard(session);
        auto entered = session.setLocation(fs::absolute(config_.local), subdirectory, true);
        if (!entered) {
            stats_ = mirror.stats();
            return std::unexpected(entered.error());
        }
        emitChdir();
        auto uploaded = mirror.upload(".");
        stats_ = mirror.stats();
        if (!uploaded) {
            return std::unexpected(uploaded.error());
        }
    }

    std::string stagedTo = transport.url(transport.remotePath(subdirectory));
    Json::Value summary = summarize(session, stagedTo);
    if (sink_) {
        TransferEvent ok;
        ok.level = 0;
        ok.kind = EventKind::Ok;
        ok.payload = summary;
        ok.dryRun = session.dryRun();
        sink_(ok);
    }
    return summary;
}

Json::Value TransferOrchestrator::summarize(TransferSession& session, const std::string& stagedTo) const {
    Json::Value summary(Json::objectValue);
    summary["Staged To"] = stagedTo;
    summary["Staged By"] = endpoint_.user;
    summary["Protocol"] = protocolName(endpoint_.protocol);
    summary["Authenticated With"] = session.authenticatedWith();
    summary["Local"] = fs::absolute(config_.local).lexically_normal().string();

    if (package_) {
        Json::Value metadata = package_->getPipelineMetadata();
        for (const auto& key : metadata.getMemberNames()) {
            summary[key] = metadata[key];
        }
    }
    if (plugin_) {
        for (const auto& [name, value] : plugin_->getDetails()) {
            summary[name] = value;
        }
        summary["parameters"] = plugin_->parameters();
    }
    summary["Dry Run"] = session.dryRun();

    if (config_.counts) {
        summary["Files Uploaded"] = Json::UInt64(stats_.filesUploaded);
        summary["Bytes Uploaded"] = Json::UInt64(stats_.bytesUploaded);
        summary["Files Downloaded"] = Json::UInt64(stats_.filesDownloaded);
        summary["Bytes Downloaded"] = Json::UInt64(stats_.bytesDownloaded);
        summary["Files Skipped"] = Json::UInt64(stats_.filesSkipped);
    }

    if (auto volume = session.transport().getVolume(".")) {
        summary["Remote Free Bytes"] = Json::UInt64(volume->availableBytes);
    }
    return summary;
}
