#include "transfer_session.hpp"
#include <utility>

TransferSession::TransferSession(std::unique_ptr<TransportClient> transport, std::string authenticatedWith)
    : transport_(std::move(transport)), authenticatedWith_(std::move(authenticatedWith)) {}

TransferSession::~TransferSession() {
    close();
}

void TransferSession::close() {
    if (transport_) {
        transport_->close();
    }
}

std::expected<Location, StagingError> TransferSession::setLocation(const std::filesystem::path& local,
                                                                   const std::string& remote,
                                                                   bool make) {
    Location previous = location();

    auto remoteEntered = transport_->setRemoteLocation(remote, make);
    if (!remoteEntered) {
        return std::unexpected(remoteEntered.error());
    }
    auto localEntered = transport_->setLocalLocation(local, make);
    if (!localEntered) {
        transport_->restoreLocation(previous);
        return std::unexpected(localEntered.error());
    }
    return previous;
}
