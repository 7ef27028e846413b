/**
 * @file transfer_session.hpp
 * @brief One open connection plus its local/remote working-directory pair.
 */

#ifndef TRANSFER_SESSION_HPP
#define TRANSFER_SESSION_HPP

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include "transport_client.hpp"

/**
 * @brief Exclusive owner of the transport for the lifetime of one invocation.
 *
 * Directory changes always go through setLocation(), which moves both sides
 * together. The connection is closed when the session is destroyed.
 */
class TransferSession {
public:
    TransferSession(std::unique_ptr<TransportClient> transport, std::string authenticatedWith);
    ~TransferSession();

    TransferSession(TransferSession&&) noexcept = default;
    TransferSession& operator=(TransferSession&&) noexcept = default;

    TransportClient& transport() { return *transport_; }
    const TransportClient& transport() const { return *transport_; }

    /**
     * @brief Description of the credential that opened this session.
     */
    const std::string& authenticatedWith() const { return authenticatedWith_; }

    Location location() const { return transport_->getLocation(); }

    /**
     * @brief Enters @p remote and @p local in lockstep.
     *
     * The remote side is entered first; if the local side then fails, the
     * remote side is put back so the pair never drifts apart.
     *
     * @param make Create missing directories on both sides.
     * @return The pair that was current before the call.
     */
    std::expected<Location, StagingError> setLocation(const std::filesystem::path& local,
                                                      const std::string& remote,
                                                      bool make);

    void restoreLocation(const Location& location) { transport_->restoreLocation(location); }

    void setDryRun(bool dryRun) { transport_->setDryRun(dryRun); }
    bool dryRun() const { return transport_->dryRun(); }

    std::string url() const { return transport_->url(); }

    void close();

private:
    std::unique_ptr<TransportClient> transport_;
    std::string authenticatedWith_;
};

/**
 * @brief Captures the current location pair and restores it on scope exit.
 *
 * Every recursive frame of the mirror holds one, so the pair is restored on
 * success, early return and error alike.
 */
class LocationGuard {
public:
    explicit LocationGuard(TransferSession& session) : session_(session), saved_(session.location()) {}
    ~LocationGuard() { session_.restoreLocation(saved_); }

    LocationGuard(const LocationGuard&) = delete;
    LocationGuard& operator=(const LocationGuard&) = delete;

    const Location& saved() const { return saved_; }

private:
    TransferSession& session_;
    Location saved_;
};

#endif // TRANSFER_SESSION_HPP
