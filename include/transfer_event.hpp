/**
 * @file transfer_event.hpp
 * @brief Leveled progress events produced while mirroring.
 */

#ifndef TRANSFER_EVENT_HPP
#define TRANSFER_EVENT_HPP

#include <functional>
#include <json/json.h>

enum class EventKind {
    Uploaded,
    Downloaded,
    Excluded,
    Chdir,
    Removed,
    Ok
};

/**
 * @brief One event of a transfer.
 *
 * The payload is a name for Uploaded, Downloaded, Excluded and Removed, a
 * [local, remote] array for Chdir and the structured summary for Ok.
 */
struct TransferEvent {
    int level = 1;              ///< 0 = always shown, higher = more verbose.
    EventKind kind = EventKind::Ok;
    Json::Value payload;
    bool dryRun = false;        ///< The action was only simulated.
};

using EventSink = std::function<void(const TransferEvent&)>;

#endif // TRANSFER_EVENT_HPP
