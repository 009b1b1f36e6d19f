#pragma once

#include "core/types.hpp"
#include <QString>

namespace rally::network {

enum class OfferDecisionKind {
    Answer,
    AnswerReplacing,
    IgnoreCollision,
    Reject,
};

struct OfferDecision {
    OfferDecisionKind kind = OfferDecisionKind::Answer;
    QString reason;
};

/**
 * Decide how to respond to a connection offer relayed through signaling.
 *
 * When both devices offered to each other at once, the offer sent by the
 * smaller device id is the one that proceeds.
 */
[[nodiscard]] inline OfferDecision decide_offer(const Uuid& local_device_id,
                                                const Uuid& remote_device_id,
                                                bool in_room,
                                                bool remote_is_member,
                                                bool local_offer_pending,
                                                bool already_connected) {
    if (remote_device_id == local_device_id) {
        return {OfferDecisionKind::Reject, QStringLiteral("Offer from self")};
    }
    if (!in_room) {
        return {OfferDecisionKind::Reject, QStringLiteral("Not in a room")};
    }
    if (!remote_is_member) {
        return {OfferDecisionKind::Reject, QStringLiteral("Device is not a room member")};
    }
    if (local_offer_pending && local_device_id < remote_device_id) {
        return {OfferDecisionKind::IgnoreCollision, QStringLiteral("Own offer takes precedence")};
    }
    if (already_connected) {
        return {OfferDecisionKind::AnswerReplacing, QStringLiteral("Remote renegotiating")};
    }
    return {OfferDecisionKind::Answer, QString{}};
}

enum class LinkLossAction {
    Forget,
    Renegotiate,
    AwaitOffer,
    ReportConnectivityLost,
};

/**
 * Decide what to do after a peer channel went away.
 *
 * A goodbye is a clean close; membership changes arrive through signaling.
 * An unclean loss that leaves no live channel means the local device is cut
 * off. Otherwise only the device that dials first renegotiates, the other
 * waits for its offer.
 */
[[nodiscard]] inline LinkLossAction decide_link_loss(const Uuid& local_device_id,
                                                     const Uuid& remote_device_id,
                                                     bool graceful,
                                                     size_t remaining_connected) {
    if (graceful) {
        return LinkLossAction::Forget;
    }
    if (remaining_connected == 0) {
        return LinkLossAction::ReportConnectivityLost;
    }
    if (local_device_id < remote_device_id) {
        return LinkLossAction::Renegotiate;
    }
    return LinkLossAction::AwaitOffer;
}

} // namespace rally::network
