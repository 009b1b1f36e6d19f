#include "controllers/SyncController.hpp"

#include "core/logging.hpp"
#include <QString>

namespace rally::controllers {

namespace {

QString error_text(const Error& error) {
    return QString::fromStdString(error.message);
}

QJsonObject error_json(const Error& error) {
    QJsonObject obj;
    obj["message"] = error_text(error);
    obj["code"] = QString::fromUtf8(error_code_name(error.code).data(),
                                    static_cast<int>(error_code_name(error.code).size()));
    return obj;
}

QJsonObject operation_json(const sync::OfflineOperation& op) {
    QJsonObject obj;
    obj["operationId"] = idString(op.id);
    obj["entityRef"] = op.entity_ref;
    obj["sequence"] = static_cast<double>(op.sequence);
    obj["retryCount"] = op.retry_count;
    obj["createdAt"] = QString::fromStdString(op.created_at.to_iso_string());
    return obj;
}

QString iso_or_empty(const Timestamp& ts) {
    return ts.is_zero() ? QString{} : QString::fromStdString(ts.to_iso_string());
}

} // namespace

SyncController::SyncController(QObject* parent)
    : QObject(parent)
{
}

SyncController::~SyncController() {
    if (initialized_) {
        shutdown();
    }
}

Result<void, Error> SyncController::initialize(const SyncConfig& config, uint16_t listen_port) {
    if (initialized_) {
        qCInfo(rallyFacadeLog) << "initialize ignored; already initialized";
        return Result<void, Error>::ok();
    }
    auto valid = config.validate();
    if (valid.is_err()) {
        qCWarning(rallyFacadeLog) << "rejected configuration:" << error_text(valid.unwrap_err());
        return valid;
    }

    if (!orchestrator_) {
        build(config);
    }
    applyConfig(config);

    auto started = orchestrator_->start(listen_port);
    if (started.is_err()) {
        qCWarning(rallyFacadeLog) << "could not start transport:" << error_text(started.unwrap_err());
        return Result<void, Error>::err(started.unwrap_err());
    }
    listening_port_ = started.unwrap();
    initialized_ = true;

    qCInfo(rallyFacadeLog) << "initialized" << config.device_name << roleName(config.device_role)
                           << "device" << deviceId() << "port" << listening_port_;
    emit initializedChanged();
    emit statusChanged();
    return Result<void, Error>::ok();
}

void SyncController::build(const SyncConfig& config) {
    DeviceInfo self;
    self.id = Uuid::generate();
    self.name = config.device_name;
    self.role = config.device_role;

    orchestrator_ = std::make_unique<network::ConnectionOrchestrator>(self);
    engine_ = std::make_unique<sync::SyncEngine>(*orchestrator_);
    offline_ = std::make_unique<sync::OfflineManager>(*orchestrator_, *orchestrator_);
    wire();
}

void SyncController::applyConfig(const SyncConfig& config) {
    config_ = config;
    set_sync_trace_enabled(config.debug_trace);
    orchestrator_->configure(config);

    sync::SyncEngine::Options engine_options;
    engine_options.auto_sync = config.enable_auto_sync;
    engine_options.strategy = config.conflict_strategy;
    engine_options.role = orchestrator_->self().role;
    engine_options.resync_timeout_ms = config.ack_timeout_ms;
    engine_options.resync_max_attempts = config.operation_max_retries;
    engine_->setOptions(engine_options);

    sync::OfflineManager::Options offline_options;
    offline_options.reconnection = config.reconnection;
    offline_options.ack_timeout_ms = config.ack_timeout_ms;
    offline_options.max_retries = config.operation_max_retries;
    offline_options.max_queue_size = config.max_queue_size;
    offline_->setOptions(offline_options);
}

void SyncController::wire() {
    auto* orchestrator = orchestrator_.get();
    auto* engine = engine_.get();
    auto* offline = offline_.get();

    // Data path: channel -> engine -> offline queue -> channel.
    connect(orchestrator, &network::ConnectionOrchestrator::messageReceived,
            engine, &sync::SyncEngine::handleEnvelope);
    connect(engine, &sync::SyncEngine::outboundReady,
            this, [this](const sync::OutboundMutation& mutation) {
                auto submitted = offline_->submit(mutation);
                if (submitted.is_err()) {
                    qCWarning(rallyFacadeLog) << "mutation" << mutation.entity_ref
                                              << "not accepted:" << error_text(submitted.unwrap_err());
                }
            });
    connect(engine, &sync::SyncEngine::ackReceived, offline, &sync::OfflineManager::handleAck);

    // Membership.
    connect(orchestrator, &network::ConnectionOrchestrator::deviceConnected,
            this, [engine, offline](const DeviceInfo& device) {
                engine->handleDeviceConnected(device);
                offline->handleDeviceConnected();
            });
    connect(orchestrator, &network::ConnectionOrchestrator::deviceDisconnected,
            offline, &sync::OfflineManager::handleDeviceDisconnected);
    connect(orchestrator, &network::ConnectionOrchestrator::deviceJoined,
            this, [this](const DeviceInfo& device) {
                QJsonObject detail = device.toJson();
                publish(QStringLiteral("device-joined"), detail);
                emit deviceJoined(idString(device.id), device.name);
            });
    connect(orchestrator, &network::ConnectionOrchestrator::deviceLeft,
            this, [this](const Uuid& device_id) {
                engine_->handleDeviceLeft(device_id);
                publish(QStringLiteral("device-left"), {{"deviceId", idString(device_id)}});
                emit deviceLeft(idString(device_id));
            });
    connect(orchestrator, &network::ConnectionOrchestrator::connectionError,
            this, [this](const Error& error) {
                publish(QStringLiteral("connection-error"), error_json(error));
                emit connectionError(error_text(error));
            });

    // Room lifecycle.
    connect(orchestrator, &network::ConnectionOrchestrator::roomCreated,
            this, [this](const QString& room_id) {
                publish(QStringLiteral("room-created"), {{"roomId", room_id}});
                emit roomCreated(room_id);
            });
    connect(orchestrator, &network::ConnectionOrchestrator::roomJoined,
            this, [this](const QString& room_id) {
                publish(QStringLiteral("room-joined"), {{"roomId", room_id}});
                emit roomJoined(room_id);
            });
    connect(orchestrator, &network::ConnectionOrchestrator::roomEnded,
            this, [this](const QString& room_id) {
                endSession();
                publish(QStringLiteral("room-ended"), {{"roomId", room_id}});
                emit roomEnded(room_id);
            });
    connect(orchestrator, &network::ConnectionOrchestrator::connectivityLost,
            offline, &sync::OfflineManager::handleConnectivityLost);
    connect(orchestrator, &network::ConnectionOrchestrator::statsChanged,
            this, &SyncController::statusChanged);

    // Replication events.
    connect(engine, &sync::SyncEngine::mutationApplied,
            this, [this](const QString& collection, const QString& entity_id, const Uuid& sender) {
                publish(QStringLiteral("remote-mutation"),
                        {{"collection", collection}, {"entityId", entity_id}, {"senderId", idString(sender)}});
                emit remoteMutation(collection, entity_id);
            });
    connect(engine, &sync::SyncEngine::snapshotApplied,
            this, [this](const Uuid& sender) {
                publish(QStringLiteral("snapshot-applied"), {{"deviceId", idString(sender)}});
                emit snapshotApplied(idString(sender));
            });
    connect(engine, &sync::SyncEngine::syncError,
            this, [this](const Error& error) {
                publish(QStringLiteral("connection-error"), error_json(error));
                emit connectionError(error_text(error));
            });

    // Offline queue and reconnection.
    connect(offline, &sync::OfflineManager::wentOffline, this, [this]() {
        publish(QStringLiteral("went-offline"), {{"queueSize", offline_->queueSize()}});
        emit wentOffline();
    });
    connect(offline, &sync::OfflineManager::backOnline, this, [this]() {
        publish(QStringLiteral("back-online"), {{"queueSize", offline_->queueSize()}});
        emit backOnline();
    });
    connect(offline, &sync::OfflineManager::reconnectionStarted, this, [this]() {
        publish(QStringLiteral("reconnection-started"),
                {{"maxAttempts", offline_->options().reconnection.max_attempts}});
        emit reconnectionStarted();
    });
    connect(offline, &sync::OfflineManager::reconnectionFailed, this, [this](const Error& error) {
        auto detail = error_json(error);
        detail["attemptCount"] = offline_->reconnectionStatus().attempt_count;
        publish(QStringLiteral("reconnection-failed"), detail);
        emit reconnectionFailed(error_text(error));
    });
    connect(offline, &sync::OfflineManager::operationQueued,
            this, [this](const sync::OfflineOperation& op) {
                publish(QStringLiteral("operation-queued"), operation_json(op));
                emit operationQueued(idString(op.id), op.entity_ref);
            });
    connect(offline, &sync::OfflineManager::operationProcessed,
            this, [this](const sync::OfflineOperation& op) {
                publish(QStringLiteral("operation-processed"), operation_json(op));
                emit operationProcessed(idString(op.id), op.entity_ref);
            });
    connect(offline, &sync::OfflineManager::operationFailed,
            this, [this](const sync::OfflineOperation& op, const Error& error) {
                auto detail = operation_json(op);
                detail["error"] = error_json(error);
                publish(QStringLiteral("operation-failed"), detail);
                emit operationFailed(idString(op.id), error_text(error));
            });
    connect(offline, &sync::OfflineManager::queueCleared, this, [this](int count) {
        publish(QStringLiteral("queue-cleared"), {{"count", count}});
        emit queueCleared(count);
    });
    connect(offline, &sync::OfflineManager::statusChanged, this, &SyncController::statusChanged);
}

void SyncController::shutdown() {
    if (!initialized_) {
        return;
    }
    qCInfo(rallyFacadeLog) << "shutting down; queued operations kept:" << offline_->queueSize();
    offline_->shutdown();
    orchestrator_->stop();
    engine_->resetSession();
    initialized_ = false;
    listening_port_ = 0;
    emit initializedChanged();
    emit statusChanged();
}

Result<void, Error> SyncController::requireInitialized() const {
    if (!initialized_) {
        return Result<void, Error>::err(make_error(ErrorCode::NotInitialized, "Sync is not initialized"));
    }
    return Result<void, Error>::ok();
}

void SyncController::createRoom(RoomCallback done) {
    auto ready = requireInitialized();
    if (ready.is_err()) {
        if (done) done(Result<QString, Error>::err(ready.unwrap_err()));
        return;
    }
    orchestrator_->createRoom([done](Result<QString, Error> created) {
        if (created.is_err()) {
            qCWarning(rallyFacadeLog) << "create room failed:" << error_text(created.unwrap_err());
        }
        if (done) done(std::move(created));
    });
}

void SyncController::joinRoom(const QString& room_id, DoneCallback done) {
    auto ready = requireInitialized();
    if (ready.is_err()) {
        if (done) done(ready);
        return;
    }
    orchestrator_->joinRoom(room_id, [room_id, done](Result<void, Error> joined) {
        if (joined.is_err()) {
            qCWarning(rallyFacadeLog) << "join" << room_id << "failed:" << error_text(joined.unwrap_err());
        }
        if (done) done(std::move(joined));
    });
}

void SyncController::listAvailableRooms(RoomsCallback done) {
    auto ready = requireInitialized();
    if (ready.is_err()) {
        done(Result<std::vector<network::signaling::RoomSummary>, Error>::err(ready.unwrap_err()));
        return;
    }
    orchestrator_->listAvailableRooms(std::move(done));
}

void SyncController::leaveRoom() {
    if (!initialized_) {
        return;
    }
    // Also abandons a create or join that has not completed yet.
    const bool was_in_room = orchestrator_->inRoom();
    orchestrator_->leaveRoom();
    if (was_in_room) {
        endSession();
    }
}

void SyncController::endSession() {
    engine_->resetSession();
    offline_->handleSessionEnded();
}

void SyncController::forceReconnect() {
    if (!initialized_) {
        return;
    }
    offline_->forceReconnect();
}

int SyncController::clearQueue() {
    return offline_ ? offline_->clearQueue() : 0;
}

void SyncController::manualSync() {
    if (!initialized_) {
        return;
    }
    engine_->manualSync();
}

void SyncController::reportNetworkStatus(bool online) {
    if (!offline_) {
        return;
    }
    offline_->setNetworkAvailable(online);
}

Result<void, Error> SyncController::submitMutation(const QString& collection,
                                                   const QString& entity_id,
                                                   sync::MutationOp op,
                                                   const QJsonObject& fields) {
    auto ready = requireInitialized();
    if (ready.is_err()) {
        return ready;
    }
    sync::Mutation mutation;
    mutation.collection = collection;
    mutation.entity_id = entity_id;
    mutation.op = op;
    mutation.fields = fields;
    return engine_->submit(mutation).map([](const sync::OutboundMutation&) {});
}

std::optional<QJsonObject> SyncController::entity(const QString& collection, const QString& id) const {
    if (!engine_) {
        return std::nullopt;
    }
    return engine_->replica().entity(collection, id);
}

QJsonObject SyncController::state() const {
    return engine_ ? engine_->replica().view() : QJsonObject{};
}

network::ConnectionStats SyncController::connectionStats() const {
    return orchestrator_ ? orchestrator_->stats() : network::ConnectionStats{};
}

sync::OfflineStats SyncController::offlineStats() const {
    return offline_ ? offline_->stats() : sync::OfflineStats{};
}

sync::ReconnectionStatus SyncController::reconnectionStatus() const {
    return offline_ ? offline_->reconnectionStatus() : sync::ReconnectionStatus{};
}

QJsonObject SyncController::status() const {
    const auto conn = connectionStats();
    QJsonObject connection;
    connection["connectedDeviceCount"] = conn.connected_device_count;
    connection["roomId"] = conn.room_id;
    connection["isHost"] = conn.is_host;
    connection["hostDeviceId"] = conn.room_id.isEmpty() ? QString{} : idString(conn.host_device_id);
    connection["connectionStatus"] = conn.connection_status;
    connection["signalingStatus"] = conn.signaling_status;

    const auto queue = offlineStats();
    QJsonObject offline;
    offline["queueSize"] = queue.queue_size;
    offline["isOnline"] = queue.is_online;
    offline["phase"] = sync::connectivityPhaseName(queue.phase);
    offline["oldestOperationAt"] = iso_or_empty(queue.oldest_operation_at);
    offline["totalRetries"] = queue.total_retries;

    const auto recon = reconnectionStatus();
    QJsonObject reconnection;
    reconnection["isReconnecting"] = recon.is_reconnecting;
    reconnection["attemptCount"] = recon.attempt_count;
    reconnection["maxAttempts"] = recon.max_attempts;
    reconnection["lastAttemptAt"] = iso_or_empty(recon.last_attempt_at);
    reconnection["nextDelayMs"] = recon.next_delay_ms;
    reconnection["phase"] = sync::connectivityPhaseName(recon.phase);

    QJsonObject out;
    out["initialized"] = initialized_;
    out["deviceId"] = deviceId();
    out["connection"] = connection;
    out["offline"] = offline;
    out["reconnection"] = reconnection;
    return out;
}

QString SyncController::deviceId() const {
    return orchestrator_ ? idString(orchestrator_->localDevice()) : QString{};
}

QString SyncController::roomId() const {
    return orchestrator_ ? orchestrator_->roomId() : QString{};
}

bool SyncController::isHost() const {
    return orchestrator_ && orchestrator_->isHost();
}

int SyncController::connectedDeviceCount() const {
    return connectionStats().connected_device_count;
}

bool SyncController::isOnline() const {
    return offline_ ? offline_->isOnline() : false;
}

int SyncController::offlineQueueSize() const {
    return offline_ ? offline_->queueSize() : 0;
}

bool SyncController::isReconnecting() const {
    return reconnectionStatus().is_reconnecting;
}

int SyncController::reconnectAttemptCount() const {
    return reconnectionStatus().attempt_count;
}

void SyncController::publish(const QString& name, const QJsonObject& detail) {
    if (sync_trace_enabled()) {
        qCInfo(rallyFacadeLog) << "SYNC: event" << name;
    }
    emit event(name, detail);
}

} // namespace rally::controllers
