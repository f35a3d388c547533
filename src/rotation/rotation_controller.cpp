/// @file rotation_controller.cpp
/// @brief RotationController implementation.

#include "keyring/rotation/rotation_controller.hpp"

#include "keyring/foundation/keyring_logger.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace keyring::rotation {

using foundation::ErrorCode;
using foundation::KeyringError;
using foundation::KeyringLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
namespace sk = keys::secret_keys;

namespace {

std::optional<int64_t> parseEpochSeconds(const std::string& text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void logKey(LogLevel level, std::string_view msg, const std::string& keyId,
            std::optional<uint64_t> epoch = std::nullopt) {
    LogContext ctx;
    ctx.keyId = keyId;
    ctx.rotationEpoch = epoch;
    KeyringLogger::instance().logWithContext(level, LogCategory::Rotation, msg, ctx);
}

}  // namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct RotationController::Impl {
    RotationConfig config;
    std::shared_ptr<keys::KeyStore> store;
    std::shared_ptr<keys::IKeyMaterialGenerator> generator;
    std::shared_ptr<const foundation::Clock> clock;
    std::shared_ptr<keys::ISecretStore> secretStore;
    std::shared_ptr<IRotationEventSink> events;

    // Serializes bootstrap, rotation, standby generation and sweeps.
    std::mutex rotationMutex;
    std::atomic<ControllerState> state{ControllerState::Idle};

    mutable std::mutex statusMutex;
    uint64_t rotationCount = 0;
    std::optional<TimePoint> lastRotationAt;
    std::optional<std::string> lastError;

    // Scheduler
    std::thread schedulerThread;
    std::mutex schedMutex;
    std::condition_variable schedCv;
    bool stopRequested = false;
    bool wakeRequested = false;
    std::atomic<bool> running{false};
    std::atomic<bool> stopping{false};

    // Marks the controller Rotating for the lifetime of a rotation.
    struct RotatingScope {
        std::atomic<ControllerState>& state;
        explicit RotatingScope(std::atomic<ControllerState>& s) : state(s) {
            state.store(ControllerState::Rotating);
        }
        ~RotatingScope() { state.store(ControllerState::Idle); }
    };

    void setLastError(const KeyringError& error) {
        std::lock_guard<std::mutex> lock(statusMutex);
        lastError = std::string(error.message());
    }

    void wakeScheduler() {
        {
            std::lock_guard<std::mutex> lock(schedMutex);
            wakeRequested = true;
        }
        schedCv.notify_all();
    }

    // ── Persistence ─────────────────────────────────────────────────────

    void persistFailed(std::string_view what, const std::string& keyId) {
        logKey(LogLevel::Warning, what, keyId);
        events->record(RotationEvent::PersistFailed, keyId);
    }

    // Standby material is persisted as soon as it exists; promotion only
    // flips the pointers.
    void persistStandby(const keys::KeyRecord& record) {
        bool ok = secretStore->put(sk::entry(record.keyId, sk::kPrivatePem), record.privateKeyPem);
        ok = secretStore->put(sk::entry(record.keyId, sk::kPublicPem), record.publicKeyPem) && ok;
        ok = secretStore->put(sk::entry(record.keyId, sk::kCreatedAt),
                              std::to_string(foundation::toEpochSeconds(record.createdAt))) &&
             ok;
        ok = secretStore->put(sk::kStandbyKeyId, record.keyId) && ok;
        if (!ok) {
            persistFailed("Secret store rejected standby key material", record.keyId);
        }
    }

    void removeEntry(std::string_view name) {
        // Missing entries are expected for keys that were never persisted.
        if (!secretStore->remove(name)) {
            KEYRING_LOG_DEBUG(LogCategory::Rotation, "No persisted entry " + std::string(name));
        }
    }

    // Drop every entry of @p keyId, including any pointer that names it.
    void forgetPersisted(const std::string& keyId) {
        for (auto field : {sk::kPrivatePem, sk::kPublicPem, sk::kCreatedAt, sk::kActivatedAt}) {
            removeEntry(sk::entry(keyId, field));
        }
        for (auto pointer : {sk::kActiveKeyId, sk::kStandbyKeyId}) {
            if (secretStore->get(pointer) == keyId) {
                removeEntry(pointer);
            }
        }
    }

    void persistPromotion(const keys::PromotionResult& promotion) {
        const auto& keyId = promotion.activatedKeyId;
        bool ok = secretStore->put(sk::entry(keyId, sk::kActivatedAt),
                                   std::to_string(foundation::toEpochSeconds(promotion.promotedAt)));
        ok = secretStore->put(sk::kActiveKeyId, keyId) && ok;
        if (!ok) {
            persistFailed("Secret store rejected active key pointer", keyId);
        }
        if (secretStore->get(sk::kStandbyKeyId) == keyId) {
            removeEntry(sk::kStandbyKeyId);
        }
        if (promotion.retiredKeyId) {
            forgetPersisted(*promotion.retiredKeyId);
        }
    }

    // Read and check the persisted material of @p keyId. Unusable entries
    // are logged and forgotten.
    std::optional<keys::KeyRecord> loadPersisted(const std::string& keyId, std::string_view role) {
        auto privatePem = secretStore->get(sk::entry(keyId, sk::kPrivatePem));
        auto publicPem = secretStore->get(sk::entry(keyId, sk::kPublicPem));
        auto createdAt = secretStore->get(sk::entry(keyId, sk::kCreatedAt));
        auto activatedAt = secretStore->get(sk::entry(keyId, sk::kActivatedAt));

        auto discard = [&](std::string_view problem) -> std::optional<keys::KeyRecord> {
            logKey(LogLevel::Warning,
                   "Persisted " + std::string(role) + " key " + std::string(problem) +
                       "; discarding it",
                   keyId);
            forgetPersisted(keyId);
            return std::nullopt;
        };

        if (!privatePem || !publicPem || !createdAt) {
            return discard("is incomplete");
        }
        auto created = parseEpochSeconds(*createdAt);
        auto activated = activatedAt ? parseEpochSeconds(*activatedAt) : created;
        if (!created || !activated) {
            return discard("has corrupt timestamps");
        }
        auto bits = keys::validateKeyPair(*privatePem, *publicPem);
        if (!bits) {
            return discard("has invalid key material");
        }

        keys::KeyRecord record;
        record.keyId = keyId;
        record.privateKeyPem = std::move(*privatePem);
        record.publicKeyPem = std::move(*publicPem);
        record.keyBits = bits.value();
        record.createdAt = foundation::fromEpochSeconds(*created);
        if (activatedAt) {
            record.activatedAt = foundation::fromEpochSeconds(*activated);
        }
        return record;
    }

    // Returns true if a persisted active key was installed.
    bool restoreFromSecretStore() {
        auto keyId = secretStore->get(sk::kActiveKeyId);
        if (!keyId) {
            KEYRING_LOG_INFO(LogCategory::Rotation, "No persisted active key; generating one");
            return false;
        }

        auto record = loadPersisted(*keyId, "active");
        if (!record) {
            return false;
        }
        if (!record->activatedAt) {
            record->activatedAt = record->createdAt;
        }

        auto restored = store->restoreActive(std::move(*record));
        if (!restored) {
            logKey(LogLevel::Warning, restored.error().message(), *keyId);
            forgetPersisted(*keyId);
            return false;
        }
        events->record(RotationEvent::KeyRestored, *keyId);
        return true;
    }

    // Reinstall the persisted standby, or forget it when it cannot be used.
    void restoreStandbyFromSecretStore() {
        auto keyId = secretStore->get(sk::kStandbyKeyId);
        if (!keyId) {
            return;
        }
        if (secretStore->get(sk::kActiveKeyId) == keyId) {
            removeEntry(sk::kStandbyKeyId);
            return;
        }
        if (store->hasStandby()) {
            forgetPersisted(*keyId);
            return;
        }

        auto record = loadPersisted(*keyId, "standby");
        if (!record) {
            return;
        }
        record->activatedAt.reset();
        auto inserted = store->insertStandby(std::move(*record));
        if (!inserted) {
            logKey(LogLevel::Warning, inserted.error().message(), *keyId);
            forgetPersisted(*keyId);
            return;
        }
        logKey(LogLevel::Info, "Standby key restored from secret store", *keyId);
    }

    // A persisted standby without a usable active key is discarded.
    void forgetPersistedStandby() {
        if (auto keyId = secretStore->get(sk::kStandbyKeyId)) {
            forgetPersisted(*keyId);
        }
    }

    // ── Rotation steps (rotationMutex held) ─────────────────────────────

    KeyringResult<void> ensureStandbyLocked() {
        if (store->hasStandby()) {
            return KeyringResult<void>::ok();
        }

        auto started = std::chrono::steady_clock::now();
        auto generated = generator->generate();
        events->recordGenerationLatency(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started));

        if (!generated) {
            events->record(RotationEvent::KeyGenerationFailed, {});
            setLastError(generated.error());
            KEYRING_LOG_WARN(LogCategory::Rotation,
                             "Standby generation failed: " +
                                 std::string(generated.error().message()));
            return KeyringResult<void>::err(generated.error());
        }

        auto record = std::move(generated).value();
        const auto keyId = record.keyId;
        persistStandby(record);

        auto inserted = store->insertStandby(std::move(record));
        if (!inserted) {
            forgetPersisted(keyId);
            setLastError(inserted.error());
            logKey(LogLevel::Error, inserted.error().message(), keyId);
            return inserted;
        }
        events->record(RotationEvent::KeyGenerated, keyId);
        return KeyringResult<void>::ok();
    }

    keys::SweepReport sweepLocked(TimePoint now) {
        auto report = store->sweepExpired(now);
        for (const auto& id : report.expired) {
            events->record(RotationEvent::KeyExpired, id);
        }
        for (const auto& id : report.forceExpired) {
            events->record(RotationEvent::KeyExpired, id);
        }
        for (const auto& id : report.removed) {
            events->record(RotationEvent::KeyRemoved, id);
        }
        events->recordRetainedKeys(store->size());
        return report;
    }

    KeyringResult<RotationOutcome> rotateLocked(RotationTrigger trigger) {
        RotatingScope scope(state);

        RotationOutcome outcome;
        outcome.trigger = trigger;

        if (trigger == RotationTrigger::Emergency && store->hasStandby()) {
            auto discarded = store->discardStandby();
            if (discarded) {
                forgetPersisted(discarded.value());
                events->record(RotationEvent::StandbyDiscarded, discarded.value());
            }
        }

        auto standby = ensureStandbyLocked();
        if (!standby) {
            events->record(RotationEvent::RotationFailed, {});
            return KeyringResult<RotationOutcome>::err(
                KeyringError(ErrorCode::RotationFailed,
                             "no standby key available: " + std::string(standby.error().message()),
                             standby.error()));
        }

        auto promoted = store->promoteStandbyToActive();
        if (!promoted) {
            events->record(RotationEvent::RotationFailed, {});
            setLastError(promoted.error());
            KEYRING_LOG_ERROR(LogCategory::Rotation,
                              "Promotion failed; previous key stays active: " +
                                  std::string(promoted.error().message()));
            return KeyringResult<RotationOutcome>::err(KeyringError(
                ErrorCode::RotationFailed, std::string(promoted.error().message()),
                promoted.error()));
        }

        const auto& promotion = promoted.value();
        persistPromotion(promotion);
        events->record(RotationEvent::RotationCompleted, promotion.activatedKeyId);
        if (promotion.retiredKeyId) {
            events->record(RotationEvent::KeyRetired, *promotion.retiredKeyId);
        }

        {
            std::lock_guard<std::mutex> lock(statusMutex);
            ++rotationCount;
            lastRotationAt = promotion.promotedAt;
            lastError.reset();
        }

        LogContext ctx;
        ctx.keyId = promotion.activatedKeyId;
        ctx.rotationEpoch = promotion.rotationEpoch;
        ctx.extra["trigger"] = std::string(rotationTriggerName(trigger));
        if (promotion.retiredKeyId) {
            ctx.extra["retired"] = *promotion.retiredKeyId;
        }
        KeyringLogger::instance().logWithContext(LogLevel::Info, LogCategory::Rotation,
                                                 "Rotation completed", ctx);

        if (config.preGenerateNextKey) {
            // Failure here does not undo the promotion; retried next tick.
            auto next = ensureStandbyLocked();
            outcome.standbyReady = next.hasValue();
        } else {
            outcome.standbyReady = store->hasStandby();
        }

        sweepLocked(clock->now());

        outcome.rotated = true;
        outcome.activeKeyId = promotion.activatedKeyId;
        outcome.retiredKeyId = promotion.retiredKeyId;
        outcome.rotationEpoch = promotion.rotationEpoch;
        return KeyringResult<RotationOutcome>::ok(std::move(outcome));
    }

    RotationOutcome unchangedOutcome(RotationTrigger trigger) const {
        RotationOutcome outcome;
        outcome.trigger = trigger;
        if (auto active = store->activeMetadata()) {
            outcome.activeKeyId = active->keyId;
        }
        outcome.rotationEpoch = store->rotationEpoch();
        outcome.standbyReady = store->hasStandby();
        return outcome;
    }

    std::optional<TimePoint> nextRotationAt() const {
        auto active = store->activeMetadata();
        if (!active) {
            return std::nullopt;
        }
        TimePoint due = active->activatedAt.value_or(active->createdAt) + config.rotationInterval;

        std::lock_guard<std::mutex> lock(statusMutex);
        if (lastRotationAt) {
            // Two scheduled rotations are never closer than the grace period,
            // even if the clock was stepped back after the last one.
            due = std::max(due, *lastRotationAt + config.validationGracePeriod);
        }
        return due;
    }

    // One scheduler evaluation. Returns false if the tick hit an error.
    KeyringResult<RotationOutcome> tickLocked(bool fromScheduler) {
        if (fromScheduler && stopping.load()) {
            return KeyringResult<RotationOutcome>::ok(unchangedOutcome(RotationTrigger::Scheduled));
        }

        const auto now = clock->now();
        auto due = nextRotationAt();
        if (due && now >= *due) {
            return rotateLocked(RotationTrigger::Scheduled);
        }

        bool standbyOk = true;
        if (config.preGenerateNextKey && !store->hasStandby()) {
            standbyOk = ensureStandbyLocked().hasValue();
        }
        sweepLocked(now);

        auto outcome = unchangedOutcome(RotationTrigger::Scheduled);
        if (!standbyOk) {
            return KeyringResult<RotationOutcome>::err(
                KeyringError(ErrorCode::KeyGenerationFailed, "standby retry failed"));
        }
        return KeyringResult<RotationOutcome>::ok(std::move(outcome));
    }

    std::chrono::milliseconds nextWait(bool lastTickFailed) const {
        if (lastTickFailed) {
            return config.maxPollInterval;
        }
        auto due = nextRotationAt();
        if (!due) {
            return config.maxPollInterval;
        }
        // Negative when overdue or when the clock stepped back past the
        // deadline computation; clamp to zero.
        auto untilDue = std::chrono::ceil<std::chrono::milliseconds>(*due - clock->now());
        untilDue = std::max(untilDue, std::chrono::milliseconds::zero());
        return std::min(untilDue, config.maxPollInterval);
    }

    void schedulerLoop() {
        KEYRING_LOG_INFO(LogCategory::Rotation, "Rotation scheduler started");
        std::unique_lock<std::mutex> lock(schedMutex);
        while (!stopRequested) {
            lock.unlock();
            bool failed = false;
            {
                std::lock_guard<std::mutex> rotationLock(rotationMutex);
                auto result = tickLocked(true);
                if (!result) {
                    failed = true;
                    KEYRING_LOG_WARN(LogCategory::Rotation,
                                     "Scheduler tick failed: " +
                                         std::string(result.error().message()));
                }
            }
            auto wait = nextWait(failed);
            lock.lock();
            if (stopRequested) {
                break;
            }
            schedCv.wait_for(lock, wait, [this] { return stopRequested || wakeRequested; });
            wakeRequested = false;
        }
        KEYRING_LOG_INFO(LogCategory::Rotation, "Rotation scheduler stopped");
    }
};

// ── RotationController ──────────────────────────────────────────────────────

RotationController::RotationController(RotationConfig config,
                                       std::shared_ptr<keys::KeyStore> store,
                                       std::shared_ptr<keys::IKeyMaterialGenerator> generator,
                                       std::shared_ptr<const foundation::Clock> clock,
                                       std::shared_ptr<keys::ISecretStore> secretStore,
                                       std::shared_ptr<IRotationEventSink> events)
    : impl_(std::make_unique<Impl>()) {
    impl_->clock = clock ? std::move(clock) : foundation::systemClock();
    impl_->store = store ? std::move(store)
                         : std::make_shared<keys::KeyStore>(config.storePolicy(), impl_->clock);
    impl_->generator = generator ? std::move(generator)
                                 : std::make_shared<keys::RsaKeyMaterialGenerator>(
                                       config.keySizeBits, impl_->clock);
    impl_->secretStore =
        secretStore ? std::move(secretStore) : std::make_shared<keys::InMemorySecretStore>();
    impl_->events = events ? std::move(events) : std::make_shared<NullEventSink>();
    impl_->config = std::move(config);
}

RotationController::~RotationController() {
    if (impl_) {
        stop();
    }
}

KeyringResult<void> RotationController::bootstrap() {
    std::lock_guard<std::mutex> lock(impl_->rotationMutex);
    if (impl_->store->hasActive()) {
        return KeyringResult<void>::ok();
    }

    if (impl_->restoreFromSecretStore()) {
        impl_->restoreStandbyFromSecretStore();
    } else {
        impl_->forgetPersistedStandby();

        // Discard anything left over from a failed earlier attempt.
        if (impl_->store->hasStandby()) {
            auto discarded = impl_->store->discardStandby();
            if (discarded) {
                impl_->forgetPersisted(discarded.value());
            }
        }

        auto standby = impl_->ensureStandbyLocked();
        if (!standby) {
            KEYRING_LOG(LogLevel::Critical, LogCategory::Rotation,
                        "Cannot generate the first signing key: " +
                            std::string(standby.error().message()));
            return standby;
        }

        auto promoted = impl_->store->promoteStandbyToActive();
        if (!promoted) {
            impl_->setLastError(promoted.error());
            return KeyringResult<void>::err(promoted.error());
        }
        impl_->persistPromotion(promoted.value());
        logKey(LogLevel::Info, "Initial signing key activated", promoted.value().activatedKeyId,
               promoted.value().rotationEpoch);
    }

    if (impl_->config.preGenerateNextKey) {
        auto next = impl_->ensureStandbyLocked();
        if (!next) {
            KEYRING_LOG_WARN(LogCategory::Rotation,
                             "Initial standby generation failed; will retry on next tick");
        }
    }
    impl_->events->recordRetainedKeys(impl_->store->size());
    return KeyringResult<void>::ok();
}

bool RotationController::isBootstrapped() const {
    return impl_->store->hasActive();
}

KeyringResult<void> RotationController::start() {
    if (!impl_->store->hasActive()) {
        return KeyringResult<void>::err(
            KeyringError(ErrorCode::NotBootstrapped, "bootstrap() must run before start()"));
    }
    bool expected = false;
    if (!impl_->running.compare_exchange_strong(expected, true)) {
        return KeyringResult<void>::err(
            KeyringError(ErrorCode::SchedulerAlreadyRunning, "rotation scheduler already running"));
    }

    {
        std::lock_guard<std::mutex> lock(impl_->schedMutex);
        impl_->stopRequested = false;
        impl_->wakeRequested = false;
    }
    impl_->stopping.store(false);
    impl_->schedulerThread = std::thread([this]() { impl_->schedulerLoop(); });
    return KeyringResult<void>::ok();
}

void RotationController::stop() {
    if (!impl_->running.load()) {
        return;
    }
    impl_->stopping.store(true);
    {
        std::lock_guard<std::mutex> lock(impl_->schedMutex);
        impl_->stopRequested = true;
    }
    impl_->schedCv.notify_all();
    if (impl_->schedulerThread.joinable()) {
        impl_->schedulerThread.join();
    }
    impl_->running.store(false);
}

bool RotationController::isRunning() const {
    return impl_->running.load();
}

KeyringResult<RotationOutcome> RotationController::rotateNow(RotationTrigger trigger) {
    if (!impl_->store->hasActive()) {
        KEYRING_LOG_ERROR(LogCategory::Rotation, "Rotation requested before bootstrap");
        return KeyringResult<RotationOutcome>::err(
            KeyringError(ErrorCode::NotBootstrapped, "bootstrap() must run before rotation"));
    }

    const auto observedEpoch = impl_->store->rotationEpoch();
    std::lock_guard<std::mutex> lock(impl_->rotationMutex);

    if (trigger == RotationTrigger::Forced && impl_->store->rotationEpoch() != observedEpoch) {
        auto outcome = impl_->unchangedOutcome(trigger);
        outcome.coalesced = true;
        impl_->events->record(RotationEvent::RotationCoalesced, outcome.activeKeyId);
        logKey(LogLevel::Debug, "Forced rotation coalesced with a concurrent rotation",
               outcome.activeKeyId, outcome.rotationEpoch);
        return KeyringResult<RotationOutcome>::ok(std::move(outcome));
    }

    auto result = impl_->rotateLocked(trigger);
    if (result) {
        impl_->wakeScheduler();
    }
    return result;
}

bool RotationController::forceRotate() {
    auto result = rotateNow(RotationTrigger::Forced);
    if (!result) {
        KEYRING_LOG_ERROR(LogCategory::Rotation,
                          "Forced rotation failed: " + std::string(result.error().message()));
        return false;
    }
    return true;
}

bool RotationController::emergencyRotate() {
    auto result = rotateNow(RotationTrigger::Emergency);
    if (!result) {
        KEYRING_LOG_ERROR(LogCategory::Rotation,
                          "Emergency rotation failed: " + std::string(result.error().message()));
        return false;
    }
    return true;
}

KeyringResult<RotationOutcome> RotationController::rotateIfDue() {
    if (!impl_->store->hasActive()) {
        return KeyringResult<RotationOutcome>::err(
            KeyringError(ErrorCode::NotBootstrapped, "bootstrap() must run before rotation"));
    }
    std::lock_guard<std::mutex> lock(impl_->rotationMutex);
    return impl_->tickLocked(false);
}

keys::SweepReport RotationController::sweep() {
    std::lock_guard<std::mutex> lock(impl_->rotationMutex);
    return impl_->sweepLocked(impl_->clock->now());
}

ControllerState RotationController::state() const {
    return impl_->state.load();
}

std::optional<TimePoint> RotationController::nextRotationAt() const {
    return impl_->nextRotationAt();
}

KeyHealth RotationController::keyHealth() const {
    auto snap = impl_->store->snapshot();

    KeyHealth health;
    health.activeKeyId = snap.activeKeyId.value_or(std::string{});
    health.standbyKeyId = snap.standbyKeyId;
    health.totalKeys = snap.keys.size();
    health.keys = std::move(snap.keys);
    health.controllerState = impl_->state.load();
    health.nextRotationAt = impl_->nextRotationAt();
    health.schedulerRunning = impl_->running.load();

    std::lock_guard<std::mutex> lock(impl_->statusMutex);
    health.rotationCount = impl_->rotationCount;
    health.lastRotationAt = impl_->lastRotationAt;
    health.lastError = impl_->lastError;
    return health;
}

const RotationConfig& RotationController::config() const {
    return impl_->config;
}

}  // namespace keyring::rotation
