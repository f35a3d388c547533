/// @file key_store.cpp
/// @brief KeyStore implementation (copy-on-write key set).

#include "keyring/keys/key_store.hpp"

#include "crypto/crypto_utils.hpp"
#include "keyring/foundation/keyring_logger.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <utility>

namespace keyring::keys {

using foundation::ErrorCode;
using foundation::KeyringError;
using foundation::KeyringLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

// Records are shared between successive key sets. The last set to let go
// of a record wipes whatever private material it still holds.
struct WipedKeyRecord : KeyRecord {
    explicit WipedKeyRecord(KeyRecord record) : KeyRecord(std::move(record)) {}
    ~WipedKeyRecord() { crypto::secureErase(privateKeyPem); }

    WipedKeyRecord(const WipedKeyRecord&) = delete;
    WipedKeyRecord& operator=(const WipedKeyRecord&) = delete;
};

using RecordPtr = std::shared_ptr<const KeyRecord>;

RecordPtr makeRecord(KeyRecord record) {
    return std::make_shared<WipedKeyRecord>(std::move(record));
}

void logTransition(LogLevel level, std::string_view msg, const std::string& keyId,
                   uint64_t epoch) {
    LogContext ctx;
    ctx.keyId = keyId;
    ctx.rotationEpoch = epoch;
    KeyringLogger::instance().logWithContext(level, LogCategory::KeyStore, msg, ctx);
}

VerificationKey toVerificationKey(const KeyRecord& record) {
    return VerificationKey{record.keyId,
                           record.publicKeyPem,
                           record.algorithm,
                           record.state,
                           record.createdAt,
                           record.activatedAt,
                           record.expiresAt};
}

}  // anonymous namespace

struct KeyStore::KeySet {
    std::map<std::string, RecordPtr> keys;
    std::optional<std::string> activeKeyId;
    std::optional<std::string> standbyKeyId;
    uint64_t rotationEpoch = 0;

    [[nodiscard]] RecordPtr find(const std::optional<std::string>& id) const {
        if (!id) {
            return nullptr;
        }
        auto it = keys.find(*id);
        return it == keys.end() ? nullptr : it->second;
    }
};

KeyStore::KeyStore(KeyStorePolicy policy, std::shared_ptr<const foundation::Clock> clock)
    : policy_(policy),
      clock_(clock ? std::move(clock) : foundation::systemClock()),
      current_(std::make_shared<const KeySet>()) {}

KeyStore::~KeyStore() = default;

std::shared_ptr<const KeyStore::KeySet> KeyStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

// ── Reads ───────────────────────────────────────────────────────────────────

KeyringResult<SigningKey> KeyStore::getActive() const {
    auto set = current();
    auto active = set->find(set->activeKeyId);
    if (!active) {
        KEYRING_LOG_ERROR(LogCategory::KeyStore, "Signing key requested before bootstrap");
        return KeyringResult<SigningKey>::err(
            KeyringError(ErrorCode::NoActiveKey, "no active signing key; bootstrap not run"));
    }
    return KeyringResult<SigningKey>::ok(
        SigningKey{active->keyId, active->privateKeyPem, active->algorithm});
}

KeyringResult<std::vector<VerificationKey>> KeyStore::getEligibleForValidation() const {
    auto set = current();
    auto active = set->find(set->activeKeyId);
    if (!active) {
        KEYRING_LOG_ERROR(LogCategory::KeyStore, "Eligible keys requested before bootstrap");
        return KeyringResult<std::vector<VerificationKey>>::err(
            KeyringError(ErrorCode::NoActiveKey, "no active signing key; bootstrap not run"));
    }

    const auto now = clock_->now();
    std::vector<RecordPtr> retiring;
    for (const auto& [id, record] : set->keys) {
        if (record->state != KeyState::Retiring || !record->expiresAt) {
            continue;
        }
        if (now <= *record->expiresAt + policy_.validationGracePeriod) {
            retiring.push_back(record);
        }
    }
    std::sort(retiring.begin(), retiring.end(), [](const RecordPtr& a, const RecordPtr& b) {
        return a->retiringSince.value_or(TimePoint{}) > b->retiringSince.value_or(TimePoint{});
    });

    std::vector<VerificationKey> eligible;
    eligible.reserve(retiring.size() + 1);
    eligible.push_back(toVerificationKey(*active));
    for (const auto& record : retiring) {
        eligible.push_back(toVerificationKey(*record));
    }
    return KeyringResult<std::vector<VerificationKey>>::ok(std::move(eligible));
}

std::optional<KeyMetadata> KeyStore::activeMetadata() const {
    auto set = current();
    auto active = set->find(set->activeKeyId);
    if (!active) {
        return std::nullopt;
    }
    return toMetadata(*active);
}

KeySetSnapshot KeyStore::snapshot() const {
    auto set = current();
    KeySetSnapshot snap;
    snap.activeKeyId = set->activeKeyId;
    snap.standbyKeyId = set->standbyKeyId;
    snap.rotationEpoch = set->rotationEpoch;
    snap.keys.reserve(set->keys.size());
    for (const auto& [id, record] : set->keys) {
        snap.keys.push_back(toMetadata(*record));
    }
    std::sort(snap.keys.begin(), snap.keys.end(), [](const KeyMetadata& a, const KeyMetadata& b) {
        return a.createdAt < b.createdAt;
    });
    return snap;
}

uint64_t KeyStore::rotationEpoch() const {
    return current()->rotationEpoch;
}

bool KeyStore::hasActive() const {
    return current()->activeKeyId.has_value();
}

bool KeyStore::hasStandby() const {
    return current()->standbyKeyId.has_value();
}

std::size_t KeyStore::size() const {
    return current()->keys.size();
}

// ── Mutations ───────────────────────────────────────────────────────────────

KeyringResult<void> KeyStore::insertStandby(KeyRecord record) {
    if (record.state != KeyState::Standby) {
        return KeyringResult<void>::err(
            KeyringError(ErrorCode::InvalidArgument, "only Standby records can be inserted"));
    }
    if (record.keyId.empty() || record.privateKeyPem.empty() || record.publicKeyPem.empty()) {
        return KeyringResult<void>::err(
            KeyringError(ErrorCode::InvalidArgument, "standby record is missing key material"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (current_->standbyKeyId) {
        return KeyringResult<void>::err(KeyringError(
            ErrorCode::StandbyAlreadyExists, "standby key " + *current_->standbyKeyId + " pending"));
    }
    if (current_->keys.count(record.keyId) != 0) {
        return KeyringResult<void>::err(
            KeyringError(ErrorCode::AlreadyExists, "key id already present: " + record.keyId));
    }

    auto next = std::make_shared<KeySet>(*current_);
    const auto keyId = record.keyId;
    next->keys.emplace(keyId, makeRecord(std::move(record)));
    next->standbyKeyId = keyId;
    current_ = std::move(next);

    logTransition(LogLevel::Debug, "Standby key inserted", keyId, current_->rotationEpoch);
    return KeyringResult<void>::ok();
}

KeyringResult<PromotionResult> KeyStore::promoteStandbyToActive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_->standbyKeyId) {
        return KeyringResult<PromotionResult>::err(
            KeyringError(ErrorCode::NoStandbyKey, "no standby key to promote"));
    }

    auto standby = current_->find(current_->standbyKeyId);
    if (!standby || standby->state != KeyState::Standby) {
        return KeyringResult<PromotionResult>::err(KeyringError(
            ErrorCode::KeyStoreInvariantViolation, "standby pointer does not name a Standby key"));
    }
    auto outgoing = current_->find(current_->activeKeyId);
    if (current_->activeKeyId && !outgoing) {
        return KeyringResult<PromotionResult>::err(KeyringError(
            ErrorCode::KeyStoreInvariantViolation, "active pointer names a missing key"));
    }

    const auto now = clock_->now();
    auto next = std::make_shared<KeySet>(*current_);

    PromotionResult result;
    result.promotedAt = now;

    if (outgoing) {
        KeyRecord retired = *outgoing;
        crypto::secureErase(retired.privateKeyPem);
        retired.state = KeyState::Retiring;
        retired.retiringSince = now;
        retired.expiresAt = now + policy_.overlapDuration;
        const auto retiredId = retired.keyId;
        result.retiredKeyId = retiredId;
        next->keys[retiredId] = makeRecord(std::move(retired));
    }

    KeyRecord promoted = *standby;
    promoted.state = KeyState::Active;
    promoted.activatedAt = now;
    result.activatedKeyId = promoted.keyId;
    next->keys[result.activatedKeyId] = makeRecord(std::move(promoted));

    next->activeKeyId = result.activatedKeyId;
    next->standbyKeyId.reset();
    next->rotationEpoch = current_->rotationEpoch + 1;
    result.rotationEpoch = next->rotationEpoch;

    current_ = std::move(next);

    logTransition(LogLevel::Info, "Standby promoted to active", result.activatedKeyId,
                  result.rotationEpoch);
    if (result.retiredKeyId) {
        logTransition(LogLevel::Info, "Previous active key retiring", *result.retiredKeyId,
                      result.rotationEpoch);
    }
    return KeyringResult<PromotionResult>::ok(std::move(result));
}

KeyringResult<std::string> KeyStore::discardStandby() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_->standbyKeyId) {
        return KeyringResult<std::string>::err(
            KeyringError(ErrorCode::NoStandbyKey, "no standby key to discard"));
    }

    auto next = std::make_shared<KeySet>(*current_);
    auto keyId = *next->standbyKeyId;
    next->keys.erase(keyId);
    next->standbyKeyId.reset();
    current_ = std::move(next);

    logTransition(LogLevel::Warning, "Standby key discarded", keyId, current_->rotationEpoch);
    return KeyringResult<std::string>::ok(std::move(keyId));
}

KeyringResult<void> KeyStore::restoreActive(KeyRecord record) {
    if (record.keyId.empty() || record.privateKeyPem.empty() || record.publicKeyPem.empty()) {
        return KeyringResult<void>::err(
            KeyringError(ErrorCode::InvalidArgument, "restored record is missing key material"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (current_->activeKeyId) {
        return KeyringResult<void>::err(KeyringError(
            ErrorCode::AlreadyExists, "an active key is already installed"));
    }
    if (current_->keys.count(record.keyId) != 0) {
        return KeyringResult<void>::err(
            KeyringError(ErrorCode::AlreadyExists, "key id already present: " + record.keyId));
    }

    record.state = KeyState::Active;
    if (!record.activatedAt) {
        record.activatedAt = record.createdAt;
    }
    record.retiringSince.reset();
    record.expiresAt.reset();

    auto next = std::make_shared<KeySet>(*current_);
    const auto keyId = record.keyId;
    next->keys.emplace(keyId, makeRecord(std::move(record)));
    next->activeKeyId = keyId;
    current_ = std::move(next);

    logTransition(LogLevel::Info, "Active key restored from secret store", keyId,
                  current_->rotationEpoch);
    return KeyringResult<void>::ok();
}

SweepReport KeyStore::sweepExpired(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    SweepReport report;

    auto next = std::make_shared<KeySet>(*current_);
    auto isPinned = [&next](const std::string& id) {
        return id == next->activeKeyId || id == next->standbyKeyId;
    };

    // Retiring -> Expired once the overlap and grace have both elapsed.
    for (auto& [id, record] : next->keys) {
        if (record->state == KeyState::Retiring && record->expiresAt &&
            now > *record->expiresAt + policy_.validationGracePeriod) {
            KeyRecord expired = *record;
            expired.state = KeyState::Expired;
            report.expired.push_back(id);
            record = makeRecord(std::move(expired));
        }
    }

    for (auto it = next->keys.begin(); it != next->keys.end();) {
        if (it->second->state == KeyState::Expired && !isPinned(it->first)) {
            report.removed.push_back(it->first);
            it = next->keys.erase(it);
        } else {
            ++it;
        }
    }

    // Retention bound: drop the oldest unpinned keys first.
    while (next->keys.size() > policy_.maxRetainedKeys) {
        auto oldest = next->keys.end();
        for (auto it = next->keys.begin(); it != next->keys.end(); ++it) {
            if (isPinned(it->first)) {
                continue;
            }
            if (oldest == next->keys.end() || it->second->createdAt < oldest->second->createdAt) {
                oldest = it;
            }
        }
        if (oldest == next->keys.end()) {
            break;
        }
        report.forceExpired.push_back(oldest->first);
        report.removed.push_back(oldest->first);
        next->keys.erase(oldest);
    }

    report.retained = next->keys.size();
    if (report.changed()) {
        current_ = std::move(next);
        for (const auto& id : report.forceExpired) {
            logTransition(LogLevel::Warning, "Key force-expired by retention bound", id,
                          current_->rotationEpoch);
        }
        for (const auto& id : report.removed) {
            logTransition(LogLevel::Info, "Expired key removed", id, current_->rotationEpoch);
        }
    }
    return report;
}

}  // namespace keyring::keys
