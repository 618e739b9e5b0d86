// SPDX-License-Identifier: Apache-2.0
#include "authorization_cache.hpp"

#include <everest/logging.hpp>

namespace csms {

namespace {
using ocpp::v16::AuthorizationStatus;

// Verdict of a tag considered on its own: stored status first, then its expiry.
AuthorizationStatus own_status(const IdTagRecord& record, Timestamp now) {
    switch (record.status) {
    case AuthorizationStatus::Accepted:
        break;
    case AuthorizationStatus::Blocked:
    case AuthorizationStatus::Expired:
    case AuthorizationStatus::Invalid:
        return record.status;
    default:
        return AuthorizationStatus::Invalid;
    }
    if (record.expiry_date && *record.expiry_date < now) {
        return AuthorizationStatus::Expired;
    }
    return AuthorizationStatus::Accepted;
}
} // namespace

AuthorizationCache::AuthorizationCache(Storage& storage, std::chrono::seconds lifetime,
                                       std::chrono::milliseconds read_retry_backoff) :
    storage_(storage), lifetime_(lifetime), read_retry_backoff_(read_retry_backoff) {
}

Verdict AuthorizationCache::resolve(const std::string& id_tag) {
    return resolve(id_tag, std::chrono::system_clock::now());
}

Verdict AuthorizationCache::resolve(const std::string& id_tag, Timestamp now) {
    const auto cached = entries_.with_shard(id_tag, [&](auto& entries) -> std::optional<Verdict> {
        const auto it = entries.find(id_tag);
        if (it == entries.end()) {
            return std::nullopt;
        }
        if (now - it->second.cached_at >= lifetime_) {
            entries.erase(it);
            return std::nullopt;
        }
        auto& verdict = it->second.verdict;
        if (verdict.accepted() && verdict.expiry_date && *verdict.expiry_date < now) {
            verdict.status = AuthorizationStatus::Expired;
        }
        return verdict;
    });
    if (cached) {
        EVLOG_debug << "Authorization cache hit for " << id_tag << ": " << cached->status;
        return *cached;
    }

    const auto generation = generation_.load();
    Verdict verdict;
    try {
        verdict = evaluate(id_tag, now);
    } catch (const StorageError& e) {
        EVLOG_error << "Authorization lookup for " << id_tag << " failed after retry: " << e.what()
                    << "; answering Invalid";
        return Verdict{};
    }

    if (lifetime_.count() > 0) {
        entries_.with_shard(id_tag, [&](auto& entries) {
            // An invalidation raced with our storage read; do not resurrect the old copy.
            if (generation_.load() != generation) {
                return;
            }
            entries[id_tag] = Entry{verdict, now};
        });
    }
    EVLOG_info << "Resolved id tag " << id_tag << " to " << verdict.status;
    return verdict;
}

void AuthorizationCache::invalidate(const std::string& id_tag) {
    ++generation_;
    entries_.with_shard(id_tag, [&](auto& entries) { entries.erase(id_tag); });
}

void AuthorizationCache::invalidate_all() {
    ++generation_;
    entries_.for_each_shard([](auto& entries) { entries.clear(); });
    EVLOG_info << "Authorization cache cleared";
}

std::size_t AuthorizationCache::size() const {
    std::size_t count = 0;
    entries_.for_each_shard([&](const auto& entries) { count += entries.size(); });
    return count;
}

Verdict AuthorizationCache::evaluate(const std::string& id_tag, Timestamp now) {
    Verdict verdict;
    const auto record = read_tag(id_tag);
    if (!record) {
        verdict.status = AuthorizationStatus::Invalid;
        return verdict;
    }
    verdict.expiry_date = record->expiry_date;
    verdict.parent_id_tag = record->parent_id_tag;
    verdict.status = own_status(*record, now);
    if (!verdict.accepted() || !record->parent_id_tag || record->parent_id_tag->empty()) {
        return verdict;
    }

    // One level only: the parent's own parent is not consulted.
    const auto parent = read_tag(*record->parent_id_tag);
    const auto parent_status = parent ? own_status(*parent, now) : AuthorizationStatus::Invalid;
    if (parent_status != AuthorizationStatus::Accepted) {
        EVLOG_info << "Id tag " << id_tag << " inherits " << parent_status << " from parent "
                   << *record->parent_id_tag;
        verdict.status = parent_status;
    }
    return verdict;
}

std::optional<IdTagRecord> AuthorizationCache::read_tag(const std::string& id_tag) {
    return with_read_retry([&]() { return storage_.get_id_tag(id_tag); }, read_retry_backoff_, "get_id_tag");
}

} // namespace csms
