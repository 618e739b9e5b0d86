// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "sharded_map.hpp"
#include "storage.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <ocpp/v16/ocpp_enums.hpp>

namespace csms {

struct Verdict {
    ocpp::v16::AuthorizationStatus status{ocpp::v16::AuthorizationStatus::Invalid};
    std::optional<Timestamp> expiry_date;
    std::optional<std::string> parent_id_tag;

    bool accepted() const {
        return status == ocpp::v16::AuthorizationStatus::Accepted;
    }
};

/// \brief Advisory copy of identity tag verdicts.
///
/// The cache lifetime bounds how stale our copy may get; the tag's own expiry bounds the verdict itself, so a cached
/// Accepted whose expiry passes resolves as Expired before the cache entry ages out.
class AuthorizationCache {
public:
    AuthorizationCache(Storage& storage, std::chrono::seconds lifetime,
                       std::chrono::milliseconds read_retry_backoff = std::chrono::milliseconds(50));

    Verdict resolve(const std::string& id_tag);
    Verdict resolve(const std::string& id_tag, Timestamp now);

    void invalidate(const std::string& id_tag);
    void invalidate_all();
    std::size_t size() const;

private:
    struct Entry {
        Verdict verdict;
        Timestamp cached_at{};
    };

    Storage& storage_;
    std::chrono::seconds lifetime_;
    std::chrono::milliseconds read_retry_backoff_;
    std::atomic<std::uint64_t> generation_{0};
    ShardedMap<std::string, Entry> entries_;

    Verdict evaluate(const std::string& id_tag, Timestamp now);
    std::optional<IdTagRecord> read_tag(const std::string& id_tag);
};

} // namespace csms
