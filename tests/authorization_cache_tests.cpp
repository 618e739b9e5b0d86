// SPDX-License-Identifier: Apache-2.0
#include "authorization_cache.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace csms;
using namespace csms::testing;
using ocpp::v16::AuthorizationStatus;

namespace {
const auto T0 = at("2024-05-01T10:00:00Z");
constexpr auto BACKOFF = std::chrono::milliseconds(1);
} // namespace

int main() {
    // Unknown tag
    {
        FakeStorage storage;
        AuthorizationCache cache(storage, std::chrono::seconds(60), BACKOFF);
        assert(cache.resolve("NOPE", T0).status == AuthorizationStatus::Invalid);
    }

    // Two resolutions inside the lifetime: identical verdicts, one storage lookup
    {
        FakeStorage storage;
        storage.add_tag("TAG001", AuthorizationStatus::Accepted, at("2030-01-01T00:00:00Z"));
        AuthorizationCache cache(storage, std::chrono::seconds(60), BACKOFF);
        const auto first = cache.resolve("TAG001", T0);
        const auto second = cache.resolve("TAG001", T0 + std::chrono::seconds(59));
        assert(first.accepted());
        assert(second.status == first.status);
        assert(second.expiry_date == first.expiry_date);
        assert(storage.get_id_tag_calls == 1);

        // Lifetime elapsed: storage is consulted again
        cache.resolve("TAG001", T0 + std::chrono::seconds(60));
        assert(storage.get_id_tag_calls == 2);
    }

    // Stored status and expiry
    {
        FakeStorage storage;
        storage.add_tag("BLOCKED001", AuthorizationStatus::Blocked);
        storage.add_tag("OLD001", AuthorizationStatus::Accepted, at("2024-04-30T00:00:00Z"));
        storage.add_tag("EXP001", AuthorizationStatus::Expired);
        AuthorizationCache cache(storage, std::chrono::seconds(60), BACKOFF);
        assert(cache.resolve("BLOCKED001", T0).status == AuthorizationStatus::Blocked);
        assert(cache.resolve("OLD001", T0).status == AuthorizationStatus::Expired);
        assert(cache.resolve("EXP001", T0).status == AuthorizationStatus::Expired);
    }

    // A cached Accepted turns Expired once the tag's own expiry passes, without another lookup
    {
        FakeStorage storage;
        storage.add_tag("SOON001", AuthorizationStatus::Accepted, T0 + std::chrono::seconds(10));
        AuthorizationCache cache(storage, std::chrono::seconds(600), BACKOFF);
        assert(cache.resolve("SOON001", T0).accepted());
        assert(cache.resolve("SOON001", T0 + std::chrono::seconds(11)).status == AuthorizationStatus::Expired);
        assert(storage.get_id_tag_calls == 1);
    }

    // Parent tags: one level only
    {
        FakeStorage storage;
        storage.add_tag("BLOCKED001", AuthorizationStatus::Blocked);
        storage.add_tag("CHILD001", AuthorizationStatus::Accepted, std::nullopt, std::string("BLOCKED001"));
        storage.add_tag("ORPHAN001", AuthorizationStatus::Accepted, std::nullopt, std::string("MISSING"));
        storage.add_tag("GRAND001", AuthorizationStatus::Blocked);
        storage.add_tag("PARENT001", AuthorizationStatus::Accepted, std::nullopt, std::string("GRAND001"));
        storage.add_tag("CHILD002", AuthorizationStatus::Accepted, std::nullopt, std::string("PARENT001"));
        storage.add_tag("CHILD003", AuthorizationStatus::Blocked, std::nullopt, std::string("PARENT001"));
        AuthorizationCache cache(storage, std::chrono::seconds(60), BACKOFF);

        const auto child = cache.resolve("CHILD001", T0);
        assert(child.status == AuthorizationStatus::Blocked);
        assert(child.parent_id_tag.value() == "BLOCKED001");
        assert(cache.resolve("ORPHAN001", T0).status == AuthorizationStatus::Invalid);
        assert(cache.resolve("CHILD002", T0).accepted());
        // The tag's own status wins over an Accepted parent
        assert(cache.resolve("CHILD003", T0).status == AuthorizationStatus::Blocked);
    }

    // One failed read is retried
    {
        FakeStorage storage;
        storage.add_tag("TAG001", AuthorizationStatus::Accepted);
        storage.failing_reads = 1;
        AuthorizationCache cache(storage, std::chrono::seconds(60), BACKOFF);
        assert(cache.resolve("TAG001", T0).accepted());
        assert(storage.get_id_tag_calls == 2);
        assert(cache.size() == 1);
    }

    // Two failed reads: Invalid, nothing cached
    {
        FakeStorage storage;
        storage.add_tag("TAG001", AuthorizationStatus::Accepted);
        storage.failing_reads = 2;
        AuthorizationCache cache(storage, std::chrono::seconds(60), BACKOFF);
        assert(cache.resolve("TAG001", T0).status == AuthorizationStatus::Invalid);
        assert(cache.size() == 0);
        assert(cache.resolve("TAG001", T0).accepted());
    }

    // Invalidation drops the cached copy
    {
        FakeStorage storage;
        storage.add_tag("TAG001", AuthorizationStatus::Accepted);
        AuthorizationCache cache(storage, std::chrono::seconds(60), BACKOFF);
        assert(cache.resolve("TAG001", T0).accepted());
        storage.add_tag("TAG001", AuthorizationStatus::Blocked);
        assert(cache.resolve("TAG001", T0).accepted());
        cache.invalidate("TAG001");
        assert(cache.resolve("TAG001", T0).status == AuthorizationStatus::Blocked);

        cache.resolve("OTHER", T0);
        assert(cache.size() == 2);
        cache.invalidate_all();
        assert(cache.size() == 0);
    }

    // Zero lifetime disables caching
    {
        FakeStorage storage;
        storage.add_tag("TAG001", AuthorizationStatus::Accepted);
        AuthorizationCache cache(storage, std::chrono::seconds(0), BACKOFF);
        cache.resolve("TAG001", T0);
        cache.resolve("TAG001", T0);
        assert(storage.get_id_tag_calls == 2);
        assert(cache.size() == 0);
    }

    std::cout << "authorization_cache_tests passed\n";
    return 0;
}
