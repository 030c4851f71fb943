#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "endpoint_registry.hpp"

using sidecar::EndpointRegistry;
using sidecar::PortNotAvailable;

// NOLINTNEXTLINE
TEST(endpoint_registry, unset_is_not_available) {
    EndpointRegistry registry;
    ASSERT_FALSE(registry.get().has_value());
    ASSERT_FALSE(registry.has_port());

    try {
        sidecar::get_sidecar_port(registry);
        FAIL() << "expected PortNotAvailable";
    } catch (const PortNotAvailable& e) {
        ASSERT_STREQ(e.what(), "Sidecar port not yet available");
    }
}

// NOLINTNEXTLINE
TEST(endpoint_registry, first_set_wins) {
    EndpointRegistry registry;
    ASSERT_TRUE(registry.set(54213));
    ASSERT_FALSE(registry.set(8080));
    ASSERT_FALSE(registry.set(54213));
    ASSERT_EQ(registry.get(), 54213);
    ASSERT_EQ(sidecar::get_sidecar_port(registry), 54213);
}

// NOLINTNEXTLINE
TEST(endpoint_registry, port_zero_is_a_value) {
    EndpointRegistry registry;
    ASSERT_TRUE(registry.set(0));
    ASSERT_TRUE(registry.has_port());
    ASSERT_EQ(sidecar::get_sidecar_port(registry), 0);
}

// NOLINTNEXTLINE
TEST(endpoint_registry, concurrent_readers_see_unset_or_final_value) {
    EndpointRegistry registry;
    std::atomic<bool> go{false};
    std::atomic<bool> bad_read{false};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int j = 0; j < 10000; ++j) {
                auto port = registry.get();
                if (port.has_value() && *port != 4242) {
                    bad_read = true;
                }
            }
        });
    }

    go = true;
    registry.set(4242);
    for (auto& t : readers) {
        t.join();
    }

    ASSERT_FALSE(bad_read.load());
    ASSERT_EQ(registry.get(), 4242);
}
