#include "arp-cache.hpp"

ArpCache& ArpCache::instance() {
    static ArpCache cache;
    return cache;
}

/**
 * @brief find IP address bound to MAC address
 *
 * @param MAC : key to look up
 * @param IP : bound IP address, untouched on miss
 *
 * @return true : binding exists
 * @return false : no binding
 */
bool ArpCache::lookup(const Mac& MAC, IPv4& IP) const {
    std::lock_guard<std::mutex> lk(mCache);

    auto it = table_.find(MAC);
    if(it == table_.end()) return false;

    IP = it->second;

    return true;
}

/**
 * @brief bind MAC address to IP address
 * an existing binding for MAC is overwritten, nothing is evicted
 *
 * @param MAC : key
 * @param IP : value
 */
void ArpCache::insert(const Mac& MAC, const IPv4& IP) {
    std::lock_guard<std::mutex> lk(mCache);

#ifdef DEBUG
    std::cout << "[DEBUG] ArpCache insert " << MAC << " -> " << IP << '\n';
#endif

    table_[MAC] = IP;
}

size_t ArpCache::size() const {
    std::lock_guard<std::mutex> lk(mCache);
    return table_.size();
}

std::map<Mac, IPv4> ArpCache::snapshot() const {
    std::lock_guard<std::mutex> lk(mCache);
    return table_;
}

#ifdef GTEST
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <atomic>

// The cache is process-wide, so every test uses its own MAC range.

TEST(ArpCache, singletonTest) {
    EXPECT_EQ(&ArpCache::instance(), &ArpCache::instance());
}

TEST(ArpCache, missTest) {
    IPv4 IP("1.2.3.4");

    EXPECT_FALSE(ArpCache::instance().lookup(Mac("02:00:00:00:10:01"), IP));
    EXPECT_EQ(IP, IPv4("1.2.3.4"));
}

TEST(ArpCache, insertOverwriteTest) {
    ArpCache& cache = ArpCache::instance();
    Mac key("02:00:00:00:20:01");
    IPv4 IP;

    EXPECT_FALSE(cache.lookup(key, IP));

    cache.insert(key, IPv4("10.0.0.1"));
    ASSERT_TRUE(cache.lookup(key, IP));
    EXPECT_EQ(IP, IPv4("10.0.0.1"));

    size_t before = cache.size();
    cache.insert(key, IPv4("10.0.0.9"));
    ASSERT_TRUE(cache.lookup(key, IP));
    EXPECT_EQ(IP, IPv4("10.0.0.9"));
    EXPECT_EQ(cache.size(), before);

    auto table = cache.snapshot();
    ASSERT_TRUE(table.find(key) != table.end());
    EXPECT_EQ(table[key], IPv4("10.0.0.9"));
}

TEST(ArpCache, concurrentLookupTest) {
    ArpCache& cache = ArpCache::instance();
    const int entries = 16;
    std::vector<std::thread> readers;
    std::atomic<int> mismatch(0);
    uint8_t raw[Mac::SIZE] = {0x02, 0x00, 0x00, 0x00, 0x30, 0x00};
    int i;

    for(i = 0; i < entries; i++) {
        raw[5] = i;
        cache.insert(Mac(raw), IPv4(0x0A000000 + i));
    }

    for(i = 0; i < 4; i++) {
        readers.emplace_back([&mismatch]() {
            uint8_t key[Mac::SIZE] = {0x02, 0x00, 0x00, 0x00, 0x30, 0x00};
            IPv4 IP;
            int round, j;

            for(round = 0; round < 1000; round++) {
                for(j = 0; j < entries; j++) {
                    key[5] = j;
                    if(not ArpCache::instance().lookup(Mac(key), IP) or IP != IPv4(0x0A000000 + j)) mismatch++;
                }

                // never inserted
                key[5] = 0xFF;
                if(ArpCache::instance().lookup(Mac(key), IP)) mismatch++;
            }
        });
    }

    for(auto& t : readers) t.join();

    EXPECT_EQ(mismatch.load(), 0);
}

TEST(ArpCache, concurrentInsertTest) {
    ArpCache& cache = ArpCache::instance();
    std::vector<std::thread> writers;
    int i;

    for(i = 0; i < 4; i++) {
        writers.emplace_back([i]() {
            uint8_t key[Mac::SIZE] = {0x02, 0x00, 0x00, 0x00, 0x40, 0x00};
            int j;

            key[4] = 0x40 + i;
            for(j = 0; j < 64; j++) {
                key[5] = j;
                ArpCache::instance().insert(Mac(key), IPv4(0xC0A80000 + (i << 8) + j));
            }
        });
    }

    for(auto& t : writers) t.join();

    uint8_t key[Mac::SIZE] = {0x02, 0x00, 0x00, 0x00, 0x43, 0x3F};
    IPv4 IP;
    ASSERT_TRUE(cache.lookup(Mac(key), IP));
    EXPECT_EQ(IP, IPv4("192.168.3.63"));
}

#endif // GTEST
