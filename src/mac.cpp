#include "mac.hpp"

#include <cstdio>   // sscanf

constexpr int Mac::SIZE;

/**
 * @brief parse "AA:BB:CC:DD:EE:FF" (or '-' separated) MAC address
 * trailing whitespace such as the newline in /sys/class/net/<if>/address is ignored
 * on malformed input the address stays null
 *
 * @param r : string form of MAC address
 */
Mac::Mac(const std::string& r) {
    unsigned int bytes[SIZE];
    char sep[SIZE - 1];
    char trailing;
    int i;

    memset(mac_, 0, SIZE);

    int res = sscanf(r.c_str(), "%2x%c%2x%c%2x%c%2x%c%2x%c%2x %c",
                     &bytes[0], &sep[0], &bytes[1], &sep[1], &bytes[2], &sep[2],
                     &bytes[3], &sep[3], &bytes[4], &sep[4], &bytes[5], &trailing);

    if(res != SIZE * 2 - 1) {
        std::cerr << "Error: Error while converting string to MAC\n";
        return;
    }

    for(i = 0; i < SIZE - 1; i++) {
        if(sep[i] != ':' and sep[i] != '-') {
            std::cerr << "Error: Error while converting string to MAC\n";
            return;
        }
    }

    for(i = 0; i < SIZE; i++) mac_[i] = static_cast<uint8_t>(bytes[i]);
}

Mac::operator std::string() const {
    std::stringstream ss;
    int i;

    ss << std::hex << std::uppercase << std::setfill('0');
    for(i = 0; i < SIZE - 1; i++) ss << std::setw(2) << (int)mac_[i] << ':';
    ss << std::setw(2) << (int)mac_[SIZE - 1];

    return ss.str();
}

Mac& Mac::nullMac() {
    static uint8_t value[] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    static Mac res(value);
    return res;
}

Mac& Mac::broadcastMac() {
    static uint8_t value[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    static Mac res(value);
    return res;
}

std::ostream& operator << (std::ostream& os, const Mac& mac) {
    return os << std::string(mac);
}

#ifdef GTEST
#include <gtest/gtest.h>

static constexpr uint8_t _temp[Mac::SIZE] = {0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC};

TEST(Mac, ctorTest) {
    Mac mac1; // Mac()
    EXPECT_TRUE(mac1.isNull());

    Mac mac2{_temp}; // Mac(const uint8_t* r)

    Mac mac3("12:34:56:78:9A:BC"); // Mac(const std::string& r)
    EXPECT_EQ(mac2, mac3);

    Mac mac4("12-34-56-78-9a-bc\n"); // sysfs style with newline, lowercase
    EXPECT_EQ(mac2, mac4);
}

TEST(Mac, badStringTest) {
    Mac mac1("12:34:56");
    EXPECT_TRUE(mac1.isNull());

    Mac mac2("12:34:56:78:9A:BC:DE");
    EXPECT_TRUE(mac2.isNull());

    Mac mac3("12.34.56.78.9A.BC");
    EXPECT_TRUE(mac3.isNull());
}

TEST(Mac, castingTest) {
    Mac mac("12:34:56:78:9A:BC");

    uint8_t buf[Mac::SIZE];
    memcpy(buf, static_cast<uint8_t*>(mac), Mac::SIZE); // operator uint8_t*() const
    EXPECT_TRUE(memcmp(buf, _temp, Mac::SIZE) == 0);

    std::string s2 = std::string(mac); // explicit operator std::string() const
    EXPECT_EQ(s2, "12:34:56:78:9A:BC");
}

TEST(Mac, readWriteTest) {
    Mac mac;
    mac.read(_temp);
    EXPECT_EQ(mac, _temp);

    uint8_t buf[Mac::SIZE] = {0, };
    mac.write(buf);
    EXPECT_TRUE(memcmp(buf, _temp, Mac::SIZE) == 0);
}

TEST(Mac, orderTest) {
    Mac low("00:00:00:00:00:01");
    Mac high("00:00:00:00:01:00");

    EXPECT_TRUE(low < high);
    EXPECT_TRUE(high > low);
    EXPECT_TRUE(low <= low);
    EXPECT_FALSE(low != low);
}

TEST(Mac, isNullTest) {
    Mac mac;
    mac.clear();
    EXPECT_TRUE(mac.isNull());
}

TEST(Mac, isBroadcastTest) {
    Mac mac("FF:FF:FF:FF:FF:FF");
    EXPECT_TRUE(mac.isBroadcast());
    EXPECT_EQ(mac, Mac::broadcastMac());
}

TEST(Mac, isMulticastTest) {
    Mac mac("01:00:5E:00:11:22");
    EXPECT_TRUE(mac.isMulticast());

    Mac other("01:00:5E:80:11:22");
    EXPECT_FALSE(other.isMulticast());
}

#endif // GTEST
