#include "ip.hpp"

const int IPv4::SIZE;

template<char C>
std::istream& expect(std::istream& in) {
	if((in >> std::ws).peek() == C) in.ignore();
	else in.setstate(std::ios_base::failbit);

	return in;
}

IPv4::IPv4(const std::string r) : ip_(0) {
	uint32_t a, b, c, d;
	std::istringstream iss(r);

	if(iss >> a >> (expect<'.'>) >> b >> (expect<'.'>) >> c >> (expect<'.'>) >> d and
	   a <= 0xFF and b <= 0xFF and c <= 0xFF and d <= 0xFF) {
		ip_ = (a << 24) bitor (b << 16) bitor (c << 8) bitor d;
		return;
	}

	std::cerr << "Error: Error while converting string to IP" << std::endl;

	return;
}

IPv4::operator std::string() const {
	std::stringstream ss;
	const int bitmask = 0x000000ff;
	int i;

	for(i = 24; i > 0; i -= 8) ss << std::dec << ((int)(ip_ >> i) bitand bitmask) << '.';
	ss << std::dec << (ip_ bitand bitmask);

	return ss.str();
}

std::ostream& operator << (std::ostream& os, const IPv4& ip) {
	return os << std::string(ip);
}

#ifdef GTEST
#include <gtest/gtest.h>

TEST(IPv4, ctorTest) {
	IPv4 ip1; // IPv4()
	EXPECT_TRUE(ip1.isNull());

	IPv4 ip2(0x7F000001); // IPv4(const uint32_t r)

	IPv4 ip3("127.0.0.1"); // IPv4(const std::string r);

	EXPECT_EQ(ip2, ip3);
}

TEST(IPv4, badStringTest) {
	IPv4 ip1("10.0.0");
	EXPECT_TRUE(ip1.isNull());

	IPv4 ip2("10.0.0.256");
	EXPECT_TRUE(ip2.isNull());
}

TEST(IPv4, castingTest) {
	IPv4 ip("127.0.0.1");

	uint32_t ui = ip; // operator uint32_t() const
	EXPECT_EQ(ui, 0x7F000001u);

	std::string s = std::string(ip); // explicit operator std::string()

	EXPECT_EQ(s, "127.0.0.1");
}

TEST(IPv4, wireOrderTest) {
	const uint8_t wire[IPv4::SIZE] = {0x0A, 0x00, 0x00, 0x02};
	IPv4 ip;

	ip.read(wire);
	EXPECT_EQ(ip, IPv4("10.0.0.2"));

	uint8_t out[IPv4::SIZE] = {0, };
	ip.write(out);
	EXPECT_EQ(out[0], 0x0A);
	EXPECT_EQ(out[3], 0x02);
}

TEST(IPv4, classTest) {
	EXPECT_TRUE(IPv4("127.1.2.3").isLocalHost());
	EXPECT_TRUE(IPv4("255.255.255.255").isBroadcast());
	EXPECT_TRUE(IPv4("224.0.0.251").isMulticast());
	EXPECT_FALSE(IPv4("10.0.0.1").isMulticast());
}

#endif // GTEST
