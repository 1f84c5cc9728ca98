#pragma once

#include <map>
#include <mutex>                // std::mutex, std::lock_guard

#include "mac.hpp"
#include "ip.hpp"

// ----------------------------------------------------------------------------
// ArpCache
// process-wide table of MAC -> IPv4 bindings learned from ARP traffic
// created empty on first use, lives until process exit
// every access takes mCache, entries are copied out, never referenced
// ----------------------------------------------------------------------------
class ArpCache final {
public:
	static ArpCache& instance();

	ArpCache(const ArpCache&) = delete;
	ArpCache& operator = (const ArpCache&) = delete;

	bool lookup(const Mac& MAC, IPv4& IP) const;
	void insert(const Mac& MAC, const IPv4& IP);

	size_t size() const;

	// copy of the whole table, for reporting
	std::map<Mac, IPv4> snapshot() const;

private:
	ArpCache() = default;

	mutable std::mutex mCache;
	std::map<Mac, IPv4> table_;
};
