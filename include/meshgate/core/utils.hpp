#ifndef MESHGATE_CORE_UTILS_HPP
#define MESHGATE_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace meshgate {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Hex-encode arbitrary bytes (lowercase)
std::string hex_encode(const unsigned char* data, size_t len);

// ============ Random identifiers ============

// Hex string built from `num_bytes` bytes of the OpenSSL CSPRNG.
// Returns an empty string if the generator is not seeded.
std::string random_hex(size_t num_bytes);

// ============ Host utilities ============

// Short host name as reported by gethostname()
std::string local_hostname();

// Non-loopback IPv4 addresses of this host, dotted-quad
std::vector<std::string> local_ipv4_addresses();

} // namespace meshgate

#endif // MESHGATE_CORE_UTILS_HPP
