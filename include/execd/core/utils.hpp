#ifndef execd_CORE_UTILS_HPP
#define execd_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace execd {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic clock in milliseconds (for deadlines, never for display)
int64_t monotonic_ms();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Strict numeric parsing: the whole string must be consumed
bool parse_int64(const std::string& s, int64_t& out);
bool parse_double(const std::string& s, double& out);

// Decode %XX and '+' in URL query components
std::string url_decode(const std::string& s);

// Length of the longest prefix of `data` that does not end inside a UTF-8
// multi-byte sequence. Bytes after it belong to the next read.
size_t utf8_complete_prefix(const std::string& data);

// ============ Path utilities ============

// Normalize path (resolve . and ..)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create every missing directory in `dir` (like mkdir -p)
bool make_directories(const std::string& dir, unsigned int mode = 0755);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ Crypto-backed utilities (OpenSSL) ============

// Generate a random UUID v4
std::string generate_uuid();

// Hex-encoded SHA-256 of the input
std::string sha256_hex(const std::string& data);

// Constant-time comparison of two secrets
bool secure_equals(const std::string& a, const std::string& b);

std::string base64_encode(const std::string& data);

// Returns false on malformed input
bool base64_decode(const std::string& text, std::string& out);

} // namespace execd

#endif // execd_CORE_UTILS_HPP
